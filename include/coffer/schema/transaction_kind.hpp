#pragma once

#include <coffer/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace coffer::schema {

enum class transaction_kind_t : uint8_t {
  income = 0,
  expense = 1,
  refund = 2,
  transfer_wallet = 3,
  transfer_flow = 4
};

inline constexpr auto kTransactionKindMappings = std::array{
    std::pair<std::string_view, transaction_kind_t>{"income",
                                                    transaction_kind_t::income},
    std::pair<std::string_view, transaction_kind_t>{
        "expense", transaction_kind_t::expense},
    std::pair<std::string_view, transaction_kind_t>{"refund",
                                                    transaction_kind_t::refund},
    std::pair<std::string_view, transaction_kind_t>{
        "transfer_wallet", transaction_kind_t::transfer_wallet},
    std::pair<std::string_view, transaction_kind_t>{
        "transfer_flow", transaction_kind_t::transfer_flow}};

template <>
inline std::optional<transaction_kind_t> try_from_string<transaction_kind_t>(
    const std::string_view value) {
  return from_string(value, kTransactionKindMappings);
}

inline constexpr std::string_view to_string(const transaction_kind_t value) {
  return to_string(value, kTransactionKindMappings).value_or("unknown");
}

constexpr bool is_transfer(const transaction_kind_t kind) {
  return kind == transaction_kind_t::transfer_wallet ||
         kind == transaction_kind_t::transfer_flow;
}

}  // namespace coffer::schema
