#pragma once

#include <coffer/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: transaction lifecycle.
// posted -> voided happens once; voided is terminal.
namespace coffer::schema {

enum class transaction_state_t : uint8_t { posted = 0, voided = 1 };

inline constexpr auto kTransactionStateMappings = std::array{
    std::pair<std::string_view, transaction_state_t>{
        "posted", transaction_state_t::posted},
    std::pair<std::string_view, transaction_state_t>{
        "voided", transaction_state_t::voided}};

template <>
inline std::optional<transaction_state_t> try_from_string<transaction_state_t>(
    const std::string_view value) {
  return from_string(value, kTransactionStateMappings);
}

inline constexpr std::string_view to_string(const transaction_state_t value) {
  return to_string(value, kTransactionStateMappings).value_or("unknown");
}

}  // namespace coffer::schema
