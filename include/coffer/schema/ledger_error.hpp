#pragma once
#include <coffer/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace coffer::schema {

enum class ledger_error_code : uint32_t {
  ok = 0,
  not_found = 1,
  unauthorized = 2,
  invalid_amount = 3,
  invalid_state = 4,
  already_voided = 5,
  immutable = 6,
  same_wallet = 7,
  same_flow = 8,
  currency_mismatch = 9,
  store_failure = 10,
  invalid_argument = 11,
  already_exists = 12,
  max_balance_reached = 13
};

inline constexpr auto kLedgerErrorCodeMappings = std::array{
    std::pair<std::string_view, ledger_error_code>{"ok", ledger_error_code::ok},
    std::pair<std::string_view, ledger_error_code>{
        "not_found", ledger_error_code::not_found},
    std::pair<std::string_view, ledger_error_code>{
        "unauthorized", ledger_error_code::unauthorized},
    std::pair<std::string_view, ledger_error_code>{
        "invalid_amount", ledger_error_code::invalid_amount},
    std::pair<std::string_view, ledger_error_code>{
        "invalid_state", ledger_error_code::invalid_state},
    std::pair<std::string_view, ledger_error_code>{
        "already_voided", ledger_error_code::already_voided},
    std::pair<std::string_view, ledger_error_code>{
        "immutable", ledger_error_code::immutable},
    std::pair<std::string_view, ledger_error_code>{
        "same_wallet", ledger_error_code::same_wallet},
    std::pair<std::string_view, ledger_error_code>{
        "same_flow", ledger_error_code::same_flow},
    std::pair<std::string_view, ledger_error_code>{
        "currency_mismatch", ledger_error_code::currency_mismatch},
    std::pair<std::string_view, ledger_error_code>{
        "store_failure", ledger_error_code::store_failure},
    std::pair<std::string_view, ledger_error_code>{
        "invalid_argument", ledger_error_code::invalid_argument},
    std::pair<std::string_view, ledger_error_code>{
        "already_exists", ledger_error_code::already_exists},
    std::pair<std::string_view, ledger_error_code>{
        "max_balance_reached", ledger_error_code::max_balance_reached}};

template <>
inline std::optional<ledger_error_code> try_from_string<ledger_error_code>(
    const std::string_view value) {
  return from_string(value, kLedgerErrorCodeMappings);
}

inline constexpr std::string_view to_string(const ledger_error_code value) {
  return to_string(value, kLedgerErrorCodeMappings).value_or("unknown");
}

enum class ledger_entity_t : uint8_t {
  vault = 0,
  wallet = 1,
  cash_flow = 2,
  transaction = 3,
  membership = 4,
  store = 5,
  category = 6
};

inline constexpr auto kLedgerEntityMappings = std::array{
    std::pair<std::string_view, ledger_entity_t>{"vault",
                                                 ledger_entity_t::vault},
    std::pair<std::string_view, ledger_entity_t>{"wallet",
                                                 ledger_entity_t::wallet},
    std::pair<std::string_view, ledger_entity_t>{"cash_flow",
                                                 ledger_entity_t::cash_flow},
    std::pair<std::string_view, ledger_entity_t>{"transaction",
                                                 ledger_entity_t::transaction},
    std::pair<std::string_view, ledger_entity_t>{"membership",
                                                 ledger_entity_t::membership},
    std::pair<std::string_view, ledger_entity_t>{"store",
                                                 ledger_entity_t::store},
    std::pair<std::string_view, ledger_entity_t>{"category",
                                                 ledger_entity_t::category}};

template <>
inline std::optional<ledger_entity_t> try_from_string<ledger_entity_t>(
    const std::string_view value) {
  return from_string(value, kLedgerEntityMappings);
}

inline constexpr std::string_view to_string(const ledger_entity_t value) {
  return to_string(value, kLedgerEntityMappings).value_or("unknown");
}

struct ledger_error_t final {
  ledger_error_code code{ledger_error_code::ok};
  ledger_entity_t entity{ledger_entity_t::vault};
  std::string field;
  std::string message;
};

/// Outcome of an engine operation: exactly one of value or error is set.
template <typename T>
struct ledger_result final {
  std::optional<T> value;
  std::optional<ledger_error_t> error;

  bool ok() const { return value.has_value(); }

  ledger_error_code code() const {
    return error ? error->code : ledger_error_code::ok;
  }

  static ledger_result success(T result) {
    return ledger_result{.value = std::move(result), .error = std::nullopt};
  }

  static ledger_result failure(ledger_error_t failure_error) {
    return ledger_result{.value = std::nullopt,
                         .error = std::move(failure_error)};
  }
};

/// Unit payload for operations with no result data.
struct done_t final {};

}  // namespace coffer::schema
