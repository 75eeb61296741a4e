#pragma once
#include <coffer/schema/currency.hpp>
#include <coffer/schema/ledger_error.hpp>
#include <coffer/schema/money.hpp>
#include <coffer/schema/primitives.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

// Command field checks that run before any lock is taken or any row is read.
// Each returns the error to report, or std::nullopt when the field is fine.
namespace coffer::ledger {

inline constexpr std::size_t kMaxNameLength = 64;
inline constexpr std::size_t kMaxNoteLength = 1024;

std::optional<coffer::schema::ledger_error_t> validate_name(
    std::string_view name,
    coffer::schema::ledger_entity_t entity);

std::optional<coffer::schema::ledger_error_t> validate_username(
    std::string_view username,
    std::string_view field);

std::optional<coffer::schema::ledger_error_t> validate_note(
    std::string_view note);

std::optional<coffer::schema::ledger_error_t> validate_category(
    const std::optional<std::string>& category);

/// Amount must be strictly positive.
std::optional<coffer::schema::ledger_error_t> validate_amount(
    const coffer::schema::money_t& amount);

/// Amount must be in the vault currency.
std::optional<coffer::schema::ledger_error_t> validate_currency(
    const coffer::schema::money_t& amount,
    coffer::schema::currency_t vault_currency);

/// max_balance must be positive when given; income_capped needs one.
std::optional<coffer::schema::ledger_error_t> validate_flow_cap(
    const std::optional<coffer::schema::amount_minor_t>& max_balance,
    bool income_capped);

/// [from, to) must be non-empty when both ends are given.
std::optional<coffer::schema::ledger_error_t> validate_window(
    const std::optional<coffer::schema::timestamp_milliseconds_t>& from,
    const std::optional<coffer::schema::timestamp_milliseconds_t>& to);

std::string trim_copy(std::string_view value);

}  // namespace coffer::ledger
