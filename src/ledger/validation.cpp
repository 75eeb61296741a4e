#include <coffer/ledger/validation.hpp>

#include <spdlog/fmt/fmt.h>

#include <cctype>

namespace coffer::ledger {

using namespace coffer::schema;

namespace {

ledger_error_t invalid_argument(ledger_entity_t entity,
                                std::string_view field,
                                std::string message) {
  return ledger_error_t{.code = ledger_error_code::invalid_argument,
                        .entity = entity,
                        .field = std::string{field},
                        .message = std::move(message)};
}

}  // namespace

std::string trim_copy(std::string_view value) {
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return std::string{value};
}

std::optional<ledger_error_t> validate_name(std::string_view name,
                                            ledger_entity_t entity) {
  auto trimmed = trim_copy(name);
  if (trimmed.empty()) {
    return invalid_argument(entity, "name", "name must not be empty");
  }
  if (trimmed.size() > kMaxNameLength) {
    return invalid_argument(
        entity, "name",
        fmt::format("name longer than {} characters", kMaxNameLength));
  }
  return std::nullopt;
}

std::optional<ledger_error_t> validate_username(std::string_view username,
                                                std::string_view field) {
  if (trim_copy(username).empty()) {
    return invalid_argument(ledger_entity_t::membership, field,
                            "username must not be empty");
  }
  if (username.size() > kMaxNameLength) {
    return invalid_argument(
        ledger_entity_t::membership, field,
        fmt::format("username longer than {} characters", kMaxNameLength));
  }
  return std::nullopt;
}

std::optional<ledger_error_t> validate_note(std::string_view note) {
  if (note.size() > kMaxNoteLength) {
    return invalid_argument(
        ledger_entity_t::transaction, "note",
        fmt::format("note longer than {} characters", kMaxNoteLength));
  }
  return std::nullopt;
}

std::optional<ledger_error_t> validate_category(
    const std::optional<std::string>& category) {
  if (category && trim_copy(*category).empty()) {
    return invalid_argument(ledger_entity_t::transaction, "category",
                            "category must not be blank");
  }
  if (category && category->size() > kMaxNameLength) {
    return invalid_argument(
        ledger_entity_t::transaction, "category",
        fmt::format("category longer than {} characters", kMaxNameLength));
  }
  return std::nullopt;
}

std::optional<ledger_error_t> validate_amount(const money_t& amount) {
  if (!amount.is_positive()) {
    return ledger_error_t{
        .code = ledger_error_code::invalid_amount,
        .entity = ledger_entity_t::transaction,
        .field = "amount",
        .message = fmt::format("amount must be positive, got {}",
                               amount.format())};
  }
  return std::nullopt;
}

std::optional<ledger_error_t> validate_currency(const money_t& amount,
                                                currency_t vault_currency) {
  if (amount.currency() != vault_currency) {
    return ledger_error_t{
        .code = ledger_error_code::currency_mismatch,
        .entity = ledger_entity_t::transaction,
        .field = "amount",
        .message = fmt::format("amount in {} but vault uses {}",
                               to_string(amount.currency()),
                               to_string(vault_currency))};
  }
  return std::nullopt;
}

std::optional<ledger_error_t> validate_flow_cap(
    const std::optional<amount_minor_t>& max_balance,
    bool income_capped) {
  if (max_balance && *max_balance <= 0) {
    return ledger_error_t{
        .code = ledger_error_code::invalid_amount,
        .entity = ledger_entity_t::cash_flow,
        .field = "max_balance",
        .message = fmt::format("cap must be positive, got {}", *max_balance)};
  }
  if (income_capped && !max_balance) {
    return invalid_argument(ledger_entity_t::cash_flow, "income_capped",
                            "an income-capped flow needs max_balance");
  }
  return std::nullopt;
}

std::optional<ledger_error_t> validate_window(
    const std::optional<timestamp_milliseconds_t>& from,
    const std::optional<timestamp_milliseconds_t>& to) {
  if (from && to && *from >= *to) {
    return invalid_argument(ledger_entity_t::transaction, "from",
                            fmt::format("empty window [{}, {})", *from, *to));
  }
  return std::nullopt;
}

}  // namespace coffer::ledger
