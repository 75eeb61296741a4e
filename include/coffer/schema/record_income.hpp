#pragma once
#include <coffer/schema/money.hpp>
#include <coffer/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: income and expense commands.
// Both move amount on one wallet and optionally one cash flow; income adds,
// expense subtracts. occurred_at defaults to the engine clock.
namespace coffer::schema {

template <uint16_t Version>
struct record_income;

template <>
struct record_income<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  wallet_id_t wallet_id{};
  std::optional<flow_id_t> flow_id;
  money_t amount{};
  std::string note;
  std::optional<std::string> category;
  std::optional<timestamp_milliseconds_t> occurred_at;
};

using record_income_t = record_income<1>;

template <uint16_t Version>
struct record_expense;

template <>
struct record_expense<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  wallet_id_t wallet_id{};
  std::optional<flow_id_t> flow_id;
  money_t amount{};
  std::string note;
  std::optional<std::string> category;
  std::optional<timestamp_milliseconds_t> occurred_at;
};

using record_expense_t = record_expense<1>;

}  // namespace coffer::schema
