#pragma once
#include <coffer/schema/currency.hpp>
#include <coffer/schema/primitives.hpp>

#include <optional>
#include <string>
#include <vector>

// Schema type: statistics.
// Read-only rollup of posted transactions. Transfers move credits/debits
// between targets but are excluded from the income/expense/refund totals.
namespace coffer::schema {

template <uint16_t Version>
struct statistics_query;

template <>
struct statistics_query<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  std::optional<timestamp_milliseconds_t> from;
  std::optional<timestamp_milliseconds_t> to;
};

using statistics_query_t = statistics_query<1>;

struct target_totals_t final {
  hash32_t id{};
  std::string name;
  amount_minor_t credits{};
  amount_minor_t debits{};
  amount_minor_t net{};
};

template <uint16_t Version>
struct statistics;

template <>
struct statistics<1> final {
  uint16_t version{1};
  vault_id_t vault_id{};
  currency_t currency{currency_t::eur};
  std::optional<timestamp_milliseconds_t> from;
  std::optional<timestamp_milliseconds_t> to;
  amount_minor_t balance_total{};
  amount_minor_t income_total{};
  amount_minor_t expense_total{};
  amount_minor_t refund_total{};
  amount_minor_t net_expense_total{};
  uint64_t transaction_count{};
  std::vector<target_totals_t> wallets;
  std::vector<target_totals_t> flows;
};

using statistics_t = statistics<1>;

}  // namespace coffer::schema
