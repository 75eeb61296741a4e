#pragma once
#include <coffer/schema/cash_flow_state.hpp>
#include <coffer/schema/statistics.hpp>
#include <coffer/schema/transaction_record.hpp>
#include <coffer/schema/vault_state.hpp>
#include <coffer/schema/wallet_state.hpp>

#include <optional>
#include <vector>

namespace coffer::ledger {

/// Roll up posted records whose occurred_at lies in [from, to).
///
/// income/expense/refund totals use record amounts; net_expense_total
/// subtracts only refunds of expenses. Per-target credits and debits are
/// summed from legs, so transfers show up there and nowhere else.
/// balance_total is the current sum of non-archived wallet balances and
/// does not depend on the window.
coffer::schema::statistics_t aggregate_statistics(
    const coffer::schema::vault_state_t& vault,
    const std::vector<coffer::schema::wallet_state_t>& wallets,
    const std::vector<coffer::schema::cash_flow_state_t>& flows,
    const std::vector<coffer::schema::transaction_record_t>& records,
    const std::optional<coffer::schema::timestamp_milliseconds_t>& from,
    const std::optional<coffer::schema::timestamp_milliseconds_t>& to);

/// Whether occurred_at falls inside [from, to); open ends always match.
bool in_window(
    coffer::schema::timestamp_milliseconds_t occurred_at,
    const std::optional<coffer::schema::timestamp_milliseconds_t>& from,
    const std::optional<coffer::schema::timestamp_milliseconds_t>& to);

}  // namespace coffer::ledger
