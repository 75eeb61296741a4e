#pragma once
#include <coffer/schema/cash_flow_state.hpp>
#include <coffer/schema/currency.hpp>
#include <coffer/schema/leg.hpp>
#include <coffer/schema/ledger_error.hpp>
#include <coffer/schema/transaction_payload.hpp>
#include <coffer/schema/transaction_record.hpp>
#include <coffer/schema/wallet_state.hpp>

#include <map>
#include <optional>
#include <vector>

// Leg computation and application. Nothing here touches storage: the engine
// loads the affected targets, hands copies in, and persists what comes out.
namespace coffer::ledger {

/// In-memory copies of the wallets and cash flows a command touches.
struct balance_set_t final {
  std::map<coffer::schema::wallet_id_t, coffer::schema::wallet_state_t> wallets;
  std::map<coffer::schema::flow_id_t, coffer::schema::cash_flow_state_t> flows;
};

/// Legs for payload moving amount (> 0). For refund payloads the legs mirror
/// original_legs: each original leg of sign s yields -s * amount on the same
/// target.
std::vector<coffer::schema::leg_t> compute_legs(
    const coffer::schema::transaction_payload_t& payload,
    coffer::schema::amount_minor_t amount,
    const std::vector<coffer::schema::leg_t>& original_legs = {});

/// Legs that undo legs. Throws money_error if a leg cannot be negated.
std::vector<coffer::schema::leg_t> invert_legs(
    const std::vector<coffer::schema::leg_t>& legs,
    coffer::schema::currency_t currency);

/// Add each leg to its target balance through money_t. Every target must be
/// present in balances. Throws money_error on overflow or when a target's
/// currency differs from currency; balances is untouched in that case.
void apply_legs(balance_set_t& balances,
                const std::vector<coffer::schema::leg_t>& legs,
                coffer::schema::currency_t currency);

/// Check cash-flow caps for legs already applied to balances. A positive leg
/// may not lift a net-capped flow above max_balance, nor the cumulative
/// income_balance of an income-capped flow above max_balance; the latter is
/// advanced by every positive leg. Returns max_balance_reached for the first
/// flow that breaks its cap.
std::optional<coffer::schema::ledger_error_t> admit_flow_legs(
    balance_set_t& balances,
    const std::vector<coffer::schema::leg_t>& legs);

/// Give back the income a voided record's positive legs counted against
/// income-capped flows. Caps never refuse a void.
void release_flow_legs(balance_set_t& balances,
                       const std::vector<coffer::schema::leg_t>& original_legs);

/// Sum of the positive legs posted records moved into flow_id.
coffer::schema::amount_minor_t replay_flow_income(
    const std::vector<coffer::schema::transaction_record_t>& records,
    const coffer::schema::flow_id_t& flow_id);

/// Distinct targets of legs, sorted.
std::vector<coffer::schema::leg_target_t> participants_of(
    const std::vector<coffer::schema::leg_t>& legs);

/// original.amount minus the amounts of its posted refunds.
coffer::schema::amount_minor_t refundable_remainder(
    const coffer::schema::transaction_record_t& original,
    const std::vector<coffer::schema::transaction_record_t>& refunds);

/// Balance of every target implied by the posted records, replayed in
/// sequence order.
std::map<coffer::schema::leg_target_t, coffer::schema::amount_minor_t>
replay_balances(std::vector<coffer::schema::transaction_record_t> records,
                coffer::schema::currency_t currency);

}  // namespace coffer::ledger
