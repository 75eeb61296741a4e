#include <coffer/ledger/deltas.hpp>
#include <coffer/schema/money.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace coffer::ledger {

using namespace coffer::schema;

namespace {

leg_t wallet_leg(const wallet_id_t& id, amount_minor_t amount) {
  return leg_t{.target = wallet_target_t{.wallet_id = id}, .amount = amount};
}

leg_t flow_leg(const flow_id_t& id, amount_minor_t amount) {
  return leg_t{.target = flow_target_t{.flow_id = id}, .amount = amount};
}

}  // namespace

std::vector<leg_t> compute_legs(const transaction_payload_t& payload,
                                amount_minor_t amount,
                                const std::vector<leg_t>& original_legs) {
  return std::visit(
      overloaded{
          [&](const income_t& income) {
            auto legs = std::vector<leg_t>{wallet_leg(income.wallet_id, amount)};
            if (income.flow_id) {
              legs.push_back(flow_leg(*income.flow_id, amount));
            }
            return legs;
          },
          [&](const expense_t& expense) {
            auto legs =
                std::vector<leg_t>{wallet_leg(expense.wallet_id, -amount)};
            if (expense.flow_id) {
              legs.push_back(flow_leg(*expense.flow_id, -amount));
            }
            return legs;
          },
          [&](const refund_t&) {
            auto legs = std::vector<leg_t>{};
            legs.reserve(original_legs.size());
            for (const auto& original : original_legs) {
              legs.push_back(leg_t{.target = original.target,
                                   .amount = original.amount > 0 ? -amount
                                                                 : amount});
            }
            return legs;
          },
          [&](const wallet_transfer_t& transfer) {
            return std::vector<leg_t>{
                wallet_leg(transfer.from_wallet_id, -amount),
                wallet_leg(transfer.to_wallet_id, amount)};
          },
          [&](const flow_transfer_t& transfer) {
            return std::vector<leg_t>{flow_leg(transfer.from_flow_id, -amount),
                                      flow_leg(transfer.to_flow_id, amount)};
          }},
      payload);
}

std::vector<leg_t> invert_legs(const std::vector<leg_t>& legs,
                               currency_t currency) {
  auto inverted = std::vector<leg_t>{};
  inverted.reserve(legs.size());
  std::ranges::transform(
      legs, std::back_inserter(inverted), [currency](const leg_t& leg) {
        return leg_t{.target = leg.target,
                     .amount = (-money_t{leg.amount, currency}).minor()};
      });
  return inverted;
}

void apply_legs(balance_set_t& balances,
                const std::vector<leg_t>& legs,
                currency_t currency) {
  // Work on a copy so a failure halfway leaves the caller's set intact.
  auto staged = balances;
  for (const auto& leg : legs) {
    auto delta = money_t{leg.amount, currency};
    std::visit(
        overloaded{[&](const wallet_target_t& target) {
                     auto& wallet = staged.wallets.at(target.wallet_id);
                     wallet.balance =
                         (money_t{wallet.balance, wallet.currency} + delta)
                             .minor();
                   },
                   [&](const flow_target_t& target) {
                     auto& flow = staged.flows.at(target.flow_id);
                     flow.balance =
                         (money_t{flow.balance, flow.currency} + delta).minor();
                   }},
        leg.target);
  }
  balances = std::move(staged);
}

std::optional<ledger_error_t> admit_flow_legs(balance_set_t& balances,
                                             const std::vector<leg_t>& legs) {
  for (const auto& leg : legs) {
    const auto* target = std::get_if<flow_target_t>(&leg.target);
    if (target == nullptr || leg.amount <= 0) {
      continue;
    }
    auto& flow = balances.flows.at(target->flow_id);
    auto mode = mode_of(flow);
    auto capped = amount_minor_t{0};
    if (mode == cash_flow_mode_t::net_capped) {
      capped = flow.balance;
    } else if (mode == cash_flow_mode_t::income_capped) {
      flow.income_balance =
          (money_t{*flow.income_balance, flow.currency} +
           money_t{leg.amount, flow.currency})
              .minor();
      capped = *flow.income_balance;
    } else {
      continue;
    }
    if (capped > *flow.max_balance) {
      return ledger_error_t{
          .code = ledger_error_code::max_balance_reached,
          .entity = ledger_entity_t::cash_flow,
          .field = "amount",
          .message = fmt::format(
              "cash flow '{}' would reach {} over its {} cap of {}",
              flow.name, money_t{capped, flow.currency}.format(),
              to_string(mode),
              money_t{*flow.max_balance, flow.currency}.format())};
    }
  }
  return std::nullopt;
}

void release_flow_legs(balance_set_t& balances,
                       const std::vector<leg_t>& original_legs) {
  for (const auto& leg : original_legs) {
    const auto* target = std::get_if<flow_target_t>(&leg.target);
    if (target == nullptr || leg.amount <= 0) {
      continue;
    }
    auto& flow = balances.flows.at(target->flow_id);
    if (mode_of(flow) == cash_flow_mode_t::income_capped) {
      flow.income_balance = std::max<amount_minor_t>(
          0, *flow.income_balance - leg.amount);
    }
  }
}

amount_minor_t replay_flow_income(
    const std::vector<transaction_record_t>& records,
    const flow_id_t& flow_id) {
  auto total = amount_minor_t{0};
  auto target = leg_target_t{flow_target_t{.flow_id = flow_id}};
  for (const auto& record : records) {
    if (!is_posted(record)) {
      continue;
    }
    for (const auto& leg : record.legs) {
      if (leg.target == target && leg.amount > 0) {
        total = (money_t{total, record.currency} +
                 money_t{leg.amount, record.currency})
                    .minor();
      }
    }
  }
  return total;
}

std::vector<leg_target_t> participants_of(const std::vector<leg_t>& legs) {
  auto targets = std::vector<leg_target_t>{};
  targets.reserve(legs.size());
  for (const auto& leg : legs) {
    targets.push_back(leg.target);
  }
  std::ranges::sort(targets);
  targets.erase(std::unique(std::begin(targets), std::end(targets)),
                std::end(targets));
  return targets;
}

amount_minor_t refundable_remainder(
    const transaction_record_t& original,
    const std::vector<transaction_record_t>& refunds) {
  auto remainder = money_t{original.amount, original.currency};
  for (const auto& refund : refunds) {
    if (is_posted(refund)) {
      remainder -= money_t{refund.amount, refund.currency};
    }
  }
  return remainder.minor();
}

std::map<leg_target_t, amount_minor_t> replay_balances(
    std::vector<transaction_record_t> records,
    currency_t currency) {
  std::ranges::sort(records, {}, &transaction_record_t::sequence);
  auto totals = std::map<leg_target_t, money_t>{};
  for (const auto& record : records) {
    if (!is_posted(record)) {
      continue;
    }
    for (const auto& leg : record.legs) {
      auto it = totals.try_emplace(leg.target, money_t::zero(currency)).first;
      it->second += money_t{leg.amount, record.currency};
    }
  }
  auto out = std::map<leg_target_t, amount_minor_t>{};
  for (const auto& [target, total] : totals) {
    out.emplace(target, total.minor());
  }
  return out;
}

}  // namespace coffer::ledger
