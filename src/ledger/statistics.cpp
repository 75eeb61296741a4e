#include <coffer/ledger/statistics.hpp>
#include <coffer/schema/money.hpp>

#include <map>

namespace coffer::ledger {

using namespace coffer::schema;

namespace {

struct running_totals_t final {
  money_t credits;
  money_t debits;
};

target_totals_t finish(const hash32_t& id,
                       const std::string& name,
                       const running_totals_t& totals) {
  return target_totals_t{.id = id,
                         .name = name,
                         .credits = totals.credits.minor(),
                         .debits = totals.debits.minor(),
                         .net = (totals.credits - totals.debits).minor()};
}

}  // namespace

bool in_window(timestamp_milliseconds_t occurred_at,
               const std::optional<timestamp_milliseconds_t>& from,
               const std::optional<timestamp_milliseconds_t>& to) {
  return (!from || occurred_at >= *from) && (!to || occurred_at < *to);
}

statistics_t aggregate_statistics(
    const vault_state_t& vault,
    const std::vector<wallet_state_t>& wallets,
    const std::vector<cash_flow_state_t>& flows,
    const std::vector<transaction_record_t>& records,
    const std::optional<timestamp_milliseconds_t>& from,
    const std::optional<timestamp_milliseconds_t>& to) {
  const auto zero = money_t::zero(vault.currency);

  auto balance_total = zero;
  auto wallet_totals = std::map<wallet_id_t, running_totals_t>{};
  for (const auto& wallet : wallets) {
    wallet_totals.emplace(wallet.id, running_totals_t{zero, zero});
    if (!wallet.archived) {
      balance_total += money_t{wallet.balance, wallet.currency};
    }
  }
  auto flow_totals = std::map<flow_id_t, running_totals_t>{};
  for (const auto& flow : flows) {
    flow_totals.emplace(flow.id, running_totals_t{zero, zero});
  }

  auto kinds = std::map<transaction_id_t, transaction_kind_t>{};
  for (const auto& record : records) {
    kinds.emplace(record.id, kind_of(record));
  }

  auto income = zero;
  auto expense = zero;
  auto refunds = zero;
  auto expense_refunds = zero;
  auto count = uint64_t{};
  for (const auto& record : records) {
    if (!is_posted(record) || !in_window(record.occurred_at, from, to)) {
      continue;
    }
    ++count;
    auto amount = money_t{record.amount, record.currency};
    std::visit(overloaded{[&](const income_t&) { income += amount; },
                          [&](const expense_t&) { expense += amount; },
                          [&](const refund_t& refund) {
                            refunds += amount;
                            auto original = kinds.find(refund.original_id);
                            if (original != std::end(kinds) &&
                                original->second ==
                                    transaction_kind_t::expense) {
                              expense_refunds += amount;
                            }
                          },
                          [](const wallet_transfer_t&) {},
                          [](const flow_transfer_t&) {}},
               record.payload);

    for (const auto& leg : record.legs) {
      auto delta = money_t{leg.amount, record.currency};
      auto* totals = std::visit(
          overloaded{[&](const wallet_target_t& target) -> running_totals_t* {
                       auto it = wallet_totals.find(target.wallet_id);
                       return it == std::end(wallet_totals) ? nullptr
                                                            : &it->second;
                     },
                     [&](const flow_target_t& target) -> running_totals_t* {
                       auto it = flow_totals.find(target.flow_id);
                       return it == std::end(flow_totals) ? nullptr
                                                          : &it->second;
                     }},
          leg.target);
      if (totals == nullptr) {
        continue;
      }
      if (delta.is_positive()) {
        totals->credits += delta;
      } else {
        totals->debits -= delta;
      }
    }
  }

  auto out = statistics_t{};
  out.vault_id = vault.id;
  out.currency = vault.currency;
  out.from = from;
  out.to = to;
  out.balance_total = balance_total.minor();
  out.income_total = income.minor();
  out.expense_total = expense.minor();
  out.refund_total = refunds.minor();
  out.net_expense_total = (expense - expense_refunds).minor();
  out.transaction_count = count;
  for (const auto& wallet : wallets) {
    out.wallets.push_back(
        finish(wallet.id, wallet.name, wallet_totals.at(wallet.id)));
  }
  for (const auto& flow : flows) {
    out.flows.push_back(finish(flow.id, flow.name, flow_totals.at(flow.id)));
  }
  return out;
}

}  // namespace coffer::ledger
