#include <coffer/ledger/deltas.hpp>
#include <coffer/ledger/statistics.hpp>
#include <coffer/testing/common.hpp>
#include <gtest/gtest.h>

#include <vector>

namespace {

using namespace coffer::schema;
using coffer::testing::make_hash;

const auto kWallet = make_hash(10);
const auto kArchived = make_hash(20);
const auto kFlow = make_hash(30);

transaction_record_t make_record(uint8_t seed,
                                 transaction_payload_t payload,
                                 amount_minor_t amount,
                                 timestamp_milliseconds_t occurred_at,
                                 const std::vector<leg_t>& original = {}) {
  auto record = transaction_record_t{};
  record.id = make_hash(seed);
  record.sequence = seed;
  record.payload = std::move(payload);
  record.amount = amount;
  record.occurred_at = occurred_at;
  record.legs = coffer::ledger::compute_legs(record.payload, amount, original);
  return record;
}

}  // namespace

TEST(statistics, window_is_half_open) {
  EXPECT_TRUE(coffer::ledger::in_window(10, 10, 20));
  EXPECT_FALSE(coffer::ledger::in_window(20, 10, 20));
  EXPECT_TRUE(coffer::ledger::in_window(5, std::nullopt, 6));
  EXPECT_TRUE(coffer::ledger::in_window(500, 100, std::nullopt));
}

TEST(statistics, totals_net_refunds_and_skip_transfers) {
  auto vault = vault_state_t{};
  vault.id = make_hash(1);

  auto wallet = wallet_state_t{};
  wallet.id = kWallet;
  wallet.name = "Cash";
  wallet.balance = 1250;
  auto archived = wallet_state_t{};
  archived.id = kArchived;
  archived.name = "Old";
  archived.balance = 999;
  archived.archived = true;
  auto flow = cash_flow_state_t{};
  flow.id = kFlow;
  flow.name = "Food";

  auto income = make_record(
      50, income_t{.wallet_id = kWallet, .flow_id = std::nullopt}, 2000, 100);
  auto expense =
      make_record(51, expense_t{.wallet_id = kWallet, .flow_id = kFlow}, 1000, 110);
  auto refund = make_record(52, refund_t{.original_id = expense.id}, 250, 120,
                            expense.legs);
  auto transfer = make_record(
      53,
      wallet_transfer_t{.from_wallet_id = kWallet, .to_wallet_id = kArchived},
      10, 130);
  auto voided = make_record(
      54, expense_t{.wallet_id = kWallet, .flow_id = std::nullopt}, 70, 140);
  voided.state = transaction_state_t::voided;
  auto late = make_record(
      55, income_t{.wallet_id = kWallet, .flow_id = std::nullopt}, 5, 900);

  auto stats = coffer::ledger::aggregate_statistics(
      vault, {wallet, archived}, {flow},
      {income, expense, refund, transfer, voided, late}, 100, 500);

  EXPECT_EQ(stats.balance_total, 1250);
  EXPECT_EQ(stats.income_total, 2000);
  EXPECT_EQ(stats.expense_total, 1000);
  EXPECT_EQ(stats.refund_total, 250);
  EXPECT_EQ(stats.net_expense_total, 750);
  EXPECT_EQ(stats.transaction_count, 4u);

  ASSERT_EQ(stats.wallets.size(), 2u);
  EXPECT_EQ(stats.wallets[0].credits, 2000 + 250);
  EXPECT_EQ(stats.wallets[0].debits, 1000 + 10);
  EXPECT_EQ(stats.wallets[0].net, 1240);
  EXPECT_EQ(stats.wallets[1].credits, 10);
  ASSERT_EQ(stats.flows.size(), 1u);
  EXPECT_EQ(stats.flows[0].net, -750);
}
