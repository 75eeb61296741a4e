#include <coffer/ledger/deltas.hpp>
#include <coffer/schema/money.hpp>
#include <coffer/testing/common.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <vector>

namespace {

using namespace coffer::schema;
using coffer::testing::make_hash;

const auto kWallet = make_hash(10);
const auto kOtherWallet = make_hash(20);
const auto kFlow = make_hash(30);
const auto kOtherFlow = make_hash(40);

leg_t wallet_leg(const wallet_id_t& id, amount_minor_t amount) {
  return leg_t{.target = wallet_target_t{.wallet_id = id}, .amount = amount};
}

leg_t flow_leg(const flow_id_t& id, amount_minor_t amount) {
  return leg_t{.target = flow_target_t{.flow_id = id}, .amount = amount};
}

coffer::ledger::balance_set_t make_balances() {
  auto balances = coffer::ledger::balance_set_t{};
  for (const auto& id : {kWallet, kOtherWallet}) {
    auto wallet = wallet_state_t{};
    wallet.id = id;
    balances.wallets.emplace(id, wallet);
  }
  for (const auto& id : {kFlow, kOtherFlow}) {
    auto flow = cash_flow_state_t{};
    flow.id = id;
    balances.flows.emplace(id, flow);
  }
  return balances;
}

transaction_record_t make_record(uint64_t sequence,
                                 transaction_payload_t payload,
                                 amount_minor_t amount) {
  auto record = transaction_record_t{};
  record.id = make_hash(static_cast<uint8_t>(100 + sequence));
  record.sequence = sequence;
  record.payload = std::move(payload);
  record.amount = amount;
  record.legs = coffer::ledger::compute_legs(record.payload, amount);
  return record;
}

}  // namespace

TEST(deltas, income_and_expense_touch_wallet_and_flow) {
  auto income = coffer::ledger::compute_legs(
      income_t{.wallet_id = kWallet, .flow_id = kFlow}, 500);
  EXPECT_EQ(income, (std::vector<leg_t>{wallet_leg(kWallet, 500),
                                        flow_leg(kFlow, 500)}));

  auto expense = coffer::ledger::compute_legs(
      expense_t{.wallet_id = kWallet, .flow_id = std::nullopt}, 300);
  EXPECT_EQ(expense, (std::vector<leg_t>{wallet_leg(kWallet, -300)}));
}

TEST(deltas, transfers_are_balanced) {
  auto wallets = coffer::ledger::compute_legs(
      wallet_transfer_t{.from_wallet_id = kWallet,
                        .to_wallet_id = kOtherWallet},
      250);
  EXPECT_EQ(wallets, (std::vector<leg_t>{wallet_leg(kWallet, -250),
                                         wallet_leg(kOtherWallet, 250)}));

  auto flows = coffer::ledger::compute_legs(
      flow_transfer_t{.from_flow_id = kFlow, .to_flow_id = kOtherFlow}, 70);
  EXPECT_EQ(flows[0].amount + flows[1].amount, 0);
}

TEST(deltas, refund_legs_mirror_the_original) {
  auto original = coffer::ledger::compute_legs(
      expense_t{.wallet_id = kWallet, .flow_id = kFlow}, 1000);
  auto refund = coffer::ledger::compute_legs(
      refund_t{.original_id = make_hash(1)}, 400, original);
  EXPECT_EQ(refund, (std::vector<leg_t>{wallet_leg(kWallet, 400),
                                        flow_leg(kFlow, 400)}));

  auto transfer = coffer::ledger::compute_legs(
      wallet_transfer_t{.from_wallet_id = kWallet,
                        .to_wallet_id = kOtherWallet},
      100);
  auto back = coffer::ledger::compute_legs(
      refund_t{.original_id = make_hash(2)}, 100, transfer);
  EXPECT_EQ(back, (std::vector<leg_t>{wallet_leg(kWallet, 100),
                                      wallet_leg(kOtherWallet, -100)}));
}

TEST(deltas, apply_then_invert_restores_balances) {
  auto balances = make_balances();
  auto legs = coffer::ledger::compute_legs(
      income_t{.wallet_id = kWallet, .flow_id = kFlow}, 900);
  coffer::ledger::apply_legs(balances, legs, currency_t::eur);
  EXPECT_EQ(balances.wallets.at(kWallet).balance, 900);
  EXPECT_EQ(balances.flows.at(kFlow).balance, 900);

  coffer::ledger::apply_legs(
      balances, coffer::ledger::invert_legs(legs, currency_t::eur),
      currency_t::eur);
  EXPECT_EQ(balances.wallets.at(kWallet).balance, 0);
  EXPECT_EQ(balances.flows.at(kFlow).balance, 0);
}

TEST(deltas, failed_apply_leaves_balances_untouched) {
  auto balances = make_balances();
  balances.flows.at(kFlow).balance = std::numeric_limits<int64_t>::max();
  auto legs = coffer::ledger::compute_legs(
      income_t{.wallet_id = kWallet, .flow_id = kFlow}, 1);
  EXPECT_THROW(coffer::ledger::apply_legs(balances, legs, currency_t::eur),
               money_error);
  EXPECT_EQ(balances.wallets.at(kWallet).balance, 0);

  auto foreign = make_balances();
  foreign.wallets.at(kWallet).currency = currency_t::usd;
  EXPECT_THROW(coffer::ledger::apply_legs(
                   foreign, {wallet_leg(kWallet, 5)}, currency_t::eur),
               money_error);
}

TEST(deltas, participants_are_sorted_and_unique) {
  auto legs = std::vector<leg_t>{flow_leg(kFlow, 1), wallet_leg(kWallet, 1),
                                 flow_leg(kFlow, -1)};
  auto participants = coffer::ledger::participants_of(legs);
  ASSERT_EQ(participants.size(), 2u);
  EXPECT_TRUE(is_wallet_target(participants[0]));
  EXPECT_EQ(target_id(participants[1]), kFlow);
}

TEST(deltas, refundable_remainder_ignores_voided_refunds) {
  auto original = make_record(
      0, expense_t{.wallet_id = kWallet, .flow_id = std::nullopt}, 1000);
  auto first = make_record(1, refund_t{.original_id = original.id}, 300);
  auto voided = make_record(2, refund_t{.original_id = original.id}, 500);
  voided.state = transaction_state_t::voided;
  EXPECT_EQ(coffer::ledger::refundable_remainder(original, {first, voided}),
            700);
}

TEST(deltas, replay_skips_voided_records) {
  auto income = make_record(
      0, income_t{.wallet_id = kWallet, .flow_id = kFlow}, 1000);
  auto expense = make_record(
      1, expense_t{.wallet_id = kWallet, .flow_id = std::nullopt}, 200);
  auto voided = make_record(
      2, expense_t{.wallet_id = kWallet, .flow_id = kFlow}, 50);
  voided.state = transaction_state_t::voided;

  auto replayed =
      coffer::ledger::replay_balances({voided, expense, income}, currency_t::eur);
  EXPECT_EQ(replayed.at(wallet_target_t{.wallet_id = kWallet}), 800);
  EXPECT_EQ(replayed.at(flow_target_t{.flow_id = kFlow}), 1000);
}

TEST(deltas, net_cap_refuses_positive_legs_above_max_balance) {
  auto balances = make_balances();
  balances.flows.at(kFlow).max_balance = 1000;

  auto legs = std::vector<leg_t>{flow_leg(kFlow, 800)};
  coffer::ledger::apply_legs(balances, legs, currency_t::eur);
  EXPECT_FALSE(coffer::ledger::admit_flow_legs(balances, legs).has_value());

  auto over = std::vector<leg_t>{flow_leg(kFlow, 201)};
  coffer::ledger::apply_legs(balances, over, currency_t::eur);
  auto error = coffer::ledger::admit_flow_legs(balances, over);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, ledger_error_code::max_balance_reached);
  EXPECT_EQ(error->entity, ledger_entity_t::cash_flow);

  // Withdrawals are never capped.
  auto withdraw = std::vector<leg_t>{flow_leg(kFlow, -500)};
  coffer::ledger::apply_legs(balances, withdraw, currency_t::eur);
  EXPECT_FALSE(coffer::ledger::admit_flow_legs(balances, withdraw).has_value());
}

TEST(deltas, income_cap_counts_cumulative_inflow) {
  auto balances = make_balances();
  auto& flow = balances.flows.at(kFlow);
  flow.max_balance = 1000;
  flow.income_balance = 0;

  for (auto step = 0; step < 2; ++step) {
    auto in = std::vector<leg_t>{flow_leg(kFlow, 400)};
    auto out = std::vector<leg_t>{flow_leg(kFlow, -400)};
    coffer::ledger::apply_legs(balances, in, currency_t::eur);
    ASSERT_FALSE(coffer::ledger::admit_flow_legs(balances, in).has_value());
    coffer::ledger::apply_legs(balances, out, currency_t::eur);
    ASSERT_FALSE(coffer::ledger::admit_flow_legs(balances, out).has_value());
  }
  EXPECT_EQ(balances.flows.at(kFlow).balance, 0);
  EXPECT_EQ(balances.flows.at(kFlow).income_balance, 800);

  auto copy = balances;
  auto third = std::vector<leg_t>{flow_leg(kFlow, 400)};
  coffer::ledger::apply_legs(copy, third, currency_t::eur);
  EXPECT_EQ(coffer::ledger::admit_flow_legs(copy, third)->code,
            ledger_error_code::max_balance_reached);

  coffer::ledger::release_flow_legs(balances, {flow_leg(kFlow, 400)});
  EXPECT_EQ(balances.flows.at(kFlow).income_balance, 400);
  coffer::ledger::release_flow_legs(balances, {flow_leg(kFlow, -400)});
  EXPECT_EQ(balances.flows.at(kFlow).income_balance, 400);
}

TEST(deltas, flow_income_replays_posted_positive_legs) {
  auto income = make_record(1, income_t{.wallet_id = kWallet, .flow_id = kFlow},
                            700);
  auto expense = make_record(
      2, expense_t{.wallet_id = kWallet, .flow_id = kFlow}, 300);
  auto voided = make_record(
      3, income_t{.wallet_id = kWallet, .flow_id = kFlow}, 50);
  voided.state = transaction_state_t::voided;
  auto inbound = make_record(
      4, flow_transfer_t{.from_flow_id = kOtherFlow, .to_flow_id = kFlow}, 20);

  EXPECT_EQ(coffer::ledger::replay_flow_income(
                {income, expense, voided, inbound}, kFlow),
            720);
  EXPECT_EQ(coffer::ledger::replay_flow_income(
                {income, expense, voided, inbound}, kOtherFlow),
            0);
}
