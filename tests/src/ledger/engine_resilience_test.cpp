#include <coffer/ledger/engine.hpp>
#include <coffer/testing/common.hpp>
#include <coffer/testing/ledger_fixture.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <random>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

using namespace coffer::schema;
using coffer::testing::eur;

template <typename Fixture>
amount_minor_t wallet_total(Fixture& fx, const vault_id_t& vault) {
  auto view =
      fx.engine().get_vault(vault_query_t{.actor = "ana", .vault_id = vault});
  EXPECT_TRUE(view.ok());
  auto total = amount_minor_t{0};
  if (view.ok()) {
    for (const auto& wallet : view.value->wallets) {
      total += wallet.balance;
    }
  }
  return total;
}

template <typename Fixture>
ledger_result<transaction_record_t> move_between(Fixture& fx,
                                                 const vault_id_t& vault,
                                                 const wallet_id_t& from,
                                                 const wallet_id_t& to,
                                                 amount_minor_t amount) {
  return fx.engine().transfer_wallet(
      record_wallet_transfer_t{.actor = "ana",
                               .vault_id = vault,
                               .from_wallet_id = from,
                               .to_wallet_id = to,
                               .amount = eur(amount)});
}

}  // namespace

TEST(engine_resilience, failed_commit_leaves_no_partial_state) {
  auto fx = coffer::testing::ledger_fixture<>{};
  auto home = fx.create_vault("ana");
  const auto vault = home.vault.id;
  const auto cash = home.wallets.front().id;
  auto savings = fx.create_wallet("ana", vault, "Savings");

  auto deposit = fx.engine().record_income(record_income_t{
      .actor = "ana", .vault_id = vault, .wallet_id = cash, .amount = eur(1000)});
  ASSERT_TRUE(deposit.ok());
  const auto rows = fx.storage().size();

  fx.storage().fail_next_commits(1);
  auto failed = move_between(fx, vault, cash, savings.id, 300);
  ASSERT_FALSE(failed.ok());
  EXPECT_EQ(failed.code(), ledger_error_code::store_failure);
  EXPECT_EQ(failed.error->entity, ledger_entity_t::store);
  EXPECT_EQ(fx.storage().size(), rows);
  EXPECT_EQ(fx.wallet_balance("ana", vault, cash), 1000);
  EXPECT_EQ(fx.wallet_balance("ana", vault, savings.id), 0);

  fx.storage().fail_next_commits(1);
  EXPECT_EQ(fx.engine()
                .void_transaction(void_transaction_t{.actor = "ana",
                                                     .vault_id = vault,
                                                     .transaction_id =
                                                         deposit.value->id})
                .code(),
            ledger_error_code::store_failure);
  auto stored = fx.engine().get_transaction(transaction_query_t{
      .actor = "ana", .vault_id = vault, .transaction_id = deposit.value->id});
  ASSERT_TRUE(stored.ok());
  EXPECT_EQ(stored.value->state, transaction_state_t::posted);

  // The sequence consumed by the failed posting is not burned.
  auto retried = move_between(fx, vault, cash, savings.id, 300);
  ASSERT_TRUE(retried.ok());
  EXPECT_EQ(retried.value->sequence, deposit.value->sequence + 1);
  EXPECT_EQ(fx.wallet_balance("ana", vault, cash), 700);

  fx.storage().fail_next_commits(1);
  auto lost = fx.engine().create_vault(
      create_vault_t{.actor = "ana", .name = "Holiday"});
  EXPECT_EQ(lost.code(), ledger_error_code::store_failure);
  auto created = fx.engine().create_vault(
      create_vault_t{.actor = "ana", .name = "Holiday"});
  EXPECT_TRUE(created.ok());
}

TEST(engine_resilience, random_operations_keep_balances_consistent) {
  auto fx = coffer::testing::ledger_fixture<>{};
  auto home = fx.create_vault("ana");
  const auto vault = home.vault.id;
  auto wallets = std::vector<wallet_id_t>{home.wallets.front().id};
  wallets.push_back(fx.create_wallet("ana", vault, "Savings").id);
  wallets.push_back(fx.create_wallet("ana", vault, "Card").id);
  auto flows = std::vector<flow_id_t>{fx.create_flow("ana", vault, "Food").id,
                                      fx.create_flow("ana", vault, "Rent").id};

  auto rng = std::mt19937{20240611};
  auto pick = [&](std::size_t size) {
    return std::uniform_int_distribution<std::size_t>{0, size - 1}(rng);
  };
  auto amount = [&]() {
    return std::uniform_int_distribution<amount_minor_t>{1, 5000}(rng);
  };

  auto posted = std::vector<transaction_id_t>{};
  for (auto step = 0; step < 300; ++step) {
    auto result = ledger_result<transaction_record_t>{};
    switch (pick(6)) {
      case 0:
        result = fx.engine().record_income(
            record_income_t{.actor = "ana",
                            .vault_id = vault,
                            .wallet_id = wallets[pick(wallets.size())],
                            .flow_id = flows[pick(flows.size())],
                            .amount = eur(amount())});
        break;
      case 1:
        result = fx.engine().record_expense(
            record_expense_t{.actor = "ana",
                             .vault_id = vault,
                             .wallet_id = wallets[pick(wallets.size())],
                             .flow_id = flows[pick(flows.size())],
                             .amount = eur(amount())});
        break;
      case 2:
        result = move_between(fx, vault, wallets[pick(wallets.size())],
                              wallets[pick(wallets.size())], amount());
        break;
      case 3:
        result = fx.engine().transfer_flow(
            record_flow_transfer_t{.actor = "ana",
                                   .vault_id = vault,
                                   .from_flow_id = flows[pick(flows.size())],
                                   .to_flow_id = flows[pick(flows.size())],
                                   .amount = eur(amount())});
        break;
      case 4:
        if (posted.empty()) {
          continue;
        }
        result = fx.engine().record_refund(
            record_refund_t{.actor = "ana",
                            .vault_id = vault,
                            .original_id = posted[pick(posted.size())],
                            .amount = eur(amount() / 4 + 1)});
        break;
      default:
        if (posted.empty()) {
          continue;
        }
        result = fx.engine().void_transaction(
            void_transaction_t{.actor = "ana",
                               .vault_id = vault,
                               .transaction_id = posted[pick(posted.size())]});
        break;
    }

    if (result.ok()) {
      posted.push_back(result.value->id);
      continue;
    }
    const auto code = result.code();
    EXPECT_TRUE(code == ledger_error_code::same_wallet ||
                code == ledger_error_code::same_flow ||
                code == ledger_error_code::invalid_amount ||
                code == ledger_error_code::invalid_state ||
                code == ledger_error_code::already_voided)
        << to_string(code) << ": " << result.error->message;
  }

  auto report = fx.engine().verify_balances(
      verify_balances_t{.actor = "ana", .vault_id = vault});
  ASSERT_TRUE(report.ok());
  EXPECT_EQ(report.value->drifted, 0u);

  auto listed = fx.engine().list_transactions(
      transaction_filter_t{.actor = "ana",
                           .vault_id = vault,
                           .include_voided = true,
                           .include_transfers = true,
                           .limit = 10'000});
  ASSERT_TRUE(listed.ok());

  auto records = std::map<transaction_id_t, transaction_record_t>{};
  for (const auto& record : *listed.value) {
    records.emplace(record.id, record);
  }
  auto refunded = std::map<transaction_id_t, amount_minor_t>{};
  for (const auto& [id, record] : records) {
    if (!is_posted(record) || kind_of(record) != transaction_kind_t::refund) {
      continue;
    }
    const auto& original = std::get<refund_t>(record.payload).original_id;
    ASSERT_TRUE(records.contains(original));
    EXPECT_TRUE(is_posted(records.at(original)));
    EXPECT_NE(kind_of(records.at(original)), transaction_kind_t::refund);
    refunded[original] += record.amount;
  }
  for (const auto& [original, total] : refunded) {
    EXPECT_LE(total, records.at(original).amount);
  }
}

TEST(engine_resilience, concurrent_transfers_conserve_the_total) {
  auto fx = coffer::testing::ledger_fixture<>{};
  auto home = fx.create_vault("ana");
  auto spare = fx.create_vault("ana", "Spare");
  const auto vault = home.vault.id;
  const auto cash = home.wallets.front().id;
  const auto savings = fx.create_wallet("ana", vault, "Savings").id;
  ASSERT_TRUE(fx.engine()
                  .record_income(record_income_t{.actor = "ana",
                                                 .vault_id = vault,
                                                 .wallet_id = cash,
                                                 .amount = eur(100'000)})
                  .ok());

  constexpr auto kThreads = 4;
  constexpr auto kTransfersPerThread = 50;
  auto workers = std::vector<std::thread>{};
  for (auto t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t]() {
      for (auto i = 0; i < kTransfersPerThread; ++i) {
        auto forward = (i + t) % 2 == 0;
        auto result = move_between(fx, vault, forward ? cash : savings,
                                   forward ? savings : cash, 10 + t);
        EXPECT_TRUE(result.ok());
        auto other = fx.engine().record_income(
            record_income_t{.actor = "ana",
                            .vault_id = spare.vault.id,
                            .wallet_id = spare.wallets.front().id,
                            .amount = eur(1)});
        EXPECT_TRUE(other.ok());
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  EXPECT_EQ(wallet_total(fx, vault), 100'000);
  EXPECT_EQ(wallet_total(fx, spare.vault.id), kThreads * kTransfersPerThread);

  auto listed = fx.engine().list_transactions(
      transaction_filter_t{.actor = "ana",
                           .vault_id = vault,
                           .include_transfers = true,
                           .limit = 10'000});
  ASSERT_TRUE(listed.ok());
  EXPECT_EQ(listed.value->size(), 1u + kThreads * kTransfersPerThread);

  auto sequences = std::vector<uint64_t>{};
  for (const auto& record : *listed.value) {
    sequences.push_back(record.sequence);
  }
  std::ranges::sort(sequences);
  EXPECT_EQ(std::ranges::adjacent_find(sequences), std::end(sequences));

  auto report = fx.engine().verify_balances(
      verify_balances_t{.actor = "ana", .vault_id = vault});
  ASSERT_TRUE(report.ok());
  EXPECT_EQ(report.value->drifted, 0u);
}

TEST(engine_resilience, void_then_reissue_matches_a_single_posting) {
  auto reissued = coffer::testing::ledger_fixture<>{};
  auto single = coffer::testing::ledger_fixture<>{};

  struct books final {
    vault_id_t vault{};
    wallet_id_t cash{};
    flow_id_t food{};
    flow_id_t allowance{};
  };
  auto open_books = [](coffer::testing::ledger_fixture<>& fx) {
    auto view = fx.create_vault("ana");
    auto allowance = fx.engine().create_cash_flow(
        create_cash_flow_t{.actor = "ana",
                           .vault_id = view.vault.id,
                           .name = "Allowance",
                           .max_balance = 5000,
                           .income_capped = true});
    EXPECT_TRUE(allowance.ok());
    return books{.vault = view.vault.id,
                 .cash = view.wallets.front().id,
                 .food = fx.create_flow("ana", view.vault.id, "Food").id,
                 .allowance = allowance.value.value_or(cash_flow_state_t{}).id};
  };
  auto post = [](coffer::testing::ledger_fixture<>& fx, const books& b) {
    auto earned = fx.engine().record_income(record_income_t{.actor = "ana",
                                                            .vault_id = b.vault,
                                                            .wallet_id = b.cash,
                                                            .flow_id = b.allowance,
                                                            .amount = eur(1000)});
    auto spent = fx.engine().record_expense(record_expense_t{.actor = "ana",
                                                             .vault_id = b.vault,
                                                             .wallet_id = b.cash,
                                                             .flow_id = b.food,
                                                             .amount = eur(700)});
    EXPECT_TRUE(earned.ok());
    EXPECT_TRUE(spent.ok());
    return std::pair{earned.value.value_or(transaction_record_t{}).id,
                     spent.value.value_or(transaction_record_t{}).id};
  };

  auto a = open_books(reissued);
  auto first = post(reissued, a);
  for (const auto& id : {first.first, first.second}) {
    ASSERT_TRUE(reissued.engine()
                    .void_transaction(void_transaction_t{
                        .actor = "ana", .vault_id = a.vault, .transaction_id = id})
                    .ok());
  }
  post(reissued, a);

  auto b = open_books(single);
  post(single, b);

  EXPECT_EQ(reissued.wallet_balance("ana", a.vault, a.cash),
            single.wallet_balance("ana", b.vault, b.cash));
  EXPECT_EQ(reissued.flow_balance("ana", a.vault, a.food),
            single.flow_balance("ana", b.vault, b.food));
  EXPECT_EQ(reissued.flow_balance("ana", a.vault, a.allowance),
            single.flow_balance("ana", b.vault, b.allowance));

  auto income_of = [](coffer::testing::ledger_fixture<>& fx, const books& bk) {
    auto flow = fx.engine().get_cash_flow(cash_flow_query_t{
        .actor = "ana", .vault_id = bk.vault, .flow_id = bk.allowance});
    EXPECT_TRUE(flow.ok());
    return flow.ok() ? flow.value->income_balance : std::nullopt;
  };
  EXPECT_EQ(income_of(reissued, a), income_of(single, b));
  EXPECT_EQ(income_of(single, b), std::optional<amount_minor_t>{1000});

  for (auto* fx : {&reissued, &single}) {
    const auto& vault = fx == &reissued ? a.vault : b.vault;
    auto report = fx->engine().verify_balances(
        verify_balances_t{.actor = "ana", .vault_id = vault});
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report.value->drifted, 0u);
  }
}

TEST(engine_resilience, concurrent_voids_of_one_transaction_apply_once) {
  auto fx = coffer::testing::ledger_fixture<>{};
  auto home = fx.create_vault("ana");
  const auto vault = home.vault.id;
  const auto cash = home.wallets.front().id;
  const auto food = fx.create_flow("ana", vault, "Food").id;
  auto spent = fx.engine().record_expense(record_expense_t{.actor = "ana",
                                                           .vault_id = vault,
                                                           .wallet_id = cash,
                                                           .flow_id = food,
                                                           .amount = eur(250)});
  ASSERT_TRUE(spent.ok());
  const auto id = spent.value->id;

  constexpr auto kThreads = 8;
  auto codes = std::vector<ledger_error_code>(kThreads, ledger_error_code::ok);
  auto workers = std::vector<std::thread>{};
  for (auto t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t]() {
      codes[t] = fx.engine()
                     .void_transaction(void_transaction_t{
                         .actor = "ana", .vault_id = vault, .transaction_id = id})
                     .code();
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  EXPECT_EQ(std::ranges::count(codes, ledger_error_code::ok), 1);
  EXPECT_EQ(std::ranges::count(codes, ledger_error_code::already_voided),
            kThreads - 1);
  EXPECT_EQ(fx.wallet_balance("ana", vault, cash), 0);
  EXPECT_EQ(fx.flow_balance("ana", vault, food), 0);
  EXPECT_EQ(fx.engine().tracked_vault_locks(), 0u);
}
