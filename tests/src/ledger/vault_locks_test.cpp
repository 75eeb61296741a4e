#include <coffer/ledger/vault_locks.hpp>
#include <coffer/schema/key/engine_keys.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <thread>

using coffer::schema::key::make_vault_id;

TEST(vault_locks, entries_live_only_while_held) {
  auto locks = coffer::ledger::vault_locks{};
  EXPECT_EQ(locks.size(), 0u);
  {
    auto home = locks.acquire(make_vault_id(1));
    auto spare = locks.acquire(make_vault_id(2));
    EXPECT_EQ(locks.size(), 2u);
  }
  EXPECT_EQ(locks.size(), 0u);
}

TEST(vault_locks, size_stays_flat_across_many_vaults) {
  auto locks = coffer::ledger::vault_locks{};
  for (uint64_t i = 0; i < 10'000; ++i) {
    auto lock = locks.acquire(make_vault_id(i));
    EXPECT_TRUE(lock.lock.owns_lock());
  }
  EXPECT_EQ(locks.size(), 0u);
}

TEST(vault_locks, same_vault_writers_take_turns) {
  auto locks = coffer::ledger::vault_locks{};
  auto held = locks.acquire(make_vault_id(7));
  auto entered = std::atomic<bool>{false};
  auto waiter = std::thread{[&]() {
    auto lock = locks.acquire(make_vault_id(7));
    entered = true;
  }};
  // A writer on another vault is not held up.
  {
    auto other = locks.acquire(make_vault_id(8));
    EXPECT_TRUE(other.lock.owns_lock());
  }
  EXPECT_FALSE(entered.load());
  held.lock.unlock();
  waiter.join();
  EXPECT_TRUE(entered.load());
}
