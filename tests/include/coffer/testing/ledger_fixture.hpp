#pragma once

#include <coffer/ledger/engine.hpp>
#include <coffer/schema/encoding/scale/encoder.hpp>
#include <coffer/storage/memory/storage.hpp>
#include <coffer/testing/common.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <optional>
#include <string>
#include <string_view>

namespace coffer::testing {

/// Engine over a private store with a deterministic clock. Each call to the
/// clock advances it by one second from kEpoch.
template <typename StorageTag = coffer::storage::memory_storage_tag>
class ledger_fixture final {
 public:
  using engine_t = coffer::ledger::engine<StorageTag>;
  using storage_t = coffer::storage::storage<StorageTag>;

  static constexpr coffer::schema::timestamp_milliseconds_t kEpoch =
      1'700'000'000'000;

  explicit ledger_fixture(coffer::ledger::engine_options options = {})
      : storage_{coffer::storage::make_storage<StorageTag>("")},
        engine_{encoder_, storage_, with_clock(std::move(options))} {}

  ledger_fixture(const ledger_fixture&) = delete;
  ledger_fixture& operator=(const ledger_fixture&) = delete;
  ledger_fixture(ledger_fixture&&) = delete;
  ledger_fixture& operator=(ledger_fixture&&) = delete;

  coffer::schema::encoding::scale_encoder_t& encoder() { return encoder_; }
  storage_t& storage() { return storage_; }
  engine_t& engine() { return engine_; }

  /// Creates a vault owned by owner and returns its view; fails the test on
  /// rejection.
  coffer::schema::vault_view_t create_vault(const std::string& owner,
                                            const std::string& name = "Home") {
    auto result = engine_.create_vault(
        coffer::schema::create_vault_t{.actor = owner, .name = name});
    EXPECT_TRUE(result.ok());
    return result.value.value_or(coffer::schema::vault_view_t{});
  }

  coffer::schema::cash_flow_state_t create_flow(
      const std::string& actor,
      const coffer::schema::vault_id_t& vault_id,
      const std::string& name) {
    auto result = engine_.create_cash_flow(coffer::schema::create_cash_flow_t{
        .actor = actor, .vault_id = vault_id, .name = name});
    EXPECT_TRUE(result.ok());
    return result.value.value_or(coffer::schema::cash_flow_state_t{});
  }

  coffer::schema::wallet_state_t create_wallet(
      const std::string& actor,
      const coffer::schema::vault_id_t& vault_id,
      const std::string& name) {
    auto result = engine_.create_wallet(coffer::schema::create_wallet_t{
        .actor = actor, .vault_id = vault_id, .name = name});
    EXPECT_TRUE(result.ok());
    return result.value.value_or(coffer::schema::wallet_state_t{});
  }

  coffer::schema::amount_minor_t wallet_balance(
      const std::string& actor,
      const coffer::schema::vault_id_t& vault_id,
      const coffer::schema::wallet_id_t& wallet_id) {
    auto result = engine_.get_wallet(coffer::schema::wallet_query_t{
        .actor = actor, .vault_id = vault_id, .wallet_id = wallet_id});
    EXPECT_TRUE(result.ok());
    return result.ok() ? result.value->balance : 0;
  }

  coffer::schema::amount_minor_t flow_balance(
      const std::string& actor,
      const coffer::schema::vault_id_t& vault_id,
      const coffer::schema::flow_id_t& flow_id) {
    auto result = engine_.get_cash_flow(coffer::schema::cash_flow_query_t{
        .actor = actor, .vault_id = vault_id, .flow_id = flow_id});
    EXPECT_TRUE(result.ok());
    return result.ok() ? result.value->balance : 0;
  }

  coffer::schema::timestamp_milliseconds_t now() const {
    return kEpoch + (ticks_.load() * 1000);
  }

 private:
  coffer::ledger::engine_options with_clock(
      coffer::ledger::engine_options options) {
    options.now = [this]() { return kEpoch + (++ticks_ * 1000); };
    return options;
  }

  coffer::schema::encoding::scale_encoder_t encoder_{};
  storage_t storage_;
  std::atomic<uint64_t> ticks_{0};
  engine_t engine_;
};

}  // namespace coffer::testing
