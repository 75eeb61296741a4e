#include <coffer/schema/encoding/scale/encoder.hpp>
#include <coffer/storage/memory/storage.hpp>
#include <coffer/storage/rocksdb/storage.hpp>
#include <coffer/storage/storage.hpp>
#include <coffer/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

using encoder_t = coffer::schema::encoding::scale_encoder_t;

coffer::schema::bytes_t key(const std::string_view text) {
  return coffer::schema::make_bytes(text);
}

coffer::schema::bytes_view_t view(const coffer::schema::bytes_t& bytes) {
  return coffer::schema::bytes_view_t{bytes};
}

// Shared behavior every backend must show.
template <typename Storage>
void exercise_backend(Storage& storage) {
  auto encoder = encoder_t{};

  auto batch = coffer::storage::write_batch_t{};
  batch.put(encoder, key("WALLET|a"), uint64_t{1});
  batch.put(encoder, key("WALLET|b"), uint64_t{2});
  batch.put(encoder, key("WALLETS"), uint64_t{3});
  batch.put(encoder, key("FLOW|a"), uint64_t{4});
  EXPECT_EQ(batch.size(), 4u);
  storage.commit(batch);

  auto value = storage.template get<uint64_t>(encoder, view(key("WALLET|b")));
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 2u);
  EXPECT_FALSE(storage.get(view(key("WALLET|c"))).has_value());

  auto listed = storage.list_by_prefix(view(key("WALLET|")));
  ASSERT_EQ(listed.size(), 2u);
  EXPECT_EQ(listed[0].first, key("WALLET|a"));
  EXPECT_EQ(listed[1].first, key("WALLET|b"));

  auto decoded = coffer::storage::list_decoded<uint64_t>(
      storage, encoder, view(key("WALLET")));
  // Byte order: "WALLETS" sorts before "WALLET|".
  EXPECT_EQ(decoded, (std::vector<uint64_t>{3, 1, 2}));

  auto removal = coffer::storage::write_batch_t{};
  removal.erase(key("WALLET|a"));
  removal.put(encoder, key("WALLET|b"), uint64_t{20});
  storage.commit(removal);
  EXPECT_FALSE(storage.get(view(key("WALLET|a"))).has_value());
  EXPECT_EQ(storage.template get<uint64_t>(encoder, view(key("WALLET|b"))),
            std::optional<uint64_t>{20});
}

}  // namespace

TEST(write_batch, records_operations_in_order) {
  auto batch = coffer::storage::write_batch_t{};
  EXPECT_TRUE(batch.empty());
  batch.put(key("a"), key("1"));
  batch.erase(key("b"));
  ASSERT_EQ(batch.size(), 2u);
  EXPECT_EQ(batch.operations()[0].key, key("a"));
  EXPECT_TRUE(batch.operations()[0].value.has_value());
  EXPECT_FALSE(batch.operations()[1].value.has_value());
}

TEST(memory_storage, commits_reads_and_lists) {
  auto storage = coffer::storage::make_storage<
      coffer::storage::memory_storage_tag>("");
  exercise_backend(storage);
  EXPECT_EQ(storage.size(), 3u);
}

TEST(memory_storage, undecodable_rows_raise_storage_error) {
  auto storage = coffer::storage::make_storage<
      coffer::storage::memory_storage_tag>("");
  auto batch = coffer::storage::write_batch_t{};
  batch.put(key("TX|x"), coffer::schema::bytes_t{0x01});
  storage.commit(batch);

  auto encoder = encoder_t{};
  EXPECT_THROW((void)storage.get<uint64_t>(encoder, view(key("TX|x"))),
               coffer::storage::storage_error);
}

TEST(memory_storage, injected_failures_reject_whole_batches) {
  auto storage = coffer::storage::make_storage<
      coffer::storage::memory_storage_tag>("");
  auto encoder = encoder_t{};
  auto batch = coffer::storage::write_batch_t{};
  batch.put(encoder, key("WALLET|a"), uint64_t{1});
  batch.put(encoder, key("WALLET|b"), uint64_t{2});

  storage.fail_next_commits(2);
  EXPECT_THROW(storage.commit(batch), coffer::storage::storage_error);
  EXPECT_THROW(storage.commit(batch), coffer::storage::storage_error);
  EXPECT_EQ(storage.size(), 0u);

  storage.commit(batch);
  EXPECT_EQ(storage.size(), 2u);
}

TEST(rocksdb_storage, commits_reads_and_lists) {
  auto db = coffer::testing::make_db_path("coffer_storage_rocksdb");
  {
    auto storage = coffer::storage::make_storage<
        coffer::storage::rocksdb_storage_tag>(db);
    exercise_backend(storage);
  }
  coffer::testing::remove_path(db);
}

TEST(rocksdb_storage, data_survives_reopen) {
  auto db = coffer::testing::make_db_path("coffer_storage_reopen");
  auto encoder = encoder_t{};
  {
    auto storage = coffer::storage::make_storage<
        coffer::storage::rocksdb_storage_tag>(db);
    auto batch = coffer::storage::write_batch_t{};
    batch.put(encoder, key("SYS|SEQ|VAULT"), uint64_t{9});
    storage.commit(batch);
  }
  {
    auto storage = coffer::storage::make_storage<
        coffer::storage::rocksdb_storage_tag>(db);
    EXPECT_EQ(storage.get<uint64_t>(encoder, view(key("SYS|SEQ|VAULT"))),
              std::optional<uint64_t>{9});
  }
  coffer::testing::remove_path(db);
}
