#include <coffer/common/critical.hpp>
#include <coffer/storage/rocksdb/storage.hpp>

namespace coffer::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    throw storage_error{"failed to open RocksDB at " + std::string{path}};
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

ROCKSDB_NAMESPACE::DB& storage<rocksdb_storage_tag>::opened(
    const std::string_view operation) const {
  if (!database) {
    coffer::common::critical("RocksDB {} attempted before the store was opened",
                             operation);
  }
  return *database;
}

std::optional<coffer::schema::bytes_t> storage<rocksdb_storage_tag>::get(
    const coffer::schema::bytes_view_t& key) const {
  auto value = std::string{};
  auto status = opened("get").Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    throw storage_error{"RocksDB get failed: " + status.ToString()};
  }
  return coffer::schema::make_bytes(value);
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const coffer::schema::bytes_view_t& prefix) const {

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_view = std::string_view{
      reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  // Iterators read from an implicit snapshot taken at creation.
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      opened("prefix scan").NewIterator(read_options)};
  iterator->Seek(detail::to_slice(prefix));
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_view)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB prefix scan failed: {}",
                  iterator->status().ToString());
    throw storage_error{"RocksDB prefix scan failed: " +
                        iterator->status().ToString()};
  }
  return entries;
}

void storage<rocksdb_storage_tag>::commit(const write_batch_t& batch) {

  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& operation : batch.operations()) {
    auto key = detail::to_slice(coffer::schema::bytes_view_t{operation.key});
    auto status =
        operation.value
            ? rocks_batch.Put(key, detail::to_slice(coffer::schema::bytes_view_t{
                                       *operation.value}))
            : rocks_batch.Delete(key);
    if (!status.ok()) {
      throw storage_error{"failed staging RocksDB write: " + status.ToString()};
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = opened("commit").Write(write_options, &rocks_batch);
  if (!status.ok()) {
    spdlog::error("RocksDB batch commit failed: {}", status.ToString());
    throw storage_error{"RocksDB batch commit failed: " + status.ToString()};
  }
}

}  // namespace coffer::storage
