#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <coffer/storage/storage.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace coffer::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const coffer::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline coffer::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<coffer::schema::bytes_t> get(
      const coffer::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const coffer::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const coffer::schema::bytes_view_t& prefix) const;

  void commit(const write_batch_t& batch);

 private:
  ROCKSDB_NAMESPACE::DB& opened(std::string_view operation) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const coffer::schema::bytes_view_t& key) const {
  auto raw = get(key);
  if (!raw) {
    return std::nullopt;
  }
  return detail::decode_or_throw<T>(encoder, key,
                                    coffer::schema::bytes_view_t{*raw});
}

}  // namespace coffer::storage
