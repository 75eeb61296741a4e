#pragma once
#include <coffer/storage/storage.hpp>

#include <map>
#include <shared_mutex>
#include <string_view>

// Ordered in-process backend. Readers share the lock, commit takes it
// exclusively, so a batch is never observed half-applied. Commits can be
// told to fail, which lets callers exercise their store_failure paths
// without a broken disk.
namespace coffer::storage {

struct memory_storage_tag {};

template <>
struct storage<memory_storage_tag> final {
  std::optional<coffer::schema::bytes_t> get(
      const coffer::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const coffer::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const coffer::schema::bytes_view_t& prefix) const;

  /// Throws storage_error without applying anything while injected
  /// failures remain.
  void commit(const write_batch_t& batch);

  /// Reject the next count commits.
  void fail_next_commits(std::size_t count);

  std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::map<coffer::schema::bytes_t, coffer::schema::bytes_t> entries_;
  std::size_t pending_failures_{0};
};

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<memory_storage_tag>::get(
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
