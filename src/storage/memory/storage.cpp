#include <coffer/storage/memory/storage.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace coffer::storage {

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  if (!path.empty()) {
    spdlog::debug("memory storage ignores path {}", path);
  }
  return storage<memory_storage_tag>{};
}

std::optional<coffer::schema::bytes_t> storage<memory_storage_tag>::get(
    const coffer::schema::bytes_view_t& key) const {
  auto lock = std::shared_lock{mutex_};
  auto it = entries_.find(coffer::schema::make_bytes(key));
  if (it == std::end(entries_)) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<key_value_entry_t> storage<memory_storage_tag>::list_by_prefix(
    const coffer::schema::bytes_view_t& prefix) const {
  auto lock = std::shared_lock{mutex_};
  auto entries = std::vector<key_value_entry_t>{};
  for (auto it = entries_.lower_bound(coffer::schema::make_bytes(prefix));
       it != std::end(entries_); ++it) {
    const auto& key = it->first;
    if (key.size() < prefix.size() ||
        !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
      break;
    }
    entries.push_back(*it);
  }
  return entries;
}

void storage<memory_storage_tag>::commit(const write_batch_t& batch) {
  auto lock = std::unique_lock{mutex_};
  if (pending_failures_ > 0) {
    --pending_failures_;
    spdlog::debug("memory storage rejects batch of {} operations",
                  batch.size());
    throw storage_error{"injected commit failure"};
  }
  for (const auto& operation : batch.operations()) {
    if (operation.value) {
      entries_.insert_or_assign(operation.key, *operation.value);
    } else {
      entries_.erase(operation.key);
    }
  }
}

void storage<memory_storage_tag>::fail_next_commits(const std::size_t count) {
  auto lock = std::unique_lock{mutex_};
  pending_failures_ = count;
}

std::size_t storage<memory_storage_tag>::size() const {
  auto lock = std::shared_lock{mutex_};
  return entries_.size();
}

}  // namespace coffer::storage
