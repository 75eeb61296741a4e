#include <coffer/ledger/vault_locks.hpp>

#include <algorithm>

namespace coffer::ledger {

vault_lock_t vault_locks::acquire(const coffer::schema::vault_id_t& vault_id) {
  auto mutex = std::shared_ptr<std::mutex>{};
  {
    auto registry_lock = std::scoped_lock{registry_mutex_};
    prune();
    auto& entry = mutexes_[vault_id];
    mutex = entry.lock();
    if (!mutex) {
      mutex = std::make_shared<std::mutex>();
      entry = mutex;
    }
  }
  auto lock = std::unique_lock{*mutex};
  return vault_lock_t{.mutex = std::move(mutex), .lock = std::move(lock)};
}

std::size_t vault_locks::size() const {
  auto registry_lock = std::scoped_lock{registry_mutex_};
  return static_cast<std::size_t>(
      std::ranges::count_if(mutexes_, [](const auto& entry) {
        return !entry.second.expired();
      }));
}

// Caller holds registry_mutex_.
void vault_locks::prune() {
  std::erase_if(mutexes_,
                [](const auto& entry) { return entry.second.expired(); });
}

}  // namespace coffer::ledger
