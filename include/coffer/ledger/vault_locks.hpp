#pragma once
#include <coffer/schema/primitives.hpp>

#include <map>
#include <memory>
#include <mutex>

namespace coffer::ledger {

/// Exclusive hold on one vault. The shared_ptr keeps the mutex alive for as
/// long as the lock exists; the registry itself only observes it.
struct vault_lock_t final {
  std::shared_ptr<std::mutex> mutex;
  std::unique_lock<std::mutex> lock;
};

/// Registry of per-vault mutexes. Writers to different vaults never contend.
///
/// Entries are weak: a vault's mutex lives exactly as long as some caller
/// holds or waits for it, and expired entries are pruned on every acquire.
/// The registry therefore stays bounded by the number of in-flight writers,
/// whatever ids callers pass in.
class vault_locks final {
 public:
  vault_lock_t acquire(const coffer::schema::vault_id_t& vault_id);

  /// Number of vaults whose mutex is currently held or awaited.
  std::size_t size() const;

 private:
  void prune();

  mutable std::mutex registry_mutex_;
  std::map<coffer::schema::vault_id_t, std::weak_ptr<std::mutex>> mutexes_;
};

}  // namespace coffer::ledger
