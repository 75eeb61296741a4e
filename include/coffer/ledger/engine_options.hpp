#pragma once
#include <coffer/schema/currency.hpp>
#include <coffer/schema/enum_string.hpp>
#include <coffer/schema/primitives.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace coffer::ledger {

/// What delete_vault does with a vault that still holds rows.
///
/// Only posted or voided transactions count as content. Wallets, cash flows,
/// memberships, flow grants, categories and aliases never block a delete:
/// under either policy they are removed together with the vault in the same
/// batch.
///
/// reject_if_not_empty ("reject"): refuse with invalid_state while any
/// transaction exists. A vault whose ledger was never used can always be
/// deleted, balances and structure included.
///
/// cascade: remove every vault-scoped row, transactions and refund links
/// included.
enum class vault_deletion_policy_t : uint8_t {
  reject_if_not_empty = 0,
  cascade = 1
};

inline constexpr auto kVaultDeletionPolicyMappings = std::array{
    std::pair<std::string_view, vault_deletion_policy_t>{
        "reject", vault_deletion_policy_t::reject_if_not_empty},
    std::pair<std::string_view, vault_deletion_policy_t>{
        "cascade", vault_deletion_policy_t::cascade}};

inline constexpr std::string_view to_string(
    const vault_deletion_policy_t value) {
  return coffer::schema::to_string(value, kVaultDeletionPolicyMappings)
      .value_or("unknown");
}

using time_source_t = std::function<coffer::schema::timestamp_milliseconds_t()>;

inline coffer::schema::timestamp_milliseconds_t system_time_now() {
  return static_cast<coffer::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

/// Deployment-level engine settings.
struct engine_options final {
  vault_deletion_policy_t deletion_policy{
      vault_deletion_policy_t::reject_if_not_empty};
  coffer::schema::currency_t default_currency{coffer::schema::currency_t::eur};
  std::string default_wallet_name{"Cash"};
  time_source_t now{system_time_now};
};

}  // namespace coffer::ledger

namespace coffer::schema {

template <>
inline std::optional<coffer::ledger::vault_deletion_policy_t>
try_from_string<coffer::ledger::vault_deletion_policy_t>(
    const std::string_view value) {
  return from_string(value, coffer::ledger::kVaultDeletionPolicyMappings);
}

}  // namespace coffer::schema
