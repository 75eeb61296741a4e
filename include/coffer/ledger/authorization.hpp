#pragma once
#include <coffer/schema/enum_string.hpp>
#include <coffer/schema/leg.hpp>
#include <coffer/schema/ledger_error.hpp>
#include <coffer/schema/membership_role.hpp>
#include <coffer/schema/vault_membership.hpp>
#include <coffer/schema/vault_state.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace coffer::ledger {

enum class capability_t : uint8_t {
  view = 0,
  report = 1,
  write = 2,
  manage = 3,
  delete_vault = 4
};

inline constexpr auto kCapabilityMappings = std::array{
    std::pair<std::string_view, capability_t>{"view", capability_t::view},
    std::pair<std::string_view, capability_t>{"report", capability_t::report},
    std::pair<std::string_view, capability_t>{"write", capability_t::write},
    std::pair<std::string_view, capability_t>{"manage", capability_t::manage},
    std::pair<std::string_view, capability_t>{"delete_vault",
                                              capability_t::delete_vault}};

inline constexpr std::string_view to_string(const capability_t value) {
  return coffer::schema::to_string(value, kCapabilityMappings)
      .value_or("unknown");
}

enum class access_scope_t : uint8_t { vault = 0, flow = 1 };

/// Who is asking, with every grant they hold on the vault.
struct access_subject_t final {
  coffer::schema::username_t username;
  const coffer::schema::vault_state_t& vault;
  std::optional<coffer::schema::vault_membership_t> membership;
  std::vector<coffer::schema::flow_membership_t> flow_grants;
};

/// What is being asked for. targets lists every wallet and cash flow the
/// operation reads or moves; empty means vault-wide.
struct access_request_t final {
  capability_t capability{capability_t::view};
  std::vector<coffer::schema::leg_target_t> targets;
};

struct access_grant_t final {
  capability_t capability{capability_t::view};
  access_scope_t scope{access_scope_t::vault};
  coffer::schema::membership_role_t role{
      coffer::schema::membership_role_t::viewer};
  /// Flows visible through flow-scoped grants; empty for vault scope.
  std::vector<coffer::schema::flow_id_t> flows;
};

/// Single authorization gate for every engine operation.
///
/// Vault-wide grants are checked first: the vault owner holds every
/// capability, an owner-role member everything but delete_vault, an editor
/// view/report/write and a viewer view/report. Failing that, flow grants
/// allow view when a target (or, for vault-wide reads, any flow) is granted
/// and write when every target is a cash flow granted with a writing role.
/// Flow grants never cover wallets, reports or management.
coffer::schema::ledger_result<access_grant_t> authorize(
    const access_subject_t& subject,
    const access_request_t& request);

}  // namespace coffer::ledger
