#include <coffer/ledger/authorization.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace coffer::ledger {

using namespace coffer::schema;

namespace {

bool role_allows(membership_role_t role, capability_t capability) {
  switch (capability) {
    case capability_t::view:
    case capability_t::report:
      return true;
    case capability_t::write:
      return can_write(role);
    case capability_t::manage:
      return role == membership_role_t::owner;
    case capability_t::delete_vault:
      return false;
  }
  return false;
}

const flow_membership_t* find_grant(
    const std::vector<flow_membership_t>& grants,
    const flow_id_t& flow_id) {
  auto it = std::ranges::find(grants, flow_id, &flow_membership_t::flow_id);
  return it == std::end(grants) ? nullptr : &*it;
}

ledger_result<access_grant_t> deny(const access_subject_t& subject,
                                   const access_request_t& request) {
  return ledger_result<access_grant_t>::failure(ledger_error_t{
      .code = ledger_error_code::unauthorized,
      .entity = ledger_entity_t::vault,
      .field = "actor",
      .message = fmt::format("{} lacks {} access to vault {}", subject.username,
                             to_string(request.capability),
                             short_id(subject.vault.id))});
}

ledger_result<access_grant_t> authorize_flow_scope(
    const access_subject_t& subject,
    const access_request_t& request) {
  if (subject.flow_grants.empty()) {
    return deny(subject, request);
  }

  auto grant = access_grant_t{.capability = request.capability,
                              .scope = access_scope_t::flow,
                              .role = membership_role_t::viewer,
                              .flows = {}};
  for (const auto& flow_grant : subject.flow_grants) {
    grant.flows.push_back(flow_grant.flow_id);
  }

  switch (request.capability) {
    case capability_t::view: {
      if (request.targets.empty()) {
        return ledger_result<access_grant_t>::success(std::move(grant));
      }
      auto visible = std::ranges::any_of(
          request.targets, [&](const leg_target_t& target) {
            const auto* flow = std::get_if<flow_target_t>(&target);
            return flow != nullptr &&
                   find_grant(subject.flow_grants, flow->flow_id) != nullptr;
          });
      if (!visible) {
        return deny(subject, request);
      }
      return ledger_result<access_grant_t>::success(std::move(grant));
    }
    case capability_t::write: {
      if (request.targets.empty()) {
        return deny(subject, request);
      }
      auto role = membership_role_t::owner;
      for (const auto& target : request.targets) {
        const auto* flow = std::get_if<flow_target_t>(&target);
        if (flow == nullptr) {
          return deny(subject, request);
        }
        const auto* flow_grant = find_grant(subject.flow_grants, flow->flow_id);
        if (flow_grant == nullptr || !can_write(flow_grant->role)) {
          return deny(subject, request);
        }
        if (flow_grant->role == membership_role_t::editor) {
          role = membership_role_t::editor;
        }
      }
      grant.role = role;
      return ledger_result<access_grant_t>::success(std::move(grant));
    }
    case capability_t::report:
    case capability_t::manage:
    case capability_t::delete_vault:
      return deny(subject, request);
  }
  return deny(subject, request);
}

}  // namespace

ledger_result<access_grant_t> authorize(const access_subject_t& subject,
                                        const access_request_t& request) {
  if (subject.username == subject.vault.owner) {
    return ledger_result<access_grant_t>::success(
        access_grant_t{.capability = request.capability,
                       .scope = access_scope_t::vault,
                       .role = membership_role_t::owner,
                       .flows = {}});
  }
  if (subject.membership &&
      role_allows(subject.membership->role, request.capability)) {
    return ledger_result<access_grant_t>::success(
        access_grant_t{.capability = request.capability,
                       .scope = access_scope_t::vault,
                       .role = subject.membership->role,
                       .flows = {}});
  }
  return authorize_flow_scope(subject, request);
}

}  // namespace coffer::ledger
