#include <coffer/ledger/authorization.hpp>
#include <coffer/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <vector>

namespace {

using namespace coffer::schema;
using coffer::ledger::access_request_t;
using coffer::ledger::access_scope_t;
using coffer::ledger::access_subject_t;
using coffer::ledger::capability_t;
using coffer::testing::make_hash;

const auto kFlow = make_hash(30);
const auto kOtherFlow = make_hash(40);

vault_state_t make_vault() {
  auto vault = vault_state_t{};
  vault.id = make_hash(1);
  vault.owner = "ana";
  vault.name = "Home";
  return vault;
}

std::optional<vault_membership_t> member(membership_role_t role) {
  auto membership = vault_membership_t{};
  membership.username = "bob";
  membership.role = role;
  return membership;
}

flow_membership_t flow_grant(const flow_id_t& flow_id,
                             membership_role_t role) {
  auto grant = flow_membership_t{};
  grant.flow_id = flow_id;
  grant.username = "bob";
  grant.role = role;
  return grant;
}

access_request_t request(capability_t capability,
                         std::vector<leg_target_t> targets = {}) {
  return access_request_t{.capability = capability,
                          .targets = std::move(targets)};
}

}  // namespace

TEST(authorization, vault_owner_holds_every_capability) {
  auto vault = make_vault();
  auto subject = access_subject_t{.username = "ana", .vault = vault};
  for (auto capability :
       {capability_t::view, capability_t::report, capability_t::write,
        capability_t::manage, capability_t::delete_vault}) {
    auto grant = coffer::ledger::authorize(subject, request(capability));
    ASSERT_TRUE(grant.ok());
    EXPECT_EQ(grant.value->scope, access_scope_t::vault);
    EXPECT_EQ(grant.value->role, membership_role_t::owner);
  }
}

TEST(authorization, member_roles_follow_the_matrix) {
  auto vault = make_vault();
  struct expectation {
    membership_role_t role;
    capability_t capability;
    bool allowed;
  };
  auto matrix = std::vector<expectation>{
      {membership_role_t::owner, capability_t::manage, true},
      {membership_role_t::owner, capability_t::delete_vault, false},
      {membership_role_t::editor, capability_t::write, true},
      {membership_role_t::editor, capability_t::report, true},
      {membership_role_t::editor, capability_t::manage, false},
      {membership_role_t::viewer, capability_t::view, true},
      {membership_role_t::viewer, capability_t::report, true},
      {membership_role_t::viewer, capability_t::write, false}};
  for (const auto& row : matrix) {
    auto subject = access_subject_t{
        .username = "bob", .vault = vault, .membership = member(row.role)};
    auto grant = coffer::ledger::authorize(subject, request(row.capability));
    EXPECT_EQ(grant.ok(), row.allowed)
        << to_string(row.role) << " " << coffer::ledger::to_string(row.capability);
  }
}

TEST(authorization, outsiders_are_unauthorized) {
  auto vault = make_vault();
  auto subject = access_subject_t{.username = "eve", .vault = vault};
  auto grant = coffer::ledger::authorize(subject, request(capability_t::view));
  ASSERT_FALSE(grant.ok());
  EXPECT_EQ(grant.code(), ledger_error_code::unauthorized);
  EXPECT_EQ(grant.error->message,
            "eve lacks view access to vault " + short_id(vault.id));
}

TEST(authorization, flow_grants_cover_only_their_flows) {
  auto vault = make_vault();
  auto subject = access_subject_t{
      .username = "bob",
      .vault = vault,
      .flow_grants = {flow_grant(kFlow, membership_role_t::editor)}};

  auto vault_wide = coffer::ledger::authorize(subject, request(capability_t::view));
  ASSERT_TRUE(vault_wide.ok());
  EXPECT_EQ(vault_wide.value->scope, access_scope_t::flow);
  EXPECT_EQ(vault_wide.value->flows, (std::vector<flow_id_t>{kFlow}));

  EXPECT_TRUE(coffer::ledger::authorize(
                  subject, request(capability_t::write,
                                   {flow_target_t{.flow_id = kFlow}}))
                  .ok());
  EXPECT_FALSE(coffer::ledger::authorize(
                   subject, request(capability_t::write,
                                    {flow_target_t{.flow_id = kOtherFlow}}))
                   .ok());
  EXPECT_FALSE(coffer::ledger::authorize(
                   subject,
                   request(capability_t::write,
                           {flow_target_t{.flow_id = kFlow},
                            wallet_target_t{.wallet_id = make_hash(9)}}))
                   .ok());
  EXPECT_FALSE(
      coffer::ledger::authorize(subject, request(capability_t::write)).ok());
  EXPECT_FALSE(
      coffer::ledger::authorize(subject, request(capability_t::report)).ok());
  EXPECT_FALSE(
      coffer::ledger::authorize(subject, request(capability_t::manage)).ok());
}

TEST(authorization, flow_viewers_cannot_write) {
  auto vault = make_vault();
  auto subject = access_subject_t{
      .username = "bob",
      .vault = vault,
      .flow_grants = {flow_grant(kFlow, membership_role_t::viewer)}};
  EXPECT_TRUE(coffer::ledger::authorize(
                  subject, request(capability_t::view,
                                   {flow_target_t{.flow_id = kFlow}}))
                  .ok());
  EXPECT_FALSE(coffer::ledger::authorize(
                   subject, request(capability_t::write,
                                    {flow_target_t{.flow_id = kFlow}}))
                   .ok());
}

TEST(authorization, vault_viewer_with_flow_editor_grant_can_write_that_flow) {
  auto vault = make_vault();
  auto subject = access_subject_t{
      .username = "bob",
      .vault = vault,
      .membership = member(membership_role_t::viewer),
      .flow_grants = {flow_grant(kFlow, membership_role_t::editor)}};
  auto grant = coffer::ledger::authorize(
      subject,
      request(capability_t::write, {flow_target_t{.flow_id = kFlow}}));
  ASSERT_TRUE(grant.ok());
  EXPECT_EQ(grant.value->scope, access_scope_t::flow);
}
