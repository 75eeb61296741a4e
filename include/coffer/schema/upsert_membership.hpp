#pragma once
#include <coffer/schema/membership_role.hpp>
#include <coffer/schema/primitives.hpp>

// Schema type: membership commands.
// Vault-wide and flow-scoped grants. Require the manage capability.
namespace coffer::schema {

template <uint16_t Version>
struct upsert_vault_membership;

template <>
struct upsert_vault_membership<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  username_t username;
  membership_role_t role{membership_role_t::editor};
};

using upsert_vault_membership_t = upsert_vault_membership<1>;

template <uint16_t Version>
struct remove_vault_membership;

template <>
struct remove_vault_membership<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  username_t username;
};

using remove_vault_membership_t = remove_vault_membership<1>;

template <uint16_t Version>
struct upsert_flow_membership;

template <>
struct upsert_flow_membership<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  flow_id_t flow_id{};
  username_t username;
  membership_role_t role{membership_role_t::editor};
};

using upsert_flow_membership_t = upsert_flow_membership<1>;

template <uint16_t Version>
struct remove_flow_membership;

template <>
struct remove_flow_membership<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  flow_id_t flow_id{};
  username_t username;
};

using remove_flow_membership_t = remove_flow_membership<1>;

}  // namespace coffer::schema
