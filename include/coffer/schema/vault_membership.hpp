#pragma once
#include <coffer/schema/membership_role.hpp>
#include <coffer/schema/primitives.hpp>

namespace coffer::schema {

template <uint16_t Version>
struct vault_membership;

template <>
struct vault_membership<1> final {
  uint16_t version{1};
  vault_id_t vault_id{};
  username_t username;
  membership_role_t role{membership_role_t::viewer};
  username_t granted_by;
  timestamp_milliseconds_t granted_at{};
};

using vault_membership_t = vault_membership<1>;

/// Grant limited to a single cash flow of a vault.
template <uint16_t Version>
struct flow_membership;

template <>
struct flow_membership<1> final {
  uint16_t version{1};
  vault_id_t vault_id{};
  flow_id_t flow_id{};
  username_t username;
  membership_role_t role{membership_role_t::viewer};
  username_t granted_by;
  timestamp_milliseconds_t granted_at{};
};

using flow_membership_t = flow_membership<1>;

}  // namespace coffer::schema
