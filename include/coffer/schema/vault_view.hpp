#pragma once
#include <coffer/schema/cash_flow_state.hpp>
#include <coffer/schema/vault_membership.hpp>
#include <coffer/schema/vault_state.hpp>
#include <coffer/schema/wallet_state.hpp>

#include <vector>

namespace coffer::schema {

template <uint16_t Version>
struct vault_view;

/// Vault aggregate as seen by one actor. Flow-scoped members only see the
/// flows they were granted.
template <>
struct vault_view<1> final {
  uint16_t version{1};
  vault_state_t vault;
  std::vector<wallet_state_t> wallets;
  std::vector<cash_flow_state_t> flows;
  std::vector<vault_membership_t> members;
  std::vector<flow_membership_t> flow_members;
};

using vault_view_t = vault_view<1>;

}  // namespace coffer::schema
