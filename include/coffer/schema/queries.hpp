#pragma once
#include <coffer/schema/category_state.hpp>
#include <coffer/schema/primitives.hpp>

namespace coffer::schema {

struct vault_query_t final {
  username_t actor;
  vault_id_t vault_id{};
};

struct wallet_query_t final {
  username_t actor;
  vault_id_t vault_id{};
  wallet_id_t wallet_id{};
};

struct cash_flow_query_t final {
  username_t actor;
  vault_id_t vault_id{};
  flow_id_t flow_id{};
};

struct transaction_query_t final {
  username_t actor;
  vault_id_t vault_id{};
  transaction_id_t transaction_id{};
};

struct category_list_query_t final {
  username_t actor;
  vault_id_t vault_id{};
  bool include_archived{false};
};

struct category_alias_query_t final {
  username_t actor;
  vault_id_t vault_id{};
  category_id_t category_id{};
};

/// Replay posted legs and compare with stored balances; repair rewrites the
/// drifted ones.
struct verify_balances_t final {
  username_t actor;
  vault_id_t vault_id{};
  bool repair{false};
};

}  // namespace coffer::schema
