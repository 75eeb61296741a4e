#pragma once
#include <coffer/schema/currency.hpp>
#include <coffer/schema/primitives.hpp>

// Schema type: vault state.
// Sharing boundary for wallets, cash flows, memberships and transactions.
// next_sequence feeds child id derivation and transaction ordering.
namespace coffer::schema {

template <uint16_t Version>
struct vault_state;

template <>
struct vault_state<1> final {
  uint16_t version{1};
  vault_id_t id{};
  username_t owner;
  std::string name;
  currency_t currency{currency_t::eur};
  uint64_t next_sequence{};
  timestamp_milliseconds_t created_at{};
};

using vault_state_t = vault_state<1>;

}  // namespace coffer::schema
