#pragma once
#include <coffer/schema/currency.hpp>
#include <coffer/schema/primitives.hpp>

namespace coffer::schema {

template <uint16_t Version>
struct wallet_state;

template <>
struct wallet_state<1> final {
  uint16_t version{1};
  wallet_id_t id{};
  vault_id_t vault_id{};
  std::string name;
  amount_minor_t balance{};
  currency_t currency{currency_t::eur};
  bool archived{false};
  timestamp_milliseconds_t created_at{};
};

using wallet_state_t = wallet_state<1>;

}  // namespace coffer::schema
