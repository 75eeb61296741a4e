#pragma once
#include <coffer/schema/primitives.hpp>

namespace coffer::schema {

template <uint16_t Version>
struct void_transaction;

template <>
struct void_transaction<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  transaction_id_t transaction_id{};
};

using void_transaction_t = void_transaction<1>;

}  // namespace coffer::schema
