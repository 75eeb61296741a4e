#pragma once
#include <coffer/schema/currency.hpp>
#include <coffer/schema/primitives.hpp>

#include <optional>
#include <string>

namespace coffer::schema {

template <uint16_t Version>
struct create_vault;

/// Provision a vault owned by actor. Currency falls back to the configured
/// default when omitted.
template <>
struct create_vault<1> final {
  uint16_t version{1};
  username_t actor;
  std::string name;
  std::optional<currency_t> currency;
};

using create_vault_t = create_vault<1>;

template <uint16_t Version>
struct delete_vault;

template <>
struct delete_vault<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
};

using delete_vault_t = delete_vault<1>;

}  // namespace coffer::schema
