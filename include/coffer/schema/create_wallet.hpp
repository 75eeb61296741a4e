#pragma once
#include <coffer/schema/primitives.hpp>

#include <string>

namespace coffer::schema {

template <uint16_t Version>
struct create_wallet;

template <>
struct create_wallet<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  std::string name;
};

using create_wallet_t = create_wallet<1>;

template <uint16_t Version>
struct archive_wallet;

template <>
struct archive_wallet<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  wallet_id_t wallet_id{};
};

using archive_wallet_t = archive_wallet<1>;

template <uint16_t Version>
struct rename_wallet;

template <>
struct rename_wallet<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  wallet_id_t wallet_id{};
  std::string name;
};

using rename_wallet_t = rename_wallet<1>;

}  // namespace coffer::schema
