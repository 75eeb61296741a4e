#pragma once
#include <coffer/schema/money.hpp>
#include <coffer/schema/primitives.hpp>

#include <optional>
#include <string>

namespace coffer::schema {

template <uint16_t Version>
struct record_wallet_transfer;

template <>
struct record_wallet_transfer<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  wallet_id_t from_wallet_id{};
  wallet_id_t to_wallet_id{};
  money_t amount{};
  std::string note;
  std::optional<timestamp_milliseconds_t> occurred_at;
};

using record_wallet_transfer_t = record_wallet_transfer<1>;

template <uint16_t Version>
struct record_flow_transfer;

template <>
struct record_flow_transfer<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  flow_id_t from_flow_id{};
  flow_id_t to_flow_id{};
  money_t amount{};
  std::string note;
  std::optional<timestamp_milliseconds_t> occurred_at;
};

using record_flow_transfer_t = record_flow_transfer<1>;

}  // namespace coffer::schema
