#pragma once
#include <coffer/schema/primitives.hpp>

#include <optional>
#include <string>

namespace coffer::schema {

template <uint16_t Version>
struct create_cash_flow;

/// max_balance left empty creates an unlimited flow. income_capped requires
/// max_balance.
template <>
struct create_cash_flow<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  std::string name;
  std::optional<amount_minor_t> max_balance;
  bool income_capped{false};
};

using create_cash_flow_t = create_cash_flow<1>;

template <uint16_t Version>
struct archive_cash_flow;

template <>
struct archive_cash_flow<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  flow_id_t flow_id{};
};

using archive_cash_flow_t = archive_cash_flow<1>;

template <uint16_t Version>
struct rename_cash_flow;

template <>
struct rename_cash_flow<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  flow_id_t flow_id{};
  std::string name;
};

using rename_cash_flow_t = rename_cash_flow<1>;

template <uint16_t Version>
struct set_cash_flow_mode;

/// Replace the cap of a flow. No max_balance means unlimited; income_capped
/// counts cumulative positive legs against max_balance instead of the
/// running balance.
template <>
struct set_cash_flow_mode<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  flow_id_t flow_id{};
  std::optional<amount_minor_t> max_balance;
  bool income_capped{false};
};

using set_cash_flow_mode_t = set_cash_flow_mode<1>;

}  // namespace coffer::schema
