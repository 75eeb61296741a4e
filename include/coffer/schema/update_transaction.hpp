#pragma once
#include <coffer/schema/leg.hpp>
#include <coffer/schema/money.hpp>
#include <coffer/schema/primitives.hpp>
#include <coffer/schema/transaction_kind.hpp>

#include <optional>
#include <string>
#include <vector>

// Schema type: update transaction.
// note and category are the editable fields. amount, kind and participants
// may be echoed back unchanged; any difference is refused as immutable.
namespace coffer::schema {

template <uint16_t Version>
struct update_transaction;

template <>
struct update_transaction<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  transaction_id_t transaction_id{};
  std::optional<std::string> note;
  std::optional<std::string> category;
  bool clear_category{false};
  std::optional<money_t> amount;
  std::optional<transaction_kind_t> kind;
  std::optional<std::vector<leg_target_t>> participants;
};

using update_transaction_t = update_transaction<1>;

}  // namespace coffer::schema
