#pragma once
#include <coffer/schema/primitives.hpp>
#include <coffer/schema/transaction_kind.hpp>

#include <optional>
#include <variant>

// Schema type: transaction payload.
// One alternative per transaction kind; the kind of a record is always
// derived from the alternative it holds.
namespace coffer::schema {

struct income_t final {
  wallet_id_t wallet_id{};
  std::optional<flow_id_t> flow_id;
};

struct expense_t final {
  wallet_id_t wallet_id{};
  std::optional<flow_id_t> flow_id;
};

struct refund_t final {
  transaction_id_t original_id{};
};

struct wallet_transfer_t final {
  wallet_id_t from_wallet_id{};
  wallet_id_t to_wallet_id{};
};

struct flow_transfer_t final {
  flow_id_t from_flow_id{};
  flow_id_t to_flow_id{};
};

using transaction_payload_t = std::variant<income_t,
                                           expense_t,
                                           refund_t,
                                           wallet_transfer_t,
                                           flow_transfer_t>;

inline transaction_kind_t kind_of(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const income_t&) { return transaction_kind_t::income; },
          [](const expense_t&) { return transaction_kind_t::expense; },
          [](const refund_t&) { return transaction_kind_t::refund; },
          [](const wallet_transfer_t&) {
            return transaction_kind_t::transfer_wallet;
          },
          [](const flow_transfer_t&) {
            return transaction_kind_t::transfer_flow;
          }},
      payload);
}

}  // namespace coffer::schema
