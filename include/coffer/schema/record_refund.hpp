#pragma once
#include <coffer/schema/money.hpp>
#include <coffer/schema/primitives.hpp>

#include <optional>
#include <string>

namespace coffer::schema {

template <uint16_t Version>
struct record_refund;

/// Partially or fully reverse a posted transaction. The refund legs mirror
/// the original's targets with opposite sign, scaled to amount.
template <>
struct record_refund<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  transaction_id_t original_id{};
  money_t amount{};
  std::string note;
  std::optional<timestamp_milliseconds_t> occurred_at;
};

using record_refund_t = record_refund<1>;

}  // namespace coffer::schema
