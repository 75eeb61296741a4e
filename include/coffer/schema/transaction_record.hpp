#pragma once
#include <coffer/schema/currency.hpp>
#include <coffer/schema/leg.hpp>
#include <coffer/schema/primitives.hpp>
#include <coffer/schema/transaction_payload.hpp>
#include <coffer/schema/transaction_state.hpp>

#include <optional>
#include <string>
#include <vector>

// Schema type: transaction record.
// Stored once at post time. Afterwards only note, category, state and
// void_info are rewritten; payload, amount and legs never change.
namespace coffer::schema {

struct void_info_t final {
  timestamp_milliseconds_t voided_at{};
  username_t voided_by;
};

template <uint16_t Version>
struct transaction_record;

template <>
struct transaction_record<1> final {
  uint16_t version{1};
  transaction_id_t id{};
  vault_id_t vault_id{};
  uint64_t sequence{};
  transaction_payload_t payload{};
  amount_minor_t amount{};
  currency_t currency{currency_t::eur};
  timestamp_milliseconds_t occurred_at{};
  timestamp_milliseconds_t recorded_at{};
  std::string note;
  std::optional<std::string> category;
  username_t created_by;
  transaction_state_t state{transaction_state_t::posted};
  std::optional<void_info_t> void_info;
  std::vector<leg_t> legs;
};

using transaction_record_t = transaction_record<1>;

inline transaction_kind_t kind_of(const transaction_record_t& record) {
  return kind_of(record.payload);
}

inline bool is_posted(const transaction_record_t& record) {
  return record.state == transaction_state_t::posted;
}

}  // namespace coffer::schema
