#pragma once
#include <coffer/schema/leg.hpp>
#include <coffer/schema/primitives.hpp>
#include <coffer/schema/transaction_kind.hpp>
#include <coffer/schema/transaction_record.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Schema type: transaction filter.
// occurred_at window is [from, to). Without kinds, transfers are hidden
// unless include_transfers is set; with kinds, the allow-list decides.
// cursor continues a paged listing from the next_cursor of the previous page.
namespace coffer::schema {

inline constexpr std::size_t kDefaultTransactionListLimit = 100;

template <uint16_t Version>
struct transaction_filter;

template <>
struct transaction_filter<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  std::optional<timestamp_milliseconds_t> from;
  std::optional<timestamp_milliseconds_t> to;
  std::optional<std::vector<transaction_kind_t>> kinds;
  bool include_voided{false};
  bool include_transfers{false};
  std::optional<leg_target_t> target;
  std::size_t limit{kDefaultTransactionListLimit};
  std::optional<std::string> cursor;
};

using transaction_filter_t = transaction_filter<1>;

template <uint16_t Version>
struct transaction_page;

/// next_cursor is set only when more records follow.
template <>
struct transaction_page<1> final {
  uint16_t version{1};
  std::vector<transaction_record_t> records;
  std::optional<std::string> next_cursor;
};

using transaction_page_t = transaction_page<1>;

}  // namespace coffer::schema
