#pragma once
#include <coffer/schema/primitives.hpp>

#include <string>
#include <string_view>

// Schema type: category registry.
// Each vault keeps its own set of categories. Transactions carry the
// canonical category name; aliases resolve alternative spellings to it.
// Names and aliases share one case-folded namespace per vault.
namespace coffer::schema {

using category_id_t = hash32_t;

/// Reserved spelling meaning "no category".
inline constexpr std::string_view kUncategorizedName{"uncategorized"};

template <uint16_t Version>
struct category_state;

template <>
struct category_state<1> final {
  uint16_t version{1};
  category_id_t id{};
  vault_id_t vault_id{};
  std::string name;
  bool archived{false};
  timestamp_milliseconds_t created_at{};
};

using category_state_t = category_state<1>;

template <uint16_t Version>
struct category_alias;

template <>
struct category_alias<1> final {
  uint16_t version{1};
  vault_id_t vault_id{};
  category_id_t category_id{};
  std::string alias;
  timestamp_milliseconds_t created_at{};
};

using category_alias_t = category_alias<1>;

}  // namespace coffer::schema
