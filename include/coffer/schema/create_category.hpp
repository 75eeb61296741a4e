#pragma once
#include <coffer/schema/category_state.hpp>
#include <coffer/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: category registry commands.
namespace coffer::schema {

template <uint16_t Version>
struct create_category;

template <>
struct create_category<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  std::string name;
};

using create_category_t = create_category<1>;

template <uint16_t Version>
struct update_category;

/// Rename and/or (un)archive. A rename is carried onto every transaction
/// filed under the old name.
template <>
struct update_category<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  category_id_t category_id{};
  std::optional<std::string> name;
  std::optional<bool> archived;
};

using update_category_t = update_category<1>;

template <uint16_t Version>
struct merge_category;

/// Fold from into into: transactions and aliases move over, from's name
/// becomes an alias of into and from is archived.
template <>
struct merge_category<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  category_id_t from_category_id{};
  category_id_t into_category_id{};
};

using merge_category_t = merge_category<1>;

template <uint16_t Version>
struct create_category_alias;

template <>
struct create_category_alias<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  category_id_t category_id{};
  std::string alias;
};

using create_category_alias_t = create_category_alias<1>;

template <uint16_t Version>
struct delete_category_alias;

template <>
struct delete_category_alias<1> final {
  uint16_t version{1};
  username_t actor;
  vault_id_t vault_id{};
  category_id_t category_id{};
  std::string alias;
};

using delete_category_alias_t = delete_category_alias<1>;

}  // namespace coffer::schema
