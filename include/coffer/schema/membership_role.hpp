#pragma once

#include <coffer/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: membership role.
// Grants on a vault or on a single cash flow: owner manages members, editor
// records transactions, viewer only reads.
namespace coffer::schema {

enum class membership_role_t : uint8_t { owner = 0, editor = 1, viewer = 2 };

inline constexpr auto kMembershipRoleMappings = std::array{
    std::pair<std::string_view, membership_role_t>{"owner",
                                                   membership_role_t::owner},
    std::pair<std::string_view, membership_role_t>{"editor",
                                                   membership_role_t::editor},
    std::pair<std::string_view, membership_role_t>{"viewer",
                                                   membership_role_t::viewer}};

template <>
inline std::optional<membership_role_t> try_from_string<membership_role_t>(
    const std::string_view value) {
  return from_string(value, kMembershipRoleMappings);
}

inline constexpr std::string_view to_string(const membership_role_t value) {
  return to_string(value, kMembershipRoleMappings).value_or("unknown");
}

constexpr bool can_write(const membership_role_t role) {
  return role == membership_role_t::owner || role == membership_role_t::editor;
}

}  // namespace coffer::schema
