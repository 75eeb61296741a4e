#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace coffer::schema {

// Each enum exposes a constexpr table of {name, value} pairs. Names are the
// spellings used by the CLI, logs and error messages.
template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view name,
    const enum_mappings_t<Enum, N>& mappings) {
  auto it = std::ranges::find(mappings, name,
                              &std::pair<std::string_view, Enum>::first);
  if (it == std::end(mappings)) {
    return std::nullopt;
  }
  return it->second;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  auto it = std::ranges::find(mappings, value,
                              &std::pair<std::string_view, Enum>::second);
  if (it == std::end(mappings)) {
    return std::nullopt;
  }
  return it->first;
}

/// Specialized next to every enum that can be parsed.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view name);

}  // namespace coffer::schema
