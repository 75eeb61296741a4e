#pragma once

#include <coffer/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: currency.
// Every vault carries exactly one currency; wallets, flows and amounts inside
// it must match.
namespace coffer::schema {

enum class currency_t : uint8_t { eur = 0, usd = 1, gbp = 2, chf = 3, jpy = 4 };

inline constexpr auto kCurrencyMappings =
    std::array{std::pair<std::string_view, currency_t>{"EUR", currency_t::eur},
               std::pair<std::string_view, currency_t>{"USD", currency_t::usd},
               std::pair<std::string_view, currency_t>{"GBP", currency_t::gbp},
               std::pair<std::string_view, currency_t>{"CHF", currency_t::chf},
               std::pair<std::string_view, currency_t>{"JPY", currency_t::jpy}};

/// Case-insensitive ISO code lookup ("eur", " USD ").
template <>
std::optional<currency_t> try_from_string<currency_t>(std::string_view value);

inline constexpr std::string_view to_string(const currency_t value) {
  return to_string(value, kCurrencyMappings).value_or("unknown");
}

/// Number of fraction digits between major and minor units.
constexpr uint8_t minor_units(const currency_t value) {
  switch (value) {
    case currency_t::jpy:
      return 0;
    case currency_t::eur:
    case currency_t::usd:
    case currency_t::gbp:
    case currency_t::chf:
      return 2;
  }
  return 2;
}

}  // namespace coffer::schema
