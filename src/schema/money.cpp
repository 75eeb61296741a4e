#include <coffer/schema/money.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <limits>

namespace coffer::schema {

namespace {

void require_same_currency(const money_t& lhs, const money_t& rhs) {
  if (lhs.currency() != rhs.currency()) {
    throw money_error{
        money_error::reason_t::currency_mismatch,
        fmt::format("currency mismatch: {} vs {}", to_string(lhs.currency()),
                    to_string(rhs.currency()))};
  }
}

constexpr auto kMinorMax = std::numeric_limits<amount_minor_t>::max();
constexpr auto kMinorMin = std::numeric_limits<amount_minor_t>::min();

amount_minor_t checked_add(const amount_minor_t lhs, const amount_minor_t rhs) {
  if ((rhs > 0 && lhs > kMinorMax - rhs) ||
      (rhs < 0 && lhs < kMinorMin - rhs)) {
    throw money_error{money_error::reason_t::overflow,
                      "money addition overflows minor-unit range"};
  }
  return lhs + rhs;
}

amount_minor_t checked_sub(const amount_minor_t lhs, const amount_minor_t rhs) {
  if ((rhs < 0 && lhs > kMinorMax + rhs) ||
      (rhs > 0 && lhs < kMinorMin + rhs)) {
    throw money_error{money_error::reason_t::overflow,
                      "money subtraction overflows minor-unit range"};
  }
  return lhs - rhs;
}

// Appends one decimal digit; false when the result leaves int64.
bool push_digit(amount_minor_t& total, const amount_minor_t digit) {
  if (total > (kMinorMax - digit) / 10) {
    return false;
  }
  total = (total * 10) + digit;
  return true;
}

std::string_view trim(std::string_view value) {
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.front())) != 0) {
    value.remove_prefix(1);
  }
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.back())) != 0) {
    value.remove_suffix(1);
  }
  return value;
}

bool all_digits(const std::string_view value) {
  return std::all_of(std::begin(value), std::end(value), [](const char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
  });
}

}  // namespace

template <>
std::optional<currency_t> try_from_string<currency_t>(std::string_view value) {
  value = trim(value);
  auto upper = std::string{value};
  std::transform(std::begin(upper), std::end(upper), std::begin(upper),
                 [](const unsigned char c) {
                   return static_cast<char>(std::toupper(c));
                 });
  return from_string(std::string_view{upper}, kCurrencyMappings);
}

money_t money_t::operator+(const money_t& other) const {
  require_same_currency(*this, other);
  return money_t{checked_add(minor_, other.minor_), currency_};
}

money_t money_t::operator-(const money_t& other) const {
  require_same_currency(*this, other);
  return money_t{checked_sub(minor_, other.minor_), currency_};
}

money_t money_t::operator-() const {
  return money_t{checked_sub(0, minor_), currency_};
}

money_t& money_t::operator+=(const money_t& other) {
  *this = *this + other;
  return *this;
}

money_t& money_t::operator-=(const money_t& other) {
  *this = *this - other;
  return *this;
}

std::strong_ordering money_t::operator<=>(const money_t& other) const {
  require_same_currency(*this, other);
  return minor_ <=> other.minor_;
}

std::string money_t::format() const {
  const auto* sign = minor_ < 0 ? "-" : "";
  // Negating INT64_MIN is undefined; widen through the unsigned magnitude.
  const auto magnitude =
      minor_ < 0 ? static_cast<uint64_t>(-(minor_ + 1)) + 1u
                 : static_cast<uint64_t>(minor_);
  const auto digits = minor_units(currency_);
  if (digits == 0) {
    return fmt::format("{}{} {}", sign, magnitude, to_string(currency_));
  }
  auto scale = uint64_t{1};
  for (auto i = 0; i < digits; ++i) {
    scale *= 10u;
  }
  return fmt::format("{}{}.{:0{}} {}", sign, magnitude / scale,
                     magnitude % scale, digits, to_string(currency_));
}

std::optional<money_t> money_t::parse_major(std::string_view input,
                                            const currency_t currency) {
  input = trim(input);
  if (input.empty()) {
    return std::nullopt;
  }

  auto negative = false;
  if (input.front() == '-' || input.front() == '+') {
    negative = input.front() == '-';
    input.remove_prefix(1);
    input = trim(input);
  }
  if (input.empty()) {
    return std::nullopt;
  }

  auto separator = input.find_first_of(".,");
  auto major = input.substr(0, separator);
  auto fraction = separator == std::string_view::npos
                      ? std::string_view{}
                      : input.substr(separator + 1);
  if (major.empty() || !all_digits(major) || !all_digits(fraction)) {
    return std::nullopt;
  }

  const auto digits = minor_units(currency);
  if (fraction.size() > digits) {
    return std::nullopt;
  }

  auto total = amount_minor_t{};
  for (const auto c : major) {
    if (!push_digit(total, amount_minor_t{c - '0'})) {
      return std::nullopt;
    }
  }
  for (auto i = std::size_t{0}; i < digits; ++i) {
    const auto digit =
        i < fraction.size() ? amount_minor_t{fraction[i] - '0'} : 0;
    if (!push_digit(total, digit)) {
      return std::nullopt;
    }
  }
  return money_t{negative ? -total : total, currency};
}

}  // namespace coffer::schema
