#pragma once

#include <coffer/schema/currency.hpp>
#include <coffer/schema/primitives.hpp>

#include <compare>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace coffer::schema {

/// Raised by money arithmetic on mixed currencies or int64 overflow.
class money_error final : public std::runtime_error {
 public:
  enum class reason_t : uint8_t { currency_mismatch, overflow };

  money_error(reason_t reason, const std::string& message)
      : std::runtime_error{message}, reason_{reason} {}

  reason_t reason() const noexcept { return reason_; }

 private:
  reason_t reason_;
};

/// Signed amount in integer minor units tagged with its currency.
///
/// Positive values increase a balance, negative values decrease it. Every
/// balance change in the engine goes through this type so that mixing
/// currencies or overflowing the minor-unit range is caught instead of
/// silently wrapping.
class money_t final {
 public:
  constexpr money_t() = default;
  constexpr money_t(amount_minor_t minor, currency_t currency)
      : minor_{minor}, currency_{currency} {}

  constexpr amount_minor_t minor() const noexcept { return minor_; }
  constexpr currency_t currency() const noexcept { return currency_; }

  constexpr bool is_positive() const noexcept { return minor_ > 0; }
  constexpr bool is_zero() const noexcept { return minor_ == 0; }

  money_t operator+(const money_t& other) const;
  money_t operator-(const money_t& other) const;
  money_t operator-() const;
  money_t& operator+=(const money_t& other);
  money_t& operator-=(const money_t& other);

  constexpr bool operator==(const money_t& other) const = default;

  /// Ordering is only meaningful within one currency.
  std::strong_ordering operator<=>(const money_t& other) const;

  /// `<sign><major>.<minor> <CODE>`, e.g. `-12.34 EUR` or `500 JPY`.
  std::string format() const;

  /// Parse a major-unit decimal ("10", "10,5", "-0.01"). Rejects more
  /// fractional digits than the currency allows and values outside int64.
  static std::optional<money_t> parse_major(std::string_view input,
                                            currency_t currency);

  static constexpr money_t zero(currency_t currency) {
    return money_t{0, currency};
  }

 private:
  amount_minor_t minor_{};
  currency_t currency_{currency_t::eur};
};

}  // namespace coffer::schema
