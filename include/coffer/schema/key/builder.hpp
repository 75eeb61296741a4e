#pragma once
#include <coffer/schema/primitives.hpp>

#include <boost/endian/conversion.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace coffer::schema::key {

/// Byte-string key assembler. Integers are written big-endian so that keys
/// sort by numeric value; variable-length text written with write_sized
/// carries a length prefix so that adjacent fields cannot alias.
struct builder final {
  coffer::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const hash32_t& hash);
  builder& write_sized(const std::string_view& str);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    auto raw = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), raw, raw + sizeof(T));
    return *this;
  }

  /// BLAKE3 digest of the bytes written so far.
  hash32_t digest() const;
};

}  // namespace coffer::schema::key
