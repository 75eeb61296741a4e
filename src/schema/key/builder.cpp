#include <coffer/blake3/hash.hpp>
#include <coffer/schema/key/builder.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <ranges>
#include <stdexcept>

using namespace coffer::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const hash32_t& hash) {
  return write(std::span<const uint8_t>{hash.data(), hash.size()});
}

builder& builder::write_sized(const std::string_view& str) {
  if (str.size() > std::numeric_limits<uint16_t>::max()) {
    throw std::length_error{"key component exceeds 65535 bytes"};
  }
  write(static_cast<uint16_t>(str.size()));
  return write(str);
}

coffer::schema::hash32_t builder::digest() const {
  return coffer::blake3::hash(coffer::schema::bytes_view_t{data});
}
