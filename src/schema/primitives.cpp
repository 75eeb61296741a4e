#include <coffer/schema/primitives.hpp>

#include <algorithm>
#include <cstddef>

namespace coffer::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};

int nibble_of(const char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{bytes.begin(), bytes.end()};
}

bytes_t make_bytes(const std::string_view text) {
  auto view = make_bytes_view(text);
  return bytes_t{view.begin(), view.end()};
}

bytes_view_t make_bytes_view(const std::string_view text) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(text.data()),
                      text.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{make_string_view(bytes)};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kHexDigits[byte >> 4u]);
    out.push_back(kHexDigits[byte & 0x0Fu]);
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash});
}

std::optional<bytes_t> try_make_bytes(const std::string_view hex) {
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  auto bytes = bytes_t(hex.size() / 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    auto high = nibble_of(hex[2 * i]);
    auto low = nibble_of(hex[(2 * i) + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    bytes[i] = static_cast<uint8_t>((high << 4) | low);
  }
  return bytes;
}

std::optional<hash32_t> try_make_hash32(const std::string_view hex) {
  auto hash = hash32_t{};
  if (hex.size() != hash.size() * 2) {
    return std::nullopt;
  }
  auto bytes = try_make_bytes(hex);
  if (!bytes) {
    return std::nullopt;
  }
  std::ranges::copy(*bytes, std::begin(hash));
  return hash;
}

std::string short_id(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash}.first(4));
}

}  // namespace coffer::schema
