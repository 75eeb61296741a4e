#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace coffer::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using vault_id_t = hash32_t;
using wallet_id_t = hash32_t;
using flow_id_t = hash32_t;
using transaction_id_t = hash32_t;
using amount_minor_t = int64_t;
using timestamp_milliseconds_t = uint64_t;
using username_t = std::string;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(std::string_view text);
bytes_view_t make_bytes_view(std::string_view text);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);

/// Parses an even-length hex string of either case.
std::optional<bytes_t> try_make_bytes(std::string_view hex);

/// Parses the 64-character lowercase or uppercase hex form of an id.
std::optional<hash32_t> try_make_hash32(std::string_view hex);

/// Short form used in log lines: first 8 hex characters.
std::string short_id(const hash32_t& hash);

}  // namespace coffer::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
