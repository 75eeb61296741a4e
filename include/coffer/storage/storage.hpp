#pragma once
#include <coffer/schema/primitives.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace coffer::storage {

using key_value_entry_t =
    std::pair<coffer::schema::bytes_t, coffer::schema::bytes_t>;

/// Raised by a backend when a read or commit cannot be completed, and by the
/// typed accessors when a stored value cannot be decoded.
class storage_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// A single put (value set) or delete (value empty) inside a write batch.
struct write_operation_t final {
  coffer::schema::bytes_t key;
  std::optional<coffer::schema::bytes_t> value;
};

/// Ordered set of writes applied all-or-nothing by storage::commit.
class write_batch_t final {
 public:
  void put(coffer::schema::bytes_t key, coffer::schema::bytes_t value) {
    operations_.push_back(
        write_operation_t{.key = std::move(key), .value = std::move(value)});
  }

  template <typename Encoder, typename T>
  void put(Encoder& encoder, coffer::schema::bytes_t key, const T& value) {
    put(std::move(key), encoder.encode(value));
  }

  void erase(coffer::schema::bytes_t key) {
    operations_.push_back(
        write_operation_t{.key = std::move(key), .value = std::nullopt});
  }

  const std::vector<write_operation_t>& operations() const {
    return operations_;
  }
  bool empty() const { return operations_.empty(); }
  std::size_t size() const { return operations_.size(); }

 private:
  std::vector<write_operation_t> operations_;
};

template <typename Library>
struct storage {
  /// Raw value at key, or std::nullopt when missing.
  std::optional<coffer::schema::bytes_t> get(
      const coffer::schema::bytes_view_t& key) const;

  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const coffer::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const coffer::schema::bytes_view_t& prefix) const;

  /// Apply every operation in batch atomically.
  void commit(const write_batch_t& batch);
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

namespace detail {

template <typename T, typename Encoder>
T decode_or_throw(Encoder& encoder,
                  const coffer::schema::bytes_view_t& key,
                  const coffer::schema::bytes_view_t& value) {
  auto decoded = encoder.template try_decode<T>(value);
  if (!decoded) {
    throw storage_error{"undecodable record at key " +
                        coffer::schema::to_hex(key)};
  }
  return std::move(decoded.value());
}

}  // namespace detail

/// Decode every value under prefix. Undecodable rows raise storage_error.
template <typename T, typename Encoder, typename Storage>
std::vector<T> list_decoded(const Storage& store,
                            Encoder& encoder,
                            const coffer::schema::bytes_view_t& prefix) {
  auto out = std::vector<T>{};
  for (const auto& [key, value] : store.list_by_prefix(prefix)) {
    out.push_back(detail::decode_or_throw<T>(
        encoder, coffer::schema::bytes_view_t{key},
        coffer::schema::bytes_view_t{value}));
  }
  return out;
}

}  // namespace coffer::storage
