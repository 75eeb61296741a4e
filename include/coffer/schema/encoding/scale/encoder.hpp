#pragma once
#include <coffer/common/critical.hpp>
#include <coffer/schema/encoding/encoder.hpp>
#include <coffer/schema/encoding/scale/enums.hpp>

#include <iterator>
#include <scale/scale.hpp>

// Persisted records are plain aggregates (integers, enums, strings,
// optionals, vectors, arrays, variants), so SCALE encodes them field by field
// without per-type codec functions.
namespace coffer::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  coffer::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, coffer::schema::bytes_t& out);

  template <typename T>
  std::optional<T> try_decode(const coffer::schema::bytes_view_t& bytes);
};

template <typename T>
coffer::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    coffer::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        coffer::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const coffer::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return std::move(decoded.value());
}

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace coffer::schema::encoding
