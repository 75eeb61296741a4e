#pragma once
#include <coffer/schema/primitives.hpp>

#include <optional>

namespace coffer::schema::encoding {

// Encoding backend is chosen at build time through the tag type; the engine
// and storage layers only see this interface.
template <typename Library>
struct encoder {
  template <typename T>
  coffer::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, coffer::schema::bytes_t& out);

  template <typename T>
  std::optional<T> try_decode(const coffer::schema::bytes_view_t& bytes);
};

}  // namespace coffer::schema::encoding
