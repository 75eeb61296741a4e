#pragma once
#include <coffer/schema/primitives.hpp>

#include <blake3.h>

#include <string_view>

namespace coffer::blake3 {

/// Incremental BLAKE3 state; finalize may be called more than once.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const coffer::schema::bytes_view_t& bytes);

  coffer::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

coffer::schema::hash32_t hash(const std::string_view& str);
coffer::schema::hash32_t hash(const coffer::schema::bytes_view_t& bytes);

}  // namespace coffer::blake3
