#include <coffer/blake3/hash.hpp>

namespace coffer::blake3 {

hasher::hasher() { blake3_hasher_init(&state_); }

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const coffer::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

coffer::schema::hash32_t hasher::finalize() const {
  // BLAKE3_OUT_LEN
  auto output = coffer::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

coffer::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

coffer::schema::hash32_t hash(const coffer::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace coffer::blake3
