#include <obligation/blake3/hash.hpp>

namespace obligation::blake3 {

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const obligation::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

obligation::schema::hash32_t hasher::finalize() const {
  // Finalizing does not consume the state, more input may follow.
  auto output = obligation::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

obligation::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

obligation::schema::hash32_t hash(
    const obligation::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace obligation::blake3
