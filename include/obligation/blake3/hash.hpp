#pragma once
#include <blake3.h>
#include <obligation/schema/primitives.hpp>
#include <string_view>

namespace obligation::blake3 {

/// Incremental BLAKE3 digest over several pieces of input.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const obligation::schema::bytes_view_t& bytes);

  obligation::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

obligation::schema::hash32_t hash(const std::string_view& str);
obligation::schema::hash32_t hash(
    const obligation::schema::bytes_view_t& bytes);

}  // namespace obligation::blake3
