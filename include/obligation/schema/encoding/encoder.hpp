#pragma once
#include <obligation/schema/primitives.hpp>
#include <optional>

namespace obligation::schema::encoding {

// Encoding backend is picked at build time through the tag type; there is
// only a SCALE backend today.
template <typename Library>
struct encoder {
  template <typename T>
  obligation::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, obligation::schema::bytes_t& out);

  template <typename T>
  T decode(const obligation::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const obligation::schema::bytes_view_t& bytes);
};

}  // namespace obligation::schema::encoding
