#pragma once
#include <obligation/common/critical.hpp>
#include <obligation/schema/command.hpp>
#include <obligation/schema/encoding/encoder.hpp>
#include <obligation/schema/ledger_transaction.hpp>
#include <obligation/schema/linear_id.hpp>
#include <obligation/schema/obligation_state.hpp>
#include <obligation/schema/party.hpp>
#include <obligation/schema/verification_result.hpp>
#include <iterator>
#include <scale/scale.hpp>

// Schema records are plain aggregates of integers, strings, fixed arrays,
// optionals, variants and vectors, so the SCALE library encodes them field
// by field in declaration order. Reordering a field changes the wire format.
namespace obligation::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  obligation::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, obligation::schema::bytes_t& out);

  template <typename T>
  T decode(const obligation::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const obligation::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
obligation::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    obligation::common::critical("failed to encode SCALE object");
  }
  return obligation::schema::bytes_t{std::begin(encoded.value()),
                                     std::end(encoded.value())};
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        obligation::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const obligation::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    obligation::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const obligation::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace obligation::schema::encoding
