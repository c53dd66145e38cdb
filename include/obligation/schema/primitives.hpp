#pragma once
#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace obligation::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using amount_t = int64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key;

  auto operator<=>(const ed25519_signer_id&) const = default;
};

struct secp256k1_signer_id final {
  std::array<uint8_t, 33> public_key;

  auto operator<=>(const secp256k1_signer_id&) const = default;
};

using named_signer_t = hash32_t;  // On ledger identity reference

/// Owning key of a party. Authentication happens before verification, so
/// the verifier only ever compares keys.
using signer_id_t =
    std::variant<ed25519_signer_id, secp256k1_signer_id, named_signer_t>;

using signer_set_t = std::set<signer_id_t>;

std::string to_string(const signer_id_t& signer);

}  // namespace obligation::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
