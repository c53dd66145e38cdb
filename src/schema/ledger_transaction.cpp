#include <obligation/blake3/hash.hpp>
#include <obligation/schema/encoding/scale/encoder.hpp>
#include <obligation/schema/ledger_transaction.hpp>

namespace obligation::schema {

hash32_t transaction_id(const ledger_transaction_t& tx) {
  auto encoder = encoding::scale_encoder_t{};
  auto encoded = encoder.encode(tx);
  return obligation::blake3::hash(bytes_view_t{encoded.data(), encoded.size()});
}

}  // namespace obligation::schema
