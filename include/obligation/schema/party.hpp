#pragma once
#include <obligation/schema/primitives.hpp>
#include <string>

// Schema type: party.
// A ledger identity holding an owning key. The name is a display label; every
// identity comparison goes through the owning key.
namespace obligation::schema {

struct party_t final {
  std::string name;
  signer_id_t owning_key{};
};

bool same_identity(const party_t& lhs, const party_t& rhs);

std::string to_string(const party_t& party);

}  // namespace obligation::schema
