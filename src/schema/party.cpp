#include <obligation/schema/party.hpp>

namespace obligation::schema {

bool same_identity(const party_t& lhs, const party_t& rhs) {
  return lhs.owning_key == rhs.owning_key;
}

std::string to_string(const party_t& party) {
  return party.name + "(" + to_string(party.owning_key) + ")";
}

}  // namespace obligation::schema
