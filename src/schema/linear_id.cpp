#include <obligation/blake3/hash.hpp>
#include <obligation/schema/linear_id.hpp>
#include <utility>

namespace obligation::schema {

linear_id_t make_linear_id(std::optional<std::string> external_id,
                           const bytes_view_t& seed) {
  return linear_id_t{.external_id = std::move(external_id),
                     .id = obligation::blake3::hash(seed)};
}

std::string to_string(const linear_id_t& linear_id) {
  auto id = to_hex(bytes_view_t{linear_id.id.data(), linear_id.id.size()});
  if (linear_id.external_id) {
    return *linear_id.external_id + "_" + id;
  }
  return id;
}

}  // namespace obligation::schema
