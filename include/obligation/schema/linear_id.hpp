#pragma once
#include <obligation/schema/primitives.hpp>
#include <optional>
#include <string>

namespace obligation::schema {

/// Identifier shared by every version of one logical obligation.
///
/// Only `id` takes part in equality; `external_id` is a caller supplied
/// label carried along for reference.
struct linear_id_t final {
  std::optional<std::string> external_id;
  hash32_t id{};

  friend bool operator==(const linear_id_t& lhs, const linear_id_t& rhs) {
    return lhs.id == rhs.id;
  }
};

/// Derive a linear id whose `id` is the BLAKE3 digest of `seed`.
linear_id_t make_linear_id(std::optional<std::string> external_id,
                           const bytes_view_t& seed);

std::string to_string(const linear_id_t& linear_id);

}  // namespace obligation::schema
