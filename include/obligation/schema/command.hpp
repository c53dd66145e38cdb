#pragma once
#include <obligation/schema/command_type.hpp>
#include <obligation/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace obligation::schema {

template <uint16_t Version>
struct command;

/// Intent marker addressed to one contract, with the keys that authorised
/// it.
template <>
struct command<1> final {
  uint16_t version{1};
  std::string contract_id;
  command_type_t type{};
  std::vector<signer_id_t> signers;
};

using command_t = command<1>;

/// Signers of `command` with duplicates collapsed.
signer_set_t signer_set(const command_t& command);

}  // namespace obligation::schema
