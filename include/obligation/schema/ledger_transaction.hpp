#pragma once
#include <obligation/schema/command.hpp>
#include <obligation/schema/obligation_state.hpp>
#include <obligation/schema/primitives.hpp>
#include <cstdint>
#include <vector>

namespace obligation::schema {

template <uint16_t Version>
struct ledger_transaction;

/// Fully resolved transaction handed to contract verification. Inputs are
/// the records consumed, outputs the records produced.
template <>
struct ledger_transaction<1> final {
  uint16_t version{1};
  std::vector<obligation_state_t> inputs;
  std::vector<obligation_state_t> outputs;
  std::vector<command_t> commands;
};

using ledger_transaction_t = ledger_transaction<1>;

/// BLAKE3 digest of the SCALE encoding. Used to name a transaction in logs.
hash32_t transaction_id(const ledger_transaction_t& tx);

}  // namespace obligation::schema
