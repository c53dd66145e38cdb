#pragma once

#include <obligation/contract/obligation_contract.hpp>
#include <obligation/schema/ledger_transaction.hpp>
#include <obligation/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace obligation::testing {

inline obligation::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = obligation::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline obligation::schema::signer_id_t make_key(const uint8_t seed) {
  auto named = obligation::schema::named_signer_t{};
  named[0] = seed;
  return obligation::schema::signer_id_t{named};
}

inline obligation::schema::party_t make_party(const std::string_view name,
                                              const uint8_t seed) {
  return obligation::schema::party_t{.name = std::string{name},
                                     .owning_key = make_key(seed)};
}

inline obligation::schema::linear_id_t make_test_linear_id(
    const uint8_t seed) {
  return obligation::schema::linear_id_t{.external_id = std::nullopt,
                                         .id = make_hash(seed)};
}

inline obligation::schema::obligation_state_t make_state(
    const obligation::schema::amount_t amount,
    const obligation::schema::party_t& lender,
    const obligation::schema::party_t& borrower,
    const obligation::schema::amount_t paid = 0,
    const uint8_t linear_seed = 7) {
  auto state = obligation::schema::make_obligation_state(
      amount, lender, borrower, make_test_linear_id(linear_seed));
  state.paid = paid;
  return state;
}

inline obligation::schema::command_t make_command(
    const obligation::schema::command_type_t type,
    std::vector<obligation::schema::signer_id_t> signers,
    const std::string_view contract_id =
        obligation::contract::kObligationContractId) {
  return obligation::schema::command_t{.version = 1,
                                       .contract_id = std::string{contract_id},
                                       .type = type,
                                       .signers = std::move(signers)};
}

inline obligation::schema::ledger_transaction_t make_transaction(
    std::vector<obligation::schema::obligation_state_t> inputs,
    std::vector<obligation::schema::obligation_state_t> outputs,
    std::vector<obligation::schema::command_t> commands) {
  return obligation::schema::ledger_transaction_t{
      .version = 1,
      .inputs = std::move(inputs),
      .outputs = std::move(outputs),
      .commands = std::move(commands)};
}

/// Lender, borrower and a third party with distinct keys.
struct parties final {
  obligation::schema::party_t alice{make_party("alice", 1)};
  obligation::schema::party_t bob{make_party("bob", 2)};
  obligation::schema::party_t charlie{make_party("charlie", 3)};
  obligation::schema::party_t dana{make_party("dana", 4)};
};

}  // namespace obligation::testing
