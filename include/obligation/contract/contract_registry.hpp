#pragma once

#include <obligation/contract/obligation_contract.hpp>
#include <obligation/schema/ledger_transaction.hpp>
#include <obligation/schema/verification_result.hpp>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace obligation::contract {

inline constexpr auto kRegistryCodespace =
    std::string_view{"obligation.registry"};
inline constexpr auto kUnknownContract = std::string_view{
    "No contract is registered under the requested contract id."};

using contract_verifier_t =
    std::function<obligation::schema::verification_result_t(
        const obligation::schema::ledger_transaction_t&)>;

/// Maps contract ids to their verifiers. Owned by the host; there is no
/// process wide instance.
class contract_registry final {
 public:
  /// Returns false and keeps the existing verifier if `contract_id` is taken.
  bool register_contract(std::string contract_id, contract_verifier_t verifier);

  bool contains(std::string_view contract_id) const;

  std::size_t size() const { return verifiers_.size(); }

  /// Run the verifier registered under `contract_id` against `tx`.
  obligation::schema::verification_result_t verify(
      std::string_view contract_id,
      const obligation::schema::ledger_transaction_t& tx) const;

 private:
  std::map<std::string, contract_verifier_t, std::less<>> verifiers_;
};

/// Register an `obligation_contract` that answers to `contract_id`.
bool register_obligation_contract(
    contract_registry& registry,
    std::string_view contract_id = kObligationContractId);

}  // namespace obligation::contract
