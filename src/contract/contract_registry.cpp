#include <spdlog/spdlog.h>
#include <obligation/contract/contract_registry.hpp>
#include <utility>

using namespace obligation::schema;

namespace obligation::contract {

bool contract_registry::register_contract(std::string contract_id,
                                          contract_verifier_t verifier) {
  if (verifiers_.contains(contract_id)) {
    spdlog::warn("Contract '{}' is already registered", contract_id);
    return false;
  }
  spdlog::debug("Registering contract '{}'", contract_id);
  verifiers_.emplace(std::move(contract_id), std::move(verifier));
  return true;
}

bool contract_registry::contains(const std::string_view contract_id) const {
  return verifiers_.find(contract_id) != std::end(verifiers_);
}

verification_result_t contract_registry::verify(
    const std::string_view contract_id,
    const ledger_transaction_t& tx) const {
  const auto id = transaction_id(tx);
  const auto id_hex = to_hex(bytes_view_t{id.data(), id.size()});

  auto it = verifiers_.find(contract_id);
  if (it == std::end(verifiers_)) {
    spdlog::warn("Transaction {} names unregistered contract '{}'", id_hex,
                 contract_id);
    return make_rejected_result(verification_error_code::unknown_contract,
                                kUnknownContract, kRegistryCodespace);
  }

  auto result = it->second(tx);
  if (accepted(result)) {
    spdlog::info("Transaction {} accepted by '{}'", id_hex, contract_id);
  } else {
    spdlog::info("Transaction {} rejected by '{}' [{}:{}]", id_hex,
                 contract_id, result.codespace, result.code);
  }
  return result;
}

bool register_obligation_contract(contract_registry& registry,
                                  const std::string_view contract_id) {
  auto contract = obligation_contract{std::string{contract_id}};
  return registry.register_contract(
      std::string{contract_id},
      [contract = std::move(contract)](const ledger_transaction_t& tx) {
        return contract.verify(tx);
      });
}

}  // namespace obligation::contract
