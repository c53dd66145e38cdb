#include <spdlog/spdlog.h>
#include <obligation/contract/obligation_contract.hpp>
#include <obligation/contract/requirements.hpp>
#include <algorithm>
#include <iterator>
#include <utility>
#include <vector>

using namespace obligation::schema;

namespace {

using code = obligation::schema::verification_error_code;

verification_result_t report(verification_result_t result) {
  if (accepted(result)) {
    spdlog::debug("[{}] transaction accepted", result.codespace);
  } else {
    spdlog::info("[{}] transaction rejected ({}): {}", result.codespace,
                 result.info, result.log);
  }
  return result;
}

}  // namespace

namespace obligation::contract {

obligation_contract::obligation_contract(std::string contract_id)
    : contract_id_{std::move(contract_id)} {}

verification_result_t obligation_contract::verify(
    const ledger_transaction_t& tx) const {
  auto matching = std::vector<const command_t*>{};
  for (const auto& command : tx.commands) {
    if (command.contract_id == contract_id_) {
      matching.push_back(&command);
    }
  }
  if (matching.size() != 1) {
    spdlog::debug("Found {} command(s) for contract '{}' among {}",
                  matching.size(), contract_id_, tx.commands.size());
    return report(make_rejected_result(code::malformed_intent,
                                       rules::kSingleCommand,
                                       kDispatchCodespace));
  }

  const auto& command = *matching.front();
  const auto signers = signer_set(command);
  switch (command.type) {
    case command_type_t::issue:
      return verify_issue(tx, signers);
    case command_type_t::transfer:
      return verify_transfer(tx, signers);
    case command_type_t::settle:
      return verify_settle(tx, signers);
  }
  spdlog::debug("Unknown command type {}",
                static_cast<uint32_t>(command.type));
  return report(make_rejected_result(code::unknown_intent,
                                     rules::kInvalidCommand,
                                     kDispatchCodespace));
}

verification_result_t obligation_contract::verify_issue(
    const ledger_transaction_t& tx,
    const signer_set_t& signers) const {
  auto checks = requirements{kIssueCodespace};
  checks
      .require(code::unexpected_input, rules::kIssueNoInputs,
               [&] { return tx.inputs.empty(); })
      .require(code::wrong_output_count, rules::kIssueOneOutput,
               [&] { return tx.outputs.size() == 1; })
      .require(code::non_positive_amount, rules::kIssuePositiveAmount,
               [&] { return tx.outputs.front().amount > 0; })
      .require(code::self_dealing, rules::kIssueDistinctParties,
               [&] {
                 const auto& output = tx.outputs.front();
                 return !same_identity(output.lender, output.borrower);
               })
      .require(code::insufficient_or_excess_signers, rules::kIssueSigners,
               [&] {
                 const auto keys = participant_keys(tx.outputs.front());
                 return std::includes(std::begin(signers), std::end(signers),
                                      std::begin(keys), std::end(keys)) &&
                        signers.size() == 2;
               });
  return report(checks.result());
}

verification_result_t obligation_contract::verify_transfer(
    const ledger_transaction_t& tx,
    const signer_set_t& signers) const {
  auto checks = requirements{kTransferCodespace};
  checks
      .require(code::wrong_input_count, rules::kTransferOneInput,
               [&] { return tx.inputs.size() == 1; })
      .require(code::wrong_output_count, rules::kTransferOneOutput,
               [&] { return tx.outputs.size() == 1; })
      .require(code::illegal_field_change, rules::kTransferOnlyLenderChanges,
               [&] {
                 const auto& input = tx.inputs.front();
                 const auto& output = tx.outputs.front();
                 return output.amount == input.amount &&
                        output.linear_id == input.linear_id &&
                        same_identity(output.borrower, input.borrower) &&
                        output.paid == input.paid;
               })
      .require(code::lender_unchanged, rules::kTransferLenderChanges,
               [&] {
                 return !same_identity(tx.outputs.front().lender,
                                       tx.inputs.front().lender);
               })
      .require(code::insufficient_or_excess_signers, rules::kTransferSigners,
               [&] {
                 // A new lender equal to the borrower or the old lender
                 // collapses the set and fails the size check.
                 auto required = participant_keys(tx.inputs.front());
                 required.insert(tx.outputs.front().lender.owning_key);
                 return signers == required && required.size() == 3;
               });
  return report(checks.result());
}

verification_result_t obligation_contract::verify_settle(
    const ledger_transaction_t& tx,
    const signer_set_t& signers) const {
  auto checks = requirements{kSettleCodespace};
  checks
      .require(code::wrong_input_count, rules::kSettleOneInput,
               [&] { return tx.inputs.size() == 1; })
      .require(code::wrong_output_count, rules::kSettleAtMostOneOutput,
               [&] { return tx.outputs.size() <= 1; });

  // Part settlement. With no output the obligation is retired as is, even
  // when `paid` is still short of `amount`.
  if (!checks.failed() && tx.outputs.size() == 1) {
    const auto& input = tx.inputs.front();
    const auto& output = tx.outputs.front();
    checks
        .require(code::illegal_field_change, rules::kSettleOnlyPaidChanges,
                 [&] {
                   return output.amount == input.amount &&
                          output.linear_id == input.linear_id &&
                          same_identity(output.borrower, input.borrower) &&
                          same_identity(output.lender, input.lender);
                 })
        .require(code::paid_did_not_increase, rules::kSettlePaidIncreases,
                 [&] { return output.paid > input.paid; })
        .require(code::overpayment_via_output, rules::kSettlePaidBelowAmount,
                 [&] { return output.paid < input.amount; });
  }

  checks.require(
      code::insufficient_or_excess_signers, rules::kSettleSigners,
      [&] { return signers == participant_keys(tx.inputs.front()); });
  return report(checks.result());
}

}  // namespace obligation::contract
