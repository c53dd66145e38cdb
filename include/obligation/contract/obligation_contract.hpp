#pragma once

#include <obligation/schema/ledger_transaction.hpp>
#include <obligation/schema/primitives.hpp>
#include <obligation/schema/verification_result.hpp>
#include <string>
#include <string_view>

namespace obligation::contract {

/// Contract id the host registers the obligation contract under by default.
inline constexpr auto kObligationContractId =
    std::string_view{"obligation.contracts.IOUContract"};

inline constexpr auto kDispatchCodespace =
    std::string_view{"obligation.dispatch"};
inline constexpr auto kIssueCodespace = std::string_view{"obligation.issue"};
inline constexpr auto kTransferCodespace =
    std::string_view{"obligation.transfer"};
inline constexpr auto kSettleCodespace = std::string_view{"obligation.settle"};

// Rule texts are surfaced verbatim to operators and auditors. Do not reword.
namespace rules {

inline constexpr auto kSingleCommand = std::string_view{
    "Exactly one IOU command must be present in the transaction."};
inline constexpr auto kInvalidCommand = std::string_view{"Invalid Command"};

inline constexpr auto kIssueNoInputs = std::string_view{
    "No inputs should be consumed when issuing an IOU."};
inline constexpr auto kIssueOneOutput = std::string_view{
    "Only one output states should be created when issuing an IOU."};
inline constexpr auto kIssuePositiveAmount =
    std::string_view{"A newly issued IOU must have a positive amount."};
inline constexpr auto kIssueDistinctParties = std::string_view{
    "The lender and borrower cannot have the same identity."};
inline constexpr auto kIssueSigners = std::string_view{
    "Both lender and borrower together only may sign IOU issue transaction."};

inline constexpr auto kTransferOneInput = std::string_view{
    "An IOU transfer transaction should only consume one input states."};
inline constexpr auto kTransferOneOutput = std::string_view{
    "An IOU transfer transaction should only create one output states."};
inline constexpr auto kTransferOnlyLenderChanges =
    std::string_view{"Only the lender property may change."};
inline constexpr auto kTransferLenderChanges =
    std::string_view{"The lender property must change in a transfer."};
inline constexpr auto kTransferSigners = std::string_view{
    "The borrower, old lender and new lender only must sign an IOU transfer "
    "transaction"};

inline constexpr auto kSettleOneInput = std::string_view{
    "One input IOU should be consumed when settling an IOU."};
inline constexpr auto kSettleAtMostOneOutput =
    std::string_view{"No more than one output IOU should be created"};
inline constexpr auto kSettleOnlyPaidChanges = std::string_view{
    "Only the paid amount can change during part settlement."};
inline constexpr auto kSettlePaidIncreases = std::string_view{
    "The paid amount must increase in case of part settlement of the IOU."};
inline constexpr auto kSettlePaidBelowAmount = std::string_view{
    "The paid amount must be less than the total amount of the IOU"};
inline constexpr auto kSettleSigners = std::string_view{
    "Both lender and borrower must sign IOU settle transaction."};

}  // namespace rules

/// Verification rules for obligation records.
///
/// Three transitions are legal:
///  - issue: nothing consumed, one record produced, signed by exactly its
///    lender and borrower.
///  - transfer: one record consumed, one produced that differs only by
///    lender, signed by exactly the borrower, the old and the new lender.
///  - settle: one record consumed, and either one produced whose `paid`
///    grew but stays below `amount` (part settlement) or none at all (full
///    settlement), signed by exactly the lender and borrower.
///
/// Verification is a pure function of the transaction: no state is kept
/// between calls and the object may be shared across threads.
class obligation_contract final {
 public:
  explicit obligation_contract(
      std::string contract_id = std::string{kObligationContractId});

  /// Pick the single command addressed to this contract and apply the rules
  /// of its transition. Returns the first violated rule, in rule order.
  obligation::schema::verification_result_t verify(
      const obligation::schema::ledger_transaction_t& tx) const;

  obligation::schema::verification_result_t verify_issue(
      const obligation::schema::ledger_transaction_t& tx,
      const obligation::schema::signer_set_t& signers) const;

  obligation::schema::verification_result_t verify_transfer(
      const obligation::schema::ledger_transaction_t& tx,
      const obligation::schema::signer_set_t& signers) const;

  /// A settle with no output retires the obligation. That path does not
  /// check that `paid` reached `amount`; whoever builds the transaction is
  /// trusted to only retire an obligation that has been paid off.
  obligation::schema::verification_result_t verify_settle(
      const obligation::schema::ledger_transaction_t& tx,
      const obligation::schema::signer_set_t& signers) const;

  const std::string& contract_id() const { return contract_id_; }

 private:
  std::string contract_id_;
};

}  // namespace obligation::contract
