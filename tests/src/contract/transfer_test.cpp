#include <gtest/gtest.h>
#include <obligation/contract/obligation_contract.hpp>
#include <obligation/testing/common.hpp>
#include <obligation/testing/verification.hpp>

namespace {

using obligation::contract::obligation_contract;
using obligation::schema::command_type_t;
using obligation::schema::verification_error_code;
using obligation::testing::make_command;
using obligation::testing::make_state;
using obligation::testing::make_transaction;
namespace rules = obligation::contract::rules;

class transfer_test : public ::testing::Test {
 protected:
  obligation::testing::parties p;
  obligation_contract contract;
  obligation::schema::obligation_state_t input{
      make_state(100, p.alice, p.bob, 30)};

  obligation::schema::ledger_transaction_t transfer_to(
      const obligation::schema::obligation_state_t& output) const {
    return make_transaction(
        {input}, {output},
        {make_command(command_type_t::transfer,
                      {p.alice.owning_key, p.bob.owning_key,
                       p.charlie.owning_key})});
  }

  obligation::schema::ledger_transaction_t valid_transfer() const {
    return transfer_to(obligation::schema::with_new_lender(input, p.charlie));
  }
};

TEST_F(transfer_test, new_lender_signed_by_all_three_is_accepted) {
  EXPECT_TRUE(
      obligation::testing::is_accepted(contract.verify(valid_transfer())));
}

TEST_F(transfer_test, missing_input_is_rejected) {
  auto tx = valid_transfer();
  tx.inputs.clear();
  EXPECT_TRUE(obligation::testing::is_rejected(
      contract.verify(tx), verification_error_code::wrong_input_count,
      rules::kTransferOneInput));
}

TEST_F(transfer_test, two_inputs_are_rejected) {
  auto tx = valid_transfer();
  tx.inputs.push_back(input);
  EXPECT_TRUE(obligation::testing::is_rejected(
      contract.verify(tx), verification_error_code::wrong_input_count,
      rules::kTransferOneInput));
}

TEST_F(transfer_test, missing_output_is_rejected) {
  auto tx = valid_transfer();
  tx.outputs.clear();
  EXPECT_TRUE(obligation::testing::is_rejected(
      contract.verify(tx), verification_error_code::wrong_output_count,
      rules::kTransferOneOutput));
}

TEST_F(transfer_test, changing_amount_is_rejected) {
  auto output = obligation::schema::with_new_lender(input, p.charlie);
  output.amount = 150;
  EXPECT_TRUE(obligation::testing::is_rejected(
      contract.verify(transfer_to(output)),
      verification_error_code::illegal_field_change,
      rules::kTransferOnlyLenderChanges));
}

TEST_F(transfer_test, changing_borrower_is_rejected) {
  auto output = obligation::schema::with_new_lender(input, p.charlie);
  output.borrower = p.dana;
  EXPECT_TRUE(obligation::testing::is_rejected(
      contract.verify(transfer_to(output)),
      verification_error_code::illegal_field_change,
      rules::kTransferOnlyLenderChanges));
}

TEST_F(transfer_test, renaming_borrower_with_same_key_is_not_a_change) {
  auto output = obligation::schema::with_new_lender(input, p.charlie);
  output.borrower.name = "robert";
  EXPECT_TRUE(
      obligation::testing::is_accepted(contract.verify(transfer_to(output))));
}

TEST_F(transfer_test, changing_paid_is_rejected) {
  auto output = obligation::schema::with_new_lender(input, p.charlie);
  output.paid = 40;
  EXPECT_TRUE(obligation::testing::is_rejected(
      contract.verify(transfer_to(output)),
      verification_error_code::illegal_field_change,
      rules::kTransferOnlyLenderChanges));
}

TEST_F(transfer_test, changing_linear_id_is_rejected) {
  auto output = obligation::schema::with_new_lender(input, p.charlie);
  output.linear_id = obligation::testing::make_test_linear_id(99);
  EXPECT_TRUE(obligation::testing::is_rejected(
      contract.verify(transfer_to(output)),
      verification_error_code::illegal_field_change,
      rules::kTransferOnlyLenderChanges));
}

TEST_F(transfer_test, unchanged_lender_is_rejected) {
  auto tx = transfer_to(input);
  tx.commands.front().signers = {p.alice.owning_key, p.bob.owning_key};
  EXPECT_TRUE(obligation::testing::is_rejected(
      contract.verify(tx), verification_error_code::lender_unchanged,
      rules::kTransferLenderChanges));
}

TEST_F(transfer_test, missing_new_lender_signature_is_rejected) {
  auto tx = valid_transfer();
  tx.commands.front().signers = {p.alice.owning_key, p.bob.owning_key};
  EXPECT_TRUE(obligation::testing::is_rejected(
      contract.verify(tx),
      verification_error_code::insufficient_or_excess_signers,
      rules::kTransferSigners));
}

TEST_F(transfer_test, missing_old_lender_signature_is_rejected) {
  auto tx = valid_transfer();
  tx.commands.front().signers = {p.bob.owning_key, p.charlie.owning_key};
  EXPECT_TRUE(obligation::testing::is_rejected(
      contract.verify(tx),
      verification_error_code::insufficient_or_excess_signers,
      rules::kTransferSigners));
}

TEST_F(transfer_test, missing_borrower_signature_is_rejected) {
  auto tx = valid_transfer();
  tx.commands.front().signers = {p.alice.owning_key, p.charlie.owning_key};
  EXPECT_TRUE(obligation::testing::is_rejected(
      contract.verify(tx),
      verification_error_code::insufficient_or_excess_signers,
      rules::kTransferSigners));
}

TEST_F(transfer_test, extra_signer_is_rejected) {
  auto tx = valid_transfer();
  tx.commands.front().signers.push_back(p.dana.owning_key);
  EXPECT_TRUE(obligation::testing::is_rejected(
      contract.verify(tx),
      verification_error_code::insufficient_or_excess_signers,
      rules::kTransferSigners));
}

TEST_F(transfer_test, transfer_to_the_borrower_is_rejected) {
  auto tx = transfer_to(obligation::schema::with_new_lender(input, p.bob));
  tx.commands.front().signers = {p.alice.owning_key, p.bob.owning_key};
  EXPECT_TRUE(obligation::testing::is_rejected(
      contract.verify(tx),
      verification_error_code::insufficient_or_excess_signers,
      rules::kTransferSigners));
}

TEST_F(transfer_test, field_change_is_reported_before_unchanged_lender) {
  auto output = input;
  output.amount = 1;
  EXPECT_TRUE(obligation::testing::is_rejected(
      contract.verify(transfer_to(output)),
      verification_error_code::illegal_field_change,
      rules::kTransferOnlyLenderChanges));
}

TEST_F(transfer_test, unchanged_lender_is_reported_before_signers) {
  auto tx = transfer_to(input);
  tx.commands.front().signers.clear();
  EXPECT_TRUE(obligation::testing::is_rejected(
      contract.verify(tx), verification_error_code::lender_unchanged,
      rules::kTransferLenderChanges));
}

TEST_F(transfer_test, input_count_is_reported_before_output_count) {
  auto tx = valid_transfer();
  tx.inputs.clear();
  tx.outputs.clear();
  EXPECT_TRUE(obligation::testing::is_rejected(
      contract.verify(tx), verification_error_code::wrong_input_count,
      rules::kTransferOneInput));
}

}  // namespace
