#pragma once

#include <obligation/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: verification error code.
// One code per contract rule. Values are stable; 0 is reserved for an
// accepted transaction in `verification_result_t::code`.
namespace obligation::schema {

enum class verification_error_code : uint32_t {
  malformed_intent = 1,
  unknown_intent = 2,
  unexpected_input = 3,
  wrong_input_count = 4,
  wrong_output_count = 5,
  non_positive_amount = 6,
  self_dealing = 7,
  insufficient_or_excess_signers = 8,
  illegal_field_change = 9,
  lender_unchanged = 10,
  paid_did_not_increase = 11,
  overpayment_via_output = 12,
  unknown_contract = 20,
};

inline constexpr auto kVerificationErrorCodeMappings = enum_mappings_t<
    verification_error_code,
    13>{std::pair<std::string_view, verification_error_code>{
            "malformed_intent", verification_error_code::malformed_intent},
        std::pair<std::string_view, verification_error_code>{
            "unknown_intent", verification_error_code::unknown_intent},
        std::pair<std::string_view, verification_error_code>{
            "unexpected_input", verification_error_code::unexpected_input},
        std::pair<std::string_view, verification_error_code>{
            "wrong_input_count", verification_error_code::wrong_input_count},
        std::pair<std::string_view, verification_error_code>{
            "wrong_output_count", verification_error_code::wrong_output_count},
        std::pair<std::string_view, verification_error_code>{
            "non_positive_amount",
            verification_error_code::non_positive_amount},
        std::pair<std::string_view, verification_error_code>{
            "self_dealing", verification_error_code::self_dealing},
        std::pair<std::string_view, verification_error_code>{
            "insufficient_or_excess_signers",
            verification_error_code::insufficient_or_excess_signers},
        std::pair<std::string_view, verification_error_code>{
            "illegal_field_change",
            verification_error_code::illegal_field_change},
        std::pair<std::string_view, verification_error_code>{
            "lender_unchanged", verification_error_code::lender_unchanged},
        std::pair<std::string_view, verification_error_code>{
            "paid_did_not_increase",
            verification_error_code::paid_did_not_increase},
        std::pair<std::string_view, verification_error_code>{
            "overpayment_via_output",
            verification_error_code::overpayment_via_output},
        std::pair<std::string_view, verification_error_code>{
            "unknown_contract", verification_error_code::unknown_contract}};

template <>
inline std::optional<verification_error_code>
try_from_string<verification_error_code>(const std::string_view value) {
  return from_string(value, kVerificationErrorCodeMappings);
}

inline constexpr std::string_view to_string(
    const verification_error_code value) {
  return to_string(value, kVerificationErrorCodeMappings).value_or("unknown");
}

}  // namespace obligation::schema
