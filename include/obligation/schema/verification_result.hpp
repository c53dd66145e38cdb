#pragma once

#include <obligation/schema/verification_error_code.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace obligation::schema {

template <uint16_t Version>
struct verification_result;

/// Verdict on one transaction.
///
/// `code` is 0 when accepted, otherwise a `verification_error_code`. `log`
/// holds the violated rule text verbatim, `info` the rule kind name and
/// `codespace` the transition (or registry) that rejected it.
template <>
struct verification_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
};

using verification_result_t = verification_result<1>;

verification_result_t make_accepted_result(std::string_view codespace);

verification_result_t make_rejected_result(verification_error_code code,
                                           std::string_view rule,
                                           std::string_view codespace);

bool accepted(const verification_result_t& result);

std::optional<verification_error_code> error_code(
    const verification_result_t& result);

}  // namespace obligation::schema
