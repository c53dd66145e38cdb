#include <obligation/schema/verification_result.hpp>

namespace obligation::schema {

verification_result_t make_accepted_result(const std::string_view codespace) {
  auto result = verification_result_t{};
  result.code = 0;
  result.codespace = std::string{codespace};
  return result;
}

verification_result_t make_rejected_result(const verification_error_code code,
                                           const std::string_view rule,
                                           const std::string_view codespace) {
  auto result = verification_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{rule};
  result.info = std::string{to_string(code)};
  result.codespace = std::string{codespace};
  return result;
}

bool accepted(const verification_result_t& result) {
  return result.code == 0;
}

std::optional<verification_error_code> error_code(
    const verification_result_t& result) {
  if (accepted(result)) {
    return std::nullopt;
  }
  return static_cast<verification_error_code>(result.code);
}

}  // namespace obligation::schema
