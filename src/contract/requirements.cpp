#include <obligation/contract/requirements.hpp>

namespace obligation::contract {

requirements::requirements(const std::string_view codespace)
    : codespace_{codespace} {}

obligation::schema::verification_result_t requirements::result() const {
  if (!failure_) {
    return obligation::schema::make_accepted_result(codespace_);
  }
  return obligation::schema::make_rejected_result(failure_->code,
                                                  failure_->rule, codespace_);
}

}  // namespace obligation::contract
