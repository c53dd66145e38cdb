#pragma once

#include <obligation/schema/verification_error_code.hpp>
#include <obligation/schema/verification_result.hpp>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace obligation::contract {

/// Ordered list of named rule checks for one transition.
///
/// Rules are evaluated in the order `require` is called. The first rule whose
/// predicate returns false fixes the verdict and every later predicate is
/// skipped, so a predicate may rely on what earlier rules established (for
/// example that an output exists).
class requirements final {
 public:
  explicit requirements(std::string_view codespace);

  template <typename Predicate>
  requirements& require(const obligation::schema::verification_error_code code,
                        const std::string_view rule,
                        Predicate&& predicate) {
    if (failure_.has_value()) {
      return *this;
    }
    if (!std::invoke(std::forward<Predicate>(predicate))) {
      failure_ = violation{.code = code, .rule = rule};
    }
    return *this;
  }

  bool failed() const { return failure_.has_value(); }

  obligation::schema::verification_result_t result() const;

 private:
  struct violation final {
    obligation::schema::verification_error_code code;
    std::string_view rule;
  };

  std::string codespace_;
  std::optional<violation> failure_;
};

}  // namespace obligation::contract
