#pragma once

#include <xpii/schema/error_code.hpp>

#include <string>
#include <utility>
#include <vector>

namespace xpii::common {

/// Failure detail filled in by fallible operations.
///
/// `failures` is only populated for `policy_denied`.
struct error final {
  xpii::schema::error_code code{xpii::schema::error_code::ok};
  std::string message;
  std::vector<std::string> failures;

  bool ok() const { return code == xpii::schema::error_code::ok; }
};

inline error make_error(const xpii::schema::error_code code,
                        std::string message) {
  return error{.code = code, .message = std::move(message), .failures = {}};
}

}  // namespace xpii::common
