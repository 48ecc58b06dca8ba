#pragma once

#include <stdexcept>
#include <string>

namespace transferroute::core {

// Raised by the selectors when the candidate batch has no routes.
struct EmptyBatchError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Raised when a route breaks one of its invariants (empty steps, negative
// fee, total_fees not matching the step fees, risk score out of range).
struct ValueError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace transferroute::core
