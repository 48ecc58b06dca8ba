/* Fee aggregation over transfer steps. */
#pragma once

#include <span>

#include "transferroute/core/types.hpp"

namespace transferroute::core {

// Sum of step fees; absent fees count as zero. Empty input yields 0.
[[nodiscard]] Money total_fees(std::span<const TransferStep> steps) noexcept;

} // namespace transferroute::core
