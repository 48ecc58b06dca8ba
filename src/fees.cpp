#include "transferroute/core/fees.hpp"

namespace transferroute::core {

Money total_fees(std::span<const TransferStep> steps) noexcept {
  Money total = 0.0;
  for (const auto& step : steps) {
    total += step.fee.value_or(0.0);
  }
  return total;
}

} // namespace transferroute::core
