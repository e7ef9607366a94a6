#pragma once
#include <cmath>
#include <vector>

#include <epoch_core/enum_wrapper.h>

CREATE_ENUM(GrowthStatus,
            Defined,   // previous and current periods are finite, previous != 0
            ZeroBase,  // previous period is zero
            Undefined); // previous or current period is not a finite number

namespace retail_lens::aggregation {

struct GrowthStep {
  size_t period; // index into the input series, always >= 1
  double pct;    // NaN unless status is Defined
  epoch_core::GrowthStatus status;

  bool IsDefined() const { return status == epoch_core::GrowthStatus::Defined; }
};

/**
 * Period-over-period growth in percent:
 *   (values[i] - values[i-1]) / values[i-1] * 100   for i >= 1
 *
 * The first period has no history and produces no step. Steps whose rate
 * cannot be computed are still emitted, flagged ZeroBase or Undefined, so a
 * caller can tell them apart from missing history.
 */
std::vector<GrowthStep> PeriodOverPeriodGrowth(std::vector<double> const &values);

} // namespace retail_lens::aggregation
