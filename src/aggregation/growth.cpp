#include <retail_lens/aggregation/growth.h>

namespace retail_lens::aggregation {

std::vector<GrowthStep>
PeriodOverPeriodGrowth(std::vector<double> const &values) {
  std::vector<GrowthStep> steps;
  if (values.size() < 2) {
    return steps;
  }
  steps.reserve(values.size() - 1);

  for (size_t i = 1; i < values.size(); ++i) {
    const double previous = values[i - 1];
    const double current = values[i];
    if (!std::isfinite(previous) || !std::isfinite(current)) {
      steps.push_back({i, std::nan(""), epoch_core::GrowthStatus::Undefined});
    } else if (previous == 0.0) {
      steps.push_back({i, std::nan(""), epoch_core::GrowthStatus::ZeroBase});
    } else {
      steps.push_back({i, (current - previous) / previous * 100.0,
                       epoch_core::GrowthStatus::Defined});
    }
  }
  return steps;
}

} // namespace retail_lens::aggregation
