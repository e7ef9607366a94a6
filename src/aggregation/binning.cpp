#include <retail_lens/aggregation/binning.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <epoch_core/macros.h>
#include <fmt/format.h>

namespace retail_lens::aggregation {

std::optional<std::string> BinnedValues::LabelAt(size_t i) const {
  if (i >= assignment.size() || !assignment[i]) {
    return std::nullopt;
  }
  return bins[*assignment[i]].label;
}

std::vector<size_t> BinnedValues::Counts() const {
  std::vector<size_t> counts(bins.size(), 0);
  for (auto const &bin : assignment) {
    if (bin) {
      ++counts[*bin];
    }
  }
  return counts;
}

BinnedValues QuantizedBins(std::vector<double> const &values, size_t binCount) {
  AssertFromFormat(binCount > 0, "bin count must be positive");

  BinnedValues result;
  result.assignment.resize(values.size());

  double lo = std::numeric_limits<double>::infinity();
  double hi = -std::numeric_limits<double>::infinity();
  for (double v : values) {
    if (std::isfinite(v)) {
      lo = std::min(lo, v);
      hi = std::max(hi, v);
    }
  }
  if (lo > hi) {
    return result;
  }

  if (lo == hi) {
    lo -= lo != 0.0 ? 0.001 * std::abs(lo) : 0.001;
    hi += hi != 0.0 ? 0.001 * std::abs(hi) : 0.001;
  }

  const double bins = static_cast<double>(binCount);
  // hi - lo overflows for ranges wider than the largest double
  const bool finiteSpan = std::isfinite(hi - lo);
  const double width = finiteSpan ? (hi - lo) / bins : hi / bins - lo / bins;
  result.bins.reserve(binCount);
  for (size_t k = 0; k < binCount; ++k) {
    const double lower = k == 0 ? lo : lo + width * static_cast<double>(k);
    const double upper = k + 1 == binCount ? hi : lo + width * static_cast<double>(k + 1);
    result.bins.push_back(
        {lower, upper,
         fmt::format("{}{:.6g}, {:.6g}]", k == 0 ? '[' : '(', lower, upper)});
  }

  for (size_t i = 0; i < values.size(); ++i) {
    if (!std::isfinite(values[i])) {
      continue;
    }
    double offset = 0.0;
    if (std::isfinite(width)) {
      offset = finiteSpan ? (values[i] - lo) / width
                          : values[i] / width - lo / width;
    }
    const double position = std::ceil(offset) - 1.0;
    result.assignment[i] = static_cast<size_t>(
        std::clamp(position, 0.0, static_cast<double>(binCount - 1)));
  }
  return result;
}

} // namespace retail_lens::aggregation
