#pragma once
#include <optional>
#include <string>
#include <vector>

namespace retail_lens::aggregation {

struct Bin {
  double lower;
  double upper;
  std::string label;
};

struct BinnedValues {
  std::vector<Bin> bins;
  // Bin index per input value; nullopt for NaN or infinite inputs
  std::vector<std::optional<size_t>> assignment;

  std::optional<std::string> LabelAt(size_t i) const;

  // Number of values per bin
  std::vector<size_t> Counts() const;
};

/**
 * Splits [min(values), max(values)] into `binCount` equal-width bins.
 *
 * Bins are right-closed, except the first which also includes its lower
 * edge, so the minimum falls in the first bin and the maximum in the last.
 * When every value is equal the range is widened by 0.1% on each side
 * (0.001 around zero). Throws when `binCount` is zero.
 */
BinnedValues QuantizedBins(std::vector<double> const &values, size_t binCount);

} // namespace retail_lens::aggregation
