#pragma once
#include <retail_lens/data/record_set.h>
#include <retail_lens/filter/filter_spec.h>

namespace retail_lens::filter {

class FilterEngine {
public:
  /**
   * Keeps the records satisfying every predicate of `spec`:
   * weekday in days, season in seasons, month in months,
   * date >= dateFrom and date <= dateTo.
   *
   * The result preserves the relative order of `records`. An empty result is
   * a normal outcome.
   */
  static data::RecordSet Apply(data::RecordSet const &records,
                               FilterSpec const &spec);
};

} // namespace retail_lens::filter
