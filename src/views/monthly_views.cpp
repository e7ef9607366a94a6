#include "monthly_views.h"
#include "view_utils.h"

#include <retail_lens/aggregation/growth.h>
#include <spdlog/spdlog.h>

namespace retail_lens::views {

epoch_frame::DataFrame
MonthlyGrowthView::BuildTable(data::RecordSet const &records) const {
  const auto months = aggregation::MonthlySum(records, column::TOTAL_SALES);

  std::vector<double> sums;
  sums.reserve(months.size());
  for (auto const &month : months) {
    sums.push_back(month.value);
  }

  std::vector<epoch_frame::DateTime> monthStarts;
  std::vector<double> sales;
  std::vector<double> growth;
  for (auto const &step : aggregation::PeriodOverPeriodGrowth(sums)) {
    auto const &month = months[step.period];
    if (!step.IsDefined()) {
      SPDLOG_WARN("{}: no growth rate for {} ({})", GetId(),
                  calendar::FormatMonthBucket(month.key),
                  epoch_core::GrowthStatusWrapper::ToString(step.status));
      continue;
    }
    monthStarts.push_back(calendar::ToDateTime(month.key));
    sales.push_back(month.value);
    growth.push_back(step.pct);
  }

  return utils::MakeTable(monthStarts.size(),
                          {epoch_frame::factory::array::make_array(monthStarts),
                           epoch_frame::factory::array::make_array(sales),
                           epoch_frame::factory::array::make_array(growth)},
                          m_metadata.outputColumns);
}

epoch_frame::DataFrame
MonthlyComboView::BuildTable(data::RecordSet const &records) const {
  const auto traffic =
      aggregation::MonthlyMean(records, column::CUSTOMER_TRAFFIC);
  const auto conversion =
      aggregation::MonthlyMean(records, column::CONVERSION_RATE);

  // Both series group the same dates, so the months line up
  std::vector<epoch_frame::DateTime> monthStarts;
  std::vector<double> trafficMeans;
  std::vector<double> conversionMeans;
  for (size_t i = 0; i < traffic.size() && i < conversion.size(); ++i) {
    monthStarts.push_back(calendar::ToDateTime(traffic[i].key));
    trafficMeans.push_back(traffic[i].value);
    conversionMeans.push_back(conversion[i].value);
  }

  return utils::MakeTable(
      monthStarts.size(),
      {epoch_frame::factory::array::make_array(monthStarts),
       epoch_frame::factory::array::make_array(trafficMeans),
       epoch_frame::factory::array::make_array(conversionMeans)},
      m_metadata.outputColumns);
}

} // namespace retail_lens::views
