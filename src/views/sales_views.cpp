#include "sales_views.h"
#include "view_utils.h"

#include <numeric>

namespace retail_lens::views {

epoch_frame::DataFrame
DailySalesView::BuildTable(data::RecordSet const &records) const {
  const auto days = aggregation::DailySum(records, column::TOTAL_SALES);

  std::vector<epoch_frame::DateTime> dates;
  std::vector<double> sales;
  for (auto const &day : days) {
    dates.push_back(calendar::ToDateTime(day.key));
    sales.push_back(day.value);
  }

  return utils::MakeTable(days.size(),
                          {epoch_frame::factory::array::make_array(dates),
                           epoch_frame::factory::array::make_array(sales)},
                          m_metadata.outputColumns);
}

epoch_frame::DataFrame
CategoryShareView::BuildTable(data::RecordSet const &records) const {
  const auto shares =
      aggregation::CategoryShare(records, column::CATEGORY_UNITS);
  const double total = std::accumulate(
      shares.begin(), shares.end(), 0.0,
      [](double acc, auto const &share) { return acc + share.value; });

  std::vector<std::string> categories;
  std::vector<double> units;
  std::vector<double> percents;
  for (auto const &share : shares) {
    categories.push_back(share.key);
    units.push_back(share.value);
    percents.push_back(total != 0.0 ? share.value / total * 100.0 : 0.0);
  }

  return utils::MakeTable(shares.size(),
                          {epoch_frame::factory::array::make_array(categories),
                           epoch_frame::factory::array::make_array(units),
                           epoch_frame::factory::array::make_array(percents)},
                          m_metadata.outputColumns);
}

} // namespace retail_lens::views
