#include "weekday_views.h"
#include "view_utils.h"

namespace retail_lens::views {

epoch_frame::DataFrame
ConversionByDayView::BuildTable(data::RecordSet const &records) const {
  const auto groups = aggregation::GroupMean(records, column::DAY_OF_WEEK,
                                             column::CONVERSION_RATE,
                                             epoch_core::GroupOrder::Weekday);

  std::vector<std::string> days;
  std::vector<double> rates;
  std::vector<double> percents;
  for (auto const &group : groups) {
    days.push_back(group.key);
    rates.push_back(group.value);
    percents.push_back(group.value * 100.0);
  }

  return utils::MakeTable(groups.size(),
                          {epoch_frame::factory::array::make_array(days),
                           epoch_frame::factory::array::make_array(rates),
                           epoch_frame::factory::array::make_array(percents)},
                          m_metadata.outputColumns);
}

epoch_frame::DataFrame
MeatByDayView::BuildTable(data::RecordSet const &records) const {
  return utils::MakeLabelTable(
      aggregation::GroupMean(records, column::DAY_OF_WEEK, column::UNITS_MEATS,
                             epoch_core::GroupOrder::Weekday),
      column::DAY_OF_WEEK, column::UNITS_MEATS);
}

} // namespace retail_lens::views
