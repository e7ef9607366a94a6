#include "promo_views.h"
#include "view_utils.h"

#include <map>
#include <retail_lens/aggregation/binning.h>

namespace retail_lens::views {

epoch_frame::DataFrame
PromoTrafficRankingView::BuildTable(data::RecordSet const &records) const {
  return utils::MakeLabelTable(
      aggregation::GroupMean(records, column::PROMO_TYPE,
                             column::CUSTOMER_TRAFFIC,
                             epoch_core::GroupOrder::ValueDescending),
      column::PROMO_TYPE, column::CUSTOMER_TRAFFIC);
}

epoch_frame::DataFrame
PromoTrafficDensityView::BuildTable(data::RecordSet const &records) const {
  const auto promos = records.Labels(column::PROMO_TYPE);
  const auto binned = aggregation::QuantizedBins(
      records.Measures(column::CUSTOMER_TRAFFIC), m_options.densityBins);

  std::vector<std::string> promoOrder;
  std::map<std::string, std::vector<int64_t>> counts;
  for (size_t i = 0; i < promos.size(); ++i) {
    if (!promos[i]) {
      continue;
    }
    auto [iter, inserted] = counts.try_emplace(
        *promos[i], std::vector<int64_t>(binned.bins.size(), 0));
    if (inserted) {
      promoOrder.push_back(*promos[i]);
    }
    if (auto bin = binned.assignment[i]) {
      ++iter->second[*bin];
    }
  }

  std::vector<std::string> promoColumn;
  std::vector<std::string> binColumn;
  std::vector<double> lowerColumn;
  std::vector<double> upperColumn;
  std::vector<int64_t> countColumn;
  for (auto const &promo : promoOrder) {
    auto const &promoCounts = counts.at(promo);
    for (size_t b = 0; b < binned.bins.size(); ++b) {
      promoColumn.push_back(promo);
      binColumn.push_back(binned.bins[b].label);
      lowerColumn.push_back(binned.bins[b].lower);
      upperColumn.push_back(binned.bins[b].upper);
      countColumn.push_back(promoCounts[b]);
    }
  }

  return utils::MakeTable(promoColumn.size(),
                          {epoch_frame::factory::array::make_array(promoColumn),
                           epoch_frame::factory::array::make_array(binColumn),
                           epoch_frame::factory::array::make_array(lowerColumn),
                           epoch_frame::factory::array::make_array(upperColumn),
                           epoch_frame::factory::array::make_array(countColumn)},
                          m_metadata.outputColumns);
}

} // namespace retail_lens::views
