#include <retail_lens/dashboard/dashboard.h>

#include <algorithm>
#include <cmath>
#include <retail_lens/aggregation/aggregation.h>
#include <retail_lens/core/errors.h>
#include <retail_lens/filter/filter_engine.h>
#include <retail_lens/views/view_registry.h>
#include <spdlog/spdlog.h>

namespace retail_lens::dashboard {

const ViewResult *ViewBundle::Find(std::string const &id) const {
  auto iter = std::find_if(views.begin(), views.end(),
                           [&](ViewResult const &view) { return view.id == id; });
  return iter == views.end() ? nullptr : &*iter;
}

double GaugeMax(double avgConversionPct) {
  if (std::isnan(avgConversionPct)) {
    return gauge::FLOOR_PCT;
  }
  const double span =
      std::max(avgConversionPct * gauge::HEADROOM, gauge::MIN_SPAN_PCT);
  return std::max(gauge::FLOOR_PCT, std::round(span));
}

Headline ComputeHeadline(data::RecordSet const &records) {
  records.RequireColumns({column::TOTAL_SALES, column::CONVERSION_RATE},
                         "headline");

  Headline headline;
  headline.recordCount = records.Size();
  if (records.Empty()) {
    headline.avgConversionPct = std::nan("");
  } else {
    auto const &frame = records.Frame();
    headline.totalSales =
        aggregation::ReducedValue(frame[column::TOTAL_SALES].sum(),
                                  epoch_core::GroupReduction::sum);
    headline.avgConversionPct =
        aggregation::ReducedValue(frame[column::CONVERSION_RATE].mean(),
                                  epoch_core::GroupReduction::mean) *
        100.0;
  }
  headline.gaugeMaxPct = GaugeMax(headline.avgConversionPct);
  return headline;
}

Dashboard::Dashboard(data::RecordStore store, DashboardConfig config)
    : m_store(std::move(store)), m_config(std::move(config)) {
  m_config.Validate();

  auto const &registry = views::ViewRegistry::GetInstance();
  const views::ViewOptions options{.densityBins = m_config.densityBins};
  for (auto const &id : m_config.views) {
    m_views.push_back(registry.Create(id, options));
  }
}

ViewBundle Dashboard::Recompute(filter::FilterSpec const &spec) const {
  SPDLOG_DEBUG("Recomputing dashboard for {}", spec.ToString());
  const auto records = filter::FilterEngine::Apply(m_store.Records(), spec);

  ViewBundle bundle;
  bundle.recordCount = records.Size();

  if (records.Empty()) {
    bundle.status = epoch_core::BundleStatus::EmptyResult;
    for (auto const &view : m_views) {
      bundle.views.push_back(ViewResult{.id = view->GetId(),
                                        .status = epoch_core::ViewStatus::Skipped,
                                        .table = std::nullopt,
                                        .missingColumns = {},
                                        .message = "no data for current filters"});
    }
    SPDLOG_INFO("Filter kept no records");
    return bundle;
  }

  bundle.status = epoch_core::BundleStatus::Ready;
  try {
    bundle.headline = ComputeHeadline(records);
  } catch (SchemaInvalidError const &e) {
    SPDLOG_WARN("{}", e.what());
    bundle.headlineMissingColumns = e.GetMissingColumns();
  }

  for (auto const &view : m_views) {
    ViewResult result{.id = view->GetId()};
    try {
      result.table = view->Compute(records);
      result.status = epoch_core::ViewStatus::Ok;
    } catch (SchemaInvalidError const &e) {
      SPDLOG_WARN("{}", e.what());
      result.status = epoch_core::ViewStatus::SchemaInvalid;
      result.missingColumns = e.GetMissingColumns();
      result.message = e.what();
    }
    bundle.views.push_back(std::move(result));
  }

  SPDLOG_DEBUG("Recomputed {} views over {} records", bundle.views.size(),
               bundle.recordCount);
  return bundle;
}

} // namespace retail_lens::dashboard
