#pragma once
#include <optional>
#include <string>
#include <vector>

#include <epoch_core/enum_wrapper.h>
#include <epoch_frame/dataframe.h>
#include <retail_lens/dashboard/dashboard_config.h>
#include <retail_lens/data/record_store.h>
#include <retail_lens/views/iview.h>

CREATE_ENUM(ViewStatus,
            Ok,
            SchemaInvalid, // required columns missing from the records
            Skipped);      // not computed because the filter kept nothing

CREATE_ENUM(BundleStatus, Ready, EmptyResult);

namespace retail_lens::dashboard {

struct Headline {
  size_t recordCount{0};
  double totalSales{0.0};
  double avgConversionPct{0.0};
  double gaugeMaxPct{gauge::FLOOR_PCT}; // upper bound of the conversion gauge
};

struct ViewResult {
  std::string id;
  epoch_core::ViewStatus status{epoch_core::ViewStatus::Skipped};
  std::optional<epoch_frame::DataFrame> table;
  std::vector<std::string> missingColumns;
  std::string message;
};

struct ViewBundle {
  epoch_core::BundleStatus status{epoch_core::BundleStatus::EmptyResult};
  size_t recordCount{0};
  std::optional<Headline> headline;
  std::vector<std::string> headlineMissingColumns;
  std::vector<ViewResult> views; // in requested order

  const ViewResult *Find(std::string const &id) const;
};

// Throws SchemaInvalidError when total_sales or conversion_rate is absent
Headline ComputeHeadline(data::RecordSet const &records);

// max(40, round(max(avgPct * 1.35, 32)))
double GaugeMax(double avgConversionPct);

/**
 * Recomputes every requested view from the store for a filter selection.
 *
 * A Dashboard is immutable once built: Recompute reads the store and the
 * view instances only, so successive calls are independent. A schema error
 * in one view is recorded in its ViewResult and never aborts the others.
 */
class Dashboard {
public:
  Dashboard(data::RecordStore store, DashboardConfig config);

  ViewBundle Recompute(filter::FilterSpec const &spec) const;

  const data::RecordStore &Store() const { return m_store; }
  const DashboardConfig &Config() const { return m_config; }

private:
  data::RecordStore m_store;
  DashboardConfig m_config;
  std::vector<views::IViewPtr> m_views;
};

} // namespace retail_lens::dashboard
