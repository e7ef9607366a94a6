#pragma once
#include <retail_lens/views/iview.h>

namespace retail_lens::views {

/**
 * Monthly total sales with the growth rate against the previous month.
 *
 * The first month and months whose rate is not defined (previous month sums
 * to zero, or a sum is not finite) carry no rate and are left out of the
 * table; each omission is logged.
 */
class MonthlyGrowthView final : public IView {
public:
  using IView::IView;

protected:
  epoch_frame::DataFrame
  BuildTable(data::RecordSet const &records) const override;
};

class MonthlyComboView final : public IView {
public:
  using IView::IView;

protected:
  epoch_frame::DataFrame
  BuildTable(data::RecordSet const &records) const override;
};

template <> struct ViewMetadata<MonthlyGrowthView> {
  static ViewMetaData Get() {
    return {.id = view_id::MONTHLY_GROWTH,
            .name = "Monthly Sales Growth",
            .requiredColumns = {column::DATE, column::TOTAL_SALES},
            .outputColumns = {view_column::MONTH_START, column::TOTAL_SALES,
                              view_column::GROWTH_PCT},
            .desc = "Month over month growth of total sales, in percent."};
  }
};

template <> struct ViewMetadata<MonthlyComboView> {
  static ViewMetaData Get() {
    return {.id = view_id::MONTHLY_COMBO,
            .name = "Monthly Traffic and Conversion",
            .requiredColumns = {column::DATE, column::CUSTOMER_TRAFFIC,
                                column::CONVERSION_RATE},
            .outputColumns = {view_column::MONTH_START,
                              column::CUSTOMER_TRAFFIC,
                              column::CONVERSION_RATE},
            .desc = "Mean customer traffic and conversion rate per month."};
  }
};

} // namespace retail_lens::views
