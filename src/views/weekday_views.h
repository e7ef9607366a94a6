#pragma once
//
// Per-weekday averages, always in Monday..Sunday order
//
#include <retail_lens/views/iview.h>

namespace retail_lens::views {

class ConversionByDayView final : public IView {
public:
  using IView::IView;

protected:
  epoch_frame::DataFrame
  BuildTable(data::RecordSet const &records) const override;
};

class MeatByDayView final : public IView {
public:
  using IView::IView;

protected:
  epoch_frame::DataFrame
  BuildTable(data::RecordSet const &records) const override;
};

template <> struct ViewMetadata<ConversionByDayView> {
  static ViewMetaData Get() {
    return {.id = view_id::CONVERSION_BY_DAY,
            .name = "Conversion by Day",
            .requiredColumns = {column::DAY_OF_WEEK, column::CONVERSION_RATE},
            .outputColumns = {column::DAY_OF_WEEK, column::CONVERSION_RATE,
                              view_column::CONVERSION_PCT},
            .desc = "Mean conversion rate per weekday, as a fraction and as a "
                    "percentage."};
  }
};

template <> struct ViewMetadata<MeatByDayView> {
  static ViewMetaData Get() {
    return {.id = view_id::MEAT_BY_DAY,
            .name = "Average Meat Sales by Day",
            .requiredColumns = {column::DAY_OF_WEEK, column::UNITS_MEATS},
            .outputColumns = {column::DAY_OF_WEEK, column::UNITS_MEATS},
            .desc = "Mean meat units sold per weekday."};
  }
};

} // namespace retail_lens::views
