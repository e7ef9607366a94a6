#pragma once
#include <retail_lens/views/iview.h>

namespace retail_lens::views {

class DailySalesView final : public IView {
public:
  using IView::IView;

protected:
  epoch_frame::DataFrame
  BuildTable(data::RecordSet const &records) const override;
};

class CategoryShareView final : public IView {
public:
  using IView::IView;

protected:
  epoch_frame::DataFrame
  BuildTable(data::RecordSet const &records) const override;
};

template <> struct ViewMetadata<DailySalesView> {
  static ViewMetaData Get() {
    return {.id = view_id::DAILY_SALES,
            .name = "Daily Sales",
            .requiredColumns = {column::DATE, column::TOTAL_SALES},
            .outputColumns = {column::DATE, column::TOTAL_SALES},
            .desc = "Total sales per calendar date, oldest first."};
  }
};

template <> struct ViewMetadata<CategoryShareView> {
  static ViewMetaData Get() {
    return {.id = view_id::CATEGORY_SHARE,
            .name = "Category Share",
            .requiredColumns = column::CATEGORY_UNITS,
            .outputColumns = {view_column::CATEGORY, view_column::UNITS,
                              view_column::SHARE_PCT},
            .desc = "Units sold per product category and their share of all "
                    "units. Shares are 0 when no units were sold."};
  }
};

} // namespace retail_lens::views
