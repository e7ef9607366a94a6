#pragma once
#include <retail_lens/views/iview.h>

namespace retail_lens::views {

class PromoTrafficRankingView final : public IView {
public:
  using IView::IView;

protected:
  epoch_frame::DataFrame
  BuildTable(data::RecordSet const &records) const override;
};

/**
 * Heatmap of promotion type against customer traffic.
 *
 * Traffic is quantized into ViewOptions::densityBins equal-width bins. The
 * table holds one row per (promo_type, bin) pair, including empty cells:
 * promotions in order of first appearance, bins from lowest to highest.
 */
class PromoTrafficDensityView final : public IView {
public:
  using IView::IView;

protected:
  epoch_frame::DataFrame
  BuildTable(data::RecordSet const &records) const override;
};

template <> struct ViewMetadata<PromoTrafficRankingView> {
  static ViewMetaData Get() {
    return {.id = view_id::PROMO_TRAFFIC_RANKING,
            .name = "Average Customers by Promotion",
            .requiredColumns = {column::PROMO_TYPE, column::CUSTOMER_TRAFFIC},
            .outputColumns = {column::PROMO_TYPE, column::CUSTOMER_TRAFFIC},
            .desc = "Mean customer traffic per promotion type, highest first."};
  }
};

template <> struct ViewMetadata<PromoTrafficDensityView> {
  static ViewMetaData Get() {
    return {.id = view_id::PROMO_TRAFFIC_DENSITY,
            .name = "Promotion vs Traffic Density",
            .requiredColumns = {column::PROMO_TYPE, column::CUSTOMER_TRAFFIC},
            .outputColumns = {column::PROMO_TYPE, view_column::TRAFFIC_BIN,
                              view_column::BIN_LOWER, view_column::BIN_UPPER,
                              view_column::RECORD_COUNT},
            .desc = "Record counts per promotion type and customer traffic "
                    "bin."};
  }
};

} // namespace retail_lens::views
