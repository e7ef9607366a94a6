#include <mutex>
#include <retail_lens/views/view_registry.h>

#include "monthly_views.h"
#include "promo_views.h"
#include "sales_views.h"
#include "weekday_views.h"

namespace retail_lens::views {

void RegisterBuiltinViews() {
  static std::once_flag registered;
  std::call_once(registered, [] {
    RegisterView<ConversionByDayView>();
    RegisterView<DailySalesView>();
    RegisterView<CategoryShareView>();
    RegisterView<PromoTrafficRankingView>();
    RegisterView<MeatByDayView>();
    RegisterView<MonthlyGrowthView>();
    RegisterView<MonthlyComboView>();
    RegisterView<PromoTrafficDensityView>();
  });
}

} // namespace retail_lens::views
