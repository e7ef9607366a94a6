#pragma once
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace retail_lens {

// Column names of the retail transactions file
namespace column {
constexpr auto DATE = "date";
constexpr auto DAY_OF_WEEK = "day_of_week";
constexpr auto SEASON = "season";
constexpr auto TOTAL_SALES = "total_sales";
constexpr auto CUSTOMER_TRAFFIC = "customer_traffic";
constexpr auto CONVERSION_RATE = "conversion_rate";
constexpr auto PROMO_TYPE = "promo_type";

constexpr auto UNITS_MEATS = "units_carnes";
constexpr auto UNITS_VEGETABLES = "units_verduras";
constexpr auto UNITS_FRUITS = "units_frutas";
constexpr auto UNITS_DAIRY = "units_lacteos";
constexpr auto UNITS_BEVERAGES = "units_bebidas";

// Derived at load time
constexpr auto MONTH = "month";

constexpr auto CATEGORY_PREFIX = "units_";

inline const std::vector<std::string> CATEGORY_UNITS = {
    UNITS_MEATS, UNITS_VEGETABLES, UNITS_FRUITS, UNITS_DAIRY, UNITS_BEVERAGES};

inline const std::vector<std::string> LABELS = {DAY_OF_WEEK, SEASON,
                                                PROMO_TYPE};

inline const std::vector<std::string> MEASURES = {
    TOTAL_SALES,   CUSTOMER_TRAFFIC, CONVERSION_RATE,  UNITS_MEATS,
    UNITS_VEGETABLES, UNITS_FRUITS,  UNITS_DAIRY,      UNITS_BEVERAGES};

// Columns the filter engine cannot work without
inline const std::vector<std::string> FILTER_FACETS = {DATE, DAY_OF_WEEK,
                                                       SEASON};
} // namespace column

constexpr std::array<std::string_view, 7> WEEKDAY_ORDER = {
    "Monday", "Tuesday", "Wednesday", "Thursday",
    "Friday", "Saturday", "Sunday"};

// Position of a weekday name in the Monday..Sunday order
constexpr std::optional<size_t> WeekdayRank(std::string_view day) {
  for (size_t i = 0; i < WEEKDAY_ORDER.size(); ++i) {
    if (WEEKDAY_ORDER[i] == day) {
      return i;
    }
  }
  return std::nullopt;
}

// Ids of the derived views, in default display order
namespace view_id {
constexpr auto CONVERSION_BY_DAY = "conversion_by_day";
constexpr auto DAILY_SALES = "daily_sales";
constexpr auto CATEGORY_SHARE = "category_share";
constexpr auto PROMO_TRAFFIC_RANKING = "promo_traffic_ranking";
constexpr auto MEAT_BY_DAY = "meat_by_day";
constexpr auto MONTHLY_GROWTH = "monthly_growth";
constexpr auto MONTHLY_COMBO = "monthly_combo";
constexpr auto PROMO_TRAFFIC_DENSITY = "promo_traffic_density";
} // namespace view_id

// Output columns of the derived views that are not source columns
namespace view_column {
constexpr auto CONVERSION_PCT = "conversion_pct";
constexpr auto CATEGORY = "category";
constexpr auto UNITS = "units";
constexpr auto SHARE_PCT = "share_pct";
constexpr auto MONTH_START = "month_start";
constexpr auto GROWTH_PCT = "growth_pct";
constexpr auto TRAFFIC_BIN = "traffic_bin";
constexpr auto BIN_LOWER = "bin_lower";
constexpr auto BIN_UPPER = "bin_upper";
constexpr auto RECORD_COUNT = "record_count";
} // namespace view_column

// Conversion gauge shown next to the headline numbers
namespace gauge {
constexpr double FLOOR_PCT = 40.0;
constexpr double MIN_SPAN_PCT = 32.0;
constexpr double HEADROOM = 1.35;
} // namespace gauge

constexpr size_t DEFAULT_DENSITY_BINS = 8;
constexpr auto DEFAULT_SOURCE_FILE = "retail_tienda_alimentos.csv";

} // namespace retail_lens
