//
// Unit tests for grouping, growth and binning primitives
//

#include "../common/record_fixtures.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <epoch_core/catch_defs.h>
#include <retail_lens/aggregation/aggregation.h>
#include <retail_lens/aggregation/binning.h>
#include <retail_lens/aggregation/growth.h>
#include <retail_lens/core/errors.h>

using namespace retail_lens;
using namespace retail_lens::aggregation;
using namespace retail_lens::test;
using namespace std::chrono;

namespace {
template <typename Key>
std::vector<Key> KeysOf(std::vector<Group<Key>> const &groups) {
  std::vector<Key> keys;
  for (auto const &group : groups) {
    keys.push_back(group.key);
  }
  return keys;
}
} // namespace

TEST_CASE("GroupMean and GroupSum - null keys and missing measures",
          "[aggregation]") {
  auto rows = SampleRows();
  std::vector<RawRow> picked{rows[0], rows[1], rows[2], rows[3], rows[4]};
  picked[0].promo = "A";
  picked[1].promo = "";
  picked[2].promo = "B";
  picked[2].sales = std::nan("");
  picked[3].promo = "A";
  picked[4].promo = "C";
  auto store = MakeStore(picked);

  SECTION("Mean") {
    auto groups = GroupMean(store.Records(), column::PROMO_TYPE,
                            column::TOTAL_SALES);
    REQUIRE(KeysOf(groups) == std::vector<std::string>{"A", "B", "C"});
    REQUIRE(groups[0].value == Catch::Approx((100.0 + 120.0) / 2.0));
    REQUIRE(std::isnan(groups[1].value));
    REQUIRE(groups[2].value == Catch::Approx(300.0));
  }

  SECTION("Sum") {
    auto groups = GroupSum(store.Records(), column::PROMO_TYPE,
                           column::TOTAL_SALES);
    REQUIRE(KeysOf(groups) == std::vector<std::string>{"A", "B", "C"});
    REQUIRE(groups[0].value == Catch::Approx(220.0));
    REQUIRE(groups[1].value == 0.0);
    REQUIRE(groups[2].value == Catch::Approx(300.0));
  }
}

TEST_CASE("GroupMean - weekday keys come back Monday to Sunday",
          "[aggregation]") {
  auto rows = SampleRows();
  std::vector<RawRow> shuffled{rows[6], rows[4], rows[0], rows[2], rows[8]};
  auto store = MakeStore(shuffled);

  for (auto order : {epoch_core::GroupOrder::FirstAppearance,
                     epoch_core::GroupOrder::KeyAscending,
                     epoch_core::GroupOrder::ValueDescending}) {
    auto groups = GroupMean(store.Records(), column::DAY_OF_WEEK,
                            column::TOTAL_SALES, order);
    REQUIRE(KeysOf(groups) == std::vector<std::string>{"Monday", "Wednesday",
                                                       "Friday", "Sunday"});
    // Friday 2024-01-05 and Friday 2024-02-09
    REQUIRE(groups[2].value == Catch::Approx((300.0 + 140.0) / 2.0));
  }
}

TEST_CASE("SortByWeekday - unknown labels go last", "[aggregation]") {
  LabelGroups groups{{"Feriado", 1.0},
                     {"Sunday", 2.0},
                     {"Extra", 3.0},
                     {"Tuesday", 4.0}};
  SortByWeekday(groups);
  REQUIRE(KeysOf(groups) ==
          std::vector<std::string>{"Tuesday", "Sunday", "Feriado", "Extra"});
}

TEST_CASE("GroupSum - orders", "[aggregation]") {
  auto store = MakeStore();

  SECTION("By date, chronological ISO keys") {
    auto rows = SampleRows();
    std::vector<RawRow> shuffled{rows[3], rows[0], rows[3], rows[1]};
    auto groups = GroupSum(MakeStore(shuffled).Records(), column::DATE,
                           column::TOTAL_SALES,
                           epoch_core::GroupOrder::KeyAscending);
    REQUIRE(KeysOf(groups) == std::vector<std::string>{"2024-01-01",
                                                       "2024-01-02",
                                                       "2024-01-04"});
    REQUIRE(groups[2].value == Catch::Approx(240.0));
  }

  SECTION("By promotion, highest first") {
    auto groups = GroupSum(store.Records(), column::PROMO_TYPE,
                           column::TOTAL_SALES,
                           epoch_core::GroupOrder::ValueDescending);
    // 2x1: 200+300+160, Ninguna: 100+150+180+140, Descuento: 120+250
    REQUIRE(KeysOf(groups) ==
            std::vector<std::string>{"2x1", "Ninguna", "Descuento"});
    REQUIRE(groups[0].value == Catch::Approx(660.0));
    REQUIRE(groups[1].value == Catch::Approx(570.0));
    REQUIRE(groups[2].value == Catch::Approx(370.0));
  }

  SECTION("Missing measure column") {
    auto partial = MakeStore(SampleRows(), {column::TOTAL_SALES});
    REQUIRE_THROWS_AS(GroupSum(partial.Records(), column::SEASON,
                               column::TOTAL_SALES),
                      SchemaInvalidError);
  }
}

TEST_CASE("DailySum - one group per calendar day", "[aggregation]") {
  auto rows = SampleRows();
  std::vector<RawRow> shuffled{rows[8], rows[3], rows[0], rows[3]};
  auto groups = DailySum(MakeStore(shuffled).Records(), column::TOTAL_SALES);

  REQUIRE(KeysOf(groups) ==
          std::vector<calendar::Date>{sys_days{2024y / January / 1d},
                                      sys_days{2024y / January / 4d},
                                      sys_days{2024y / February / 9d}});
  REQUIRE(groups[0].value == Catch::Approx(100.0));
  REQUIRE(groups[1].value == Catch::Approx(240.0));
  REQUIRE(groups[2].value == Catch::Approx(140.0));
}

TEST_CASE("MonthlyBucket - calendar month truncation", "[aggregation]") {
  auto store = MakeStore();
  auto buckets = MonthlyBucket(store.Records());
  REQUIRE(buckets.size() == 9);
  REQUIRE(buckets[0] == sys_days{2024y / January / 1d});
  REQUIRE(buckets[6] == sys_days{2024y / January / 1d});
  REQUIRE(buckets[8] == sys_days{2024y / February / 1d});

  auto sums = MonthlySum(store.Records(), column::TOTAL_SALES);
  REQUIRE(sums.size() == 2);
  REQUIRE(sums[0].value == Catch::Approx(1300.0));
  REQUIRE(sums[1].value == Catch::Approx(300.0));

  auto means = MonthlyMean(store.Records(), column::CUSTOMER_TRAFFIC);
  REQUIRE(means[1].value == Catch::Approx((70.0 + 55.0) / 2.0));
}

TEST_CASE("PeriodOverPeriodGrowth", "[aggregation][growth]") {
  SECTION("Rates in percent, first period absent") {
    auto steps = PeriodOverPeriodGrowth({100.0, 150.0, 120.0});
    REQUIRE(steps.size() == 2);
    REQUIRE(steps[0].period == 1);
    REQUIRE(steps[0].IsDefined());
    REQUIRE(steps[0].pct == Catch::Approx(50.0));
    REQUIRE(steps[1].pct == Catch::Approx(-20.0));
  }

  SECTION("Insufficient history") {
    REQUIRE(PeriodOverPeriodGrowth({}).empty());
    REQUIRE(PeriodOverPeriodGrowth({42.0}).empty());
  }

  SECTION("Zero and non-finite periods") {
    auto steps = PeriodOverPeriodGrowth({0.0, 10.0, std::nan(""), 5.0});
    REQUIRE(steps.size() == 3);
    REQUIRE(steps[0].status == epoch_core::GrowthStatus::ZeroBase);
    REQUIRE(std::isnan(steps[0].pct));
    REQUIRE(steps[1].status == epoch_core::GrowthStatus::Undefined);
    REQUIRE(steps[2].status == epoch_core::GrowthStatus::Undefined);
  }
}

TEST_CASE("QuantizedBins", "[aggregation][binning]") {
  SECTION("Eight bins over [0, 10]") {
    auto binned = QuantizedBins({0.0, 1.25, 1.3, 5.0, 10.0}, 8);
    REQUIRE(binned.bins.size() == 8);
    for (auto const &bin : binned.bins) {
      REQUIRE(bin.upper - bin.lower == Catch::Approx(1.25));
    }
    REQUIRE(binned.bins.front().lower == 0.0);
    REQUIRE(binned.bins.back().upper == 10.0);

    REQUIRE(binned.assignment[0] == 0);
    REQUIRE(binned.assignment[1] == 0);
    REQUIRE(binned.assignment[2] == 1);
    REQUIRE(binned.assignment[3] == 3);
    REQUIRE(binned.assignment[4] == 7);

    REQUIRE(binned.LabelAt(0) == "[0, 1.25]");
    REQUIRE(binned.LabelAt(2) == "(1.25, 2.5]");
    REQUIRE(binned.Counts() ==
            std::vector<size_t>{2, 1, 0, 1, 0, 0, 0, 1});
  }

  SECTION("NaN values get no bin") {
    auto binned = QuantizedBins({1.0, std::nan(""), 3.0}, 2);
    REQUIRE(binned.assignment[0] == 0);
    REQUIRE_FALSE(binned.assignment[1].has_value());
    REQUIRE_FALSE(binned.LabelAt(1).has_value());
    REQUIRE(binned.assignment[2] == 1);
  }

  SECTION("Constant values widen the range") {
    auto binned = QuantizedBins({50.0, 50.0}, 4);
    REQUIRE(binned.bins.front().lower == Catch::Approx(49.95));
    REQUIRE(binned.bins.back().upper == Catch::Approx(50.05));
    REQUIRE(binned.assignment[0] == binned.assignment[1]);

    auto zeros = QuantizedBins({0.0}, 1);
    REQUIRE(zeros.bins.front().lower == Catch::Approx(-0.001));
    REQUIRE(zeros.bins.front().upper == Catch::Approx(0.001));
    REQUIRE(zeros.assignment[0] == 0);
  }

  SECTION("Zero bins is an argument error") {
    REQUIRE_THROWS(QuantizedBins({1.0, 2.0}, 0));
  }

  SECTION("Range wider than the largest double") {
    auto binned = QuantizedBins({-1e308, 0.0, 1e308}, 2);
    REQUIRE(binned.bins.front().lower == -1e308);
    REQUIRE(binned.bins.back().upper == 1e308);
    REQUIRE(binned.assignment[0] == 0);
    REQUIRE(binned.assignment[1] == 0);
    REQUIRE(binned.assignment[2] == 1);

    auto single = QuantizedBins({-1.7e308, 1.7e308}, 1);
    REQUIRE(single.assignment[0] == 0);
    REQUIRE(single.assignment[1] == 0);
    REQUIRE(single.bins.front().lower == -1.7e308);
  }
}

TEST_CASE("CategoryShare", "[aggregation]") {
  SECTION("Totals per category with the prefix stripped") {
    auto store = MakeStore();
    auto shares = CategoryShare(store.Records(), column::CATEGORY_UNITS);
    REQUIRE(KeysOf(shares) == std::vector<std::string>{"carnes", "verduras",
                                                       "frutas", "lacteos",
                                                       "bebidas"});
    REQUIRE(shares[0].value == Catch::Approx(146.0));
    REQUIRE(shares[4].value == Catch::Approx(12.0));
  }

  SECTION("Missing columns are all reported") {
    auto store = MakeStore(SampleRows(),
                           {column::UNITS_FRUITS, column::UNITS_BEVERAGES});
    try {
      CategoryShare(store.Records(), column::CATEGORY_UNITS);
      FAIL("Expected SchemaInvalidError");
    } catch (SchemaInvalidError const &e) {
      REQUIRE(e.GetMissingColumns() ==
              std::vector<std::string>{column::UNITS_FRUITS,
                                       column::UNITS_BEVERAGES});
    }
  }

  REQUIRE(CategoryName("units_lacteos") == "lacteos");
  REQUIRE(CategoryName("other") == "other");
}
