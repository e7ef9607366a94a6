//
// Unit tests for the derived views
//

#include "../common/record_fixtures.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <retail_lens/core/errors.h>
#include <retail_lens/views/view_registry.h>

using namespace retail_lens;
using namespace retail_lens::views;
using namespace retail_lens::test;

namespace {
epoch_frame::DataFrame ComputeView(std::string const &id,
                                   data::RecordSet const &records,
                                   ViewOptions const &options = {}) {
  RegisterBuiltinViews();
  return ViewRegistry::GetInstance().Create(id, options)->Compute(records);
}

std::vector<std::string> StringColumn(epoch_frame::DataFrame const &table,
                                      std::string const &column) {
  std::vector<std::string> values;
  for (size_t i = 0; i < table.num_rows(); ++i) {
    values.push_back(table[column].iloc(static_cast<int64_t>(i)).repr());
  }
  return values;
}
} // namespace

TEST_CASE("ViewRegistry - built-in views", "[views][registry]") {
  RegisterBuiltinViews();
  RegisterBuiltinViews();
  auto &registry = ViewRegistry::GetInstance();

  REQUIRE(registry.GetIds() ==
          std::vector<std::string>{view_id::CONVERSION_BY_DAY,
                                   view_id::DAILY_SALES,
                                   view_id::CATEGORY_SHARE,
                                   view_id::PROMO_TRAFFIC_RANKING,
                                   view_id::MEAT_BY_DAY,
                                   view_id::MONTHLY_GROWTH,
                                   view_id::MONTHLY_COMBO,
                                   view_id::PROMO_TRAFFIC_DENSITY});

  auto metadata = registry.GetMetaData(view_id::CATEGORY_SHARE);
  REQUIRE(metadata.has_value());
  REQUIRE(metadata->get().requiredColumns == column::CATEGORY_UNITS);

  REQUIRE_FALSE(registry.GetMetaData("pie_of_everything").has_value());
  REQUIRE_THROWS(registry.Create("pie_of_everything", {}));
}

TEST_CASE("Views - every table has its documented columns", "[views]") {
  RegisterBuiltinViews();
  auto store = MakeStore();
  auto &registry = ViewRegistry::GetInstance();

  for (auto const &id : registry.GetIds()) {
    auto view = registry.Create(id, {});
    auto table = view->Compute(store.Records());
    REQUIRE(table.column_names() == view->GetMetaData().outputColumns);
  }
}

TEST_CASE("Views - conversion_by_day", "[views]") {
  auto store = MakeStore();
  auto table = ComputeView(view_id::CONVERSION_BY_DAY, store.Records());

  REQUIRE(table.num_rows() == 7);
  REQUIRE(StringColumn(table, column::DAY_OF_WEEK) ==
          std::vector<std::string>{"Monday", "Tuesday", "Wednesday",
                                   "Thursday", "Friday", "Saturday",
                                   "Sunday"});
  // Monday: 0.20 and 0.30
  REQUIRE(table[column::CONVERSION_RATE].iloc(0).as_double() ==
          Catch::Approx(0.25));
  REQUIRE(table[view_column::CONVERSION_PCT].iloc(0).as_double() ==
          Catch::Approx(25.0));
}

TEST_CASE("Views - meat_by_day", "[views]") {
  auto store = MakeStore();
  auto table = ComputeView(view_id::MEAT_BY_DAY, store.Records());

  REQUIRE(table.num_rows() == 7);
  // Friday: 30 and 11
  REQUIRE(table[column::UNITS_MEATS].iloc(4).as_double() ==
          Catch::Approx(20.5));
}

TEST_CASE("Views - daily_sales", "[views]") {
  auto rows = SampleRows();
  std::vector<RawRow> shuffled{rows[2], rows[0], rows[2], rows[1]};
  auto table = ComputeView(view_id::DAILY_SALES, MakeStore(shuffled).Records());

  REQUIRE(table.num_rows() == 3);
  REQUIRE(table[column::TOTAL_SALES].iloc(0).as_double() == Catch::Approx(100.0));
  REQUIRE(table[column::TOTAL_SALES].iloc(1).as_double() == Catch::Approx(200.0));
  REQUIRE(table[column::TOTAL_SALES].iloc(2).as_double() == Catch::Approx(300.0));
}

TEST_CASE("Views - category_share", "[views]") {
  SECTION("Shares of the grand total") {
    auto store = MakeStore();
    auto table = ComputeView(view_id::CATEGORY_SHARE, store.Records());

    REQUIRE(StringColumn(table, view_column::CATEGORY) ==
            std::vector<std::string>{"carnes", "verduras", "frutas",
                                     "lacteos", "bebidas"});
    // 146 + 50 + 36 + 20 + 12
    REQUIRE(table[view_column::UNITS].iloc(0).as_double() ==
            Catch::Approx(146.0));
    REQUIRE(table[view_column::SHARE_PCT].iloc(0).as_double() ==
            Catch::Approx(146.0 / 264.0 * 100.0));

    double total = 0.0;
    for (int64_t i = 0; i < 5; ++i) {
      total += table[view_column::SHARE_PCT].iloc(i).as_double();
    }
    REQUIRE(total == Catch::Approx(100.0));
  }

  SECTION("Zero units give zero shares") {
    auto rows = SampleRows();
    rows.resize(1);
    rows[0].meats = rows[0].vegetables = rows[0].fruits = rows[0].dairy =
        rows[0].beverages = 0;
    auto table = ComputeView(view_id::CATEGORY_SHARE, MakeStore(rows).Records());
    for (int64_t i = 0; i < 5; ++i) {
      REQUIRE(table[view_column::SHARE_PCT].iloc(i).as_double() == 0.0);
    }
  }

  SECTION("Missing category column") {
    auto store = MakeStore(SampleRows(), {column::UNITS_DAIRY});
    REQUIRE_THROWS_AS(ComputeView(view_id::CATEGORY_SHARE, store.Records()),
                      SchemaInvalidError);
  }
}

TEST_CASE("Views - promo_traffic_ranking", "[views]") {
  auto store = MakeStore();
  auto table = ComputeView(view_id::PROMO_TRAFFIC_RANKING, store.Records());

  // 2x1: (80+120+70)/3, Descuento: (40+100)/2, Ninguna: (50+60+90+55)/4
  REQUIRE(StringColumn(table, column::PROMO_TYPE) ==
          std::vector<std::string>{"2x1", "Descuento", "Ninguna"});
  REQUIRE(table[column::CUSTOMER_TRAFFIC].iloc(0).as_double() ==
          Catch::Approx(90.0));
  REQUIRE(table[column::CUSTOMER_TRAFFIC].iloc(2).as_double() ==
          Catch::Approx(63.75));
}

TEST_CASE("Views - monthly_growth", "[views]") {
  auto rows = SampleRows();
  rows.push_back({"2024-03-15", "Friday", "Primavera", 450, 60, 0.2, "2x1",
                  1, 1, 1, 1, 1});
  auto table = ComputeView(view_id::MONTHLY_GROWTH, MakeStore(rows).Records());

  // January 1300, February 300, March 450
  REQUIRE(table.num_rows() == 2);
  REQUIRE(table[column::TOTAL_SALES].iloc(0).as_double() == Catch::Approx(300.0));
  REQUIRE(table[view_column::GROWTH_PCT].iloc(0).as_double() ==
          Catch::Approx((300.0 - 1300.0) / 1300.0 * 100.0));
  REQUIRE(table[view_column::GROWTH_PCT].iloc(1).as_double() ==
          Catch::Approx(50.0));

  SECTION("Single month has no growth rows") {
    std::vector<RawRow> january(rows.begin(), rows.begin() + 7);
    REQUIRE(ComputeView(view_id::MONTHLY_GROWTH, MakeStore(january).Records())
                .num_rows() == 0);
  }

  SECTION("Month after a zero month is left out") {
    auto zeroed = SampleRows();
    for (size_t i = 0; i < 7; ++i) {
      zeroed[i].sales = 0;
    }
    REQUIRE(ComputeView(view_id::MONTHLY_GROWTH, MakeStore(zeroed).Records())
                .num_rows() == 0);
  }
}

TEST_CASE("Views - monthly_combo", "[views]") {
  auto store = MakeStore();
  auto table = ComputeView(view_id::MONTHLY_COMBO, store.Records());

  REQUIRE(table.num_rows() == 2);
  REQUIRE(table[column::CUSTOMER_TRAFFIC].iloc(1).as_double() ==
          Catch::Approx(62.5));
  REQUIRE(table[column::CONVERSION_RATE].iloc(1).as_double() ==
          Catch::Approx(0.25));
}

TEST_CASE("Views - promo_traffic_density", "[views]") {
  auto store = MakeStore();
  auto table = ComputeView(view_id::PROMO_TRAFFIC_DENSITY, store.Records(),
                           ViewOptions{.densityBins = 4});

  // Traffic spans [40, 120]: bins of width 20
  REQUIRE(table.num_rows() == 3 * 4);
  REQUIRE(StringColumn(table, column::PROMO_TYPE) ==
          std::vector<std::string>{"Ninguna", "Ninguna", "Ninguna", "Ninguna",
                                   "2x1", "2x1", "2x1", "2x1", "Descuento",
                                   "Descuento", "Descuento", "Descuento"});
  REQUIRE(table[view_column::TRAFFIC_BIN].iloc(0).repr() == "[40, 60]");
  REQUIRE(table[view_column::BIN_LOWER].iloc(1).as_double() ==
          Catch::Approx(60.0));
  REQUIRE(table[view_column::BIN_UPPER].iloc(3).as_double() ==
          Catch::Approx(120.0));

  // Ninguna traffic 50, 60, 90, 55
  REQUIRE(table[view_column::RECORD_COUNT].iloc(0).as_int64() == 3);
  REQUIRE(table[view_column::RECORD_COUNT].iloc(1).as_int64() == 0);
  REQUIRE(table[view_column::RECORD_COUNT].iloc(2).as_int64() == 1);

  int64_t total = 0;
  for (int64_t i = 0; i < 12; ++i) {
    total += table[view_column::RECORD_COUNT].iloc(i).as_int64();
  }
  REQUIRE(total == 9);
}
