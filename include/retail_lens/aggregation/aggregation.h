#pragma once
#include <algorithm>
#include <cmath>
#include <string>
#include <string_view>
#include <vector>

#include <epoch_core/enum_wrapper.h>
#include <epoch_frame/scalar.h>
#include <retail_lens/core/calendar.h>
#include <retail_lens/data/record_set.h>

CREATE_ENUM(GroupOrder,
            FirstAppearance, // order in which keys first occur
            Weekday,         // Monday..Sunday, unknown labels last
            KeyAscending,
            ValueDescending);

// Names are the epoch_frame aggregation functions
CREATE_ENUM(GroupReduction, sum, mean);

namespace retail_lens::aggregation {

template <typename Key> struct Group {
  Key key;
  double value;
};

using LabelGroups = std::vector<Group<std::string>>;
using DateGroups = std::vector<Group<calendar::Date>>;
using MonthGroups = DateGroups;

// Value of a reduced group; an all-null group sums to 0 and has a NaN mean
double ReducedValue(epoch_frame::Scalar const &reduced,
                    epoch_core::GroupReduction reduction);

template <typename Key> void SortByKey(std::vector<Group<Key>> &groups) {
  std::stable_sort(groups.begin(), groups.end(),
                   [](auto const &a, auto const &b) { return a.key < b.key; });
}

// Largest first; NaN values sink to the end
template <typename Key>
void SortByValueDescending(std::vector<Group<Key>> &groups) {
  std::stable_sort(groups.begin(), groups.end(),
                   [](auto const &a, auto const &b) {
                     return !std::isnan(a.value) &&
                            (std::isnan(b.value) || a.value > b.value);
                   });
}

void SortByWeekday(LabelGroups &groups);

void OrderGroups(LabelGroups &groups, epoch_core::GroupOrder order);

// Mean of `measure` per distinct value of `key`. Grouping by day_of_week
// always yields Monday..Sunday order; grouping by date uses YYYY-MM-DD keys.
LabelGroups GroupMean(data::RecordSet const &records, std::string const &key,
                      std::string const &measure,
                      epoch_core::GroupOrder order =
                          epoch_core::GroupOrder::FirstAppearance);

LabelGroups GroupSum(data::RecordSet const &records, std::string const &key,
                     std::string const &measure,
                     epoch_core::GroupOrder order =
                         epoch_core::GroupOrder::FirstAppearance);

// Total of `measure` per calendar day, chronological
DateGroups DailySum(data::RecordSet const &records, std::string const &measure);

// Month start of every record's date, aligned with the records
std::vector<calendar::Date> MonthlyBucket(data::RecordSet const &records);

// Chronological
MonthGroups MonthlyMean(data::RecordSet const &records,
                        std::string const &measure);
MonthGroups MonthlySum(data::RecordSet const &records,
                       std::string const &measure);

// "units_carnes" -> "carnes"
std::string CategoryName(std::string_view column);

/**
 * Total units per category column across all records, in the order of
 * `categoryColumns`. Throws SchemaInvalidError naming every absent column.
 */
LabelGroups CategoryShare(data::RecordSet const &records,
                          std::vector<std::string> const &categoryColumns);

} // namespace retail_lens::aggregation
