#include <retail_lens/aggregation/aggregation.h>
#include <retail_lens/core/constants.h>

#include <limits>
#include <map>
#include <optional>
#include <set>

#include <arrow/api.h>
#include <epoch_frame/factory/dataframe_factory.h>

namespace retail_lens::aggregation {

namespace {
constexpr auto MONTH_START = "month_start";

/**
 * Reduces `measure` per distinct non-null `key` of `frame`.
 *
 * Returns the reduced value for each key as read by `readKey` from the
 * grouped index. The map carries no order; callers order the groups.
 */
template <typename Key, typename ReadKey>
std::map<Key, double> ReduceByKey(epoch_frame::DataFrame const &frame,
                                  std::string const &key,
                                  std::string const &measure,
                                  epoch_core::GroupReduction reduction,
                                  ReadKey &&readKey) {
  std::map<Key, double> reduced;
  if (frame.num_rows() == 0) {
    return reduced;
  }

  auto df = frame[{key, measure}];
  df = df.loc(df[key].is_valid());
  if (df.num_rows() == 0) {
    return reduced;
  }

  const auto grouped =
      df.group_by_agg(key)
          .agg(epoch_core::GroupReductionWrapper::ToString(reduction))
          .to_series();
  for (int64_t i = 0; i < static_cast<int64_t>(grouped.size()); ++i) {
    reduced.emplace(readKey(grouped.index()->at(i)),
                    ReducedValue(grouped.iloc(i), reduction));
  }
  return reduced;
}

std::string LabelKey(epoch_frame::Scalar const &cell) {
  return cell.value<std::string>().value();
}

calendar::Date DateKey(epoch_frame::Scalar const &cell) {
  return calendar::FromTimestamp(cell.timestamp().value);
}

// One group per key, in the order keys first occur in `keys`
template <typename Key>
std::vector<Group<Key>>
InFirstAppearance(std::map<Key, double> const &reduced,
                  std::vector<std::optional<Key>> const &keys) {
  std::vector<Group<Key>> groups;
  groups.reserve(reduced.size());
  std::set<Key> seen;
  for (auto const &key : keys) {
    if (!key || !seen.insert(*key).second) {
      continue;
    }
    if (auto iter = reduced.find(*key); iter != reduced.end()) {
      groups.push_back({iter->first, iter->second});
    }
  }
  return groups;
}

template <typename Key>
std::vector<Group<Key>> Chronological(std::map<Key, double> const &reduced) {
  std::vector<Group<Key>> groups;
  groups.reserve(reduced.size());
  for (auto const &[key, value] : reduced) {
    groups.push_back({key, value});
  }
  return groups;
}

LabelGroups GroupLabels(data::RecordSet const &records, std::string const &key,
                        std::string const &measure,
                        epoch_core::GroupReduction reduction,
                        epoch_core::GroupOrder order) {
  records.RequireColumns({key, measure}, "group " + key);

  LabelGroups groups;
  if (key == column::DATE) {
    auto const reduced = ReduceByKey<calendar::Date>(
        records.Frame(), key, measure, reduction, DateKey);
    const auto dates = records.Dates();
    std::vector<std::optional<calendar::Date>> keys(dates.begin(), dates.end());
    for (auto const &group : InFirstAppearance(reduced, keys)) {
      groups.push_back({calendar::FormatDate(group.key), group.value});
    }
  } else {
    auto const reduced = ReduceByKey<std::string>(records.Frame(), key,
                                                  measure, reduction, LabelKey);
    groups = InFirstAppearance(reduced, records.Labels(key));
  }

  if (key == column::DAY_OF_WEEK) {
    order = epoch_core::GroupOrder::Weekday;
  }
  OrderGroups(groups, order);
  return groups;
}

MonthGroups GroupMonths(data::RecordSet const &records,
                        std::string const &measure,
                        epoch_core::GroupReduction reduction) {
  records.RequireColumns({column::DATE, measure}, "monthly " + measure);
  if (records.Empty()) {
    return {};
  }

  auto const &frame = records.Frame();
  const auto monthStarts = calendar::MonthStarts(
      frame[column::DATE].contiguous_array().value());
  const auto byMonth = epoch_frame::make_dataframe(
      frame.index(),
      {arrow::ChunkedArray::Make({monthStarts}).ValueOrDie(),
       frame[measure].array()},
      {MONTH_START, measure});
  return Chronological(ReduceByKey<calendar::Date>(byMonth, MONTH_START,
                                                   measure, reduction,
                                                   DateKey));
}
} // namespace

double ReducedValue(epoch_frame::Scalar const &reduced,
                    epoch_core::GroupReduction reduction) {
  if (!reduced.is_null()) {
    return reduced.as_double();
  }
  return reduction == epoch_core::GroupReduction::sum
             ? 0.0
             : std::numeric_limits<double>::quiet_NaN();
}

void SortByWeekday(LabelGroups &groups) {
  std::stable_sort(groups.begin(), groups.end(),
                   [](auto const &a, auto const &b) {
                     return WeekdayRank(a.key).value_or(WEEKDAY_ORDER.size()) <
                            WeekdayRank(b.key).value_or(WEEKDAY_ORDER.size());
                   });
}

void OrderGroups(LabelGroups &groups, epoch_core::GroupOrder order) {
  switch (order) {
  case epoch_core::GroupOrder::Weekday:
    SortByWeekday(groups);
    break;
  case epoch_core::GroupOrder::KeyAscending:
    SortByKey(groups);
    break;
  case epoch_core::GroupOrder::ValueDescending:
    SortByValueDescending(groups);
    break;
  case epoch_core::GroupOrder::FirstAppearance:
  default:
    break;
  }
}

LabelGroups GroupMean(data::RecordSet const &records, std::string const &key,
                      std::string const &measure,
                      epoch_core::GroupOrder order) {
  return GroupLabels(records, key, measure, epoch_core::GroupReduction::mean,
                     order);
}

LabelGroups GroupSum(data::RecordSet const &records, std::string const &key,
                     std::string const &measure, epoch_core::GroupOrder order) {
  return GroupLabels(records, key, measure, epoch_core::GroupReduction::sum,
                     order);
}

DateGroups DailySum(data::RecordSet const &records,
                    std::string const &measure) {
  records.RequireColumns({column::DATE, measure}, "daily " + measure);
  return Chronological(ReduceByKey<calendar::Date>(
      records.Frame(), column::DATE, measure,
      epoch_core::GroupReduction::sum, DateKey));
}

std::vector<calendar::Date> MonthlyBucket(data::RecordSet const &records) {
  records.RequireColumns({column::DATE}, "monthly bucket");

  std::vector<calendar::Date> buckets;
  if (records.Empty()) {
    return buckets;
  }
  const auto starts = std::static_pointer_cast<arrow::TimestampArray>(
      calendar::MonthStarts(
          records.Frame()[column::DATE].contiguous_array().value()));
  buckets.reserve(starts->length());
  for (int64_t i = 0; i < starts->length(); ++i) {
    buckets.push_back(calendar::FromTimestamp(starts->Value(i)));
  }
  return buckets;
}

MonthGroups MonthlyMean(data::RecordSet const &records,
                        std::string const &measure) {
  return GroupMonths(records, measure, epoch_core::GroupReduction::mean);
}

MonthGroups MonthlySum(data::RecordSet const &records,
                       std::string const &measure) {
  return GroupMonths(records, measure, epoch_core::GroupReduction::sum);
}

std::string CategoryName(std::string_view column) {
  std::string_view prefix{column::CATEGORY_PREFIX};
  if (column.starts_with(prefix)) {
    column.remove_prefix(prefix.size());
  }
  return std::string{column};
}

LabelGroups CategoryShare(data::RecordSet const &records,
                          std::vector<std::string> const &categoryColumns) {
  records.RequireColumns(categoryColumns, "category share");

  LabelGroups shares;
  shares.reserve(categoryColumns.size());
  for (auto const &name : categoryColumns) {
    const double total =
        records.Empty()
            ? 0.0
            : ReducedValue(records.Frame()[name].sum(),
                           epoch_core::GroupReduction::sum);
    shares.push_back({CategoryName(name), total});
  }
  return shares;
}

} // namespace retail_lens::aggregation
