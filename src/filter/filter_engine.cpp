#include <retail_lens/filter/filter_engine.h>
#include <retail_lens/core/compute.h>
#include <retail_lens/core/constants.h>

#include <arrow/api.h>
#include <epoch_frame/scalar.h>
#include <spdlog/spdlog.h>

namespace retail_lens::filter {

namespace {
// Null labels never match: the implicit domain only holds observed values.
epoch_frame::Series InSet(epoch_frame::DataFrame const &frame,
                          std::string const &column,
                          std::set<std::string> const &allowed) {
  arrow::StringBuilder builder;
  for (auto const &value : allowed) {
    if (auto status = builder.Append(value); !status.ok()) {
      throw std::runtime_error("Failed to build filter set: " +
                               status.ToString());
    }
  }
  const arrow::compute::SetLookupOptions options{
      builder.Finish().ValueOrDie()};
  return epoch_frame::Series(
      frame.index(),
      compute::Call("is_in", {frame[column].array()}, &options).chunked_array(),
      column);
}

epoch_frame::Series
FacetMask(epoch_frame::DataFrame const &frame, std::string const &column,
          std::optional<std::set<std::string>> const &allowed) {
  return allowed ? InSet(frame, column, *allowed) : frame[column].is_valid();
}

std::set<std::string> CanonicalDays() {
  std::set<std::string> days;
  for (auto day : WEEKDAY_ORDER) {
    days.emplace(day);
  }
  return days;
}

epoch_frame::Scalar Midnight(calendar::Date date) {
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
                         date.time_since_epoch())
                         .count();
  return epoch_frame::Scalar(std::make_shared<arrow::TimestampScalar>(
      nanos, arrow::timestamp(arrow::TimeUnit::NANO)));
}
} // namespace

data::RecordSet FilterEngine::Apply(data::RecordSet const &records,
                                    FilterSpec const &spec) {
  if (records.Empty()) {
    return records;
  }

  auto const &frame = records.Frame();
  // An unset weekday facet still only admits the seven canonical labels
  static const std::set<std::string> canonicalDays = CanonicalDays();

  auto mask = InSet(frame, column::DAY_OF_WEEK,
                    spec.days.value_or(canonicalDays)) &&
              FacetMask(frame, column::SEASON, spec.seasons) &&
              FacetMask(frame, column::MONTH, spec.months);

  const auto dates = frame[column::DATE];
  if (spec.dateFrom) {
    mask = mask && (dates >= Midnight(*spec.dateFrom));
  }
  if (spec.dateTo) {
    mask = mask && (dates <= Midnight(*spec.dateTo));
  }

  const auto kept = mask.sum().value<size_t>().value();
  SPDLOG_DEBUG("Filter {} kept {} of {} records", spec.ToString(), kept,
               records.Size());

  if (kept == records.Size()) {
    return records;
  }
  return data::RecordSet{frame.loc(mask)};
}

} // namespace retail_lens::filter
