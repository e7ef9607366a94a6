#include <retail_lens/core/calendar.h>
#include <retail_lens/core/compute.h>

#include <arrow/api.h>
#include <arrow/compute/api.h>
#include <fmt/format.h>

namespace retail_lens::calendar {

namespace {
constexpr auto DATE_PATTERN =
    R"(^(?P<year>\d{4})(?P<sep>[-/])(?P<month>\d{1,2})(?P<sep2>[-/]))"
    R"((?P<day>\d{1,2})(?:[T ].*)?$)";

std::shared_ptr<arrow::DataType> TimestampType() {
  return arrow::timestamp(arrow::TimeUnit::NANO);
}

std::shared_ptr<arrow::Array>
ParseDateText(std::shared_ptr<arrow::Array> const &text) {
  const arrow::compute::TrimOptions trim{" \t\r\n\""};
  const auto trimmed = compute::Call("utf8_trim", {text}, &trim);

  const arrow::compute::ExtractRegexOptions extract{DATE_PATTERN};
  const auto parts = std::static_pointer_cast<arrow::StructArray>(
      compute::CallArray("extract_regex", {trimmed}, &extract));
  // Unmatched rows are null structs; flattening carries that into each part
  const auto year = parts->GetFlattenedField(0).ValueOrDie();
  const auto separator = parts->GetFlattenedField(1).ValueOrDie();
  const auto month = parts->GetFlattenedField(2).ValueOrDie();
  const auto secondSeparator = parts->GetFlattenedField(3).ValueOrDie();
  const auto day = parts->GetFlattenedField(4).ValueOrDie();

  const arrow::compute::PadOptions pad{2, "0"};
  const auto iso = compute::Call(
      "binary_join_element_wise",
      {year, compute::Call("utf8_lpad", {month}, &pad),
       compute::Call("utf8_lpad", {day}, &pad),
       arrow::Datum{std::make_shared<arrow::StringScalar>("-")}});

  const arrow::compute::StrptimeOptions strptime{"%Y-%m-%d",
                                                 arrow::TimeUnit::NANO, true};
  const auto parsed = compute::Call("strptime", {iso}, &strptime);

  // 2023-02-30 must not come back as 2023-03-02
  const auto dayKept = compute::Call(
      "equal", {compute::Call("day", {parsed}),
                compute::CastArray(day, arrow::int64())});
  const auto sameSeparator =
      compute::Call("equal", {separator, secondSeparator});
  const auto valid = compute::Call("and", {dayKept, sameSeparator});

  return compute::CallArray(
      "if_else", {valid, parsed, arrow::MakeNullScalar(TimestampType())});
}
} // namespace

std::optional<Date> ParseDate(std::string_view text) {
  const auto cells =
      arrow::MakeArrayFromScalar(arrow::StringScalar{std::string{text}}, 1)
          .ValueOrDie();
  const auto parsed =
      std::static_pointer_cast<arrow::TimestampArray>(ParseDates(cells));
  if (parsed->IsNull(0)) {
    return std::nullopt;
  }
  return FromTimestamp(parsed->Value(0));
}

std::shared_ptr<arrow::Array>
ParseDates(std::shared_ptr<arrow::Array> const &cells) {
  switch (cells->type_id()) {
  case arrow::Type::NA:
    return arrow::MakeArrayOfNull(TimestampType(), cells->length())
        .ValueOrDie();
  case arrow::Type::STRING:
    return ParseDateText(cells);
  case arrow::Type::DATE32:
  case arrow::Type::DATE64:
  case arrow::Type::TIMESTAMP: {
    const arrow::compute::RoundTemporalOptions toDay{
        1, arrow::compute::CalendarUnit::DAY};
    return compute::CallArray(
        "floor_temporal", {compute::CastArray(cells, TimestampType())},
        &toDay);
  }
  default:
    return ParseDateText(compute::CastArray(cells, arrow::utf8()));
  }
}

std::shared_ptr<arrow::Array>
MonthBuckets(std::shared_ptr<arrow::Array> const &timestamps) {
  const arrow::compute::StrftimeOptions format{"%Y-%m", "C"};
  return compute::CallArray("strftime", {timestamps}, &format);
}

std::shared_ptr<arrow::Array>
MonthStarts(std::shared_ptr<arrow::Array> const &timestamps) {
  const arrow::compute::RoundTemporalOptions toMonth{
      1, arrow::compute::CalendarUnit::MONTH};
  return compute::CallArray("floor_temporal", {timestamps}, &toMonth);
}

std::string FormatDate(Date date) {
  const std::chrono::year_month_day ymd{date};
  return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                     static_cast<unsigned>(ymd.month()),
                     static_cast<unsigned>(ymd.day()));
}

std::string FormatMonthBucket(Date date) {
  const std::chrono::year_month_day ymd{date};
  return fmt::format("{:04}-{:02}", static_cast<int>(ymd.year()),
                     static_cast<unsigned>(ymd.month()));
}

epoch_frame::DateTime ToDateTime(Date date) {
  const std::chrono::year_month_day ymd{date};
  return epoch_frame::DateTime{ymd.year(), ymd.month(), ymd.day()};
}

Date FromTimestamp(int64_t nanoseconds) {
  const std::chrono::sys_time<std::chrono::nanoseconds> tp{
      std::chrono::nanoseconds{nanoseconds}};
  return std::chrono::floor<std::chrono::days>(tp);
}

} // namespace retail_lens::calendar
