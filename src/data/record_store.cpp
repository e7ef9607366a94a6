#include <retail_lens/data/record_store.h>
#include <retail_lens/core/constants.h>
#include <retail_lens/core/compute.h>
#include <retail_lens/core/errors.h>

#include <algorithm>
#include <set>

#include <arrow/api.h>
#include <epoch_frame/factory/dataframe_factory.h>
#include <epoch_frame/factory/index_factory.h>
#include <epoch_frame/serialization.h>
#include <spdlog/spdlog.h>

namespace retail_lens::data {

namespace {
constexpr auto NUMBER_PATTERN = R"(^[+-]?(\d+\.?\d*|\.\d+)([eE][+-]?\d+)?$)";

std::shared_ptr<arrow::Array> Cells(epoch_frame::DataFrame const &raw,
                                    std::string const &name) {
  const auto chunked = raw[name].array();
  if (chunked->num_chunks() == 0) {
    return arrow::MakeEmptyArray(chunked->type()).ValueOrDie();
  }
  if (chunked->num_chunks() == 1) {
    return chunked->chunk(0);
  }
  return arrow::Concatenate(chunked->chunks()).ValueOrDie();
}

// Text labels; empty cells become null
std::shared_ptr<arrow::Array>
NormalizeLabels(std::shared_ptr<arrow::Array> const &cells) {
  const auto text = compute::CastArray(cells, arrow::utf8());
  const auto empty = compute::Call(
      "equal", {text, arrow::Datum{std::make_shared<arrow::StringScalar>("")}});
  return compute::CallArray(
      "if_else", {empty, arrow::MakeNullScalar(arrow::utf8()), text});
}

// float64 measures; NaN and text cells that are not numbers become null
std::shared_ptr<arrow::Array>
NormalizeMeasures(std::shared_ptr<arrow::Array> const &cells) {
  std::shared_ptr<arrow::Array> numbers;
  const auto typeId = cells->type_id();
  if (typeId == arrow::Type::STRING || typeId == arrow::Type::LARGE_STRING) {
    const auto trimmed = compute::Call(
        "utf8_trim_whitespace", {compute::CastArray(cells, arrow::utf8())});
    const arrow::compute::MatchSubstringOptions numeric{NUMBER_PATTERN};
    const auto isNumber =
        compute::Call("match_substring_regex", {trimmed}, &numeric);
    numbers = compute::CastArray(
        compute::CallArray("if_else", {isNumber, trimmed,
                                       arrow::MakeNullScalar(arrow::utf8())}),
        arrow::float64());
  } else {
    numbers = compute::CastArray(cells, arrow::float64());
  }
  return compute::CallArray("if_else",
                            {compute::Call("is_nan", {numbers}),
                             arrow::MakeNullScalar(arrow::float64()), numbers});
}

arrow::ChunkedArrayPtr Chunked(std::shared_ptr<arrow::Array> const &array) {
  return arrow::ChunkedArray::Make({array}).ValueOrDie();
}
} // namespace

FacetDomains FacetDomains::FromRecords(RecordSet const &records) {
  FacetDomains facets;

  std::set<std::string> presentDays;
  for (auto const &day : records.Labels(column::DAY_OF_WEEK)) {
    if (day) {
      presentDays.insert(*day);
    }
  }
  for (auto day : WEEKDAY_ORDER) {
    if (presentDays.contains(std::string{day})) {
      facets.days.emplace_back(day);
    }
  }

  std::set<std::string> seasons;
  for (auto const &season : records.Labels(column::SEASON)) {
    if (season) {
      seasons.insert(*season);
    }
  }
  facets.seasons.assign(seasons.begin(), seasons.end());

  std::set<std::string> months;
  for (auto const &month : records.Labels(column::MONTH)) {
    if (month) {
      months.insert(*month);
    }
  }
  facets.months.assign(months.begin(), months.end());

  const auto dates = records.Dates();
  if (!dates.empty()) {
    auto [lo, hi] = std::minmax_element(dates.begin(), dates.end());
    facets.minDate = *lo;
    facets.maxDate = *hi;
  }
  return facets;
}

RecordStore::RecordStore(RecordSet records, size_t droppedRows)
    : m_records(std::move(records)),
      m_facets(FacetDomains::FromRecords(m_records)),
      m_droppedRows(droppedRows) {}

RecordStore RecordStore::Load(std::filesystem::path const &source) {
  if (!std::filesystem::exists(source)) {
    throw SourceNotFoundError(source);
  }

  auto result =
      epoch_frame::read_csv_file(source.string(), epoch_frame::CSVReadOptions{});
  if (!result.ok()) {
    throw std::runtime_error("Failed to read " + source.string() + ": " +
                             result.status().ToString());
  }

  auto store = FromFrame(result.ValueOrDie());
  SPDLOG_INFO("Loaded {} records from {} ({} dropped for invalid dates)",
              store.Records().Size(), source.string(), store.DroppedRows());
  return store;
}

RecordStore RecordStore::FromFrame(epoch_frame::DataFrame const &raw) {
  std::vector<std::string> missing;
  for (auto const &name : column::FILTER_FACETS) {
    if (raw.num_cols() == 0 || !raw.contains(name)) {
      missing.push_back(name);
    }
  }
  if (!missing.empty()) {
    throw SchemaInvalidError("record store", std::move(missing));
  }

  const auto n = raw.num_rows();
  const auto dates = calendar::ParseDates(Cells(raw, column::DATE));

  std::vector<arrow::ChunkedArrayPtr> columns{Chunked(dates)};
  std::vector<std::string> names{column::DATE};

  for (auto const &name : column::LABELS) {
    if (!raw.contains(name)) {
      SPDLOG_DEBUG("Source has no '{}' column", name);
      continue;
    }
    columns.push_back(Chunked(NormalizeLabels(Cells(raw, name))));
    names.push_back(name);
  }

  for (auto const &name : column::MEASURES) {
    if (!raw.contains(name)) {
      SPDLOG_DEBUG("Source has no '{}' column", name);
      continue;
    }
    columns.push_back(Chunked(NormalizeMeasures(Cells(raw, name))));
    names.push_back(name);
  }

  columns.push_back(Chunked(calendar::MonthBuckets(dates)));
  names.emplace_back(column::MONTH);

  auto frame = epoch_frame::make_dataframe(
      epoch_frame::factory::index::from_range(static_cast<int64_t>(n)),
      columns, names);

  const auto dropped = static_cast<size_t>(dates->null_count());
  if (dropped > 0) {
    SPDLOG_WARN("Dropped {} of {} rows with a missing or unparseable date",
                dropped, n);
    frame = frame.loc(frame[column::DATE].is_valid());
  }
  return RecordStore{RecordSet{std::move(frame)}, dropped};
}

} // namespace retail_lens::data
