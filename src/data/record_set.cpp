#include <retail_lens/data/record_set.h>
#include <retail_lens/core/constants.h>
#include <retail_lens/core/errors.h>

#include <arrow/api.h>
#include <limits>

namespace retail_lens::data {

bool RecordSet::HasColumn(std::string const &column) const {
  return m_frame.num_cols() > 0 && m_frame.contains(column);
}

std::vector<std::string>
RecordSet::MissingColumns(std::vector<std::string> const &columns) const {
  std::vector<std::string> missing;
  for (auto const &column : columns) {
    if (!HasColumn(column)) {
      missing.push_back(column);
    }
  }
  return missing;
}

void RecordSet::RequireColumns(std::vector<std::string> const &columns,
                               std::string const &context) const {
  auto missing = MissingColumns(columns);
  if (!missing.empty()) {
    throw SchemaInvalidError(context, std::move(missing));
  }
}

std::vector<calendar::Date> RecordSet::Dates() const {
  RequireColumns({column::DATE}, "record set");

  std::vector<calendar::Date> dates;
  if (Empty()) {
    return dates;
  }
  const auto timestamps = std::static_pointer_cast<arrow::TimestampArray>(
      m_frame[column::DATE].contiguous_array().value());
  dates.reserve(timestamps->length());
  for (int64_t i = 0; i < timestamps->length(); ++i) {
    dates.push_back(calendar::FromTimestamp(timestamps->Value(i)));
  }
  return dates;
}

std::vector<std::optional<std::string>>
RecordSet::Labels(std::string const &column) const {
  RequireColumns({column}, "record set");

  std::vector<std::optional<std::string>> labels;
  if (Empty()) {
    return labels;
  }
  auto array = m_frame[column].contiguous_array();
  if (array.type()->id() != arrow::Type::STRING) {
    array = array.cast(arrow::utf8());
  }
  const auto strings = std::static_pointer_cast<arrow::StringArray>(array.value());
  labels.reserve(strings->length());
  for (int64_t i = 0; i < strings->length(); ++i) {
    if (strings->IsNull(i)) {
      labels.emplace_back(std::nullopt);
    } else {
      labels.emplace_back(strings->GetString(i));
    }
  }
  return labels;
}

std::vector<double> RecordSet::Measures(std::string const &column) const {
  RequireColumns({column}, "record set");

  const auto n = m_frame.num_rows();
  std::vector<double> values(n, std::numeric_limits<double>::quiet_NaN());
  if (n == 0) {
    return values;
  }

  auto array = m_frame[column].contiguous_array();
  if (array.type()->id() != arrow::Type::DOUBLE) {
    array = array.cast(arrow::float64());
  }
  const auto view = array.to_view<double>();
  for (int64_t i = 0; i < view->length(); ++i) {
    if (!view->IsNull(i)) {
      values[i] = view->Value(i);
    }
  }
  return values;
}

} // namespace retail_lens::data
