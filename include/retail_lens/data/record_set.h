#pragma once
#include <optional>
#include <string>
#include <vector>

#include <epoch_frame/dataframe.h>
#include <retail_lens/core/calendar.h>

namespace retail_lens::data {

/**
 * Immutable, ordered set of transaction records.
 *
 * Wraps a normalized epoch_frame::DataFrame (see RecordStore): `date` is a
 * timestamp column with no nulls, label columns are strings, measure columns
 * are float64 and `month` holds the YYYY-MM bucket. Filtering produces a new
 * RecordSet sharing the underlying Arrow buffers; nothing is mutated.
 */
class RecordSet {
public:
  RecordSet() = default;
  explicit RecordSet(epoch_frame::DataFrame frame)
      : m_frame(std::move(frame)) {}

  const epoch_frame::DataFrame &Frame() const { return m_frame; }

  size_t Size() const { return m_frame.num_rows(); }
  bool Empty() const { return Size() == 0; }

  bool HasColumn(std::string const &column) const;

  // Subset of `columns` that is absent, in the order given
  std::vector<std::string>
  MissingColumns(std::vector<std::string> const &columns) const;

  // Throws SchemaInvalidError naming every absent column
  void RequireColumns(std::vector<std::string> const &columns,
                      std::string const &context) const;

  std::vector<calendar::Date> Dates() const;

  // Null cells come back as nullopt
  std::vector<std::optional<std::string>>
  Labels(std::string const &column) const;

  // Null cells come back as NaN
  std::vector<double> Measures(std::string const &column) const;

private:
  epoch_frame::DataFrame m_frame;
};

} // namespace retail_lens::data
