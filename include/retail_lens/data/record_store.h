#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <epoch_frame/dataframe.h>
#include <retail_lens/data/record_set.h>

namespace retail_lens::data {

// Option domains for the filter surface, taken from the loaded data
struct FacetDomains {
  std::vector<std::string> days;    // Monday..Sunday order, only those present
  std::vector<std::string> seasons; // sorted
  std::vector<std::string> months;  // sorted YYYY-MM
  std::optional<calendar::Date> minDate;
  std::optional<calendar::Date> maxDate;

  static FacetDomains FromRecords(RecordSet const &records);
};

/**
 * Session-wide store of transaction records.
 *
 * Built once from the source file and immutable afterwards. Rows whose
 * `date` is missing or cannot be parsed are dropped during normalization;
 * they are not reported as errors.
 */
class RecordStore {
public:
  // Throws SourceNotFoundError when the file is absent and
  // SchemaInvalidError when a filter facet column is missing.
  static RecordStore Load(std::filesystem::path const &source);

  // Normalizes an already parsed frame, as Load does after reading the file
  static RecordStore FromFrame(epoch_frame::DataFrame const &raw);

  const RecordSet &Records() const { return m_records; }
  const FacetDomains &Facets() const { return m_facets; }

  size_t DroppedRows() const { return m_droppedRows; }

private:
  RecordStore(RecordSet records, size_t droppedRows);

  RecordSet m_records;
  FacetDomains m_facets;
  size_t m_droppedRows{0};
};

} // namespace retail_lens::data
