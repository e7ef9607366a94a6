#pragma once
#include <memory>
#include <string>
#include <vector>

#include <epoch_frame/dataframe.h>
#include <retail_lens/core/constants.h>
#include <retail_lens/data/record_set.h>

namespace retail_lens::views {

struct ViewOptions {
  size_t densityBins{DEFAULT_DENSITY_BINS};
};

struct ViewMetaData {
  std::string id;
  std::string name;
  std::vector<std::string> requiredColumns;
  std::vector<std::string> outputColumns;
  std::string desc;
};

/**
 * A named derived table computed from the filtered records.
 *
 * Views are stateless and independent of each other: Compute only reads the
 * record set it is given and returns a fresh table whose columns are
 * GetMetaData().outputColumns, in that order.
 */
class IView {
public:
  IView(ViewMetaData metadata, ViewOptions options)
      : m_metadata(std::move(metadata)), m_options(options) {}

  const std::string &GetId() const { return m_metadata.id; }
  const ViewMetaData &GetMetaData() const { return m_metadata; }

  // Throws SchemaInvalidError listing every missing required column
  epoch_frame::DataFrame Compute(data::RecordSet const &records) const {
    records.RequireColumns(m_metadata.requiredColumns, m_metadata.id);
    return BuildTable(records);
  }

  virtual ~IView() = default;

protected:
  virtual epoch_frame::DataFrame
  BuildTable(data::RecordSet const &records) const = 0;

  ViewMetaData m_metadata;
  ViewOptions m_options;
};

using IViewPtr = std::unique_ptr<IView>;

// Each view specializes this to describe itself
template <typename ViewClass> struct ViewMetadata {
  static ViewMetaData Get() {
    static_assert(sizeof(ViewClass) == 0,
                  "View class must specialize ViewMetadata<T>::Get()");
    return {};
  }
};

} // namespace retail_lens::views
