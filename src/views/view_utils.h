#pragma once
#include <string>
#include <vector>

#include <epoch_frame/factory/array_factory.h>
#include <epoch_frame/factory/dataframe_factory.h>
#include <epoch_frame/factory/index_factory.h>
#include <retail_lens/aggregation/aggregation.h>

namespace retail_lens::views::utils {

// Range-indexed table; every column must hold `rows` values
inline epoch_frame::DataFrame
MakeTable(size_t rows, std::vector<arrow::ChunkedArrayPtr> const &columns,
          std::vector<std::string> const &names) {
  auto index =
      epoch_frame::factory::index::from_range(static_cast<int64_t>(rows));
  return epoch_frame::make_dataframe(index, columns, names);
}

// Two column table: group key, group value
inline epoch_frame::DataFrame
MakeLabelTable(aggregation::LabelGroups const &groups,
               std::string const &keyName, std::string const &valueName) {
  std::vector<std::string> keys;
  std::vector<double> values;
  keys.reserve(groups.size());
  values.reserve(groups.size());
  for (auto const &group : groups) {
    keys.push_back(group.key);
    values.push_back(group.value);
  }
  return MakeTable(groups.size(),
                   {epoch_frame::factory::array::make_array(keys),
                    epoch_frame::factory::array::make_array(values)},
                   {keyName, valueName});
}

} // namespace retail_lens::views::utils
