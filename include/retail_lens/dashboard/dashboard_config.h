#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include <retail_lens/core/constants.h>
#include <retail_lens/filter/filter_spec.h>
#include <yaml-cpp/yaml.h>

namespace retail_lens::dashboard {

struct DashboardConfig {
  std::filesystem::path source{DEFAULT_SOURCE_FILE};
  std::vector<std::string> views;
  size_t densityBins{DEFAULT_DENSITY_BINS};
  filter::FilterSpec initialFilter;

  // Every registered view, default source and bin count, no filter
  static DashboardConfig Defaults();

  // Relative `source` paths resolve against the directory of `path`
  static DashboardConfig FromFile(std::filesystem::path const &path);

  // Throws std::invalid_argument for an unknown view id or zero bins
  void Validate() const;

  void decode(YAML::Node const &node);
};

} // namespace retail_lens::dashboard

namespace YAML {
template <> struct convert<retail_lens::dashboard::DashboardConfig> {
  static bool decode(Node const &node,
                     retail_lens::dashboard::DashboardConfig &rhs) {
    rhs.decode(node);
    return true;
  }
};
} // namespace YAML
