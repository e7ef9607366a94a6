#include <retail_lens/dashboard/dashboard_config.h>

#include <fmt/format.h>
#include <retail_lens/core/errors.h>
#include <retail_lens/views/view_registry.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace retail_lens::dashboard {

DashboardConfig DashboardConfig::Defaults() {
  views::RegisterBuiltinViews();
  DashboardConfig config;
  config.views = views::ViewRegistry::GetInstance().GetIds();
  return config;
}

DashboardConfig DashboardConfig::FromFile(std::filesystem::path const &path) {
  if (!std::filesystem::exists(path)) {
    throw SourceNotFoundError(path);
  }

  auto config = Defaults();
  config.decode(YAML::LoadFile(path.string()));
  if (config.source.is_relative()) {
    config.source = path.parent_path() / config.source;
  }
  SPDLOG_INFO("Loaded dashboard config {} (source {}, {} views)",
              path.string(), config.source.string(), config.views.size());
  return config;
}

void DashboardConfig::Validate() const {
  views::RegisterBuiltinViews();
  auto const &registry = views::ViewRegistry::GetInstance();
  for (auto const &id : views) {
    if (!registry.Contains(id)) {
      throw std::invalid_argument(
          fmt::format("Unknown view id '{}', expected one of: {}", id,
                      fmt::join(registry.GetIds(), ", ")));
    }
  }
  if (densityBins == 0) {
    throw std::invalid_argument("density_bins must be at least 1");
  }
}

void DashboardConfig::decode(YAML::Node const &node) {
  if (!node || node.IsNull()) {
    Validate();
    return;
  }
  if (!node.IsMap()) {
    throw std::runtime_error("Dashboard config must be a map");
  }

  if (auto sourceNode = node["source"]) {
    source = sourceNode.as<std::string>();
  }
  if (auto viewsNode = node["views"]) {
    views = viewsNode.as<std::vector<std::string>>();
  }
  if (auto binsNode = node["density_bins"]) {
    auto bins = binsNode.as<int64_t>();
    if (bins <= 0) {
      throw std::invalid_argument(
          fmt::format("density_bins must be at least 1, got {}", bins));
    }
    densityBins = static_cast<size_t>(bins);
  }
  if (auto filterNode = node["filter"]) {
    initialFilter = filterNode.as<filter::FilterSpec>();
  }

  Validate();
}

} // namespace retail_lens::dashboard
