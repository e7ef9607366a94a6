#include <retail_lens/views/view_registry.h>

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace retail_lens::views {

ViewRegistry &ViewRegistry::GetInstance() {
  static ViewRegistry instance;
  return instance;
}

void ViewRegistry::Register(ViewMetaData metadata, Factory factory) {
  if (m_positions.contains(metadata.id)) {
    throw std::runtime_error("View already registered: " + metadata.id);
  }
  SPDLOG_DEBUG("Registering view {}", metadata.id);
  m_positions.emplace(metadata.id, m_entries.size());
  m_entries.push_back({std::move(metadata), std::move(factory)});
}

bool ViewRegistry::Contains(std::string const &id) const {
  return m_positions.contains(id);
}

std::optional<std::reference_wrapper<const ViewMetaData>>
ViewRegistry::GetMetaData(std::string const &id) const {
  auto iter = m_positions.find(id);
  if (iter == m_positions.end()) {
    return std::nullopt;
  }
  return std::cref(m_entries[iter->second].metadata);
}

IViewPtr ViewRegistry::Create(std::string const &id,
                              ViewOptions const &options) const {
  auto iter = m_positions.find(id);
  if (iter == m_positions.end()) {
    throw std::runtime_error("Unknown view: " + id);
  }
  auto const &entry = m_entries[iter->second];
  return entry.factory(entry.metadata, options);
}

std::vector<std::string> ViewRegistry::GetIds() const {
  std::vector<std::string> ids;
  ids.reserve(m_entries.size());
  for (auto const &entry : m_entries) {
    ids.push_back(entry.metadata.id);
  }
  return ids;
}

} // namespace retail_lens::views
