#pragma once
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <retail_lens/views/iview.h>

namespace retail_lens::views {

class ViewRegistry {
public:
  using Factory =
      std::function<IViewPtr(ViewMetaData const &, ViewOptions const &)>;

  static ViewRegistry &GetInstance();

  void Register(ViewMetaData metadata, Factory factory);

  bool Contains(std::string const &id) const;

  std::optional<std::reference_wrapper<const ViewMetaData>>
  GetMetaData(std::string const &id) const;

  // Throws std::runtime_error for an unknown id
  IViewPtr Create(std::string const &id, ViewOptions const &options) const;

  // Registration order
  std::vector<std::string> GetIds() const;

private:
  ViewRegistry() = default;

  struct Entry {
    ViewMetaData metadata;
    Factory factory;
  };
  std::vector<Entry> m_entries;
  std::unordered_map<std::string, size_t> m_positions;
};

template <typename ViewClass> void RegisterView() {
  ViewRegistry::GetInstance().Register(
      ViewMetadata<ViewClass>::Get(),
      [](ViewMetaData const &metadata, ViewOptions const &options) -> IViewPtr {
        return std::make_unique<ViewClass>(metadata, options);
      });
}

// Registers the built-in views once; later calls do nothing
void RegisterBuiltinViews();

} // namespace retail_lens::views
