#include <retail_lens/core/errors.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace retail_lens {

SourceNotFoundError::SourceNotFoundError(std::filesystem::path path)
    : std::runtime_error(
          fmt::format("Data source not found: {}", path.string())),
      m_path(std::move(path)) {}

SchemaInvalidError::SchemaInvalidError(std::string context,
                                       std::vector<std::string> missingColumns)
    : std::runtime_error(fmt::format("{}: missing columns: {}", context,
                                     fmt::join(missingColumns, ", "))),
      m_context(std::move(context)),
      m_missingColumns(std::move(missingColumns)) {}

} // namespace retail_lens
