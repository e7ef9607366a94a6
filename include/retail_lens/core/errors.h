#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace retail_lens {

// The backing data file does not exist. Fatal for the session.
class SourceNotFoundError : public std::runtime_error {
public:
  explicit SourceNotFoundError(std::filesystem::path path);

  const std::filesystem::path &GetPath() const { return m_path; }

private:
  std::filesystem::path m_path;
};

/**
 * One or more required columns are absent.
 *
 * Carries every missing column at once so the caller can report them in a
 * single message. `context` names what needed the columns (a view id, the
 * headline, the record store).
 */
class SchemaInvalidError : public std::runtime_error {
public:
  SchemaInvalidError(std::string context,
                     std::vector<std::string> missingColumns);

  const std::string &GetContext() const { return m_context; }
  const std::vector<std::string> &GetMissingColumns() const {
    return m_missingColumns;
  }

private:
  std::string m_context;
  std::vector<std::string> m_missingColumns;
};

} // namespace retail_lens
