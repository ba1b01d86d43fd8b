#include "../search.h"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace hsearch {

/// Loads file contents for a search run.
/// MUST report missing or unreadable paths as nullopt and MUST not perform network access.
/// Inputs are paths; outputs are contents with file IO side effects.
std::optional<std::string> read_file(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

LoadResult read_inputs(const SearchInputs& inputs, std::istream& in) {
  LoadResult result;
  if (inputs.kind == SearchInputs::Kind::Stdin) {
    std::ostringstream buffer;
    buffer << in.rdbuf();
    result.sources.push_back(SourceText{"stdin", buffer.str()});
    return result;
  }
  for (const auto& path : inputs.paths) {
    std::optional<std::string> content = read_file(path);
    if (!content.has_value()) {
      SearchError error;
      error.kind = SearchError::Kind::FileNotFound;
      error.path = path;
      result.sources.clear();
      result.error = error;
      return result;
    }
    result.sources.push_back(SourceText{path, std::move(*content)});
  }
  return result;
}

}  // namespace hsearch
