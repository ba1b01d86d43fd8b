#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "ast.h"
#include "hsearch/hsearch.h"

namespace hsearch {

/// A parsed input tagged with the name it is reported under.
struct SourceDocument {
  std::string path;
  HtmlDocument document;
};

/// Wraps either the loaded inputs or the first FileNotFound error.
struct LoadResult {
  std::vector<SourceText> sources;
  std::optional<SearchError> error;
};

/// Wraps either every parsed document or the first HtmlParse error.
struct ParseSourcesResult {
  std::vector<SourceDocument> documents;
  std::optional<SearchError> error;
};

/// Reads a file fully into memory.
/// MUST return nullopt when the path is missing, a directory, or unreadable.
std::optional<std::string> read_file(const std::string& path);
/// Loads stdin (as "stdin") or each file in order.
/// MUST stop at the first missing path and MUST NOT return partial sources with an error.
/// Inputs are input kinds/stream; side effects are file and stream reads.
LoadResult read_inputs(const SearchInputs& inputs, std::istream& in);
/// Parses every source in order with one backend.
/// MUST report the first failing source and discard everything else.
ParseSourcesResult parse_sources(const std::vector<SourceText>& sources, HtmlParserBackend backend);

/// Searches each document in order and tags matches with their path.
/// MUST keep file order, then in-document order; files without matches add nothing.
std::vector<FileMatch> search_files(const Query& query, const std::vector<SourceDocument>& documents);
/// Truncates the combined list to its first max_results entries.
void apply_max_results(std::vector<FileMatch>& matches, std::optional<size_t> max_results);

/// Parses sources then searches them with an already-parsed query.
/// MUST fail fast on the first parse error and MUST apply max_results after aggregation.
SearchResult run_search(const Query& query,
                        const std::vector<SourceText>& sources,
                        const SearchOptions& options);

}  // namespace hsearch
