#include "hsearch/hsearch.h"

#include <iostream>

#include "../executor.h"
#include "../html_parser.h"
#include "../query_parser.h"
#include "../search.h"

namespace hsearch {

ParseSourcesResult parse_sources(const std::vector<SourceText>& sources, HtmlParserBackend backend) {
  ParseSourcesResult result;
  result.documents.reserve(sources.size());
  for (const auto& source : sources) {
    HtmlParseResult parsed = parse_html(source.content, backend);
    if (parsed.error.has_value()) {
      SearchError error;
      error.kind = SearchError::Kind::HtmlParse;
      error.path = source.path;
      error.parse_error = *parsed.error;
      result.documents.clear();
      result.error = error;
      return result;
    }
    result.documents.push_back(SourceDocument{source.path, std::move(*parsed.document)});
  }
  return result;
}

std::vector<FileMatch> search_files(const Query& query, const std::vector<SourceDocument>& documents) {
  std::vector<FileMatch> out;
  for (const auto& source : documents) {
    for (const HtmlNode* node : search_document(query, source.document)) {
      out.push_back(FileMatch{source.path, *node});
    }
  }
  return out;
}

void apply_max_results(std::vector<FileMatch>& matches, std::optional<size_t> max_results) {
  if (max_results.has_value() && matches.size() > *max_results) {
    matches.resize(*max_results);
  }
}

SearchResult run_search(const Query& query,
                        const std::vector<SourceText>& sources,
                        const SearchOptions& options) {
  SearchResult result;
  ParseSourcesResult parsed = parse_sources(sources, options.parser);
  if (parsed.error.has_value()) {
    result.error = parsed.error;
    return result;
  }
  result.matches = search_files(query, parsed.documents);
  apply_max_results(result.matches, options.max_results);
  return result;
}

namespace {

std::optional<SearchError> parse_query_or_error(const std::string& text, Query& out) {
  QueryParseResult parsed = parse_query(text);
  if (parsed.error.has_value()) {
    SearchError error;
    error.kind = SearchError::Kind::QueryParse;
    error.parse_error = *parsed.error;
    return error;
  }
  out = std::move(*parsed.query);
  return std::nullopt;
}

}  // namespace

/// Executes a search over in-memory sources for zero-IO operation.
/// MUST parse the query before any source is parsed.
/// Inputs are query/sources/options; outputs are SearchResult with no side effects.
SearchResult search_sources(const std::string& query,
                            const std::vector<SourceText>& sources,
                            const SearchOptions& options) {
  Query parsed;
  if (auto error = parse_query_or_error(query, parsed)) {
    SearchResult result;
    result.error = error;
    return result;
  }
  return run_search(parsed, sources, options);
}

SearchResult search_inputs(const std::string& query,
                           const SearchInputs& inputs,
                           const SearchOptions& options) {
  SearchResult result;
  Query parsed;
  if (auto error = parse_query_or_error(query, parsed)) {
    result.error = error;
    return result;
  }
  LoadResult loaded = read_inputs(inputs, std::cin);
  if (loaded.error.has_value()) {
    result.error = loaded.error;
    return result;
  }
  return run_search(parsed, loaded.sources, options);
}

}  // namespace hsearch
