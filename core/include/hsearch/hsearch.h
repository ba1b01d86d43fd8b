#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "hsearch/document.h"

namespace hsearch {

/// Selects the HTML parser used to build documents from raw text.
/// Strict reports malformed markup; Libxml2 recovers silently.
enum class HtmlParserBackend { Strict, Libxml2 };

/// Describes a parse failure with a message and byte position.
/// MUST report positions relative to the parsed input string.
struct ParseError {
  std::string message;
  size_t position = 0;
};

/// Raw input text tagged with the name it is reported under.
struct SourceText {
  std::string path;
  std::string content;
};

/// Where the CLI reads HTML from; Stdin is reported under the name "stdin".
struct SearchInputs {
  enum class Kind { Stdin, Files } kind = Kind::Stdin;
  std::vector<std::string> paths;
};

struct SearchOptions {
  /// Truncates the combined cross-file result list; nullopt keeps everything.
  std::optional<size_t> max_results;
  HtmlParserBackend parser = HtmlParserBackend::Strict;
};

/// Holds one matched subtree together with the input it came from.
/// MUST hold an element node, never a text node.
struct FileMatch {
  std::string path;
  HtmlNode node;
};

/// Identifies the first failure of a search run.
/// MUST carry the offending path for FileNotFound/HtmlParse and a parse_error for parse kinds.
struct SearchError {
  enum class Kind { FileNotFound, HtmlParse, QueryParse } kind = Kind::FileNotFound;
  std::string path;
  ParseError parse_error;
};

/// Wraps either the ordered match list or the first error.
/// MUST leave matches empty whenever error is set.
struct SearchResult {
  std::vector<FileMatch> matches;
  std::optional<SearchError> error;
};

/// Parses the query, then every source, then searches them in order.
/// MUST fail fast on the first error and MUST NOT return partial matches.
/// Inputs are query text/sources/options; outputs are SearchResult with no side effects.
SearchResult search_sources(const std::string& query,
                            const std::vector<SourceText>& sources,
                            const SearchOptions& options);
/// Same as search_sources but reads files or stdin first.
/// MUST NOT touch the filesystem when the query does not parse.
/// Inputs are query text/inputs/options; side effects are file and stdin reads.
SearchResult search_inputs(const std::string& query,
                           const SearchInputs& inputs,
                           const SearchOptions& options);

/// Serializes a subtree back to HTML text.
/// MUST emit children in order and MUST escape text and attribute values.
/// script/style content is emitted verbatim.
std::string render_html(const HtmlNode& node);
/// Formats a SearchError as a single user-facing line.
std::string describe_error(const SearchError& error);

}  // namespace hsearch
