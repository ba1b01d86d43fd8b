#pragma once

#include <optional>
#include <string>

#include "hsearch/document.h"
#include "hsearch/hsearch.h"

namespace hsearch {

/// Wraps either a parsed HtmlDocument or a ParseError.
/// MUST contain exactly one of document or error.
struct HtmlParseResult {
  std::optional<HtmlDocument> document;
  std::optional<ParseError> error;
};

/// Parses HTML text with the selected backend.
/// MUST NOT throw on malformed input; failures come back as ParseError.
/// Inputs are HTML strings; outputs are HtmlParseResult with no side effects.
HtmlParseResult parse_html(const std::string& html, HtmlParserBackend backend);

/// Maps a backend name ("strict", "libxml2") to its enum value.
std::optional<HtmlParserBackend> parse_backend_name(const std::string& name);
std::string backend_name(HtmlParserBackend backend);

/// Tests whether a tag is an HTML void element (br, img, ...), case-insensitively.
/// Void elements never take children or a close tag.
bool is_void_element(const std::string& tag);
/// Tests whether a tag holds raw text (script, style), case-insensitively.
/// Raw text is never entity-decoded or escaped.
bool is_raw_text_element(const std::string& tag);

}  // namespace hsearch
