#include "html_parser.h"

#include "html/parser_impl.h"
#include "util/string_util.h"

namespace hsearch {

/// Dispatches HTML parsing to the selected backend.
/// MUST keep the strict backend as the default for exact error reporting.
/// Inputs are HTML strings; outputs are HtmlParseResult with no side effects.
HtmlParseResult parse_html(const std::string& html, HtmlParserBackend backend) {
  switch (backend) {
    case HtmlParserBackend::Libxml2:
      return parse_html_libxml2(html);
    case HtmlParserBackend::Strict:
      break;
  }
  return parse_html_strict(html);
}

std::optional<HtmlParserBackend> parse_backend_name(const std::string& name) {
  std::string lower = util::to_lower(util::trim_ws(name));
  if (lower == "strict") return HtmlParserBackend::Strict;
  if (lower == "libxml2") return HtmlParserBackend::Libxml2;
  return std::nullopt;
}

std::string backend_name(HtmlParserBackend backend) {
  return backend == HtmlParserBackend::Libxml2 ? "libxml2" : "strict";
}

bool is_void_element(const std::string& tag) {
  static const char* const kVoid[] = {"area", "base",  "br",     "col",   "embed", "hr",  "img",
                                      "input", "link", "meta", "source", "track", "wbr"};
  std::string lower = util::to_lower(tag);
  for (const char* name : kVoid) {
    if (lower == name) return true;
  }
  return false;
}

bool is_raw_text_element(const std::string& tag) {
  std::string lower = util::to_lower(tag);
  return lower == "script" || lower == "style";
}

}  // namespace hsearch
