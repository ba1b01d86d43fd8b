#include "hsearch/hsearch.h"

#include "../html/entities.h"
#include "../html_parser.h"

namespace hsearch {

namespace {

/// Serializes one node; raw_text is set inside script/style.
/// MUST re-escape decoded text so rendered output parses back to the same tree.
void render_into(const HtmlNode& node, bool raw_text, std::string& out) {
  if (!node.is_element()) {
    const std::string& content = std::get<TextNode>(node.value).content;
    out += raw_text ? content : escape_text(content);
    return;
  }
  const auto& element = node.element();
  out += "<" + element.tag;
  for (const auto& attr : element.attributes) {
    out += " " + attr.first + "=\"" + escape_attribute(attr.second) + "\"";
  }
  out += ">";
  if (element.children.empty() && is_void_element(element.tag)) {
    return;
  }
  bool child_raw = is_raw_text_element(element.tag);
  for (const auto& child : element.children) {
    render_into(child, child_raw, out);
  }
  out += "</" + element.tag + ">";
}

}  // namespace

std::string render_html(const HtmlNode& node) {
  std::string out;
  render_into(node, false, out);
  return out;
}

std::string describe_error(const SearchError& error) {
  switch (error.kind) {
    case SearchError::Kind::FileNotFound:
      return "file not found: " + error.path;
    case SearchError::Kind::HtmlParse:
      return "failed to parse " + error.path + " at byte " +
             std::to_string(error.parse_error.position) + ": " + error.parse_error.message;
    case SearchError::Kind::QueryParse:
      return "invalid query at position " + std::to_string(error.parse_error.position) + ": " +
             error.parse_error.message;
  }
  return "unknown error";
}

}  // namespace hsearch
