#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace hsearch {

struct HtmlNode;

/// Holds one attribute with its value entity-decoded.
/// Duplicate keys are legal and MUST be preserved in source order.
using Attribute = std::pair<std::string, std::string>;

/// Represents character data between tags, with entity references already decoded.
/// MUST never be treated as a match candidate.
struct TextNode {
  std::string content;
};

/// Represents an element with ordered attributes and children.
/// MUST keep attribute and child order identical to the source document.
/// Inputs are parser output; consumers treat the value as immutable.
struct ElementNode {
  std::string tag;
  std::vector<Attribute> attributes;
  std::vector<HtmlNode> children;
};

/// Tagged union of the two node shapes produced by the HTML parsers.
struct HtmlNode {
  std::variant<TextNode, ElementNode> value;

  bool is_element() const { return std::holds_alternative<ElementNode>(value); }
  const ElementNode& element() const { return std::get<ElementNode>(value); }
};

/// Ordered forest of top-level nodes; documents have no single root.
struct HtmlDocument {
  std::vector<HtmlNode> nodes;
};

HtmlNode make_text(std::string content);
HtmlNode make_element(std::string tag,
                      std::vector<Attribute> attributes = {},
                      std::vector<HtmlNode> children = {});

}  // namespace hsearch
