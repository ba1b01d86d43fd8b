#include "hsearch/document.h"

namespace hsearch {

HtmlNode make_text(std::string content) {
  HtmlNode node;
  node.value = TextNode{std::move(content)};
  return node;
}

HtmlNode make_element(std::string tag,
                      std::vector<Attribute> attributes,
                      std::vector<HtmlNode> children) {
  ElementNode element;
  element.tag = std::move(tag);
  element.attributes = std::move(attributes);
  element.children = std::move(children);
  HtmlNode node;
  node.value = std::move(element);
  return node;
}

}  // namespace hsearch
