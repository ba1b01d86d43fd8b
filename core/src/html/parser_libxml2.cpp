#include "parser_impl.h"

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

#include "../util/string_util.h"

namespace hsearch {

namespace {

/// Copies an element's attributes in libxml2 order.
/// MUST map attributes without a value to the empty string.
std::vector<Attribute> collect_attributes(xmlNode* node) {
  std::vector<Attribute> out;
  for (xmlAttr* attr = node->properties; attr != nullptr; attr = attr->next) {
    std::string name = util::to_lower(reinterpret_cast<const char*>(attr->name));
    xmlChar* value = xmlNodeListGetString(node->doc, attr->children, 1);
    if (value) {
      out.emplace_back(name, reinterpret_cast<const char*>(value));
      xmlFree(value);
    } else {
      out.emplace_back(name, "");
    }
  }
  return out;
}

/// Walks a libxml2 sibling chain and appends the converted nodes.
/// MUST keep traversal deterministic and MUST preserve child order.
/// Inputs are libxml2 nodes; outputs are appended HtmlNode values.
void walk_node(xmlNode* node, std::vector<HtmlNode>& out) {
  for (xmlNode* cur = node; cur != nullptr; cur = cur->next) {
    if (cur->type == XML_ELEMENT_NODE) {
      ElementNode element;
      element.tag = util::to_lower(reinterpret_cast<const char*>(cur->name));
      element.attributes = collect_attributes(cur);
      if (cur->children) {
        walk_node(cur->children, element.children);
      }
      out.push_back(HtmlNode{std::move(element)});
    } else if (cur->type == XML_TEXT_NODE || cur->type == XML_CDATA_SECTION_NODE) {
      if (cur->content) {
        out.push_back(make_text(reinterpret_cast<const char*>(cur->content)));
      }
    } else if (cur->type == XML_DTD_NODE || cur->type == XML_COMMENT_NODE) {
      continue;
    } else if (cur->children) {
      walk_node(cur->children, out);
    }
  }
}

}  // namespace

/// Parses HTML with libxml2 into the internal HtmlDocument representation.
/// MUST recover from malformed HTML and MUST avoid executing scripts.
/// Inputs are HTML strings; outputs are HtmlParseResult with no side effects.
HtmlParseResult parse_html_libxml2(const std::string& html) {
  HtmlParseResult res;
  res.document = HtmlDocument{};
  // WHY: recovery mode handles malformed HTML commonly found on the web.
  htmlDocPtr html_doc = htmlReadMemory(
      html.data(),
      static_cast<int>(html.size()),
      nullptr,
      nullptr,
      HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET);
  if (!html_doc) {
    return res;
  }
  walk_node(html_doc->children, res.document->nodes);
  xmlFreeDoc(html_doc);
  return res;
}

}  // namespace hsearch
