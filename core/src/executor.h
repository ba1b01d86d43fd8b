#pragma once

#include <vector>

#include "ast.h"
#include "hsearch/document.h"

namespace hsearch {

/// Matched nodes in result order; pointers refer into the searched document.
/// MUST NOT outlive the HtmlDocument they were produced from.
using NodeRefs = std::vector<const HtmlNode*>;

/// Tests one selector against one element: exact tag, then every required pair present.
/// MUST treat an empty selector as matching every element.
/// Inputs are selector/element; outputs are boolean with no side effects.
bool selector_matches(const QuerySelector& selector, const ElementNode& element);

/// Searches a sibling list, concatenating per-node results in input order.
/// recursive=false restricts matching to this exact level.
/// MUST skip text nodes. Inputs are scope/query/nodes; outputs are matches.
NodeRefs search_nodes(bool recursive, const Query& query, const std::vector<HtmlNode>& nodes);
/// Evaluates a query rooted at one node.
/// MUST return an empty list for text nodes.
NodeRefs search_node(bool recursive, const Query& query, const HtmlNode& node);
/// Searches a whole document with unrestricted depth.
NodeRefs search_document(const Query& query, const HtmlDocument& doc);

}  // namespace hsearch
