#include "../executor.h"

#include "executor_internal.h"

namespace hsearch {

namespace {

void append(NodeRefs& out, const NodeRefs& more) {
  out.insert(out.end(), more.begin(), more.end());
}

/// Evaluates a bare selector at one element.
/// MUST stop at a match: a matched node's subtree is not searched again.
NodeRefs search_selector(bool recursive, const Query& query, const HtmlNode& node) {
  const auto& element = node.element();
  if (selector_matches(std::get<QuerySelector>(query), element)) {
    return NodeRefs{&node};
  }
  if (recursive) {
    return search_nodes(true, query, element.children);
  }
  return {};
}

/// Evaluates q1 at the node, then q2 over the direct children of every q1 match.
/// right_recursive is true for Descendant and false for Child, independent of the caller's scope.
NodeRefs search_combined(bool recursive, const Combinator& node_query, const HtmlNode& node,
                         bool right_recursive) {
  NodeRefs out;
  for (const HtmlNode* match : search_node(recursive, node_query.left, node)) {
    append(out, search_nodes(right_recursive, node_query.right, match->element().children));
  }
  return out;
}

}  // namespace

NodeRefs search_nodes(bool recursive, const Query& query, const std::vector<HtmlNode>& nodes) {
  NodeRefs out;
  for (const auto& node : nodes) {
    if (!node.is_element()) continue;
    append(out, search_node(recursive, query, node));
  }
  return out;
}

NodeRefs search_node(bool recursive, const Query& query, const HtmlNode& node) {
  if (!node.is_element()) return {};
  if (std::holds_alternative<QuerySelector>(query)) {
    return search_selector(recursive, query, node);
  }
  const auto& combinator = *std::get<std::shared_ptr<Combinator>>(query);
  switch (combinator.kind) {
    case Combinator::Kind::Descendant:
      return search_combined(recursive, combinator, node, true);
    case Combinator::Kind::Child:
      return search_combined(recursive, combinator, node, false);
    case Combinator::Kind::Union: {
      NodeRefs out = search_node(recursive, combinator.left, node);
      append(out, search_node(recursive, combinator.right, node));
      return out;
    }
  }
  return {};
}

NodeRefs search_document(const Query& query, const HtmlDocument& doc) {
  return search_nodes(true, query, doc.nodes);
}

}  // namespace hsearch
