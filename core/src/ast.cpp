#include "ast.h"

namespace hsearch {

Query make_selector_query(QuerySelector selector) {
  return Query{std::move(selector)};
}

Query make_combinator(Combinator::Kind kind, Query left, Query right) {
  auto node = std::make_shared<Combinator>();
  node->kind = kind;
  node->left = std::move(left);
  node->right = std::move(right);
  return Query{std::move(node)};
}

}  // namespace hsearch
