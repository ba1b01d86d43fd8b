#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "hsearch/document.h"

namespace hsearch {

struct Span {
  size_t start = 0;
  size_t end = 0;
};

/// Flat matcher tested against a single element.
/// ids/classes/attributes all merge into required (key, value) pairs.
struct QuerySelector {
  std::optional<std::string> tag;
  std::vector<std::string> ids;
  std::vector<std::string> classes;
  std::vector<Attribute> attributes;
  Span span;
};

struct Combinator;
using Query = std::variant<QuerySelector, std::shared_ptr<Combinator>>;

/// Joins two sub-queries with depth (Descendant, Child) or list (Union) semantics.
/// MUST own both operands; the tree is immutable after parsing.
struct Combinator {
  enum class Kind { Descendant, Child, Union } kind = Kind::Descendant;
  Query left;
  Query right;
  Span span;
};

Query make_selector_query(QuerySelector selector);
Query make_combinator(Combinator::Kind kind, Query left, Query right);

}  // namespace hsearch
