#pragma once

#include <optional>
#include <string>

#include "ast.h"
#include "hsearch/hsearch.h"

namespace hsearch {

/// Wraps either a parsed Query or a ParseError.
/// MUST contain exactly one of query or error.
/// Inputs are parser outputs; side effects are none.
struct QueryParseResult {
  std::optional<Query> query;
  std::optional<ParseError> error;
};

/// Parses selector text (e.g. "div > h1.title, p") into a Query AST.
/// MUST return errors without throwing on invalid syntax.
/// Inputs are query text; outputs are QueryParseResult with optional error.
QueryParseResult parse_query(const std::string& input);

/// Renders a Query AST as a stable one-line tree, e.g. Child(div, h1.title).
/// Used for debug output and structural assertions.
std::string query_to_string(const Query& query);
std::string selector_to_string(const QuerySelector& selector);

}  // namespace hsearch
