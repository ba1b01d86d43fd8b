#pragma once

#include <string>

#include "../query_parser.h"

namespace hsearch {

/// Parses a query string into a Query AST with error reporting.
/// MUST be deterministic and MUST not throw on parse errors.
/// Inputs are query text; outputs are QueryParseResult with optional error.
QueryParseResult parse_query_impl(const std::string& input);

}  // namespace hsearch
