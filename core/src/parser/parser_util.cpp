#include "parser_internal.h"

namespace hsearch {

/// Consumes a token of the expected type or sets a parse error.
/// MUST advance the token stream on success.
/// Inputs are token type/message; outputs are success or error.
bool Parser::consume(TokenType type, const std::string& message) {
  if (current_.type != type) {
    return set_error(message);
  }
  advance();
  return true;
}

/// Records the first parse error for reporting.
/// MUST preserve the earliest error position for clarity.
/// Inputs are error message; outputs are false with stored error.
bool Parser::set_error(const std::string& message) {
  if (!error_.has_value()) {
    error_ = ParseError{message, current_.pos};
  }
  return false;
}

QueryParseResult Parser::error_result() {
  QueryParseResult res;
  res.error = error_;
  return res;
}

void Parser::advance() {
  current_ = lexer_.next();
}

}  // namespace hsearch
