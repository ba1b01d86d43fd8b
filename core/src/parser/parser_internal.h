#pragma once

#include <optional>
#include <string>

#include "../query_parser.h"
#include "lexer.h"

namespace hsearch {

/// Recursive-descent parser over selector tokens.
/// Grammar: union := combined (',' combined)*; combined := compound ((ws | '>') compound)*.
/// MUST set error_ on the first failure and stop.
class Parser {
 public:
  explicit Parser(const std::string& input);
  QueryParseResult parse();

 private:
  bool parse_union(Query& out);
  bool parse_combined(Query& out);
  bool parse_compound(QuerySelector& out);
  bool parse_attribute(QuerySelector& out);
  bool parse_suffix_name(std::string& out, const std::string& what);

  static bool starts_compound(const Token& token);
  static bool is_suffix(const Token& token);

  bool consume(TokenType type, const std::string& message);
  bool set_error(const std::string& message);
  QueryParseResult error_result();
  void advance();

  Lexer lexer_;
  Token current_{};
  std::optional<ParseError> error_;
};

}  // namespace hsearch
