#pragma once

#include <string>

#include "tokens.h"

namespace hsearch {

/// Tokenizes selector text into a stream for the parser.
/// MUST be deterministic and MUST not skip meaningful characters.
/// Inputs are query strings; outputs are tokens with position metadata.
class Lexer {
 public:
  /// Constructs a lexer over a stable input string reference.
  /// MUST NOT outlive the referenced input buffer.
  explicit Lexer(const std::string& input);
  /// Produces the next token from the input stream.
  /// MUST advance the cursor and MUST return End at input exhaustion.
  Token next();

 private:
  /// Lexes a quoted string token, handling unterminated input.
  /// MUST capture raw contents and MUST stop at the matching quote.
  Token lex_string(bool space_before);
  Token lex_identifier(bool space_before);
  /// Skips whitespace and reports whether any was consumed.
  bool skip_ws();
  static bool is_ident_char(char c);

  const std::string& input_;
  size_t pos_ = 0;
};

}  // namespace hsearch
