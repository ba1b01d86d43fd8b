#pragma once

#include <cstddef>
#include <string>

namespace hsearch {

/// Enumerates lexical tokens produced by the query lexer.
/// MUST remain consistent with parser expectations.
/// Inputs are characters; outputs are token kinds with no side effects.
enum class TokenType {
  Identifier,
  String,
  UnterminatedString,
  Hash,
  Dot,
  Star,
  LBracket,
  RBracket,
  Equal,
  Greater,
  Comma,
  Invalid,
  End
};

/// Represents a single token with source text and position metadata.
/// MUST track byte positions to support precise error reporting.
/// space_before is set when whitespace separated this token from the previous one.
struct Token {
  TokenType type;
  std::string text;
  size_t pos = 0;
  bool space_before = false;
};

}  // namespace hsearch
