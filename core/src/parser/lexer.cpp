#include "lexer.h"

#include <cctype>

namespace hsearch {

Lexer::Lexer(const std::string& input) : input_(input) {}

Token Lexer::next() {
  bool space = skip_ws();
  if (pos_ >= input_.size()) {
    return Token{TokenType::End, "", pos_, space};
  }

  char c = input_[pos_];
  TokenType single = TokenType::Invalid;
  switch (c) {
    case '#':
      single = TokenType::Hash;
      break;
    case '.':
      single = TokenType::Dot;
      break;
    case '*':
      single = TokenType::Star;
      break;
    case '[':
      single = TokenType::LBracket;
      break;
    case ']':
      single = TokenType::RBracket;
      break;
    case '=':
      single = TokenType::Equal;
      break;
    case '>':
      single = TokenType::Greater;
      break;
    case ',':
      single = TokenType::Comma;
      break;
    case '\'':
    case '"':
      return lex_string(space);
    default:
      if (is_ident_char(c)) {
        return lex_identifier(space);
      }
      break;
  }
  // WHY: Invalid still advances so a malformed query cannot loop the parser.
  ++pos_;
  return Token{single, std::string(1, c), pos_ - 1, space};
}

Token Lexer::lex_string(bool space_before) {
  size_t start = pos_;
  char quote = input_[pos_++];
  std::string out;
  while (pos_ < input_.size()) {
    char c = input_[pos_++];
    if (c == quote) {
      return Token{TokenType::String, out, start, space_before};
    }
    out.push_back(c);
  }
  return Token{TokenType::UnterminatedString, out, start, space_before};
}

Token Lexer::lex_identifier(bool space_before) {
  size_t start = pos_;
  std::string out;
  while (pos_ < input_.size() && is_ident_char(input_[pos_])) {
    out.push_back(input_[pos_++]);
  }
  return Token{TokenType::Identifier, out, start, space_before};
}

bool Lexer::skip_ws() {
  size_t start = pos_;
  while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
    ++pos_;
  }
  return pos_ != start;
}

bool Lexer::is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == ':';
}

}  // namespace hsearch
