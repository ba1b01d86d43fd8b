#include "query_parser_impl.h"

#include "parser_internal.h"

namespace hsearch {

Parser::Parser(const std::string& input) : lexer_(input) { advance(); }

/// Parses the full selector list and rejects trailing input.
/// MUST report empty input as an error rather than an empty query.
QueryParseResult Parser::parse() {
  if (current_.type == TokenType::End) {
    set_error("Expected selector, got empty query");
    return error_result();
  }
  Query query;
  if (!parse_union(query)) return error_result();
  if (current_.type != TokenType::End) {
    if (current_.type == TokenType::Invalid) {
      set_error("Unexpected character '" + current_.text + "'");
    } else {
      set_error("Unexpected token '" + current_.text + "' after selector");
    }
    return error_result();
  }
  QueryParseResult res;
  res.query = std::move(query);
  return res;
}

bool Parser::parse_union(Query& out) {
  size_t start = current_.pos;
  if (!parse_combined(out)) return false;
  while (current_.type == TokenType::Comma) {
    advance();
    if (current_.type == TokenType::End) {
      return set_error("Expected selector after ,");
    }
    Query right;
    if (!parse_combined(right)) return false;
    out = make_combinator(Combinator::Kind::Union, std::move(out), std::move(right));
    std::get<std::shared_ptr<Combinator>>(out)->span = Span{start, current_.pos};
  }
  return true;
}

/// Parses compounds joined by whitespace (descendant) or '>' (child), left-associative.
/// MUST bind tighter than ',' so "a b, c" groups as (a b), c.
bool Parser::parse_combined(Query& out) {
  size_t start = current_.pos;
  QuerySelector first;
  if (!parse_compound(first)) return false;
  out = make_selector_query(std::move(first));
  while (true) {
    Combinator::Kind kind = Combinator::Kind::Descendant;
    if (current_.type == TokenType::Greater) {
      advance();
      if (!starts_compound(current_)) {
        return set_error("Expected selector after >");
      }
      kind = Combinator::Kind::Child;
    } else if (!(current_.space_before && starts_compound(current_))) {
      break;
    }
    QuerySelector next;
    if (!parse_compound(next)) return false;
    out = make_combinator(kind, std::move(out), make_selector_query(std::move(next)));
    std::get<std::shared_ptr<Combinator>>(out)->span = Span{start, current_.pos};
  }
  return true;
}

bool Parser::parse_compound(QuerySelector& out) {
  size_t start = current_.pos;
  bool any = false;
  if (current_.type == TokenType::Identifier) {
    out.tag = current_.text;
    any = true;
    advance();
  } else if (current_.type == TokenType::Star) {
    any = true;
    advance();
  }
  // WHY: whitespace before a suffix ends the compound; it is a descendant step instead.
  while (is_suffix(current_) && (!any || !current_.space_before)) {
    if (current_.type == TokenType::Hash) {
      std::string id;
      if (!parse_suffix_name(id, "id after #")) return false;
      out.ids.push_back(id);
    } else if (current_.type == TokenType::Dot) {
      std::string cls;
      if (!parse_suffix_name(cls, "class name after .")) return false;
      out.classes.push_back(cls);
    } else if (!parse_attribute(out)) {
      return false;
    }
    any = true;
  }
  if (!any) {
    if (current_.type == TokenType::Invalid) {
      return set_error("Unexpected character '" + current_.text + "'");
    }
    if (current_.type == TokenType::End) {
      return set_error("Expected selector before end of query");
    }
    return set_error("Expected selector but found '" + current_.text + "'");
  }
  out.span = Span{start, current_.pos};
  return true;
}

bool Parser::parse_suffix_name(std::string& out, const std::string& what) {
  advance();
  if (current_.type != TokenType::Identifier || current_.space_before) {
    return set_error("Expected " + what);
  }
  out = current_.text;
  advance();
  return true;
}

/// Parses a [key=value] constraint; value may be bare or quoted.
bool Parser::parse_attribute(QuerySelector& out) {
  advance();
  if (current_.type != TokenType::Identifier) {
    return set_error("Expected attribute name after [");
  }
  std::string key = current_.text;
  advance();
  if (!consume(TokenType::Equal, "Expected = in attribute selector")) return false;
  if (current_.type == TokenType::UnterminatedString) {
    return set_error("Unterminated string in attribute selector");
  }
  if (current_.type != TokenType::Identifier && current_.type != TokenType::String) {
    return set_error("Expected attribute value after =");
  }
  std::string value = current_.text;
  advance();
  if (!consume(TokenType::RBracket, "Expected ] to close attribute selector")) return false;
  out.attributes.emplace_back(std::move(key), std::move(value));
  return true;
}

bool Parser::starts_compound(const Token& token) {
  return token.type == TokenType::Identifier || token.type == TokenType::Star || is_suffix(token);
}

bool Parser::is_suffix(const Token& token) {
  return token.type == TokenType::Hash || token.type == TokenType::Dot ||
         token.type == TokenType::LBracket;
}

QueryParseResult parse_query_impl(const std::string& input) {
  Parser parser(input);
  return parser.parse();
}

}  // namespace hsearch
