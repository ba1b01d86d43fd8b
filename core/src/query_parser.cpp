#include "query_parser.h"

#include <cctype>

#include "parser/query_parser_impl.h"

namespace hsearch {

namespace {

bool is_bare_value(const std::string& value) {
  if (value.empty()) return false;
  for (char c : value) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != ':') {
      return false;
    }
  }
  return true;
}

const char* combinator_name(Combinator::Kind kind) {
  switch (kind) {
    case Combinator::Kind::Descendant:
      return "Descendant";
    case Combinator::Kind::Child:
      return "Child";
    case Combinator::Kind::Union:
      return "Union";
  }
  return "Union";
}

}  // namespace

QueryParseResult parse_query(const std::string& input) {
  return parse_query_impl(input);
}

std::string selector_to_string(const QuerySelector& selector) {
  std::string out = selector.tag.value_or("");
  for (const auto& id : selector.ids) {
    out += "#" + id;
  }
  for (const auto& cls : selector.classes) {
    out += "." + cls;
  }
  for (const auto& attr : selector.attributes) {
    out += "[" + attr.first + "=";
    out += is_bare_value(attr.second) ? attr.second : "\"" + attr.second + "\"";
    out += "]";
  }
  return out.empty() ? "*" : out;
}

std::string query_to_string(const Query& query) {
  if (std::holds_alternative<QuerySelector>(query)) {
    return selector_to_string(std::get<QuerySelector>(query));
  }
  const auto& node = *std::get<std::shared_ptr<Combinator>>(query);
  return std::string(combinator_name(node.kind)) + "(" + query_to_string(node.left) + ", " +
         query_to_string(node.right) + ")";
}

}  // namespace hsearch
