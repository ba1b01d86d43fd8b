#include "test_harness.h"

#include "query_parser.h"
#include "test_utils.h"

namespace {

std::string tree_of(const std::string& query) {
  hsearch::QueryParseResult parsed = hsearch::parse_query(query);
  if (!parsed.query.has_value()) {
    return "<error: " + (parsed.error.has_value() ? parsed.error->message : std::string("?")) + ">";
  }
  return hsearch::query_to_string(*parsed.query);
}

void expect_parse_error(const std::string& query, const std::string& message, size_t position) {
  hsearch::QueryParseResult parsed = hsearch::parse_query(query);
  expect_true(!parsed.query.has_value(), "query should not parse: " + query);
  expect_true(parsed.error.has_value(), "error is reported for: " + query);
  if (!parsed.error.has_value()) return;
  expect_str_eq(parsed.error->message, message, "error message for: " + query);
  expect_eq(parsed.error->position, position, "error position for: " + query);
}

void test_compound_selectors() {
  expect_str_eq(tree_of("div"), "div", "bare tag");
  expect_str_eq(tree_of("*"), "*", "universal selector");
  expect_str_eq(tree_of(".note"), ".note", "class only");
  expect_str_eq(tree_of("#main"), "#main", "id only");
  expect_str_eq(tree_of("div#main.note.wide"), "div#main.note.wide", "tag id classes");
  expect_str_eq(tree_of("a[rel=nofollow]"), "a[rel=nofollow]", "bare attribute value");
  expect_str_eq(tree_of("a[title=\"two words\"]"), "a[title=\"two words\"]", "quoted attribute value");
  expect_str_eq(tree_of("a[title='x']"), "a[title=x]", "single quotes accepted");
}

void test_combinator_precedence() {
  expect_str_eq(tree_of("div p"), "Descendant(div, p)", "whitespace is descendant");
  expect_str_eq(tree_of("div > p"), "Child(div, p)", "greater is child");
  expect_str_eq(tree_of("div>p"), "Child(div, p)", "child without spaces");
  expect_str_eq(tree_of("a b c"), "Descendant(Descendant(a, b), c)", "left associative");
  expect_str_eq(tree_of("a > b c"), "Descendant(Child(a, b), c)", "mixed combinators");
  expect_str_eq(tree_of("a b, c"), "Union(Descendant(a, b), c)", "comma binds loosest");
  expect_str_eq(tree_of("a, b, c"), "Union(Union(a, b), c)", "union is left associative");
  expect_str_eq(tree_of("  div  "), "div", "surrounding whitespace ignored");
}

void test_whitespace_before_suffix_is_descendant() {
  expect_str_eq(tree_of("div .a"), "Descendant(div, .a)", "space splits compound");
  expect_str_eq(tree_of("div.a"), "div.a", "no space keeps compound");
}

void test_selector_fields() {
  hsearch::QueryParseResult parsed = hsearch::parse_query("li#x.a.b[data-k=v]");
  expect_true(parsed.query.has_value(), "query parses");
  if (!parsed.query.has_value()) return;
  expect_true(std::holds_alternative<hsearch::QuerySelector>(*parsed.query), "single selector");
  const auto& selector = std::get<hsearch::QuerySelector>(*parsed.query);
  expect_true(selector.tag.has_value() && *selector.tag == "li", "tag captured");
  expect_eq(selector.ids.size(), 1, "one id");
  expect_eq(selector.classes.size(), 2, "two classes");
  expect_eq(selector.attributes.size(), 1, "one attribute");
  expect_eq(selector.span.start, 0, "span starts at 0");
  expect_eq(selector.span.end, 18, "span ends at input end");
}

void test_parse_errors() {
  expect_parse_error("", "Expected selector, got empty query", 0);
  expect_parse_error("   ", "Expected selector, got empty query", 3);
  expect_parse_error("div >", "Expected selector after >", 5);
  expect_parse_error("div ,", "Expected selector after ,", 5);
  expect_parse_error("div $", "Unexpected character '$'", 4);
  expect_parse_error("#", "Expected id after #", 1);
  expect_parse_error("div.", "Expected class name after .", 4);
  expect_parse_error("a[href]", "Expected = in attribute selector", 6);
  expect_parse_error("a[=x]", "Expected attribute name after [", 2);
  expect_parse_error("a[k=\"x", "Unterminated string in attribute selector", 4);
  expect_parse_error("a[k=]", "Expected attribute value after =", 4);
  expect_parse_error("a[k=v", "Expected ] to close attribute selector", 5);
  expect_parse_error("div ]", "Unexpected token ']' after selector", 4);
  expect_parse_error(", div", "Expected selector but found ','", 0);
}

}  // namespace

void register_query_parser_tests(std::vector<TestCase>& tests) {
  tests.push_back({"compound_selectors", test_compound_selectors});
  tests.push_back({"combinator_precedence", test_combinator_precedence});
  tests.push_back({"whitespace_before_suffix_is_descendant", test_whitespace_before_suffix_is_descendant});
  tests.push_back({"selector_fields", test_selector_fields});
  tests.push_back({"query_parse_errors", test_parse_errors});
}
