#include "test_harness.h"

#include "test_utils.h"

namespace {

hsearch::QuerySelector tag_selector(const std::string& tag) {
  hsearch::QuerySelector selector;
  selector.tag = tag;
  return selector;
}

void collect_elements(const std::vector<hsearch::HtmlNode>& nodes,
                      std::vector<const hsearch::ElementNode*>& out) {
  for (const auto& node : nodes) {
    if (!node.is_element()) continue;
    out.push_back(&node.element());
    collect_elements(node.element().children, out);
  }
}

void test_empty_selector_matches_every_element() {
  hsearch::HtmlDocument doc =
      parse_doc("<html><body><div id=\"a\"><p>t<span>s</span></p></div><br></body></html>");
  std::vector<const hsearch::ElementNode*> elements;
  collect_elements(doc.nodes, elements);
  expect_eq(elements.size(), 6, "document has six elements");
  hsearch::QuerySelector any;
  size_t matched = 0;
  for (const auto* element : elements) {
    if (hsearch::selector_matches(any, *element)) ++matched;
  }
  expect_eq(matched, elements.size(), "empty selector matches every element");
}

void test_tag_exactness() {
  hsearch::QuerySelector selector = tag_selector("div");
  expect_true(hsearch::selector_matches(selector, hsearch::make_element("div").element()),
              "div matches div");
  expect_true(!hsearch::selector_matches(selector, hsearch::make_element("divx").element()),
              "div does not match divx");
  expect_true(!hsearch::selector_matches(selector, hsearch::make_element("DIV").element()),
              "tag comparison is case-sensitive");
  expect_true(!hsearch::selector_matches(selector, hsearch::make_element("span").element()),
              "div does not match span");
}

void test_class_requires_exact_pair() {
  hsearch::QuerySelector selector;
  selector.classes.push_back("a");
  hsearch::HtmlNode spaced = hsearch::make_element("p", {{"class", "a b"}});
  hsearch::HtmlNode exact = hsearch::make_element("p", {{"class", "a"}});
  expect_true(!hsearch::selector_matches(selector, spaced.element()),
              "class list is not tokenized");
  expect_true(hsearch::selector_matches(selector, exact.element()),
              "exact class pair matches");
}

void test_duplicate_attribute_pairs() {
  hsearch::QuerySelector selector;
  selector.classes = {"a", "b"};
  hsearch::HtmlNode both = hsearch::make_element("p", {{"class", "a"}, {"class", "b"}});
  hsearch::HtmlNode one = hsearch::make_element("p", {{"class", "a"}});
  expect_true(hsearch::selector_matches(selector, both.element()),
              "duplicate keys satisfy separate requirements");
  expect_true(!hsearch::selector_matches(selector, one.element()),
              "every required pair must be present");
}

void test_id_and_attribute_requirements() {
  hsearch::QuerySelector selector = tag_selector("a");
  selector.ids.push_back("home");
  selector.attributes.emplace_back("rel", "nofollow");
  hsearch::HtmlNode good =
      hsearch::make_element("a", {{"rel", "nofollow"}, {"href", "/"}, {"id", "home"}});
  hsearch::HtmlNode wrong_value = hsearch::make_element("a", {{"rel", "noopener"}, {"id", "home"}});
  hsearch::HtmlNode missing_id = hsearch::make_element("a", {{"rel", "nofollow"}});
  expect_true(hsearch::selector_matches(selector, good.element()), "attribute order is irrelevant");
  expect_true(!hsearch::selector_matches(selector, wrong_value.element()), "value must match exactly");
  expect_true(!hsearch::selector_matches(selector, missing_id.element()), "id is required");
}

}  // namespace

void register_selector_tests(std::vector<TestCase>& tests) {
  tests.push_back({"empty_selector_matches_every_element", test_empty_selector_matches_every_element});
  tests.push_back({"tag_exactness", test_tag_exactness});
  tests.push_back({"class_requires_exact_pair", test_class_requires_exact_pair});
  tests.push_back({"duplicate_attribute_pairs", test_duplicate_attribute_pairs});
  tests.push_back({"id_and_attribute_requirements", test_id_and_attribute_requirements});
}
