#include "test_harness.h"

#include "test_utils.h"

namespace {

const char* kNested = "<div><section><h1>x</h1></section></div>";

void test_child_vs_descendant_scope() {
  expect_eq(search_html("div > h1", kNested).size(), 0, "grandchild is not a direct child");
  std::vector<std::string> descendant = search_html("div h1", kNested);
  expect_eq(descendant.size(), 1, "descendant reaches grandchild");
  if (!descendant.empty()) {
    expect_str_eq(descendant[0], "<h1>x</h1>", "descendant returns the h1 subtree");
  }
  expect_eq(search_html("div > section", kNested).size(), 1, "direct child matches");
}

void test_no_self_overlap() {
  std::vector<std::string> out = search_html("div", "<div><div>inner</div></div>");
  expect_eq(out.size(), 1, "matched subtree is not searched again");
  if (!out.empty()) {
    expect_str_eq(out[0], "<div><div>inner</div></div>", "outermost div is returned");
  }
}

void test_descendant_right_side_stops_at_match() {
  std::vector<std::string> out = search_html("div div", "<div><div><div>x</div></div></div>");
  expect_eq(out.size(), 1, "right side stops at its first match");
  if (!out.empty()) {
    expect_str_eq(out[0], "<div><div>x</div></div>", "middle div is returned");
  }
}

void test_child_left_match_stops_at_outermost() {
  expect_eq(search_html("div > p", "<div><div><p>x</p></div></div>").size(), 0,
            "left side matches only the outermost div");
  expect_eq(search_html("div > p", "<section><div><p>x</p></div></section>").size(), 1,
            "left side is found at any depth");
}

void test_union_order_and_duplicates() {
  std::vector<std::string> same = search_html("p, p", "<p>a</p>");
  expect_eq(same.size(), 2, "union does not deduplicate");

  std::vector<std::string> out = search_html("p, div", "<div><p>1</p></div><p>2</p>");
  expect_str_eq(join(out, "|"), "<p>1</p>|<div><p>1</p></div>|<p>2</p>",
                "left results precede right results per top-level node");
}

void test_union_binds_loosest() {
  std::vector<std::string> out =
      search_html("ul li, h2", "<h2>t</h2><ul><li>a</li></ul><li>stray</li>");
  expect_str_eq(join(out, "|"), "<h2>t</h2>|<li>a</li>", "stray li is not matched");
}

void test_text_nodes_skipped() {
  hsearch::HtmlDocument doc;
  doc.nodes.push_back(hsearch::make_text("hello"));
  doc.nodes.push_back(hsearch::make_element("p", {}, {hsearch::make_text("x")}));
  hsearch::NodeRefs out = hsearch::search_document(parse_q("*"), doc);
  expect_eq(out.size(), 1, "only the element is a candidate");
  expect_eq(hsearch::search_node(true, parse_q("*"), doc.nodes[0]).size(), 0,
            "text node yields nothing");
}

void test_non_recursive_scope() {
  hsearch::HtmlDocument doc = parse_doc("<div><p>a</p></div><p>b</p>");
  hsearch::NodeRefs shallow = hsearch::search_nodes(false, parse_q("p"), doc.nodes);
  expect_eq(shallow.size(), 1, "non-recursive search tests only this level");
  hsearch::NodeRefs deep = hsearch::search_nodes(true, parse_q("p"), doc.nodes);
  expect_eq(deep.size(), 2, "recursive search descends");
}

void test_chained_combinators() {
  const char* html =
      "<div><section><article><h1>a</h1></article></section><section><h1>b</h1></section></div>";
  std::vector<std::string> out = search_html("div > section h1", html);
  expect_str_eq(join(out, "|"), "<h1>a</h1>|<h1>b</h1>", "child then descendant");
  std::vector<std::string> strict = search_html("div > section > h1", html);
  expect_str_eq(join(strict, "|"), "<h1>b</h1>", "child then child");
}

void test_match_order_is_document_order() {
  std::vector<std::string> out =
      search_html(".x", "<p class=\"x\">1</p><div><span class=\"x\">2</span></div><b class=\"x\">3</b>");
  expect_str_eq(join(out, "|"),
                "<p class=\"x\">1</p>|<span class=\"x\">2</span>|<b class=\"x\">3</b>",
                "pre-order traversal");
}

}  // namespace

void register_engine_tests(std::vector<TestCase>& tests) {
  tests.push_back({"child_vs_descendant_scope", test_child_vs_descendant_scope});
  tests.push_back({"no_self_overlap", test_no_self_overlap});
  tests.push_back({"descendant_right_side_stops_at_match", test_descendant_right_side_stops_at_match});
  tests.push_back({"child_left_match_stops_at_outermost", test_child_left_match_stops_at_outermost});
  tests.push_back({"union_order_and_duplicates", test_union_order_and_duplicates});
  tests.push_back({"union_binds_loosest", test_union_binds_loosest});
  tests.push_back({"text_nodes_skipped", test_text_nodes_skipped});
  tests.push_back({"non_recursive_scope", test_non_recursive_scope});
  tests.push_back({"chained_combinators", test_chained_combinators});
  tests.push_back({"match_order_is_document_order", test_match_order_is_document_order});
}
