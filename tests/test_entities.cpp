#include "test_harness.h"

#include "html/entities.h"
#include "html_parser.h"
#include "test_utils.h"

namespace {

const hsearch::HtmlParserBackend kBackends[] = {hsearch::HtmlParserBackend::Strict,
                                                hsearch::HtmlParserBackend::Libxml2};

std::string render_first(const std::string& query, const std::string& html,
                         hsearch::HtmlParserBackend backend) {
  hsearch::SearchOptions options;
  options.parser = backend;
  hsearch::SearchResult result = hsearch::search_sources(query, {{"x.html", html}}, options);
  if (result.error.has_value() || result.matches.empty()) return "<no match>";
  return hsearch::render_html(result.matches.front().node);
}

void test_decode_entities() {
  expect_str_eq(hsearch::decode_entities("a &amp; b &lt;c&gt; &quot;d&quot; &apos;"), "a & b <c> \"d\" '",
                "basic references");
  expect_str_eq(hsearch::decode_entities("&#65;&#x42;&#X43;"), "ABC", "numeric references");
  expect_str_eq(hsearch::decode_entities("&copy;&nbsp;&mdash;"), "\xC2\xA9\xC2\xA0\xE2\x80\x94",
                "named references become UTF-8");
  expect_str_eq(hsearch::decode_entities("&bogus; & &#; &amp"), "&bogus; & &#; &amp",
                "unknown or unterminated references stay verbatim");
  expect_str_eq(hsearch::decode_entities("&#xD800;"), "\xEF\xBF\xBD", "surrogate becomes U+FFFD");
}

void test_escape_text_and_attribute() {
  expect_str_eq(hsearch::escape_text("a<b>&\"c\""), "a&lt;b&gt;&amp;\"c\"", "text keeps quotes");
  expect_str_eq(hsearch::escape_attribute("a<b>&\"c\""), "a&lt;b&gt;&amp;&quot;c&quot;",
                "attribute escapes quotes");
}

void test_attribute_entities_render_once() {
  for (auto backend : kBackends) {
    std::string name = hsearch::backend_name(backend);
    expect_str_eq(render_first("a", "<a href=\"?x=1&amp;y=2\">t</a>", backend),
                  "<a href=\"?x=1&amp;y=2\">t</a>", "attribute escaped exactly once (" + name + ")");
  }
}

void test_text_entities_stay_escaped() {
  for (auto backend : kBackends) {
    std::string name = hsearch::backend_name(backend);
    expect_str_eq(render_first("p", "<p>a &lt;b&gt; c</p>", backend), "<p>a &lt;b&gt; c</p>",
                  "decoded markup is re-escaped (" + name + ")");
  }
}

void test_selector_matches_decoded_value() {
  for (auto backend : kBackends) {
    std::string name = hsearch::backend_name(backend);
    expect_str_eq(render_first("a[href=\"?x=1&y=2\"]", "<a href=\"?x=1&amp;y=2\">t</a>", backend),
                  "<a href=\"?x=1&amp;y=2\">t</a>", "query compares decoded values (" + name + ")");
  }
}

void test_strict_decodes_text_content() {
  hsearch::HtmlDocument doc = parse_doc("<p>Tom &amp; Jerry&#33;</p>");
  expect_eq(doc.nodes.size(), 1, "one node");
  if (doc.nodes.empty()) return;
  const auto& children = doc.nodes[0].element().children;
  expect_eq(children.size(), 1, "one text node");
  if (children.empty()) return;
  expect_str_eq(std::get<hsearch::TextNode>(children[0].value).content, "Tom & Jerry!", "decoded text");
}

void test_script_text_is_not_escaped() {
  expect_str_eq(render_first("script", "<script>if (a < b && c) {}</script>",
                             hsearch::HtmlParserBackend::Strict),
                "<script>if (a < b && c) {}</script>", "raw text renders verbatim");
}

}  // namespace

void register_entity_tests(std::vector<TestCase>& tests) {
  tests.push_back({"decode_entities", test_decode_entities});
  tests.push_back({"escape_text_and_attribute", test_escape_text_and_attribute});
  tests.push_back({"attribute_entities_render_once", test_attribute_entities_render_once});
  tests.push_back({"text_entities_stay_escaped", test_text_entities_stay_escaped});
  tests.push_back({"selector_matches_decoded_value", test_selector_matches_decoded_value});
  tests.push_back({"strict_decodes_text_content", test_strict_decodes_text_content});
  tests.push_back({"script_text_is_not_escaped", test_script_text_is_not_escaped});
}
