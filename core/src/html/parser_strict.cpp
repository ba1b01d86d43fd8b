#include "parser_impl.h"

#include <cctype>
#include <vector>

#include "../util/string_util.h"
#include "entities.h"

namespace hsearch {

namespace {

/// Checks whether a character is valid in tag names.
/// MUST align with the close-tag scanner so open/close names compare equal.
bool is_name_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == ':' || c == '.';
}

bool is_attr_name_char(char c) {
  if (std::isspace(static_cast<unsigned char>(c))) return false;
  return c != '/' && c != '>' && c != '=' && c != '"' && c != '\'' && c != '<';
}

/// Deepest element nesting accepted before parsing stops with an error.
/// Keeps parser, search and node destruction recursion within the stack.
constexpr size_t kMaxNestingDepth = 4096;

/// Recursive-descent scanner that builds the node tree and stops at the first problem.
/// MUST preserve source order for attributes and children.
/// Inputs are HTML text; outputs are HtmlParseResult with no side effects.
class StrictParser {
 public:
  explicit StrictParser(const std::string& html) : html_(html) {}

  HtmlParseResult parse() {
    HtmlDocument doc;
    HtmlParseResult res;
    if (!parse_nodes(doc.nodes, nullptr)) {
      res.error = error_;
      return res;
    }
    res.document = std::move(doc);
    return res;
  }

 private:
  /// Parses siblings until the close tag of open_tag, or end of input at top level.
  /// MUST consume the matching close tag when open_tag is set.
  bool parse_nodes(std::vector<HtmlNode>& out, const std::string* open_tag) {
    while (pos_ < html_.size()) {
      if (!at_markup()) {
        parse_text(out);
        continue;
      }
      if (html_.compare(pos_, 4, "<!--") == 0) {
        if (!skip_comment()) return false;
        continue;
      }
      if (html_.compare(pos_, 2, "<!") == 0 || html_.compare(pos_, 2, "<?") == 0) {
        if (!skip_declaration()) return false;
        continue;
      }
      if (html_.compare(pos_, 2, "</") == 0) {
        if (open_tag == nullptr) {
          return set_error("Unexpected closing tag " + peek_close_name() + " with no open element", pos_);
        }
        return parse_close_tag(*open_tag);
      }
      if (!parse_element(out)) return false;
    }
    if (open_tag != nullptr) {
      return set_error("Expected </" + *open_tag + "> before end of input", html_.size());
    }
    return true;
  }

  /// Tests whether '<' at the cursor starts markup rather than literal text.
  bool at_markup() const {
    if (html_[pos_] != '<' || pos_ + 1 >= html_.size()) return false;
    char next = html_[pos_ + 1];
    return std::isalpha(static_cast<unsigned char>(next)) || next == '/' || next == '!' || next == '?';
  }

  void parse_text(std::vector<HtmlNode>& out) {
    size_t start = pos_++;
    while (pos_ < html_.size() && html_[pos_] != '<') {
      ++pos_;
    }
    std::string text = decode_entities(html_.substr(start, pos_ - start));
    // WHY: a literal '<' splits scanning but not the text node itself.
    if (!out.empty() && std::holds_alternative<TextNode>(out.back().value)) {
      std::get<TextNode>(out.back().value).content += text;
      return;
    }
    out.push_back(make_text(std::move(text)));
  }

  bool skip_comment() {
    size_t end = html_.find("-->", pos_ + 4);
    if (end == std::string::npos) {
      return set_error("Unterminated comment, expected -->", pos_);
    }
    pos_ = end + 3;
    return true;
  }

  bool skip_declaration() {
    size_t end = html_.find('>', pos_ + 2);
    if (end == std::string::npos) {
      return set_error("Unterminated declaration, expected >", pos_);
    }
    pos_ = end + 1;
    return true;
  }

  bool parse_element(std::vector<HtmlNode>& out) {
    size_t start = pos_;
    ++pos_;
    ElementNode element;
    element.tag = read_name();
    bool self_close = false;
    while (true) {
      skip_ws();
      if (pos_ >= html_.size()) {
        return set_error("Unterminated tag <" + element.tag + ">, expected >", start);
      }
      if (html_[pos_] == '>') {
        ++pos_;
        break;
      }
      if (html_[pos_] == '/') {
        if (pos_ + 1 < html_.size() && html_[pos_ + 1] == '>') {
          pos_ += 2;
          self_close = true;
          break;
        }
        return set_error("Expected > after / in <" + element.tag + ">", pos_);
      }
      if (!parse_attribute(element)) return false;
    }

    if (self_close || is_void_element(element.tag)) {
      out.push_back(HtmlNode{std::move(element)});
      return true;
    }
    if (depth_ >= kMaxNestingDepth) {
      return set_error("Nesting too deep", start);
    }
    if (is_raw_text_element(element.tag)) {
      if (!parse_raw_text(element)) return false;
      out.push_back(HtmlNode{std::move(element)});
      return true;
    }
    ++depth_;
    bool ok = parse_nodes(element.children, &element.tag);
    --depth_;
    if (!ok) return false;
    out.push_back(HtmlNode{std::move(element)});
    return true;
  }

  bool parse_attribute(ElementNode& element) {
    size_t start = pos_;
    std::string name;
    while (pos_ < html_.size() && is_attr_name_char(html_[pos_])) {
      name.push_back(html_[pos_++]);
    }
    if (name.empty()) {
      return set_error("Expected attribute name in <" + element.tag + ">", start);
    }
    skip_ws();
    std::string value;
    if (pos_ < html_.size() && html_[pos_] == '=') {
      ++pos_;
      skip_ws();
      if (pos_ >= html_.size()) {
        return set_error("Expected value for attribute " + name, pos_);
      }
      char c = html_[pos_];
      if (c == '"' || c == '\'') {
        size_t close = html_.find(c, pos_ + 1);
        if (close == std::string::npos) {
          return set_error("Unterminated value for attribute " + name, pos_);
        }
        value = html_.substr(pos_ + 1, close - pos_ - 1);
        pos_ = close + 1;
      } else {
        while (pos_ < html_.size() && !std::isspace(static_cast<unsigned char>(html_[pos_])) &&
               html_[pos_] != '>') {
          value.push_back(html_[pos_++]);
        }
        if (value.empty()) {
          return set_error("Expected value for attribute " + name, pos_);
        }
      }
    }
    element.attributes.emplace_back(std::move(name), decode_entities(value));
    return true;
  }

  /// Reads script/style content verbatim up to the matching close tag.
  bool parse_raw_text(ElementNode& element) {
    size_t close_start = find_raw_text_end(element.tag);
    if (close_start == std::string::npos) {
      return set_error("Expected </" + element.tag + "> before end of input", html_.size());
    }
    if (close_start > pos_) {
      element.children.push_back(make_text(html_.substr(pos_, close_start - pos_)));
    }
    pos_ = close_start;
    return parse_close_tag(element.tag);
  }

  /// Finds the next "</tag" from the cursor whose name ends right after tag.
  /// MUST compare case-insensitively without copying the input.
  size_t find_raw_text_end(const std::string& tag) const {
    size_t at = pos_;
    while ((at = html_.find("</", at)) != std::string::npos) {
      size_t name_end = at + 2 + tag.size();
      if (name_end <= html_.size() && same_name_at(at + 2, tag) &&
          (name_end == html_.size() || !is_name_char(html_[name_end]))) {
        return at;
      }
      at += 2;
    }
    return std::string::npos;
  }

  bool same_name_at(size_t at, const std::string& tag) const {
    for (size_t i = 0; i < tag.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(html_[at + i])) !=
          std::tolower(static_cast<unsigned char>(tag[i]))) {
        return false;
      }
    }
    return true;
  }

  bool parse_close_tag(const std::string& expected) {
    size_t start = pos_;
    pos_ += 2;
    std::string name = read_name();
    skip_ws();
    if (pos_ >= html_.size() || html_[pos_] != '>') {
      return set_error("Unterminated closing tag </" + name + ">, expected >", start);
    }
    ++pos_;
    if (util::to_lower(name) != util::to_lower(expected)) {
      return set_error("Expected </" + expected + "> but found </" + name + ">", start);
    }
    return true;
  }

  std::string peek_close_name() const {
    size_t i = pos_ + 2;
    std::string name;
    while (i < html_.size() && is_name_char(html_[i])) {
      name.push_back(html_[i++]);
    }
    return "</" + name + ">";
  }

  std::string read_name() {
    std::string name;
    while (pos_ < html_.size() && is_name_char(html_[pos_])) {
      name.push_back(html_[pos_++]);
    }
    return name;
  }

  void skip_ws() {
    while (pos_ < html_.size() && std::isspace(static_cast<unsigned char>(html_[pos_]))) {
      ++pos_;
    }
  }

  bool set_error(const std::string& message, size_t position) {
    error_ = ParseError{message, position};
    return false;
  }

  const std::string& html_;
  size_t pos_ = 0;
  size_t depth_ = 0;
  ParseError error_;
};

}  // namespace

HtmlParseResult parse_html_strict(const std::string& html) {
  return StrictParser(html).parse();
}

}  // namespace hsearch
