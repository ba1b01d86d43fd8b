#include "entities.h"

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace hsearch {

namespace {

constexpr size_t kMaxReferenceLength = 34;

struct NamedEntity {
  const char* name;
  uint32_t codepoint;
};

// Lowercase-only names; matching is case-sensitive like HTML itself.
const NamedEntity kNamedEntities[] = {
    {"amp", 0x26},     {"lt", 0x3C},      {"gt", 0x3E},     {"quot", 0x22},   {"apos", 0x27},
    {"nbsp", 0xA0},    {"copy", 0xA9},    {"reg", 0xAE},    {"trade", 0x2122}, {"hellip", 0x2026},
    {"mdash", 0x2014}, {"ndash", 0x2013}, {"lsquo", 0x2018}, {"rsquo", 0x2019}, {"ldquo", 0x201C},
    {"rdquo", 0x201D}, {"laquo", 0xAB},   {"raquo", 0xBB},  {"middot", 0xB7}, {"times", 0xD7},
    {"divide", 0xF7},  {"euro", 0x20AC},  {"pound", 0xA3},  {"yen", 0xA5},    {"cent", 0xA2},
    {"sect", 0xA7},    {"deg", 0xB0},     {"para", 0xB6},   {"bull", 0x2022},
};

/// Appends a code point as UTF-8.
/// MUST replace surrogates and out-of-range values with U+FFFD.
void append_utf8(uint32_t cp, std::string& out) {
  if (cp == 0 || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
    cp = 0xFFFD;
  }
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool parse_numeric(const std::string& body, uint32_t& out) {
  bool hex = body.size() > 1 && (body[1] == 'x' || body[1] == 'X');
  size_t start = hex ? 2 : 1;
  if (start >= body.size()) return false;
  uint32_t value = 0;
  for (size_t i = start; i < body.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(body[i]);
    uint32_t digit = 0;
    if (std::isdigit(c)) {
      digit = c - '0';
    } else if (hex && std::isxdigit(c)) {
      digit = static_cast<uint32_t>(std::tolower(c) - 'a' + 10);
    } else {
      return false;
    }
    value = value * (hex ? 16 : 10) + digit;
    if (value > 0x10FFFF) value = 0x110000;
  }
  out = value;
  return true;
}

/// Resolves the text between '&' and ';'.
bool resolve_reference(const std::string& body, std::string& out) {
  if (!body.empty() && body[0] == '#') {
    uint32_t cp = 0;
    if (!parse_numeric(body, cp)) return false;
    append_utf8(cp, out);
    return true;
  }
  for (const auto& entity : kNamedEntities) {
    if (body == entity.name) {
      append_utf8(entity.codepoint, out);
      return true;
    }
  }
  return false;
}

}  // namespace

std::string decode_entities(const std::string& raw) {
  if (raw.find('&') == std::string::npos) return raw;
  std::string out;
  out.reserve(raw.size());
  size_t i = 0;
  while (i < raw.size()) {
    if (raw[i] != '&') {
      out.push_back(raw[i++]);
      continue;
    }
    // WHY: references are short; scanning a bounded window keeps stray '&' linear.
    size_t limit = std::min(raw.size(), i + kMaxReferenceLength);
    size_t semi = i + 1;
    while (semi < limit && raw[semi] != ';') ++semi;
    if (semi >= limit || !resolve_reference(raw.substr(i + 1, semi - i - 1), out)) {
      out.push_back('&');
      ++i;
      continue;
    }
    i = semi + 1;
  }
  return out;
}

std::string escape_text(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

std::string escape_attribute(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    if (c == '"') {
      out += "&quot;";
    } else if (c == '&' || c == '<' || c == '>') {
      out += escape_text(std::string(1, c));
    } else {
      out.push_back(c);
    }
  }
  return out;
}

}  // namespace hsearch
