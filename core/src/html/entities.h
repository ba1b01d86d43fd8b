#pragma once

#include <string>

namespace hsearch {

/// Decodes character references (&amp;, &#39;, &#x2014;, common named entities) to UTF-8.
/// MUST leave unknown or unterminated references verbatim so no input text is lost.
/// Inputs are raw text or attribute values; outputs are decoded strings with no side effects.
std::string decode_entities(const std::string& raw);

/// Escapes &, < and > for text content.
std::string escape_text(const std::string& text);
/// Escapes &, <, > and " for a double-quoted attribute value.
std::string escape_attribute(const std::string& value);

}  // namespace hsearch
