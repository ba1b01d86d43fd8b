#include "executor_internal.h"

#include <algorithm>

namespace hsearch::executor_internal {

std::vector<Attribute> required_attributes(const QuerySelector& selector) {
  std::vector<Attribute> out;
  out.reserve(selector.ids.size() + selector.classes.size() + selector.attributes.size());
  for (const auto& id : selector.ids) {
    out.emplace_back("id", id);
  }
  for (const auto& cls : selector.classes) {
    out.emplace_back("class", cls);
  }
  out.insert(out.end(), selector.attributes.begin(), selector.attributes.end());
  return out;
}

bool has_attribute_pair(const std::vector<Attribute>& attributes, const Attribute& pair) {
  return std::find(attributes.begin(), attributes.end(), pair) != attributes.end();
}

}  // namespace hsearch::executor_internal

namespace hsearch {

bool selector_matches(const QuerySelector& selector, const ElementNode& element) {
  if (selector.tag.has_value() && *selector.tag != element.tag) {
    return false;
  }
  // WHY: class="a b" only satisfies .a when a literal ("class", "a") pair exists.
  for (const auto& pair : executor_internal::required_attributes(selector)) {
    if (!executor_internal::has_attribute_pair(element.attributes, pair)) return false;
  }
  return true;
}

}  // namespace hsearch
