#pragma once

#include <vector>

#include "../executor.h"

namespace hsearch::executor_internal {

/// Merges ids, classes and explicit attributes into the required pair list.
/// MUST map ids to ("id", v) and classes to ("class", v) without tokenizing.
/// Inputs are selectors; outputs are pair vectors with no side effects.
std::vector<Attribute> required_attributes(const QuerySelector& selector);
/// Checks exact (key, value) membership in an attribute list.
/// MUST be case-sensitive and MUST ignore attribute order.
bool has_attribute_pair(const std::vector<Attribute>& attributes, const Attribute& pair);

}  // namespace hsearch::executor_internal
