#pragma once
#include <livepatch/vdom/node.h>

#include <string>
#include <string_view>

namespace livepatch::vdom {

// Serializes a tree back to markup, identity and key attributes included.
// Adjacent text siblings are separated by an empty comment so that parsing
// the output yields the same node boundaries.
std::string to_html(const Node& node);

std::string escape_text(std::string_view text);
std::string escape_attribute(std::string_view value);

} // namespace livepatch::vdom
