#pragma once
#include <livepatch/html/tree_builder.h>
#include <livepatch/vdom/identity.h>
#include <livepatch/vdom/node.h>

#include <string_view>
#include <vector>

namespace livepatch::html {

struct ParseResult {
    vdom::Node root;
    std::vector<ParseWarning> warnings;
};

// Parses a fragment into exactly one root element and stamps identities on
// every element in document order. Throws core::ParseError for input that is
// not valid UTF-8 and core::DepthExceeded past ParseOptions::max_depth.
ParseResult parse_html_with_diagnostics(std::string_view html,
                                        vdom::IdentityCounter& counter,
                                        const ParseOptions& options = {});

// Continues `counter`, so trees parsed in one session have disjoint
// identities.
vdom::Node parse_html(std::string_view html, vdom::IdentityCounter& counter);

// Fresh counter: identities start at "0".
vdom::Node parse_html(std::string_view html);

// Pre-order over elements; writes the identity attribute as well.
void assign_identities(vdom::Node& root, vdom::IdentityCounter& counter);

} // namespace livepatch::html
