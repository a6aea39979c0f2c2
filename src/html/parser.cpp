#include <livepatch/html/parser.h>
#include <livepatch/core/diagnostics.h>
#include <livepatch/core/error.h>

namespace livepatch::html {

namespace {

vdom::Node* first_element_child(vdom::Node& node) {
    auto* children = node.mutable_children();
    if (!children) return nullptr;
    for (auto& child : *children) {
        if (child.is_element()) return &child;
    }
    return nullptr;
}

vdom::Node* child_with_tag(vdom::Node& node, const std::string& tag) {
    auto* children = node.mutable_children();
    if (!children) return nullptr;
    for (auto& child : *children) {
        if (child.is_element() && child.tag() == tag) return &child;
    }
    return nullptr;
}

std::size_t count_other_content(const std::vector<vdom::Node>& siblings, const vdom::Node* kept) {
    std::size_t n = 0;
    for (const auto& node : siblings) {
        if (&node != kept) ++n;
    }
    return n;
}

// Picks the single root out of the top-level nodes of a fragment. A full
// document descends html -> body -> first element.
vdom::Node select_root(std::vector<vdom::Node>& top_level, std::vector<ParseWarning>& warnings,
                       core::DiagnosticEmitter* diagnostics) {
    auto note = [&](std::string message, std::string action) {
        if (diagnostics) {
            diagnostics->warning("html", "root", message + " (" + action + ")");
        }
        warnings.push_back({std::move(message), std::move(action), 0});
    };

    vdom::Node* first = nullptr;
    for (auto& node : top_level) {
        if (node.is_element()) {
            first = &node;
            break;
        }
    }

    if (!first) {
        auto wrapper = vdom::Node::element("div");
        for (auto& node : top_level) {
            wrapper.append_child(std::move(node));
        }
        note("fragment contains no element", "wrapped top-level text in <div>");
        return wrapper;
    }

    std::vector<vdom::Node>* siblings = &top_level;
    vdom::Node* chosen = first;
    if (first->tag() == "html") {
        if (auto* body = child_with_tag(*first, "body")) {
            if (auto* content = first_element_child(*body)) {
                siblings = body->mutable_children();
                chosen = content;
            }
        }
        if (count_other_content(top_level, first) > 0) {
            note("content outside <html>", "dropped");
        }
    }

    const std::size_t dropped = count_other_content(*siblings, chosen);
    if (dropped > 0) {
        note(std::to_string(dropped) + " node(s) beside the root <" + chosen->tag() + ">",
             "dropped");
    }
    return std::move(*chosen);
}

} // namespace

void assign_identities(vdom::Node& root, vdom::IdentityCounter& counter) {
    if (!root.is_element()) return;
    root.set_identity(counter.next());
    for (auto& child : *root.mutable_children()) {
        assign_identities(child, counter);
    }
}

ParseResult parse_html_with_diagnostics(std::string_view html,
                                        vdom::IdentityCounter& counter,
                                        const ParseOptions& options) {
    if (auto bad = find_invalid_utf8(html)) {
        if (options.diagnostics) {
            options.diagnostics->error("html", "decode",
                                       "input is not valid UTF-8 at byte " + std::to_string(*bad));
        }
        throw core::ParseError("invalid UTF-8 or NUL byte in markup", *bad);
    }

    Tokenizer tokenizer(html);
    TreeBuilder builder(tokenizer, options);
    while (true) {
        Token token = tokenizer.next_token();
        builder.process_token(token);
        if (token.type == Token::EndOfFile) break;
    }

    auto top_level = builder.take_top_level();
    std::vector<ParseWarning> warnings = builder.warnings();
    vdom::Node root = select_root(top_level, warnings, options.diagnostics);
    assign_identities(root, counter);

    return ParseResult{std::move(root), std::move(warnings)};
}

vdom::Node parse_html(std::string_view html, vdom::IdentityCounter& counter) {
    return parse_html_with_diagnostics(html, counter).root;
}

vdom::Node parse_html(std::string_view html) {
    vdom::IdentityCounter counter;
    return parse_html(html, counter);
}

} // namespace livepatch::html
