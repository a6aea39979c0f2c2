#include <livepatch/vdom/html_writer.h>

#include <unordered_set>

namespace livepatch::vdom {

namespace {

bool is_void_element(const std::string& tag) {
    static const std::unordered_set<std::string> s = {
        "area", "base", "br", "col", "embed", "hr", "img", "input",
        "link", "meta", "param", "source", "track", "wbr"
    };
    return s.count(tag) > 0;
}

bool is_raw_text_element(const std::string& tag) {
    return tag == "script" || tag == "style" || tag == "xmp"
        || tag == "iframe" || tag == "noembed" || tag == "noframes" || tag == "noscript";
}

void write_node(std::string& out, const Node& node, bool raw_text) {
    if (const auto* text = node.as_text()) {
        out += raw_text ? text->content : escape_text(text->content);
        return;
    }

    const auto* el = node.as_element();
    out += "<";
    out += el->tag;
    for (const auto& [name, value] : el->attributes) {
        out += " ";
        out += name;
        out += "=\"";
        out += escape_attribute(value);
        out += "\"";
    }
    out += ">";
    if (is_void_element(el->tag)) return;

    const bool raw_children = is_raw_text_element(el->tag);
    bool previous_was_text = false;
    for (const auto& child : el->children) {
        if (child.is_text() && previous_was_text) {
            out += "<!---->";
        }
        write_node(out, child, raw_children);
        previous_was_text = child.is_text();
    }

    out += "</";
    out += el->tag;
    out += ">";
}

} // namespace

std::string escape_text(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default:  out += c; break;
        }
    }
    return out;
}

std::string escape_attribute(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '"': out += "&quot;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default:  out += c; break;
        }
    }
    return out;
}

std::string to_html(const Node& node) {
    std::string out;
    write_node(out, node, false);
    return out;
}

} // namespace livepatch::vdom
