#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace livepatch::vdom {

class Node;

// Child-index path from a root. Empty addresses the root itself.
using Path = std::vector<std::size_t>;

// Ordered so that serialization and attribute diffs are deterministic.
using AttributeMap = std::map<std::string, std::string>;

struct Text {
    std::string content;
    std::optional<std::string> identity;
};

struct Element {
    std::string tag;
    AttributeMap attributes;
    std::vector<Node> children;
    std::optional<std::string> key;
    std::optional<std::string> identity;
};

// A unit of the virtual tree: either a text run or an element. Children are
// owned by value, so copying a Node deep-copies the subtree.
class Node {
public:
    Node(Text text);
    Node(Element element);

    static Node element(std::string tag);
    static Node text(std::string content);

    bool is_text() const { return std::holds_alternative<Text>(data_); }
    bool is_element() const { return std::holds_alternative<Element>(data_); }

    Element* as_element() { return std::get_if<Element>(&data_); }
    const Element* as_element() const { return std::get_if<Element>(&data_); }
    Text* as_text() { return std::get_if<Text>(&data_); }
    const Text* as_text() const { return std::get_if<Text>(&data_); }

    // Lower-case tag name, or "#text" for text nodes.
    const std::string& tag() const;

    // Text content; empty for elements.
    const std::string& text_content() const;
    bool set_text_content(std::string content);

    const std::optional<std::string>& identity() const;
    const std::optional<std::string>& key() const;

    // Sets the identity field, and for elements the identity attribute too.
    Node& set_identity(std::optional<std::string> identity);
    // Sets the key field and the key attribute. Ignored for text nodes.
    Node& set_key(std::optional<std::string> key);

    // Empty for text nodes.
    const AttributeMap& attributes() const;
    const std::string* attribute(std::string_view name) const;
    bool has_attribute(std::string_view name) const;

    // Writing or removing the key or identity attribute keeps the matching
    // field in sync. Both return false on text nodes.
    bool set_attribute(const std::string& name, std::string value);
    bool remove_attribute(const std::string& name);

    // Chainable builder form of set_attribute().
    Node& attr(const std::string& name, std::string value);
    Node& append_child(Node child);

    // Empty for text nodes.
    const std::vector<Node>& children() const;
    // Null for text nodes.
    std::vector<Node>* mutable_children();

    std::size_t child_count() const { return children().size(); }

    friend bool operator==(const Node& a, const Node& b);
    friend bool operator!=(const Node& a, const Node& b) { return !(a == b); }

private:
    std::variant<Text, Element> data_;
};

// Equality ignoring identities (field and attribute) and the derived key
// field. The key attribute is compared like any other attribute.
bool structurally_equal(const Node& a, const Node& b);

std::size_t count_nodes(const Node& root);
std::size_t count_attributes(const Node& root);

// Depth-first pre-order lookup.
Node* find_by_identity(Node& root, std::string_view identity);
const Node* find_by_identity(const Node& root, std::string_view identity);

Node* node_at(Node& root, const Path& path);
const Node* node_at(const Node& root, const Path& path);

// Compact single-line rendering for logs and test failure messages.
std::string debug_string(const Node& node);
std::string format_path(const Path& path);

} // namespace livepatch::vdom
