#include <livepatch/vdom/node.h>
#include <livepatch/core/config.h>

#include <sstream>

namespace livepatch::vdom {

namespace config = core::config;

namespace {

const std::string& text_tag() {
    static const std::string tag = config::kTextTag;
    return tag;
}

const std::string& empty_string() {
    static const std::string empty;
    return empty;
}

const std::optional<std::string>& no_value() {
    static const std::optional<std::string> none;
    return none;
}

const AttributeMap& empty_attributes() {
    static const AttributeMap empty;
    return empty;
}

const std::vector<Node>& no_children() {
    static const std::vector<Node> empty;
    return empty;
}

bool attributes_equal_ignoring_identity(const AttributeMap& a, const AttributeMap& b) {
    auto ia = a.begin();
    auto ib = b.begin();
    while (true) {
        while (ia != a.end() && ia->first == config::kIdentityAttribute) ++ia;
        while (ib != b.end() && ib->first == config::kIdentityAttribute) ++ib;
        if (ia == a.end() || ib == b.end()) {
            return ia == a.end() && ib == b.end();
        }
        if (ia->first != ib->first || ia->second != ib->second) return false;
        ++ia;
        ++ib;
    }
}

template <typename NodeT>
NodeT* find_by_identity_impl(NodeT& node, std::string_view identity) {
    const auto& id = node.identity();
    if (id && *id == identity) return &node;
    if (auto* el = node.as_element()) {
        for (auto& child : el->children) {
            if (auto* found = find_by_identity_impl(child, identity)) return found;
        }
    }
    return nullptr;
}

template <typename NodeT>
NodeT* node_at_impl(NodeT& root, const Path& path) {
    NodeT* current = &root;
    for (std::size_t index : path) {
        auto* el = current->as_element();
        if (!el || index >= el->children.size()) return nullptr;
        current = &el->children[index];
    }
    return current;
}

void write_debug(std::ostringstream& oss, const Node& node) {
    if (const auto* t = node.as_text()) {
        oss << '"' << t->content << '"';
        if (t->identity) oss << "#" << *t->identity;
        return;
    }
    const auto* el = node.as_element();
    oss << "<" << el->tag;
    if (el->identity) oss << "#" << *el->identity;
    if (el->key) oss << " key=" << *el->key;
    for (const auto& [name, value] : el->attributes) {
        if (name == config::kIdentityAttribute || name == config::kKeyAttribute) continue;
        oss << " " << name << "=\"" << value << "\"";
    }
    oss << ">";
    for (const auto& child : el->children) {
        write_debug(oss, child);
    }
    oss << "</" << el->tag << ">";
}

} // namespace

// ---------------------------------------------------------------------------
// Node
// ---------------------------------------------------------------------------

Node::Node(Text text) : data_(std::move(text)) {}

Node::Node(Element element) : data_(std::move(element)) {}

Node Node::element(std::string tag) {
    Element el;
    el.tag = std::move(tag);
    return Node(std::move(el));
}

Node Node::text(std::string content) {
    Text t;
    t.content = std::move(content);
    return Node(std::move(t));
}

const std::string& Node::tag() const {
    if (const auto* el = as_element()) return el->tag;
    return text_tag();
}

const std::string& Node::text_content() const {
    if (const auto* t = as_text()) return t->content;
    return empty_string();
}

bool Node::set_text_content(std::string content) {
    auto* t = as_text();
    if (!t) return false;
    t->content = std::move(content);
    return true;
}

const std::optional<std::string>& Node::identity() const {
    if (const auto* el = as_element()) return el->identity;
    return std::get<Text>(data_).identity;
}

const std::optional<std::string>& Node::key() const {
    if (const auto* el = as_element()) return el->key;
    return no_value();
}

Node& Node::set_identity(std::optional<std::string> identity) {
    if (auto* t = as_text()) {
        t->identity = std::move(identity);
        return *this;
    }
    auto* el = as_element();
    if (identity) {
        el->attributes[config::kIdentityAttribute] = *identity;
    } else {
        el->attributes.erase(config::kIdentityAttribute);
    }
    el->identity = std::move(identity);
    return *this;
}

Node& Node::set_key(std::optional<std::string> key) {
    if (key) {
        set_attribute(config::kKeyAttribute, std::move(*key));
    } else {
        remove_attribute(config::kKeyAttribute);
    }
    return *this;
}

const AttributeMap& Node::attributes() const {
    if (const auto* el = as_element()) return el->attributes;
    return empty_attributes();
}

const std::string* Node::attribute(std::string_view name) const {
    const auto* el = as_element();
    if (!el) return nullptr;
    auto it = el->attributes.find(std::string(name));
    if (it == el->attributes.end()) return nullptr;
    return &it->second;
}

bool Node::has_attribute(std::string_view name) const {
    return attribute(name) != nullptr;
}

bool Node::set_attribute(const std::string& name, std::string value) {
    auto* el = as_element();
    if (!el) return false;
    if (name == config::kKeyAttribute) {
        el->key = value.empty() ? std::nullopt : std::optional<std::string>(value);
    } else if (name == config::kIdentityAttribute) {
        el->identity = value;
    }
    el->attributes[name] = std::move(value);
    return true;
}

bool Node::remove_attribute(const std::string& name) {
    auto* el = as_element();
    if (!el) return false;
    if (name == config::kKeyAttribute) {
        el->key.reset();
    } else if (name == config::kIdentityAttribute) {
        el->identity.reset();
    }
    return el->attributes.erase(name) > 0;
}

Node& Node::attr(const std::string& name, std::string value) {
    set_attribute(name, std::move(value));
    return *this;
}

Node& Node::append_child(Node child) {
    if (auto* el = as_element()) {
        el->children.push_back(std::move(child));
    }
    return *this;
}

const std::vector<Node>& Node::children() const {
    if (const auto* el = as_element()) return el->children;
    return no_children();
}

std::vector<Node>* Node::mutable_children() {
    if (auto* el = as_element()) return &el->children;
    return nullptr;
}

bool operator==(const Node& a, const Node& b) {
    if (a.is_text() != b.is_text()) return false;
    if (const auto* ta = a.as_text()) {
        const auto* tb = b.as_text();
        return ta->content == tb->content && ta->identity == tb->identity;
    }
    const auto* ea = a.as_element();
    const auto* eb = b.as_element();
    return ea->tag == eb->tag &&
           ea->identity == eb->identity &&
           ea->key == eb->key &&
           ea->attributes == eb->attributes &&
           ea->children == eb->children;
}

// ---------------------------------------------------------------------------
// Tree queries
// ---------------------------------------------------------------------------

bool structurally_equal(const Node& a, const Node& b) {
    if (a.is_text() != b.is_text()) return false;
    if (const auto* ta = a.as_text()) {
        return ta->content == b.as_text()->content;
    }
    const auto* ea = a.as_element();
    const auto* eb = b.as_element();
    if (ea->tag != eb->tag) return false;
    if (!attributes_equal_ignoring_identity(ea->attributes, eb->attributes)) return false;
    if (ea->children.size() != eb->children.size()) return false;
    for (std::size_t i = 0; i < ea->children.size(); ++i) {
        if (!structurally_equal(ea->children[i], eb->children[i])) return false;
    }
    return true;
}

std::size_t count_nodes(const Node& root) {
    std::size_t n = 1;
    for (const auto& child : root.children()) {
        n += count_nodes(child);
    }
    return n;
}

std::size_t count_attributes(const Node& root) {
    std::size_t n = root.attributes().size();
    for (const auto& child : root.children()) {
        n += count_attributes(child);
    }
    return n;
}

Node* find_by_identity(Node& root, std::string_view identity) {
    return find_by_identity_impl(root, identity);
}

const Node* find_by_identity(const Node& root, std::string_view identity) {
    return find_by_identity_impl(root, identity);
}

Node* node_at(Node& root, const Path& path) {
    return node_at_impl(root, path);
}

const Node* node_at(const Node& root, const Path& path) {
    return node_at_impl(root, path);
}

std::string debug_string(const Node& node) {
    std::ostringstream oss;
    write_debug(oss, node);
    return oss.str();
}

std::string format_path(const Path& path) {
    std::string out = "[";
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out += ",";
        out += std::to_string(path[i]);
    }
    out += "]";
    return out;
}

} // namespace livepatch::vdom
