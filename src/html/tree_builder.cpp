#include <livepatch/html/tree_builder.h>
#include <livepatch/core/diagnostics.h>
#include <livepatch/core/error.h>
#include <algorithm>

namespace livepatch::html {

// ============================================================================
// Helper utilities
// ============================================================================

static const std::unordered_set<std::string>& void_elements() {
    static const std::unordered_set<std::string> s = {
        "area", "base", "br", "col", "embed", "hr", "img", "input",
        "link", "meta", "param", "source", "track", "wbr"
    };
    return s;
}

// Elements that implicitly close an open <p> when they start
static bool closes_p(const std::string& tag) {
    static const std::unordered_set<std::string> s = {
        "address", "article", "aside", "blockquote", "center", "details",
        "dialog", "dir", "div", "dl", "fieldset", "figcaption", "figure",
        "footer", "header", "hgroup", "hr", "li", "listing", "main",
        "menu", "nav", "ol", "p", "pre", "search", "section", "summary",
        "form", "table", "ul", "dd", "dt",
        "h1", "h2", "h3", "h4", "h5", "h6"
    };
    return s.count(tag) > 0;
}

static const std::unordered_set<std::string>& scope_boundaries() {
    static const std::unordered_set<std::string> s = {
        "applet", "caption", "html", "table", "td", "th", "marquee",
        "object", "template", "foreignobject"
    };
    return s;
}

static const std::unordered_set<std::string>& button_scope_boundaries() {
    static const std::unordered_set<std::string> s = [] {
        auto set = scope_boundaries();
        set.insert("button");
        return set;
    }();
    return s;
}

static const std::unordered_set<std::string>& list_scope_boundaries() {
    static const std::unordered_set<std::string> s = [] {
        auto set = scope_boundaries();
        set.insert("ul");
        set.insert("ol");
        return set;
    }();
    return s;
}

static const std::unordered_set<std::string>& definition_scope_boundaries() {
    static const std::unordered_set<std::string> s = [] {
        auto set = scope_boundaries();
        set.insert("dl");
        return set;
    }();
    return s;
}

static const std::unordered_set<std::string>& table_scope_boundaries() {
    static const std::unordered_set<std::string> s = {"table", "html", "template"};
    return s;
}

static const std::unordered_set<std::string>& row_scope_boundaries() {
    static const std::unordered_set<std::string> s = {
        "table", "tbody", "thead", "tfoot", "html", "template"
    };
    return s;
}

static const std::unordered_set<std::string>& cell_scope_boundaries() {
    static const std::unordered_set<std::string> s = {
        "tr", "table", "tbody", "thead", "tfoot", "html", "template"
    };
    return s;
}

static const std::unordered_set<std::string>& end_tag_boundaries(const std::string& tag) {
    static const std::unordered_set<std::string> document_only = {"html", "template"};
    if (tag == "table") return document_only;
    if (tag == "tbody" || tag == "thead" || tag == "tfoot" || tag == "tr" ||
        tag == "td" || tag == "th" || tag == "caption") {
        return table_scope_boundaries();
    }
    return scope_boundaries();
}

// Raw text elements: their content is parsed as raw text
static bool is_raw_text_element(const std::string& tag) {
    return tag == "script" || tag == "style" || tag == "xmp"
        || tag == "iframe" || tag == "noembed" || tag == "noframes" || tag == "noscript";
}

// RCDATA elements: title, textarea
static bool is_rcdata_element(const std::string& tag) {
    return tag == "title" || tag == "textarea";
}

static bool is_foreign_root(const std::string& tag) {
    return tag == "svg" || tag == "math";
}

// ASCII whitespace only; U+00A0 counts as content.
static bool is_all_whitespace(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\f' || c == '\r';
    });
}

// ============================================================================
// TreeBuilder
// ============================================================================

TreeBuilder::TreeBuilder(Tokenizer& tokenizer, const ParseOptions& options)
    : tokenizer_(tokenizer), options_(options) {}

void TreeBuilder::process_token(const Token& token) {
    switch (token.type) {
        case Token::Character:
            pending_text_ += token.data;
            break;
        case Token::Comment:
        case Token::DOCTYPE:
            // Dropped, but they still end the current text run.
            flush_text();
            break;
        case Token::StartTag:
            flush_text();
            handle_start_tag(token);
            break;
        case Token::EndTag:
            // Flushes only if the tag closes something; an ignored end tag
            // leaves the text run intact.
            handle_end_tag(token);
            break;
        case Token::EndOfFile:
            finish();
            break;
    }
}

void TreeBuilder::finish() {
    flush_text();
    if (!open_elements_.empty()) {
        warn(std::to_string(open_elements_.size()) + " element(s) still open at end of input, innermost <" +
                 open_elements_.back()->tag() + ">",
             "closed at end of input", tokenizer_.position());
        while (!open_elements_.empty()) {
            pop_element();
        }
    }
}

void TreeBuilder::handle_start_tag(const Token& token) {
    const std::string& name = token.name;
    const bool in_foreign = foreign_depth_ > 0;

    if (!in_foreign) {
        if (closes_p(name)) {
            close_implied({"p"}, button_scope_boundaries(), token.offset);
        }
        if (name == "li") {
            close_implied({"li"}, list_scope_boundaries(), token.offset);
        } else if (name == "dt" || name == "dd") {
            close_implied({"dt", "dd"}, definition_scope_boundaries(), token.offset);
        } else if (name == "option" || name == "optgroup") {
            if (!open_elements_.empty() && open_elements_.back()->tag() == "option") {
                warn("<" + name + "> inside open <option>", "implied </option>", token.offset);
                pop_element();
            }
            if (name == "optgroup") {
                close_implied({"optgroup"}, {"select", "datalist", "html", "template"}, token.offset);
            }
        } else if (name == "tr") {
            close_implied({"tr"}, row_scope_boundaries(), token.offset);
        } else if (name == "td" || name == "th") {
            close_implied({"td", "th"}, cell_scope_boundaries(), token.offset);
        } else if (name == "thead" || name == "tbody" || name == "tfoot") {
            close_implied({"thead", "tbody", "tfoot"}, table_scope_boundaries(), token.offset);
        }
    }

    const bool is_void = void_elements().count(name) > 0;
    const bool foreign = in_foreign || is_foreign_root(name);
    if (token.self_closing && !is_void && !foreign) {
        warn("self-closing syntax on non-void <" + name + ">", "treated as start tag", token.offset);
    }

    auto element = vdom::Node::element(name);
    for (const auto& attr : token.attributes) {
        if (attr.name.empty()) continue;
        if (element.has_attribute(attr.name)) {
            warn("duplicate attribute '" + attr.name + "' on <" + name + ">",
                 "kept first occurrence", token.offset);
            continue;
        }
        element.set_attribute(attr.name, attr.value);
    }

    const bool push = !is_void && !(token.self_closing && foreign);
    insert_element(std::move(element), push);

    if (push && !in_foreign) {
        if (is_raw_text_element(name)) {
            tokenizer_.set_state(TokenizerState::RAWTEXT);
            tokenizer_.set_last_start_tag(name);
        } else if (is_rcdata_element(name)) {
            tokenizer_.set_state(TokenizerState::RCDATA);
            tokenizer_.set_last_start_tag(name);
        }
    }
}

void TreeBuilder::handle_end_tag(const Token& token) {
    const std::string& name = token.name;
    if (void_elements().count(name) > 0) {
        warn("end tag for void element </" + name + ">", "ignored", token.offset);
        return;
    }

    const auto& boundaries = end_tag_boundaries(name);
    for (std::size_t i = open_elements_.size(); i-- > 0;) {
        const std::string& tag = open_elements_[i]->tag();
        if (tag == name) {
            const std::size_t unclosed = open_elements_.size() - 1 - i;
            if (unclosed > 0) {
                warn("</" + name + "> closed " + std::to_string(unclosed) +
                         " unclosed element(s), innermost <" + open_elements_.back()->tag() + ">",
                     "implied end tags", token.offset);
            }
            flush_text();
            while (open_elements_.size() > i) {
                pop_element();
            }
            return;
        }
        if (boundaries.count(tag) > 0) break;
    }

    warn("unmatched end tag </" + name + ">", "ignored", token.offset);
}

void TreeBuilder::flush_text() {
    if (pending_text_.empty()) return;
    if (!is_all_whitespace(pending_text_)) {
        current_children().push_back(vdom::Node::text(std::move(pending_text_)));
    }
    pending_text_.clear();
}

std::vector<vdom::Node>& TreeBuilder::current_children() {
    if (open_elements_.empty()) return top_level_;
    return *open_elements_.back()->mutable_children();
}

void TreeBuilder::insert_element(vdom::Node element, bool push) {
    if (open_elements_.size() + 1 > options_.max_depth) {
        throw core::DepthExceeded(options_.max_depth);
    }
    const bool foreign_root = is_foreign_root(element.tag());
    auto& siblings = current_children();
    siblings.push_back(std::move(element));
    if (push) {
        open_elements_.push_back(&siblings.back());
        if (foreign_root) ++foreign_depth_;
    }
}

void TreeBuilder::pop_element() {
    if (open_elements_.empty()) return;
    if (is_foreign_root(open_elements_.back()->tag()) && foreign_depth_ > 0) {
        --foreign_depth_;
    }
    open_elements_.pop_back();
}

bool TreeBuilder::close_implied(const std::unordered_set<std::string>& targets,
                                const std::unordered_set<std::string>& boundaries,
                                std::size_t offset) {
    for (std::size_t i = open_elements_.size(); i-- > 0;) {
        const std::string& tag = open_elements_[i]->tag();
        if (targets.count(tag) > 0) {
            warn("<" + tag + "> closed implicitly", "implied </" + tag + ">", offset);
            while (open_elements_.size() > i) {
                pop_element();
            }
            return true;
        }
        if (boundaries.count(tag) > 0) return false;
    }
    return false;
}

void TreeBuilder::warn(std::string message, std::string recovery_action, std::size_t offset) {
    if (options_.diagnostics) {
        options_.diagnostics->warning("html", "tree",
                                      message + " (" + recovery_action + ", byte " +
                                          std::to_string(offset) + ")");
    }
    warnings_.push_back({std::move(message), std::move(recovery_action), offset});
}

} // namespace livepatch::html
