#pragma once
#include <livepatch/core/config.h>
#include <livepatch/html/tokenizer.h>
#include <livepatch/vdom/node.h>

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace livepatch::core {
class DiagnosticEmitter;
}

namespace livepatch::html {

struct ParseWarning {
    std::string message;
    std::string recovery_action;
    std::size_t offset = 0;
};

struct ParseOptions {
    // Deepest element nesting accepted before DepthExceeded is thrown.
    std::size_t max_depth = core::config::kDefaultMaxDepth;
    core::DiagnosticEmitter* diagnostics = nullptr;
};

// Permissive tree construction over a token stream. Produces the top-level
// node list of a fragment; it never rejects markup, it only records the
// recovery it applied.
class TreeBuilder {
public:
    TreeBuilder(Tokenizer& tokenizer, const ParseOptions& options);

    void process_token(const Token& token);

    // Flushes pending text and closes elements still open.
    void finish();

    std::vector<vdom::Node> take_top_level() { return std::move(top_level_); }
    const std::vector<ParseWarning>& warnings() const { return warnings_; }

private:
    Tokenizer& tokenizer_;
    ParseOptions options_;
    std::vector<vdom::Node> top_level_;
    // Each entry is the last child of the entry below it, so appending to the
    // innermost element never moves an open ancestor.
    std::vector<vdom::Node*> open_elements_;
    std::size_t foreign_depth_ = 0;
    std::string pending_text_;
    std::vector<ParseWarning> warnings_;

    void handle_start_tag(const Token& token);
    void handle_end_tag(const Token& token);
    void flush_text();

    std::vector<vdom::Node>& current_children();
    void insert_element(vdom::Node element, bool push);
    void pop_element();

    // Closes the innermost open element whose tag is in `targets`, unless an
    // element in `boundaries` is reached first.
    bool close_implied(const std::unordered_set<std::string>& targets,
                       const std::unordered_set<std::string>& boundaries,
                       std::size_t offset);

    void warn(std::string message, std::string recovery_action, std::size_t offset);
};

} // namespace livepatch::html
