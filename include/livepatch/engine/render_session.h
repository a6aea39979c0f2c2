#pragma once

#include "livepatch/core/config.h"
#include "livepatch/html/tree_builder.h"
#include "livepatch/vdom/identity.h"
#include "livepatch/vdom/node.h"
#include "livepatch/vdom/patch.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace livepatch::core {
class DiagnosticEmitter;
}

namespace livepatch::engine {

struct SessionOptions {
    std::size_t max_depth = core::config::kDefaultMaxDepth;
    core::DiagnosticEmitter* diagnostics = nullptr;
};

struct RenderResult {
    bool ok = false;
    // The client must replace its tree with `html` instead of patching.
    bool full_render = false;
    std::string html;
    std::vector<vdom::Patch> patches;
    std::vector<html::ParseWarning> warnings;
    std::string message;
    int render_count = 0;
};

// Server-side mirror of one client view. Each render parses the new markup
// with the session's identity counter, diffs it against the mirror and
// patches the mirror the way the client will, so surviving nodes keep the
// identities the client already holds.
class RenderSession {
public:
    explicit RenderSession(SessionOptions options = {});

    RenderResult render(std::string_view markup);

    // Forgets the mirror; the next render is a full render with identities
    // starting from "0" again.
    void reset();

    bool has_mirror() const { return mirror_.has_value(); }
    const vdom::Node* mirror() const;
    int render_count() const { return render_count_; }
    std::uint64_t next_identity() const { return counter_.peek(); }

private:
    SessionOptions options_;
    vdom::IdentityCounter counter_;
    std::optional<vdom::Node> mirror_;
    int render_count_ = 0;

    RenderResult full_render(vdom::Node root, RenderResult result);
};

}  // namespace livepatch::engine
