#include "livepatch/engine/render_session.h"

#include "livepatch/core/diagnostics.h"
#include "livepatch/core/error.h"
#include "livepatch/html/parser.h"
#include "livepatch/vdom/apply.h"
#include "livepatch/vdom/diff.h"
#include "livepatch/vdom/html_writer.h"

namespace livepatch::engine {

RenderSession::RenderSession(SessionOptions options)
    : options_(options) {}

const vdom::Node* RenderSession::mirror() const {
    return mirror_ ? &*mirror_ : nullptr;
}

void RenderSession::reset() {
    mirror_.reset();
    counter_.reset();
    render_count_ = 0;
}

RenderResult RenderSession::full_render(vdom::Node root, RenderResult result) {
    mirror_ = std::move(root);
    result.ok = true;
    result.full_render = true;
    result.html = vdom::to_html(*mirror_);
    result.patches.clear();
    return result;
}

RenderResult RenderSession::render(std::string_view markup) {
    ++render_count_;
    auto* diagnostics = options_.diagnostics;
    if (diagnostics) {
        diagnostics->set_correlation_id(static_cast<std::uint64_t>(render_count_));
    }

    RenderResult result;
    result.render_count = render_count_;

    html::ParseOptions parse_options;
    parse_options.max_depth = options_.max_depth;
    parse_options.diagnostics = diagnostics;

    std::optional<html::ParseResult> parsed;
    try {
        parsed = html::parse_html_with_diagnostics(markup, counter_, parse_options);
    } catch (const core::ParseError& e) {
        result.message = e.what();
    } catch (const core::DepthExceeded& e) {
        result.message = e.what();
    }
    if (!parsed) {
        if (diagnostics) {
            diagnostics->error("session", "parse", "render rejected: " + result.message);
        }
        return result;
    }
    result.warnings = std::move(parsed->warnings);

    if (!mirror_) {
        if (diagnostics) {
            diagnostics->info("session", "render", "initial render of <" + parsed->root.tag() + ">");
        }
        result.message = "initial render";
        return full_render(std::move(parsed->root), std::move(result));
    }

    result.patches = vdom::diff(*mirror_, parsed->root, vdom::Path{}, vdom::DiffOptions{diagnostics});

    vdom::Node patched = *mirror_;
    const auto report = vdom::apply_all(patched, result.patches, vdom::ApplyOptions{diagnostics});
    if (!report.clean() || !vdom::structurally_equal(patched, parsed->root)) {
        if (diagnostics) {
            diagnostics->error("session", "verify",
                               "patched mirror diverged from rendered tree (" +
                                   std::to_string(report.skipped) + " skipped of " +
                                   std::to_string(result.patches.size()) + "); sending full render");
        }
        result.message = "mirror diverged";
        return full_render(std::move(parsed->root), std::move(result));
    }

    mirror_ = std::move(patched);
    result.ok = true;
    result.message = "OK";
    if (diagnostics) {
        diagnostics->info("session", "render",
                          std::to_string(result.patches.size()) + " patch(es)");
    }
    return result;
}

}  // namespace livepatch::engine
