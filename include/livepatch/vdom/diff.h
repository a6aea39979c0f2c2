#pragma once
#include <livepatch/vdom/node.h>
#include <livepatch/vdom/patch.h>

#include <vector>

namespace livepatch::core {
class DiagnosticEmitter;
}

namespace livepatch::vdom {

struct DiffOptions {
    // Receives duplicate-key warnings and reconciliation notes.
    core::DiagnosticEmitter* diagnostics = nullptr;
};

// Computes the patches that turn `old_node` into `new_node`. Patches are
// emitted in pre-order, so applying them in list order is valid as well as
// applying them with apply_all().
std::vector<Patch> diff(const Node& old_node, const Node& new_node);

// Same, with `path` as the location of `old_node` inside a larger tree.
std::vector<Patch> diff(const Node& old_node, const Node& new_node, const Path& path);

std::vector<Patch> diff(const Node& old_node, const Node& new_node, const Path& path,
                        const DiffOptions& options);

} // namespace livepatch::vdom
