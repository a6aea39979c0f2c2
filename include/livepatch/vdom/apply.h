#pragma once
#include <livepatch/vdom/node.h>
#include <livepatch/vdom/patch.h>

#include <cstddef>
#include <vector>

namespace livepatch::core {
class DiagnosticEmitter;
}

namespace livepatch::vdom {

struct ApplyOptions {
    // Unresolved targets and skipped operations are reported here.
    core::DiagnosticEmitter* diagnostics = nullptr;
};

struct ApplyReport {
    std::size_t applied = 0;
    // Patches whose target could not be resolved or whose operation did not
    // fit the node (e.g. SetText on an element).
    std::size_t skipped = 0;

    bool clean() const { return skipped == 0; }
};

ApplyReport apply_patch(Node& root, const Patch& patch, const ApplyOptions& options = {});

// Applies patches in list order.
ApplyReport apply(Node& root, const std::vector<Patch>& patches,
                  const ApplyOptions& options = {});

// Applies patches grouped by depth, shallowest first. Within one depth:
// RemoveChild (descending index), MoveChild (list order), InsertChild
// (ascending index), then Replace/SetText/SetAttr/RemoveAttr.
ApplyReport apply_all(Node& root, const std::vector<Patch>& patches,
                      const ApplyOptions& options = {});

// The order apply_all() uses, as indices into `patches`.
std::vector<std::size_t> apply_order(const std::vector<Patch>& patches);

} // namespace livepatch::vdom
