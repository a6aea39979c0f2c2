#include <livepatch/vdom/apply.h>
#include <livepatch/core/diagnostics.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace livepatch::vdom {

namespace {

int phase_of(PatchType type) {
    switch (type) {
        case PatchType::RemoveChild: return 0;
        case PatchType::MoveChild:   return 1;
        case PatchType::InsertChild: return 2;
        default:                     return 3;
    }
}

class Applier {
public:
    Applier(Node& root, const ApplyOptions& options) : root_(root), options_(options) {}

    void run(const Patch& patch) {
        if (apply_one(patch)) {
            ++report_.applied;
        } else {
            ++report_.skipped;
        }
    }

    ApplyReport report() const { return report_; }

private:
    Node& root_;
    const ApplyOptions& options_;
    ApplyReport report_;
    // Identities of each touched parent's children as they were before the
    // batch first changed that child list; MoveChild.from indexes into it.
    std::unordered_map<std::string, std::vector<std::optional<std::string>>> snapshots_;

    bool apply_one(const Patch& patch);
    Node* resolve(const Patch& patch);
    std::vector<Node>* child_list(Node& parent, const Patch& patch);
    const std::vector<std::optional<std::string>>& snapshot(const Patch& patch) const;

    static std::string parent_key(const Patch& patch) {
        if (patch.target) return "#" + *patch.target;
        return "@" + format_path(patch.path);
    }

    bool skip(const char* stage, const Patch& patch, const std::string& reason) {
        if (options_.diagnostics) {
            options_.diagnostics->warning("apply", stage, reason + ": " + format_patch(patch));
        }
        return false;
    }
};

Node* Applier::resolve(const Patch& patch) {
    Node* at_path = node_at(root_, patch.path);
    if (!patch.target) return at_path;
    if (at_path && at_path->identity() == patch.target) return at_path;
    return find_by_identity(root_, *patch.target);
}

std::vector<Node>* Applier::child_list(Node& parent, const Patch& patch) {
    auto* children = parent.mutable_children();
    if (!children) return nullptr;
    const std::string key = parent_key(patch);
    if (snapshots_.find(key) == snapshots_.end()) {
        std::vector<std::optional<std::string>> ids;
        ids.reserve(children->size());
        for (const auto& child : *children) {
            ids.push_back(child.identity());
        }
        snapshots_.emplace(key, std::move(ids));
    }
    return children;
}

const std::vector<std::optional<std::string>>& Applier::snapshot(const Patch& patch) const {
    return snapshots_.at(parent_key(patch));
}

bool Applier::apply_one(const Patch& patch) {
    Node* node = resolve(patch);
    if (!node) {
        return skip("resolve", patch, "target not found");
    }

    switch (patch.type()) {
        case PatchType::Replace: {
            *node = patch.as<op::Replace>()->node;
            return true;
        }
        case PatchType::SetText: {
            if (!node->set_text_content(patch.as<op::SetText>()->text)) {
                return skip("op", patch, "SetText on element");
            }
            return true;
        }
        case PatchType::SetAttr: {
            const auto* o = patch.as<op::SetAttr>();
            if (!node->set_attribute(o->key, o->value)) {
                return skip("op", patch, "attribute on text node");
            }
            return true;
        }
        case PatchType::RemoveAttr: {
            if (!node->is_element()) {
                return skip("op", patch, "attribute on text node");
            }
            node->remove_attribute(patch.as<op::RemoveAttr>()->key);
            return true;
        }
        case PatchType::InsertChild: {
            const auto* o = patch.as<op::InsertChild>();
            auto* children = child_list(*node, patch);
            if (!children) return skip("op", patch, "child operation on text node");
            if (o->index > children->size()) {
                return skip("op", patch, "insert index out of range");
            }
            children->insert(children->begin() + static_cast<std::ptrdiff_t>(o->index), o->node);
            return true;
        }
        case PatchType::RemoveChild: {
            const auto* o = patch.as<op::RemoveChild>();
            auto* children = child_list(*node, patch);
            if (!children) return skip("op", patch, "child operation on text node");
            if (o->index >= children->size()) {
                return skip("op", patch, "remove index out of range");
            }
            children->erase(children->begin() + static_cast<std::ptrdiff_t>(o->index));
            return true;
        }
        case PatchType::MoveChild: {
            const auto* o = patch.as<op::MoveChild>();
            auto* children = child_list(*node, patch);
            if (!children) return skip("op", patch, "child operation on text node");

            std::size_t current = children->size();
            const auto& before = snapshot(patch);
            if (o->from < before.size() && before[o->from]) {
                const auto& id = *before[o->from];
                auto it = std::find_if(children->begin(), children->end(),
                                       [&id](const Node& child) { return child.identity() == id; });
                if (it != children->end()) {
                    current = static_cast<std::size_t>(it - children->begin());
                }
            } else if (o->from < children->size()) {
                current = o->from;
            }
            if (current >= children->size()) {
                return skip("op", patch, "moved child not found");
            }

            Node moving = std::move((*children)[current]);
            children->erase(children->begin() + static_cast<std::ptrdiff_t>(current));
            const std::size_t to = std::min(o->to, children->size());
            children->insert(children->begin() + static_cast<std::ptrdiff_t>(to), std::move(moving));
            return true;
        }
    }
    return false;
}

} // namespace

ApplyReport apply_patch(Node& root, const Patch& patch, const ApplyOptions& options) {
    Applier applier(root, options);
    applier.run(patch);
    return applier.report();
}

ApplyReport apply(Node& root, const std::vector<Patch>& patches, const ApplyOptions& options) {
    Applier applier(root, options);
    for (const auto& patch : patches) {
        applier.run(patch);
    }
    return applier.report();
}

std::vector<std::size_t> apply_order(const std::vector<Patch>& patches) {
    std::vector<std::size_t> order(patches.size());
    for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;

    std::stable_sort(order.begin(), order.end(), [&patches](std::size_t a, std::size_t b) {
        const Patch& pa = patches[a];
        const Patch& pb = patches[b];
        if (pa.path.size() != pb.path.size()) return pa.path.size() < pb.path.size();
        const int phase_a = phase_of(pa.type());
        const int phase_b = phase_of(pb.type());
        if (phase_a != phase_b) return phase_a < phase_b;
        if (pa.type() == PatchType::RemoveChild) {
            return pa.as<op::RemoveChild>()->index > pb.as<op::RemoveChild>()->index;
        }
        if (pa.type() == PatchType::InsertChild) {
            return pa.as<op::InsertChild>()->index < pb.as<op::InsertChild>()->index;
        }
        return false;
    });
    return order;
}

ApplyReport apply_all(Node& root, const std::vector<Patch>& patches, const ApplyOptions& options) {
    Applier applier(root, options);
    for (std::size_t index : apply_order(patches)) {
        applier.run(patches[index]);
    }
    return applier.report();
}

} // namespace livepatch::vdom
