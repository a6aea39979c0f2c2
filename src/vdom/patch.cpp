#include <livepatch/vdom/patch.h>

#include <sstream>
#include <type_traits>

namespace livepatch::vdom {

namespace op {

bool operator==(const Replace& a, const Replace& b) { return a.node == b.node; }
bool operator==(const SetText& a, const SetText& b) { return a.text == b.text; }
bool operator==(const SetAttr& a, const SetAttr& b) {
    return a.key == b.key && a.value == b.value;
}
bool operator==(const RemoveAttr& a, const RemoveAttr& b) { return a.key == b.key; }
bool operator==(const InsertChild& a, const InsertChild& b) {
    return a.index == b.index && a.node == b.node;
}
bool operator==(const RemoveChild& a, const RemoveChild& b) { return a.index == b.index; }
bool operator==(const MoveChild& a, const MoveChild& b) {
    return a.from == b.from && a.to == b.to;
}

} // namespace op

bool Patch::is_child_op() const {
    switch (type()) {
        case PatchType::InsertChild:
        case PatchType::RemoveChild:
        case PatchType::MoveChild:
            return true;
        default:
            return false;
    }
}

bool operator==(const Patch& a, const Patch& b) {
    return a.path == b.path && a.target == b.target && a.op == b.op;
}

const char* patch_type_name(PatchType type) {
    switch (type) {
        case PatchType::Replace:     return "Replace";
        case PatchType::SetText:     return "SetText";
        case PatchType::SetAttr:     return "SetAttr";
        case PatchType::RemoveAttr:  return "RemoveAttr";
        case PatchType::InsertChild: return "InsertChild";
        case PatchType::RemoveChild: return "RemoveChild";
        case PatchType::MoveChild:   return "MoveChild";
    }
    return "Unknown";
}

std::string format_patch(const Patch& patch) {
    std::ostringstream oss;
    oss << patch_type_name(patch.type()) << " " << format_path(patch.path);
    if (patch.target) {
        oss << " #" << *patch.target;
    }
    std::visit([&oss](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, op::Replace>) {
            oss << " " << debug_string(o.node);
        } else if constexpr (std::is_same_v<T, op::SetText>) {
            oss << " \"" << o.text << "\"";
        } else if constexpr (std::is_same_v<T, op::SetAttr>) {
            oss << " " << o.key << "=\"" << o.value << "\"";
        } else if constexpr (std::is_same_v<T, op::RemoveAttr>) {
            oss << " " << o.key;
        } else if constexpr (std::is_same_v<T, op::InsertChild>) {
            oss << " @" << o.index << " " << debug_string(o.node);
        } else if constexpr (std::is_same_v<T, op::RemoveChild>) {
            oss << " @" << o.index;
        } else if constexpr (std::is_same_v<T, op::MoveChild>) {
            oss << " " << o.from << "->" << o.to;
        }
    }, patch.op);
    return oss.str();
}

std::size_t count_type(const std::vector<Patch>& patches, PatchType type) {
    std::size_t n = 0;
    for (const auto& p : patches) {
        if (p.type() == type) ++n;
    }
    return n;
}

} // namespace livepatch::vdom
