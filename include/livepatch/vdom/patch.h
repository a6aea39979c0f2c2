#pragma once
#include <livepatch/vdom/node.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace livepatch::vdom {

// Order matches the Operation variant and the wire tag.
enum class PatchType : std::uint8_t {
    Replace,
    SetText,
    SetAttr,
    RemoveAttr,
    InsertChild,
    RemoveChild,
    MoveChild,
};

namespace op {

struct Replace {
    Node node;
};

struct SetText {
    std::string text;
};

struct SetAttr {
    std::string key;
    std::string value;
};

struct RemoveAttr {
    std::string key;
};

struct InsertChild {
    std::size_t index = 0;
    Node node;
};

struct RemoveChild {
    std::size_t index = 0;
};

// `from` indexes the parent's child list before the batch touched it; `to`
// is the position at the time the move runs (after removals and earlier
// moves on the same parent, before insertions).
struct MoveChild {
    std::size_t from = 0;
    std::size_t to = 0;
};

bool operator==(const Replace& a, const Replace& b);
bool operator==(const SetText& a, const SetText& b);
bool operator==(const SetAttr& a, const SetAttr& b);
bool operator==(const RemoveAttr& a, const RemoveAttr& b);
bool operator==(const InsertChild& a, const InsertChild& b);
bool operator==(const RemoveChild& a, const RemoveChild& b);
bool operator==(const MoveChild& a, const MoveChild& b);

} // namespace op

using Operation = std::variant<op::Replace, op::SetText, op::SetAttr, op::RemoveAttr,
                               op::InsertChild, op::RemoveChild, op::MoveChild>;

// One edit instruction. Child operations address the parent through
// path/target; the others address the node itself. `target` is the old
// node's identity and wins over `path` when both resolve.
struct Patch {
    Path path;
    std::optional<std::string> target;
    Operation op;

    PatchType type() const { return static_cast<PatchType>(op.index()); }

    template <typename T>
    const T* as() const { return std::get_if<T>(&op); }

    bool is_child_op() const;
};

bool operator==(const Patch& a, const Patch& b);
inline bool operator!=(const Patch& a, const Patch& b) { return !(a == b); }

const char* patch_type_name(PatchType type);

std::string format_patch(const Patch& patch);

std::size_t count_type(const std::vector<Patch>& patches, PatchType type);

} // namespace livepatch::vdom
