#include <livepatch/vdom/wire.h>
#include <livepatch/core/config.h>
#include <livepatch/core/error.h>

#include <string>
#include <type_traits>

namespace livepatch::vdom {

namespace {

constexpr uint8_t kTextKind = 0;
constexpr uint8_t kElementKind = 1;

void write_optional(ipc::Serializer& out, const std::optional<std::string>& value) {
    out.write_bool(value.has_value());
    if (value) out.write_string(*value);
}

std::optional<std::string> read_optional(ipc::Deserializer& in) {
    if (!in.read_bool()) return std::nullopt;
    return in.read_string();
}

uint32_t to_u32(std::size_t value) {
    if (value > 0xFFFFFFFFu) {
        throw core::WireError("value " + std::to_string(value) + " does not fit in u32");
    }
    return static_cast<uint32_t>(value);
}

void write_node_at(ipc::Serializer& out, const Node& node, std::size_t depth) {
    if (depth > core::config::kMaxWireDepth) {
        throw core::WireError("node nesting exceeds " + std::to_string(core::config::kMaxWireDepth));
    }
    if (const auto* text = node.as_text()) {
        out.write_u8(kTextKind);
        out.write_string(text->content);
        write_optional(out, text->identity);
        return;
    }
    const auto* el = node.as_element();
    out.write_u8(kElementKind);
    out.write_string(el->tag);
    write_optional(out, el->key);
    write_optional(out, el->identity);
    out.write_u32(to_u32(el->attributes.size()));
    for (const auto& [name, value] : el->attributes) {
        out.write_string(name);
        out.write_string(value);
    }
    out.write_u32(to_u32(el->children.size()));
    for (const auto& child : el->children) {
        write_node_at(out, child, depth + 1);
    }
}

Node read_node_at(ipc::Deserializer& in, std::size_t depth) {
    if (depth > core::config::kMaxWireDepth) {
        throw core::WireError("node nesting exceeds " + std::to_string(core::config::kMaxWireDepth));
    }
    const uint8_t kind = in.read_u8();
    if (kind == kTextKind) {
        Text text;
        text.content = in.read_string();
        text.identity = read_optional(in);
        return Node(std::move(text));
    }
    if (kind != kElementKind) {
        throw core::WireError("unknown node kind " + std::to_string(kind) +
                              " at offset " + std::to_string(in.offset() - 1));
    }

    Element el;
    el.tag = in.read_string();
    el.key = read_optional(in);
    el.identity = read_optional(in);
    const uint32_t attribute_count = in.read_u32();
    for (uint32_t i = 0; i < attribute_count; ++i) {
        std::string name = in.read_string();
        el.attributes[std::move(name)] = in.read_string();
    }
    const uint32_t child_count = in.read_u32();
    for (uint32_t i = 0; i < child_count; ++i) {
        el.children.push_back(read_node_at(in, depth + 1));
    }
    return Node(std::move(el));
}

void expect_consumed(const ipc::Deserializer& in) {
    if (in.has_remaining()) {
        throw core::WireError(std::to_string(in.remaining()) + " trailing byte(s) after payload");
    }
}

} // namespace

void write_node(ipc::Serializer& out, const Node& node) {
    write_node_at(out, node, 0);
}

Node read_node(ipc::Deserializer& in) {
    return read_node_at(in, 0);
}

void write_patch(ipc::Serializer& out, const Patch& patch) {
    out.write_u8(static_cast<uint8_t>(patch.type()));
    out.write_u32(to_u32(patch.path.size()));
    for (std::size_t index : patch.path) {
        out.write_u32(to_u32(index));
    }
    write_optional(out, patch.target);

    std::visit([&out](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, op::Replace>) {
            write_node(out, o.node);
        } else if constexpr (std::is_same_v<T, op::SetText>) {
            out.write_string(o.text);
        } else if constexpr (std::is_same_v<T, op::SetAttr>) {
            out.write_string(o.key);
            out.write_string(o.value);
        } else if constexpr (std::is_same_v<T, op::RemoveAttr>) {
            out.write_string(o.key);
        } else if constexpr (std::is_same_v<T, op::InsertChild>) {
            out.write_u32(to_u32(o.index));
            write_node(out, o.node);
        } else if constexpr (std::is_same_v<T, op::RemoveChild>) {
            out.write_u32(to_u32(o.index));
        } else if constexpr (std::is_same_v<T, op::MoveChild>) {
            out.write_u32(to_u32(o.from));
            out.write_u32(to_u32(o.to));
        }
    }, patch.op);
}

Patch read_patch(ipc::Deserializer& in) {
    const uint8_t tag = in.read_u8();
    if (tag > static_cast<uint8_t>(PatchType::MoveChild)) {
        throw core::WireError("unknown patch type " + std::to_string(tag) +
                              " at offset " + std::to_string(in.offset() - 1));
    }

    Path path;
    const uint32_t length = in.read_u32();
    for (uint32_t i = 0; i < length; ++i) {
        path.push_back(in.read_u32());
    }
    auto target = read_optional(in);

    auto make = [&](Operation op) {
        return Patch{std::move(path), std::move(target), std::move(op)};
    };

    switch (static_cast<PatchType>(tag)) {
        case PatchType::Replace:
            return make(op::Replace{read_node(in)});
        case PatchType::SetText:
            return make(op::SetText{in.read_string()});
        case PatchType::SetAttr: {
            std::string key = in.read_string();
            return make(op::SetAttr{std::move(key), in.read_string()});
        }
        case PatchType::RemoveAttr:
            return make(op::RemoveAttr{in.read_string()});
        case PatchType::InsertChild: {
            const std::size_t index = in.read_u32();
            return make(op::InsertChild{index, read_node(in)});
        }
        case PatchType::RemoveChild:
            return make(op::RemoveChild{in.read_u32()});
        case PatchType::MoveChild: {
            const std::size_t from = in.read_u32();
            return make(op::MoveChild{from, in.read_u32()});
        }
    }
    throw core::WireError("unknown patch type " + std::to_string(tag));
}

std::vector<uint8_t> encode_patches(const std::vector<Patch>& patches) {
    ipc::Serializer out;
    out.write_u32(to_u32(patches.size()));
    for (const auto& patch : patches) {
        write_patch(out, patch);
    }
    return out.take_data();
}

std::vector<Patch> decode_patches(const std::vector<uint8_t>& bytes) {
    ipc::Deserializer in(bytes);
    const uint32_t count = in.read_u32();
    std::vector<Patch> patches;
    for (uint32_t i = 0; i < count; ++i) {
        patches.push_back(read_patch(in));
    }
    expect_consumed(in);
    return patches;
}

std::vector<uint8_t> encode_node(const Node& node) {
    ipc::Serializer out;
    write_node(out, node);
    return out.take_data();
}

Node decode_node(const std::vector<uint8_t>& bytes) {
    ipc::Deserializer in(bytes);
    Node node = read_node(in);
    expect_consumed(in);
    return node;
}

} // namespace livepatch::vdom
