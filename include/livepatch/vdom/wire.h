#pragma once
#include <livepatch/ipc/serializer.h>
#include <livepatch/vdom/node.h>
#include <livepatch/vdom/patch.h>

#include <cstdint>
#include <vector>

namespace livepatch::vdom {

// Binary transport form of a patch batch:
//
//   u32 count
//   per patch: u8 PatchType, u32 path length, u32 indices,
//              bool has-target [string target], operation payload
//
// Nodes are written recursively (u8 kind, then text or element fields).
// Decoding throws core::WireError on truncated or malformed input.
std::vector<uint8_t> encode_patches(const std::vector<Patch>& patches);
std::vector<Patch> decode_patches(const std::vector<uint8_t>& bytes);

std::vector<uint8_t> encode_node(const Node& node);
Node decode_node(const std::vector<uint8_t>& bytes);

void write_node(ipc::Serializer& out, const Node& node);
Node read_node(ipc::Deserializer& in);

void write_patch(ipc::Serializer& out, const Patch& patch);
Patch read_patch(ipc::Deserializer& in);

} // namespace livepatch::vdom
