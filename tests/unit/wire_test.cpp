#include <livepatch/vdom/wire.h>
#include <livepatch/vdom/diff.h>
#include <livepatch/core/error.h>
#include <livepatch/html/parser.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace livepatch::vdom;
using livepatch::core::WireError;

// ------------------------------------------------------------------
// 1. Round trips
// ------------------------------------------------------------------

TEST(WireTest, NodeRoundTripKeepsKeyAndIdentity) {
    Node root = livepatch::html::parse_html(
        "<ul class=\"list\"><li data-key=\"a\">caf\xC3\xA9</li><li><br></li></ul>");
    Node decoded = decode_node(encode_node(root));
    EXPECT_EQ(decoded, root);
    EXPECT_EQ(decoded.children()[0].key(), std::optional<std::string>("a"));
    EXPECT_EQ(*decoded.children()[1].identity(), "2");
}

TEST(WireTest, EveryPatchTypeRoundTrips) {
    Node node = Node::element("p");
    node.set_identity("x1");
    node.append_child(Node::text("t"));

    std::vector<Patch> patches = {
        Patch{{0, 2}, std::string("9"), op::Replace{node}},
        Patch{{1}, std::nullopt, op::SetText{"hello"}},
        Patch{{}, std::string("0"), op::SetAttr{"class", "a b"}},
        Patch{{}, std::string("0"), op::RemoveAttr{"title"}},
        Patch{{3}, std::string("4"), op::InsertChild{2, node}},
        Patch{{3}, std::string("4"), op::RemoveChild{0}},
        Patch{{3}, std::string("4"), op::MoveChild{5, 1}},
    };
    EXPECT_EQ(decode_patches(encode_patches(patches)), patches);
}

TEST(WireTest, EmptyBatch) {
    const auto bytes = encode_patches({});
    const std::vector<uint8_t> expected = {0, 0, 0, 0};
    EXPECT_EQ(bytes, expected);
    EXPECT_TRUE(decode_patches(bytes).empty());
}

TEST(WireTest, DiffOutputRoundTrips) {
    Node a = livepatch::html::parse_html(
        "<div><ul><li data-key=\"1\">1</li><li data-key=\"2\">2</li></ul><p>x</p></div>");
    Node b = livepatch::html::parse_html(
        "<div><ul><li data-key=\"2\">2</li><li data-key=\"3\">3</li></ul><span>x</span></div>");
    const auto patches = diff(a, b);
    ASSERT_FALSE(patches.empty());
    EXPECT_EQ(decode_patches(encode_patches(patches)), patches);
}

TEST(WireTest, PatchLayout) {
    std::vector<Patch> patches = {Patch{{1}, std::nullopt, op::RemoveChild{3}}};
    const std::vector<uint8_t> expected = {
        0, 0, 0, 1,                         // count
        static_cast<uint8_t>(PatchType::RemoveChild),
        0, 0, 0, 1, 0, 0, 0, 1,             // path [1]
        0,                                  // no target
        0, 0, 0, 3,                         // index
    };
    EXPECT_EQ(encode_patches(patches), expected);
}

// ------------------------------------------------------------------
// 2. Malformed input
// ------------------------------------------------------------------

TEST(WireTest, TruncatedInputThrows) {
    auto bytes = encode_patches({Patch{{}, std::string("0"), op::SetAttr{"k", "v"}}});
    bytes.pop_back();
    EXPECT_THROW(decode_patches(bytes), WireError);
}

TEST(WireTest, UnknownPatchTypeThrows) {
    auto bytes = encode_patches({Patch{{}, std::nullopt, op::RemoveChild{0}}});
    bytes[4] = 42;
    EXPECT_THROW(decode_patches(bytes), WireError);
}

TEST(WireTest, UnknownNodeKindThrows) {
    auto bytes = encode_node(Node::text("x"));
    bytes[0] = 7;
    EXPECT_THROW(decode_node(bytes), WireError);
}

TEST(WireTest, TrailingBytesThrow) {
    auto bytes = encode_patches({});
    bytes.push_back(0);
    EXPECT_THROW(decode_patches(bytes), WireError);

    auto node_bytes = encode_node(Node::element("div"));
    node_bytes.push_back(1);
    EXPECT_THROW(decode_node(node_bytes), WireError);
}

TEST(WireTest, ExcessiveNestingRejected) {
    Node root = Node::element("div");
    Node* leaf = &root;
    for (int i = 0; i < 1100; ++i) {
        leaf->append_child(Node::element("div"));
        leaf = &leaf->mutable_children()->back();
    }
    EXPECT_THROW(encode_node(root), WireError);
}
