#include <livepatch/vdom/apply.h>
#include <livepatch/vdom/diff.h>
#include <livepatch/vdom/identity.h>
#include <livepatch/vdom/wire.h>
#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <string>
#include <vector>

using namespace livepatch::vdom;

namespace {

const char* const kTags[] = {"div", "span", "p", "ul", "li", "b", "section"};
const char* const kWords[] = {"a", "b", "hello", "x y", "Z", "&amp;", "\xC3\xA9t\xC3\xA9"};

// Seeded random trees and edits of them. Keys are drawn from one sequence
// per generator, so apart from deliberate duplicates they are unique.
class TreeGen {
public:
    TreeGen(std::uint32_t seed, bool identify_text)
        : rng_(seed), identify_text_(identify_text) {}

    Node tree() { return element(0); }

    void mutate(Node& node, int depth) {
        if (node.is_text()) {
            if (chance(30)) node.set_text_content(word());
            return;
        }
        if (chance(8)) node.as_element()->tag = tag();
        if (chance(25)) node.set_attribute("class", word());
        if (chance(15)) node.remove_attribute("title");
        if (chance(10)) node.set_attribute("title", word());
        if (chance(4)) node.set_attribute("data-dj-replace", "");

        auto& children = *node.mutable_children();
        if (children.size() > 1 && chance(35)) {
            std::shuffle(children.begin(), children.end(), rng_);
        }
        if (!children.empty() && chance(25)) {
            children.erase(children.begin() + pick(static_cast<int>(children.size())));
        }
        if (depth < kMaxDepth && chance(25)) {
            Node fresh = child(depth + 1, chance(50));
            children.insert(children.begin() + pick(static_cast<int>(children.size()) + 1),
                            std::move(fresh));
        }
        for (auto& c : children) {
            mutate(c, depth + 1);
        }
    }

    // Gives every node a fresh identity, as a re-render would.
    void relabel(Node& node) {
        if (node.is_element() || identify_text_) node.set_identity(ids_.next());
        if (auto* children = node.mutable_children()) {
            for (auto& c : *children) relabel(c);
        }
    }

private:
    static constexpr int kMaxDepth = 4;

    std::mt19937 rng_;
    bool identify_text_;
    IdentityCounter ids_;
    int key_seq_ = 0;
    std::string last_key_;

    int pick(int n) { return std::uniform_int_distribution<int>(0, n - 1)(rng_); }
    bool chance(int percent) { return pick(100) < percent; }
    std::string tag() { return kTags[pick(7)]; }
    std::string word() { return kWords[pick(7)]; }

    Node text() {
        Node t = Node::text(word());
        if (identify_text_) t.set_identity(ids_.next());
        return t;
    }

    Node child(int depth, bool keyed) {
        if (chance(30)) return text();
        Node el = element(depth);
        if (keyed && chance(85)) {
            if (!last_key_.empty() && chance(5)) {
                el.set_key(last_key_);
            } else {
                last_key_ = "k" + std::to_string(key_seq_++);
                el.set_key(last_key_);
            }
        }
        return el;
    }

    Node element(int depth) {
        Node el = Node::element(tag());
        el.set_identity(ids_.next());
        if (chance(40)) el.set_attribute("class", word());
        if (chance(20)) el.set_attribute("title", word());
        if (chance(3)) el.set_attribute("data-dj-replace", "");
        if (depth < kMaxDepth) {
            const int count = pick(depth == 0 ? 7 : 5);
            const bool keyed = chance(50);
            for (int i = 0; i < count; ++i) {
                el.append_child(child(depth + 1, keyed));
            }
        }
        return el;
    }
};

void check_roundtrip(std::uint32_t seed, bool identify_text) {
    SCOPED_TRACE("seed " + std::to_string(seed));
    TreeGen gen(seed, identify_text);
    const Node before = gen.tree();
    Node after = before;
    gen.mutate(after, 0);
    gen.relabel(after);

    EXPECT_TRUE(diff(before, before).empty());

    const auto patches = diff(before, after);
    EXPECT_LE(patches.size(), count_nodes(before) + count_nodes(after) +
                                  count_attributes(before) + count_attributes(after));

    Node sequential = before;
    EXPECT_TRUE(apply(sequential, patches).clean());
    EXPECT_TRUE(structurally_equal(sequential, after))
        << debug_string(before) << "\n -> " << debug_string(sequential)
        << "\n != " << debug_string(after);

    Node grouped = before;
    EXPECT_TRUE(apply_all(grouped, patches).clean());
    EXPECT_TRUE(structurally_equal(grouped, after));
    EXPECT_EQ(sequential, grouped);

    EXPECT_TRUE(diff(grouped, after).empty());
    EXPECT_EQ(decode_patches(encode_patches(patches)), patches);
}

} // namespace

// ---------------------------------------------------------------------------
// Random edits
// ---------------------------------------------------------------------------

TEST(RoundtripFuzzTest, RandomEditsConvergeWithIdentifiedText) {
    for (std::uint32_t seed = 1; seed <= 300; ++seed) {
        check_roundtrip(seed, true);
    }
}

TEST(RoundtripFuzzTest, RandomEditsConvergeWithAnonymousText) {
    for (std::uint32_t seed = 1000; seed <= 1300; ++seed) {
        check_roundtrip(seed, false);
    }
}

TEST(RoundtripFuzzTest, KeyedShuffles) {
    for (std::uint32_t seed = 1; seed <= 100; ++seed) {
        SCOPED_TRACE("seed " + std::to_string(seed));
        std::mt19937 rng(seed);
        IdentityCounter ids;

        Node before = Node::element("ul");
        before.set_identity(ids.next());
        for (int i = 0; i < 12; ++i) {
            Node li = Node::element("li");
            li.set_identity(ids.next());
            li.set_key("k" + std::to_string(i));
            li.append_child(Node::text(std::to_string(i)));
            before.append_child(std::move(li));
        }

        Node after = before;
        auto& children = *after.mutable_children();
        std::shuffle(children.begin(), children.end(), rng);

        const auto patches = diff(before, after);
        EXPECT_EQ(count_type(patches, PatchType::InsertChild), 0u);
        EXPECT_EQ(count_type(patches, PatchType::RemoveChild), 0u);

        Node patched = before;
        ASSERT_TRUE(apply_all(patched, patches).clean());
        // Exact equality: every node kept its identity.
        EXPECT_EQ(patched, after);
    }
}

// ---------------------------------------------------------------------------
// Regressions
// ---------------------------------------------------------------------------

// A keyed child arriving in front of a text run: the old element lines up
// with the new text by position and is replaced in place.
TEST(RoundtripFuzzTest, KeyedInsertBeforeTextAndElement) {
    Node inner = Node::element("div");
    inner.set_identity("3");
    inner.set_key("a");
    Node anchor = Node::element("a");
    anchor.set_identity("2");
    anchor.append_child(inner);
    Node before = Node::element("div");
    before.set_identity("0");
    before.append_child(Node::text("a").set_identity("1"));
    before.append_child(anchor);

    Node keyed = Node::element("div");
    keyed.set_key("a");
    Node after = Node::element("div");
    after.append_child(keyed);
    after.append_child(Node::text("A"));
    after.append_child(Node::element("a"));

    const auto patches = diff(before, after);
    Node sequential = before;
    EXPECT_TRUE(apply(sequential, patches).clean());
    EXPECT_TRUE(structurally_equal(sequential, after)) << debug_string(sequential);

    Node grouped = before;
    EXPECT_TRUE(apply_all(grouped, patches).clean());
    EXPECT_TRUE(structurally_equal(grouped, after)) << debug_string(grouped);
}
