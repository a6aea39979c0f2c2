#include "livepatch/engine/render_session.h"
#include "livepatch/core/diagnostics.h"
#include "livepatch/html/parser.h"
#include "livepatch/vdom/apply.h"
#include <gtest/gtest.h>
#include <string>

using livepatch::engine::RenderSession;
using livepatch::engine::SessionOptions;
using livepatch::vdom::Node;
using livepatch::vdom::PatchType;

namespace {

std::string counter_view(int n) {
    return "<div id=\"app\"><h1>Count</h1><span class=\"n\">" + std::to_string(n) +
           "</span><button>+</button></div>";
}

} // namespace

// ---------------------------------------------------------------------------
// Full renders
// ---------------------------------------------------------------------------

TEST(RenderSessionTest, FirstRenderIsFull) {
    RenderSession session;
    auto result = session.render(counter_view(0));
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(result.full_render);
    EXPECT_TRUE(result.patches.empty());
    EXPECT_EQ(result.render_count, 1);
    EXPECT_NE(result.html.find("data-dj-id=\"0\""), std::string::npos);
    ASSERT_TRUE(session.has_mirror());
    EXPECT_EQ(session.mirror()->tag(), "div");
}

TEST(RenderSessionTest, ParseFailureLeavesMirrorAlone) {
    livepatch::core::DiagnosticEmitter diagnostics;
    SessionOptions options;
    options.diagnostics = &diagnostics;
    RenderSession session(options);

    ASSERT_TRUE(session.render(counter_view(0)).ok);
    const Node before = *session.mirror();

    auto result = session.render("<div>\xFF</div>");
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.message.empty());
    EXPECT_EQ(*session.mirror(), before);
    EXPECT_GE(diagnostics.count(livepatch::core::Severity::Error), 1u);
}

TEST(RenderSessionTest, DepthLimitRejectsRender) {
    SessionOptions options;
    options.max_depth = 3;
    RenderSession session(options);
    auto result = session.render("<div><div><div><div></div></div></div></div>");
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(session.has_mirror());
}

TEST(RenderSessionTest, ResetStartsOver) {
    RenderSession session;
    session.render(counter_view(0));
    session.render(counter_view(1));
    EXPECT_GT(session.next_identity(), 0u);

    session.reset();
    EXPECT_FALSE(session.has_mirror());
    EXPECT_EQ(session.render_count(), 0);
    EXPECT_EQ(session.next_identity(), 0u);

    auto result = session.render(counter_view(2));
    EXPECT_TRUE(result.full_render);
    EXPECT_EQ(*session.mirror()->identity(), "0");
}

// ---------------------------------------------------------------------------
// Incremental renders
// ---------------------------------------------------------------------------

TEST(RenderSessionTest, SecondRenderSendsPatches) {
    RenderSession session;
    session.render(counter_view(0));
    auto result = session.render(counter_view(1));
    EXPECT_TRUE(result.ok);
    EXPECT_FALSE(result.full_render);
    ASSERT_EQ(result.patches.size(), 1u);
    EXPECT_EQ(result.patches[0].type(), PatchType::SetText);
    EXPECT_EQ(result.render_count, 2);
}

TEST(RenderSessionTest, UnchangedRenderSendsNothing) {
    RenderSession session;
    session.render(counter_view(3));
    auto result = session.render(counter_view(3));
    EXPECT_TRUE(result.ok);
    EXPECT_FALSE(result.full_render);
    EXPECT_TRUE(result.patches.empty());
}

TEST(RenderSessionTest, MirrorKeepsClientIdentities) {
    RenderSession session;
    session.render("<ul><li data-key=\"a\">A</li><li data-key=\"b\">B</li></ul>");
    const std::string id_a = *session.mirror()->children()[0].identity();
    const std::string id_b = *session.mirror()->children()[1].identity();

    auto result = session.render(
        "<ul><li data-key=\"c\">C</li><li data-key=\"b\">B</li><li data-key=\"a\">A</li></ul>");
    ASSERT_TRUE(result.ok);
    EXPECT_FALSE(result.full_render);

    const Node* mirror = session.mirror();
    ASSERT_EQ(mirror->child_count(), 3u);
    EXPECT_EQ(*mirror->children()[1].identity(), id_b);
    EXPECT_EQ(*mirror->children()[2].identity(), id_a);
    // The new item carries an identity the client has not seen before.
    EXPECT_NE(*mirror->children()[0].identity(), id_a);
    EXPECT_NE(*mirror->children()[0].identity(), id_b);
}

TEST(RenderSessionTest, ClientReplayMatchesMirror) {
    RenderSession session;
    auto first = session.render(
        "<main><ul><li data-key=\"1\">one</li><li data-key=\"2\">two</li></ul><p>x</p></main>");
    Node client = livepatch::html::parse_html(first.html);

    const char* renders[] = {
        "<main><ul><li data-key=\"2\">two</li><li data-key=\"1\">one!</li></ul><p>x</p></main>",
        "<main><ul><li data-key=\"3\">three</li><li data-key=\"1\">one!</li></ul></main>",
        "<main class=\"done\"><ul></ul><p>y</p><p>z</p></main>",
    };
    for (const char* markup : renders) {
        SCOPED_TRACE(markup);
        auto result = session.render(markup);
        ASSERT_TRUE(result.ok);
        ASSERT_FALSE(result.full_render);
        EXPECT_TRUE(livepatch::vdom::apply_all(client, result.patches).clean());
        EXPECT_EQ(client, *session.mirror());
    }
}

TEST(RenderSessionTest, WarningsAreReported) {
    RenderSession session;
    auto result = session.render("<div><p>a<p>b</div>");
    EXPECT_TRUE(result.ok);
    EXPECT_FALSE(result.warnings.empty());
}
