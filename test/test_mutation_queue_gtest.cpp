#include <gtest/gtest.h>
#include <veneer/dom/memory_host.hpp>
#include <veneer/dom/mutation_queue.hpp>
#include <veneer/dom/root.hpp>

#include <string>
#include <vector>

using namespace veneer::dom;

TEST(MutationQueueTest, KeepsPushOrder) {
    MutationQueue q;
    q.push(PatchAppend{1, "<b></b>"});
    q.push(PatchSetAttr{2, 3, 4});
    q.push(PatchRemove{5});
    ASSERT_EQ(q.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<PatchAppend>(q.pending()[0]));
    EXPECT_TRUE(std::holds_alternative<PatchSetAttr>(q.pending()[1]));
    EXPECT_TRUE(std::holds_alternative<PatchRemove>(q.pending()[2]));
    EXPECT_EQ(q.coalesced(), 0u);
}

TEST(MutationQueueTest, ReplaceOuterSupersedesPatchesOnTheElement) {
    MutationQueue q;
    q.push(PatchReplaceInner{1, "a"});
    q.push(PatchSetAttr{1, 3, 4});
    q.push(PatchAppend{1, "b"});
    q.push(PatchInsertBefore{1, "<i></i>"});
    q.push(PatchAppend{2, "other"});
    q.push(PatchReplaceOuter{1, "<p></p>"});

    ASSERT_EQ(q.size(), 3u);
    EXPECT_EQ(q.pending()[0], (Patch{PatchInsertBefore{1, "<i></i>"}}));
    EXPECT_EQ(q.pending()[1], (Patch{PatchAppend{2, "other"}}));
    EXPECT_EQ(q.pending()[2], (Patch{PatchReplaceOuter{1, "<p></p>"}}));
    EXPECT_EQ(q.coalesced(), 3u);
}

TEST(MutationQueueTest, RemoveSupersedesPatchesOnTheElement) {
    MutationQueue q;
    q.push(PatchSetAttr{7, 3, 4});
    q.push(PatchRemoveAttr{7, 5});
    q.push(PatchInsertAfter{7, "x"});
    q.push(PatchRemove{7});
    ASSERT_EQ(q.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<PatchInsertAfter>(q.pending()[0]));
    EXPECT_TRUE(std::holds_alternative<PatchRemove>(q.pending()[1]));
}

TEST(MutationQueueTest, ReplaceInnerSupersedesContentPatches) {
    MutationQueue q;
    q.push(PatchAppend{1, "a"});
    q.push(PatchPrepend{1, "b"});
    q.push(PatchReplaceInner{1, "c"});
    q.push(PatchSetAttr{1, 3, 4});
    q.push(PatchReplaceInner{1, "d"});
    ASSERT_EQ(q.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<PatchSetAttr>(q.pending()[0]));
    EXPECT_EQ(q.pending()[1], (Patch{PatchReplaceInner{1, "d"}}));
}

TEST(MutationQueueTest, DroppedInsertionTakesPatchesOnItsElements) {
    MutationQueue q;
    q.push(PatchAppend{0, "a<div id=\"vn-1\"><b id=\"vn-2\">x</b></div>"});
    q.push(PatchSetAttr{2, 3, 4});
    q.push(PatchReplaceOuter{1, "<span id=\"vn-3\"></span>"});
    q.push(PatchRemoveAttr{3, 5});
    q.push(PatchSetAttr{0, 3, 4});
    q.push(PatchReplaceInner{0, "b<span id=\"vn-3\"></span>"});

    ASSERT_EQ(q.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<PatchSetAttr>(q.pending()[0]));
    EXPECT_EQ(q.pending()[1], (Patch{PatchReplaceInner{0, "b<span id=\"vn-3\"></span>"}}));
    EXPECT_EQ(q.coalesced(), 4u);
}

TEST(MutationQueueTest, ReplacedElementKeepsSiblingInsertions) {
    MutationQueue q;
    q.push(PatchReplaceOuter{4, "<p id=\"vn-4\" data-n=\"vn-9\"><i id=\"vn-5\"></i></p>"});
    q.push(PatchInsertBefore{4, "<hr id=\"vn-6\">"});
    q.push(PatchSetAttr{5, 3, 4});
    q.push(PatchReplaceOuter{4, "<p id=\"vn-4\"></p>"});

    ASSERT_EQ(q.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<PatchInsertBefore>(q.pending()[0]));
    EXPECT_TRUE(std::holds_alternative<PatchReplaceOuter>(q.pending()[1]));
}

TEST(MutationQueueTest, BurstOfRendersFlushesCleanly) {
    Context ctx;
    MemoryHost host;
    host.add_container(ctx.dom_id_string(0));
    Root root{ctx, host, 0};

    root.render(fragment({text("a"), element(ctx, "div").build().node}));
    root.render(fragment({text("a"), element(ctx, "span").build().node}));
    root.render(fragment({text("b"), element(ctx, "span").build().node}));
    ASSERT_EQ(root.queue().size(), 1u);

    auto report = root.flush();
    EXPECT_TRUE(report.ok());
    EXPECT_TRUE(report.failures.empty());
    EXPECT_EQ(root.host_html(), root.tree().html());
}

TEST(MutationQueueTest, CoalescingCanBeDisabled) {
    MutationQueue q{false};
    q.push(PatchAppend{1, "a"});
    q.push(PatchReplaceInner{1, "b"});
    q.push(PatchReplaceOuter{1, "c"});
    EXPECT_EQ(q.size(), 3u);
    EXPECT_EQ(q.coalesced(), 0u);
}

TEST(MutationQueueTest, FlushAppliesAndEmpties) {
    Context ctx;
    MemoryHost host;
    host.add_container("vn-1");
    MutationQueue q;
    q.push(PatchAppend{1, "<b id=\"vn-2\">x</b>"});
    q.push(PatchSetAttr{2, ctx.intern("class"), ctx.intern("on")});
    auto report = q.flush(host, ctx);
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.applied, 2u);
    EXPECT_TRUE(q.empty());
    EXPECT_EQ(host.get_inner_html("vn-1"), "<b id=\"vn-2\" class=\"on\">x</b>");

    auto again = q.flush(host, ctx);
    EXPECT_EQ(again.applied, 0u);
    EXPECT_TRUE(again.ok());
}

TEST(MutationQueueTest, MissingTargetDoesNotStopTheBatch) {
    Context ctx;
    MemoryHost host;
    host.add_container("vn-1");
    MutationQueue q;
    q.push(PatchSetAttr{99, ctx.intern("class"), ctx.intern("x")});
    q.push(PatchAppend{1, "ok"});
    q.push(PatchRemove{98});

    std::vector<std::string> warnings;
    auto prev = set_log_sink([&](LogLevel level, std::string_view msg) {
        if (level == LogLevel::Warn) {
            warnings.emplace_back(msg);
        }
    });
    auto report = q.flush(host, ctx);
    set_log_sink(std::move(prev));

    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.applied, 1u);
    ASSERT_EQ(report.failures.size(), 2u);
    EXPECT_EQ(report.failures[0].index, 0u);
    EXPECT_EQ(report.failures[0].id, 99u);
    EXPECT_EQ(report.failures[0].error.code, ErrorCode::MissingTarget);
    EXPECT_EQ(report.failures[0].error.message, "SetAttr: no element with id 'vn-99'");
    EXPECT_EQ(report.failures[1].index, 2u);
    EXPECT_EQ(warnings.size(), 2u);
    EXPECT_EQ(host.get_inner_html("vn-1"), "ok");
}

TEST(MutationQueueTest, ClearDropsPending) {
    MutationQueue q;
    q.push_all({PatchRemove{1}, PatchRemove{2}});
    EXPECT_EQ(q.size(), 2u);
    q.clear();
    EXPECT_TRUE(q.empty());
}
