#include <gtest/gtest.h>
#include <veneer/dom/memory_host.hpp>
#include <veneer/dom/root.hpp>

#include <string>
#include <vector>

using namespace veneer::dom;

namespace {

struct Row {
    std::string key;
    std::string label;
    bool done{};
};

VNode todo_view(Context& ctx, const std::string& title, const std::vector<Row>& rows) {
    auto ul = element(ctx, "ul").attr("class", "todo");
    for (const auto& r : rows) {
        auto li = element(ctx, "li").attr("data-key", r.key);
        if (r.done) {
            li.attr("class", "done");
        }
        li.child(element(ctx, "input").attr("type", "checkbox").build());
        li.text(r.label);
        ul.child(std::move(li).build());
    }
    return element(ctx, "section")
        .child(element(ctx, "h1").text(title).build())
        .child(std::move(ul).build())
        .child(element(ctx, "footer").text(std::to_string(rows.size()) + " items").build())
        .build()
        .node;
}

} // namespace

class RootTest : public ::testing::Test {
protected:
    void SetUp() override { host.add_container(ctx.dom_id_string(0)); }

    // The host must hold exactly what the committed tree serializes to.
    void expect_in_sync() {
        auto inner = root.host_html();
        ASSERT_TRUE(inner.has_value());
        EXPECT_EQ(normalize_html(*inner), normalize_html(root.tree().html()));
    }

    Context ctx;
    MemoryHost host;
    Root root{ctx, host, 0};
};

TEST_F(RootTest, FirstRenderMountsIntoContainer) {
    auto report = root.render_now(todo_view(ctx, "Todo", {{"1", "milk"}}));
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.applied, 1u);
    expect_in_sync();
    EXPECT_NE(host.find("vn-1"), nullptr);
}

TEST_F(RootTest, SequenceOfRendersStaysInSync) {
    std::vector<std::vector<Row>> frames{
        {},
        {{"1", "milk"}},
        {{"1", "milk"}, {"2", "eggs"}},
        {{"0", "coffee"}, {"1", "milk"}, {"2", "eggs"}},
        {{"0", "coffee"}, {"1", "milk", true}, {"2", "eggs"}},
        {{"0", "coffee"}, {"2", "eggs"}},
        {{"2", "eggs"}, {"0", "coffee <strong>"}, {"3", "tea & \"cake\""}},
        {{"3", "tea"}},
        {},
    };
    for (std::size_t i = 0; i < frames.size(); ++i) {
        SCOPED_TRACE("frame " + std::to_string(i));
        auto report = root.render_now(todo_view(ctx, "Todo " + std::to_string(i), frames[i]));
        EXPECT_TRUE(report.ok());
        expect_in_sync();
    }
}

TEST_F(RootTest, RootKindChanges) {
    root.render_now(element(ctx, "div").text("a").build().node);
    expect_in_sync();
    root.render_now(text("just text"));
    expect_in_sync();
    root.render_now(fragment({element(ctx, "b").text("x").build().node, text("y")}));
    expect_in_sync();
    root.render_now(element(ctx, "span").build().node);
    expect_in_sync();
}

TEST_F(RootTest, BatchedRendersApplyTogether) {
    root.render(todo_view(ctx, "A", {{"1", "milk"}}));
    root.render(todo_view(ctx, "B", {{"1", "milk"}, {"2", "eggs"}}));
    root.render(todo_view(ctx, "C", {{"2", "eggs"}}));
    EXPECT_GT(root.queue().size(), 1u);
    EXPECT_EQ(host.mutations(), 0u);
    auto report = root.flush();
    EXPECT_TRUE(report.ok());
    EXPECT_TRUE(root.queue().empty());
    expect_in_sync();
}

TEST_F(RootTest, UnmountEmptiesContainer) {
    root.render_now(todo_view(ctx, "Todo", {{"1", "milk"}}));
    root.unmount();
    auto report = root.flush();
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(root.host_html(), "");
    EXPECT_FALSE(root.tree().mounted());
}

TEST_F(RootTest, ExternalRemovalIsReportedAndHealed) {
    root.render_now(todo_view(ctx, "Todo", {{"1", "milk"}, {"2", "eggs"}}));
    // Someone else removes the list behind our back.
    const auto* section = host.find(ctx.dom_id_string(1));
    ASSERT_NE(section, nullptr);
    const auto* ul = section->children[1].get();
    const auto ul_id = *ul->attr("id");
    ASSERT_TRUE(host.remove(ul_id));

    auto report = root.render_now(todo_view(ctx, "Todo", {{"1", "milk"}, {"2", "eggs"}, {"3", "tea"}}));
    EXPECT_FALSE(report.ok());
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].error.code, ErrorCode::MissingTarget);
    EXPECT_EQ(ctx.dom_id_string(report.failures[0].id), ul_id);

    // A structural change above the lost node repairs the host.
    root.render_now(element(ctx, "article").build().node);
    expect_in_sync();
}

TEST_F(RootTest, TreeCountsCommits) {
    root.render(text("a"));
    root.render(text("b"));
    EXPECT_EQ(root.tree().commits(), 2u);
    EXPECT_EQ(root.tree().container(), 0u);
}

TEST(TreeContainerTest, ContainerIdIsNeverAllocated) {
    Context ctx;
    MemoryHost host;
    host.add_container(ctx.dom_id_string(3));
    Root root{ctx, host, 3};
    EXPECT_EQ(ctx.peek_next_id(), 4u);

    auto report = root.render_now(element(ctx, "p").child(element(ctx, "b").build()).build().node);
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(root.host_html(), "<p id=\"vn-4\"><b id=\"vn-5\"></b></p>");
}

TEST(TreeContainerTest, AllocatedContainerKeepsTheCounter) {
    Context ctx;
    const auto container = ctx.allocate_id();
    Tree tree{ctx, container};
    EXPECT_EQ(ctx.peek_next_id(), container + 1);
    auto patches = tree.render(element(ctx, "i").build().node);
    ASSERT_EQ(patches.size(), 1u);
    EXPECT_EQ(patches[0], (Patch{PatchAppend{container, "<i id=\"vn-2\"></i>"}}));
}
