#include <gtest/gtest.h>
#include <veneer/dom/context.hpp>
#include <veneer/dom/interner.hpp>
#include <veneer/dom/log.hpp>

#include <string>
#include <vector>

using namespace veneer::dom;

TEST(InternerTest, StaticTableIsSortedAndUnique) {
    const auto& tbl = detail::static_strings;
    EXPECT_EQ(tbl[0], "");
    for (std::size_t i = 1; i < tbl.size(); ++i) {
        EXPECT_LT(tbl[i - 1], tbl[i]) << "at index " << i;
    }
}

TEST(InternerTest, StaticStringsResolveToTheirPosition) {
    Interner in;
    for (std::size_t i = 0; i < Interner::static_size(); ++i) {
        const auto h = in.intern(detail::static_strings[i]);
        EXPECT_EQ(h, i);
        EXPECT_TRUE(in.is_static(h));
    }
    EXPECT_EQ(in.dynamic_size(), 0u);
}

TEST(InternerTest, InternIsIdempotent) {
    Interner in;
    const auto a = in.intern("data-row");
    const auto b = in.intern("data-row");
    EXPECT_EQ(a, b);
    EXPECT_EQ(in.dynamic_size(), 1u);
    EXPECT_FALSE(in.is_static(a));
    EXPECT_GE(a, Interner::static_size());

    const auto div1 = in.intern("div");
    const auto div2 = in.intern(std::string{"di"} + "v");
    EXPECT_EQ(div1, div2);
}

TEST(InternerTest, ResolveReturnsTheInternedString) {
    Interner in;
    const auto h = in.intern("my-widget");
    auto r = in.resolve(h);
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.value, "my-widget");
    EXPECT_EQ(in.str(in.intern("span")), "span");
}

TEST(InternerTest, DistinctStringsGetDistinctHandles) {
    Interner in;
    const auto a = in.intern("alpha-1");
    const auto b = in.intern("alpha-2");
    EXPECT_NE(a, b);
    EXPECT_EQ(b, a + 1);
    EXPECT_NE(in.intern("ul"), in.intern("ol"));
}

TEST(InternerTest, FindDoesNotInsert) {
    Interner in;
    EXPECT_FALSE(in.find("never-seen").has_value());
    EXPECT_EQ(in.dynamic_size(), 0u);
    ASSERT_TRUE(in.find("button").has_value());
    in.intern("never-seen");
    EXPECT_TRUE(in.find("never-seen").has_value());
}

TEST(InternerTest, UnknownHandleIsInvalid) {
    Interner in;
    const Handle bogus = static_cast<Handle>(Interner::static_size() + 7);
    EXPECT_FALSE(in.contains(bogus));
    auto r = in.resolve(bogus);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error.code, ErrorCode::InvalidHandle);
    EXPECT_NE(r.error.message.find(std::to_string(bogus)), std::string::npos);
}

TEST(InternerTest, StrLogsAndReturnsEmptyForUnknownHandle) {
    std::vector<std::string> lines;
    auto prev = set_log_sink([&](LogLevel level, std::string_view msg) {
        if (level == LogLevel::Error) {
            lines.emplace_back(msg);
        }
    });
    Interner in;
    EXPECT_EQ(in.str(100000), "");
    set_log_sink(std::move(prev));
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("never issued"), std::string::npos);
}

TEST(InternerTest, ViewsStayValidAcrossGrowth) {
    Interner in;
    const auto h = in.intern("first-dynamic");
    const auto view = in.str(h);
    for (int i = 0; i < 1000; ++i) {
        in.intern("grow-" + std::to_string(i));
    }
    EXPECT_EQ(view, "first-dynamic");
    EXPECT_EQ(in.str(h).data(), view.data());
}

TEST(ContextTest, ReservedKeyIsTheIdAttribute) {
    Context ctx;
    EXPECT_EQ(ctx.str(ctx.reserved_key()), "id");
    EXPECT_EQ(ctx.allocate_id(), 1u);
    EXPECT_EQ(ctx.allocate_id(), 2u);
    EXPECT_EQ(ctx.peek_next_id(), 3u);
    EXPECT_EQ(ctx.dom_id_string(2), "vn-2");
}

TEST(ContextTest, IdPrefixComesFromConfig) {
    Config cfg;
    cfg.id_prefix = "app-";
    Context ctx{cfg};
    EXPECT_EQ(ctx.dom_id_string(12), "app-12");
}
