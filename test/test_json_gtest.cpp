#include <gtest/gtest.h>
#include <veneer/dom/json.hpp>

#include <string>

using namespace veneer::dom;

TEST(SnapshotTest, ParsesFlatObject) {
    auto r = parse_attribute_snapshot(R"({"id": "vn-3", "class": "btn primary", "data-n": "7"})");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.attrs.size(), 3u);
    EXPECT_EQ(r.attrs.at("id"), "vn-3");
    EXPECT_EQ(r.attrs.at("class"), "btn primary");
    EXPECT_EQ(r.attrs.at("data-n"), "7");
}

TEST(SnapshotTest, ScalarsAreStringified) {
    auto r = parse_attribute_snapshot(R"({"disabled": null, "n": 2, "f": 0.5, "b": true, "c": false})");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.attrs.at("disabled"), "");
    EXPECT_EQ(r.attrs.at("n"), "2");
    EXPECT_EQ(r.attrs.at("f"), "0.5");
    EXPECT_EQ(r.attrs.at("b"), "true");
    EXPECT_EQ(r.attrs.at("c"), "false");
}

TEST(SnapshotTest, EmptyObject) {
    auto r = parse_attribute_snapshot(" { } ");
    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(r.attrs.empty());
}

TEST(SnapshotTest, DecodesEscapes) {
    auto r = parse_attribute_snapshot(R"({"t": "a\"b\\c\n\u00e9\ud83d\ude00"})");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.attrs.at("t"), "a\"b\\c\n\xc3\xa9\xf0\x9f\x98\x80");
}

TEST(SnapshotTest, UnpairedSurrogatesBecomeReplacementChar) {
    const std::string fffd = "\xef\xbf\xbd";
    auto r = parse_attribute_snapshot(R"({"hi": "\ud83d", "lo": "\ude00x", "bad": "\ud83d\u0041"})");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.attrs.at("hi"), fffd);
    EXPECT_EQ(r.attrs.at("lo"), fffd + "x");
    EXPECT_EQ(r.attrs.at("bad"), fffd + "A");
}

TEST(SnapshotTest, NumbersKeepTheirSpelling) {
    auto r = parse_attribute_snapshot(R"({"a": -1.5e3, "b": 10})");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.attrs.at("a"), "-1.5e3");
    EXPECT_EQ(r.attrs.at("b"), "10");
}

TEST(SnapshotTest, RejectsUnknownEscapes) {
    auto r = parse_attribute_snapshot(R"({"a": "\q"})");
    EXPECT_FALSE(r.ok);
    ASSERT_FALSE(r.errors.empty());
    EXPECT_EQ(r.errors[0].message, "unsupported escape");
}

TEST(SnapshotTest, RejectsNonObjects) {
    EXPECT_FALSE(parse_attribute_snapshot("[1, 2]").ok);
    EXPECT_FALSE(parse_attribute_snapshot("\"str\"").ok);
    EXPECT_FALSE(parse_attribute_snapshot("").ok);
}

TEST(SnapshotTest, RejectsNestedValues) {
    auto r = parse_attribute_snapshot(R"({"a": {"b": "c"}})");
    EXPECT_FALSE(r.ok);
    ASSERT_FALSE(r.errors.empty());
    EXPECT_NE(r.errors[0].message.find("not a scalar"), std::string::npos);
}

TEST(SnapshotTest, ReportsPositionOfSyntaxErrors) {
    auto r = parse_attribute_snapshot("{\n  \"a\": \"b\",\n  oops\n}");
    EXPECT_FALSE(r.ok);
    ASSERT_FALSE(r.errors.empty());
    EXPECT_EQ(r.errors[0].line, 3);
    EXPECT_EQ(r.errors[0].column, 3);
}

TEST(SnapshotTest, RejectsTrailingGarbage) {
    EXPECT_FALSE(parse_attribute_snapshot("{} x").ok);
    EXPECT_FALSE(parse_attribute_snapshot(R"({"a": "b")").ok);
}

TEST(SnapshotTest, WriteEscapesAndSorts) {
    AttributeSnapshot attrs{{"z", "1"}, {"a", "say \"hi\"\n"}};
    EXPECT_EQ(write_attribute_snapshot(attrs), R"({"a":"say \"hi\"\n","z":"1"})");
    EXPECT_EQ(write_attribute_snapshot({}), "{}");

    auto back = parse_attribute_snapshot(write_attribute_snapshot(attrs));
    ASSERT_TRUE(back.ok);
    EXPECT_EQ(back.attrs, attrs);
}
