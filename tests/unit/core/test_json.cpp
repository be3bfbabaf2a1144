/**
 * @file test_json.cpp
 * @brief Unit tests for the JSON document model
 */

#include <gtest/gtest.h>

#include <kcenon/media_relay/core/json.h>

#include <string>

namespace kcenon::media_relay::test {

class JsonTest : public ::testing::Test {};

// =============================================================================
// Parsing
// =============================================================================

TEST_F(JsonTest, ParseScalars) {
    auto t = json_value::parse("true");
    ASSERT_TRUE(t.has_value());
    EXPECT_TRUE(t.value().is_bool());
    EXPECT_TRUE(t.value().as_bool());

    auto n = json_value::parse("  null ");
    ASSERT_TRUE(n.has_value());
    EXPECT_TRUE(n.value().is_null());

    auto s = json_value::parse("\"hello\"");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s.value().as_string(), "hello");
}

TEST_F(JsonTest, NumbersKeepSourceText) {
    auto doc = json_value::parse(R"({"id": 7, "ratio": 0.50, "big": 12345678901234})");
    ASSERT_TRUE(doc.has_value());

    const auto* id = doc.value().find("id");
    ASSERT_NE(id, nullptr);
    EXPECT_TRUE(id->is_number());
    EXPECT_EQ(id->scalar_text(), "7");
    EXPECT_EQ(id->as_int64(), 7);

    const auto* ratio = doc.value().find("ratio");
    ASSERT_NE(ratio, nullptr);
    EXPECT_EQ(ratio->as_string(), "0.50");
    EXPECT_DOUBLE_EQ(ratio->as_double(), 0.5);
    EXPECT_FALSE(ratio->as_int64().has_value());

    EXPECT_EQ(doc.value().find("big")->as_int64(), 12345678901234LL);
}

TEST_F(JsonTest, ParseNestedDocument) {
    auto doc = json_value::parse(R"({
        "recipes": [
            {"id": 1, "dish_name": "Pho", "ingredients": ["noodles", "beef"]},
            {"id": "b2", "dish_name": "Tacos"}
        ]
    })");
    ASSERT_TRUE(doc.has_value());

    const auto* recipes = doc.value().find("recipes");
    ASSERT_NE(recipes, nullptr);
    ASSERT_TRUE(recipes->is_array());
    ASSERT_EQ(recipes->size(), 2u);

    const auto& first = recipes->as_array()[0];
    EXPECT_EQ(first.find("dish_name")->as_string(), "Pho");
    EXPECT_EQ(first.find("ingredients")->size(), 2u);
    EXPECT_EQ(recipes->as_array()[1].find("id")->as_string(), "b2");
}

TEST_F(JsonTest, ParseEscapes) {
    auto doc = json_value::parse(R"("a\"b\\c\/d\n\u00e9\ud83d\ude00")");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc.value().as_string(), "a\"b\\c/d\n\xC3\xA9\xF0\x9F\x98\x80");
}

TEST_F(JsonTest, LoneSurrogateBecomesReplacementCharacter) {
    auto doc = json_value::parse(R"("x\ud800y")");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc.value().as_string(), "x\xEF\xBF\xBDy");
}

TEST_F(JsonTest, MalformedDocuments) {
    for (const char* text : {"", "{", "[1,]", "{\"a\" 1}", "tru", "01x", "\"unterminated",
                             "{\"a\":1} trailing", "\"tab\there\""}) {
        auto doc = json_value::parse(text);
        ASSERT_FALSE(doc.has_value()) << text;
        EXPECT_EQ(doc.error().code, error_code::malformed_document) << text;
    }
}

TEST_F(JsonTest, ErrorReportsOffset) {
    auto doc = json_value::parse("[1, 2, x]");
    ASSERT_FALSE(doc.has_value());
    EXPECT_NE(doc.error().message.find("offset 7"), std::string::npos)
        << doc.error().message;
}

TEST_F(JsonTest, RejectsExcessiveNesting) {
    std::string deep(300, '[');
    deep += std::string(300, ']');

    auto doc = json_value::parse(deep);
    ASSERT_FALSE(doc.has_value());
    EXPECT_NE(doc.error().message.find("nesting"), std::string::npos);
}

// =============================================================================
// Building and serialization
// =============================================================================

TEST_F(JsonTest, ObjectKeepsInsertionOrder) {
    auto obj = json_value::make_object();
    obj.set("zeta", json_value::make_number(int64_t{1}));
    obj.set("alpha", json_value::make_string("x"));
    obj.set("zeta", json_value::make_number(int64_t{2}));

    EXPECT_EQ(obj.size(), 2u);
    EXPECT_EQ(obj.dump(), R"({"zeta":2,"alpha":"x"})");
}

TEST_F(JsonTest, EraseMember) {
    auto obj = json_value::make_object();
    obj.set("a", json_value::make_bool(true));
    obj.set("b", json_value::make_bool(false));

    EXPECT_TRUE(obj.erase("a"));
    EXPECT_FALSE(obj.erase("missing"));
    EXPECT_EQ(obj.dump(), R"({"b":false})");
}

TEST_F(JsonTest, IndentedDump) {
    auto arr = json_value::make_array();
    arr.push_back(json_value::make_string("7"));
    arr.push_back(json_value::make_string("12"));

    EXPECT_EQ(arr.dump(2), "[\n  \"7\",\n  \"12\"\n]");
    EXPECT_EQ(json_value::make_array().dump(2), "[]");
}

TEST_F(JsonTest, DumpEscapesStrings) {
    auto obj = json_value::make_object();
    obj.set("text", json_value::make_string("quote \" and\ttab"));
    EXPECT_EQ(obj.dump(), R"({"text":"quote \" and\ttab"})");
}

TEST_F(JsonTest, ReparseOfDumpPreservesContent) {
    auto doc = json_value::parse(R"({"7":{"stage":"uploading","artifact_size":1048576}})");
    ASSERT_TRUE(doc.has_value());

    auto again = json_value::parse(doc.value().dump(2));
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again.value().dump(), doc.value().dump());
}

TEST_F(JsonTest, ScalarTextForNonScalars) {
    EXPECT_FALSE(json_value::make_array().scalar_text().has_value());
    EXPECT_FALSE(json_value{}.scalar_text().has_value());
    EXPECT_EQ(json_value::make_bool(true).scalar_text(), "true");
}

}  // namespace kcenon::media_relay::test
