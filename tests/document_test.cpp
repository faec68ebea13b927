#include <docpatch-cpp/document.hpp>
#include <docpatch-cpp/error.hpp>

#include <gtest/gtest.h>

#include <string>

namespace dp = docpatch_cpp;

// -- Serialization ------------------------------------------------------------

TEST(Serialize, two_space_indent_without_trailing_newline) {
    const auto doc = dp::parse_document(R"({"a":[1,2],"b":{}})");
    EXPECT_EQ(dp::serialize(doc), "{\n  \"a\": [\n    1,\n    2\n  ],\n  \"b\": {}\n}");
}

TEST(Serialize, keeps_insertion_order) {
    const auto doc = dp::parse_document(R"({"zeta":1,"alpha":2,"mid":3})");
    EXPECT_EQ(dp::serialize(doc, {.indent = -1}), R"({"zeta":1,"alpha":2,"mid":3})");
}

TEST(Serialize, non_ascii_is_not_escaped) {
    const auto doc = dp::parse_document(R"({"name":"Zürich"})");
    EXPECT_EQ(dp::serialize(doc, {.indent = -1}), "{\"name\":\"Z\xC3\xBCrich\"}");
}

TEST(Serialize, sort_keys_is_recursive) {
    const auto doc = dp::parse_document(R"({"b":{"y":1,"x":2},"a":[{"d":0,"c":0}]})");
    EXPECT_EQ(dp::serialize(doc, {.indent = -1, .sort_keys = true}),
              R"({"a":[{"c":0,"d":0}],"b":{"x":2,"y":1}})");
}

TEST(Serialize, sorted_keys_leaves_input_untouched) {
    const auto doc = dp::parse_document(R"({"b":1,"a":2})");
    auto sorted = dp::sorted_keys(doc);
    EXPECT_EQ(sorted.begin().key(), "a");
    EXPECT_EQ(doc.begin().key(), "b");
}

TEST(Serialize, load_then_serialize_is_stable) {
    const auto text = std::string{"{\n  \"layers\": [\n    {\n      \"id\": \"T001\"\n    }\n  ]\n}"};
    EXPECT_EQ(dp::serialize(dp::parse_document(text)), text);
}

TEST(Serialize, invalid_utf8_is_rejected) {
    auto doc = dp::Document::object();
    doc["bad"] = std::string{"\xFF\xFE"};
    try {
        (void)dp::serialize(doc);
        FAIL() << "expected an error";
    } catch (const dp::Error& e) {
        EXPECT_EQ(e.kind(), dp::ErrorKind::parse_error);
    }
}

// -- Parsing ------------------------------------------------------------------

TEST(ParseDocument, reports_source_label) {
    try {
        (void)dp::parse_document("{\"a\":", "plan.json");
        FAIL() << "expected an error";
    } catch (const dp::Error& e) {
        EXPECT_EQ(e.kind(), dp::ErrorKind::parse_error);
        EXPECT_NE(std::string{e.what()}.find("plan.json"), std::string::npos);
    }
}

TEST(ParseDocument, accepts_any_top_level_value) {
    EXPECT_EQ(dp::parse_document("[]"), dp::Document::array());
    EXPECT_EQ(dp::parse_document("\"s\""), "s");
    EXPECT_TRUE(dp::parse_document("null").is_null());
}

// -- Equivalence --------------------------------------------------------------

TEST(Equivalent, object_key_order_is_ignored) {
    const auto a = dp::parse_document(R"({"x":1,"y":{"p":true,"q":null}})");
    const auto b = dp::parse_document(R"({"y":{"q":null,"p":true},"x":1})");
    EXPECT_TRUE(dp::equivalent(a, b));
    EXPECT_NE(a, b);
}

TEST(Equivalent, array_order_matters) {
    EXPECT_FALSE(dp::equivalent(dp::parse_document("[1,2]"), dp::parse_document("[2,1]")));
    EXPECT_FALSE(dp::equivalent(dp::parse_document("[1]"), dp::parse_document("[1,1]")));
}

TEST(Equivalent, numbers_compare_by_value) {
    EXPECT_TRUE(dp::equivalent(dp::parse_document("1"), dp::parse_document("1.0")));
    EXPECT_FALSE(dp::equivalent(dp::parse_document("1"), dp::parse_document("\"1\"")));
}

TEST(Equivalent, different_key_sets) {
    EXPECT_FALSE(dp::equivalent(dp::parse_document(R"({"a":1})"),
                                dp::parse_document(R"({"a":1,"b":2})")));
    EXPECT_FALSE(dp::equivalent(dp::parse_document(R"({"a":1})"),
                                dp::parse_document(R"({"b":1})")));
}

TEST(Document, copies_are_deep) {
    auto original = dp::parse_document(R"({"list":[1,2]})");
    auto copy = original;
    copy["list"].push_back(3);
    EXPECT_EQ(original["list"].size(), 2u);
}
