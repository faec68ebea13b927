#include <docpatch-cpp/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace docpatch_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::malformed_pointer),      "malformed_pointer");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_token),          "invalid_token");
    EXPECT_EQ(to_string_view(ErrorKind::not_found),              "not_found");
    EXPECT_EQ(to_string_view(ErrorKind::index_out_of_range),     "index_out_of_range");
    EXPECT_EQ(to_string_view(ErrorKind::type_mismatch),          "type_mismatch");
    EXPECT_EQ(to_string_view(ErrorKind::target_exists),          "target_exists");
    EXPECT_EQ(to_string_view(ErrorKind::root_removal_forbidden), "root_removal_forbidden");
    EXPECT_EQ(to_string_view(ErrorKind::malformed_operation),    "malformed_operation");
    EXPECT_EQ(to_string_view(ErrorKind::patch_assertion_failed), "patch_assertion_failed");
    EXPECT_EQ(to_string_view(ErrorKind::parse_error),            "parse_error");
    EXPECT_EQ(to_string_view(ErrorKind::io_error),               "io_error");
}

TEST(Error, kind_and_message_are_accessible) {
    const auto e = Error{ErrorKind::not_found, "no key 'x'"};

    EXPECT_EQ(e.kind(), ErrorKind::not_found);
    EXPECT_STREQ(e.what(), "no key 'x'");
}

TEST(Error, is_catchable_as_runtime_error) {
    try {
        throw Error{ErrorKind::io_error, "disk full"};
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "disk full");
        return;
    }
    FAIL() << "Error did not derive from std::runtime_error";
}

TEST(PatchAssertionError, carries_path_and_values) {
    const auto e = PatchAssertionError{"/meta/version", Document(2), Document(1)};

    EXPECT_EQ(e.kind(), ErrorKind::patch_assertion_failed);
    EXPECT_EQ(e.path(), "/meta/version");
    EXPECT_EQ(e.expected(), 2);
    EXPECT_EQ(e.actual(), 1);
    EXPECT_EQ(std::string{e.what()}, "test failed at /meta/version: expected 2, found 1");
}

TEST(PatchAssertionError, keeps_structured_values_unwrapped) {
    const auto expected = Document::parse(R"({"a":[1,2]})");
    const auto e = PatchAssertionError{"/o", expected, Document("x")};

    EXPECT_TRUE(e.expected().is_object());
    EXPECT_EQ(e.expected(), expected);
    EXPECT_TRUE(e.actual().is_string());
    EXPECT_EQ(e.actual(), "x");
}

TEST(PatchAssertionError, root_path_is_named_in_message) {
    const auto e = PatchAssertionError{"", Document::object(), Document::array()};
    EXPECT_EQ(std::string{e.what()}, "test failed at <root>: expected {}, found []");
}

TEST(PatchAssertionError, is_an_error) {
    try {
        throw PatchAssertionError{"/a", Document("x"), Document("y")};
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::patch_assertion_failed);
        return;
    }
    FAIL() << "PatchAssertionError did not derive from Error";
}
