// ═══════════════════════════════════════════════════════════════════
//  test_error.cpp — Error categories and wire serialization
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "miniql/error.h"
#include <stdexcept>
#include <string>

using namespace miniql;

TEST(ErrorTest, CarriesCategoryAndMessage) {
    Error err(ErrorCategory::Syntax, "Empty query string.");

    EXPECT_EQ(err.category(), ErrorCategory::Syntax);
    EXPECT_EQ(err.message(), "Empty query string.");
    EXPECT_STREQ(err.what(), "Empty query string.");
}

TEST(ErrorTest, CatchableAsRuntimeError) {
    try {
        throw Error(ErrorCategory::Execution, "boom");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "boom");
        return;
    }
    FAIL() << "Error was not caught as std::runtime_error";
}

TEST(ErrorTest, CategoryNames) {
    EXPECT_EQ(toString(ErrorCategory::Schema), "schema");
    EXPECT_EQ(toString(ErrorCategory::Syntax), "syntax");
    EXPECT_EQ(toString(ErrorCategory::Execution), "execution");
    EXPECT_EQ(toString(ErrorCategory::Resolver), "resolver");
    EXPECT_EQ(toString(ErrorCategory::Coercion), "coercion");
}

// ═══════════════════════════════════════════
//  toJson
// ═══════════════════════════════════════════

TEST(ErrorTest, MinimalJson) {
    Error err(ErrorCategory::Coercion, "Value is not a valid Int: \"abc\"");
    auto j = err.toJson();

    EXPECT_EQ(j["message"], "Value is not a valid Int: \"abc\"");
    EXPECT_FALSE(j.contains("extensions"));
    EXPECT_FALSE(j.contains("debug"));
}

TEST(ErrorTest, ExtensionsIncluded) {
    Error err(ErrorCategory::Execution, "Cannot query field \"x\" on type \"Query\".",
              Json{{"field", "x"}, {"type", "Query"}});
    auto j = err.toJson();

    ASSERT_TRUE(j.contains("extensions"));
    EXPECT_EQ(j["extensions"]["field"], "x");
    EXPECT_EQ(j["extensions"]["type"], "Query");
}

TEST(ErrorTest, NonObjectExtensionsDropped) {
    Error err(ErrorCategory::Execution, "boom", Json::array({1, 2}));

    EXPECT_TRUE(err.extensions().is_object());
    EXPECT_TRUE(err.extensions().empty());
    EXPECT_FALSE(err.toJson().contains("extensions"));
}

TEST(ErrorTest, DebugBlockPointsAtThrowSite) {
    Error err(ErrorCategory::Resolver, "boom");
    auto j = err.toJson(true);

    ASSERT_TRUE(j.contains("debug"));
    const auto& debug = j["debug"];

    EXPECT_NE(debug["file"].get<std::string>().find("test_error.cpp"), std::string::npos);
    EXPECT_GT(debug["line"].get<int>(), 0);
    EXPECT_TRUE(debug["function"].is_string());
    EXPECT_TRUE(debug["trace"].is_array());
}

TEST(ErrorTest, LocationMatchesConstruction) {
    Error err(ErrorCategory::Schema, "boom"); int line = __LINE__;

    EXPECT_EQ(static_cast<int>(err.location().line()), line);
}
