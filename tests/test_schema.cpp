// ═══════════════════════════════════════════════════════════════════
//  test_schema.cpp — Root validation and type registration
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "miniql/error.h"
#include "miniql/schema.h"
#include <algorithm>
#include <string>
#include <vector>

using namespace miniql;

namespace {

std::shared_ptr<Type> makeUser() {
    auto user = Type::object("User");
    user->addField("id", Type::nonNull(Type::scalar(ScalarKind::ID)));
    user->addField("friend", user);
    user->addField("tags", Type::listOf(Type::scalar(ScalarKind::String)));
    return user;
}

} // namespace

// ═══════════════════════════════════════════
//  Roots
// ═══════════════════════════════════════════

TEST(SchemaTest, QueryRootRequired) {
    try {
        Schema schema(nullptr);
        FAIL() << "Expected miniql::Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.category(), ErrorCategory::Schema);
        EXPECT_EQ(e.message(), "Query type must be an ObjectType.");
    }
}

TEST(SchemaTest, QueryRootMustBeObject) {
    try {
        Schema schema(Type::scalar(ScalarKind::String));
        FAIL() << "Expected miniql::Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.message(), "Query type must be an ObjectType.");
    }
}

TEST(SchemaTest, MutationRootMustBeObject) {
    try {
        Schema schema(Type::object("Query"), Type::listOf(Type::object("Mutation")));
        FAIL() << "Expected miniql::Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.message(), "Mutation type must be an ObjectType.");
    }
}

TEST(SchemaTest, RootsExposed) {
    auto query = Type::object("Query");
    auto mutation = Type::object("Mutation");
    Schema schema(query, mutation);

    EXPECT_EQ(schema.queryType(), query);
    EXPECT_EQ(schema.mutationType(), mutation);
    EXPECT_EQ(schema.type("Mutation"), mutation);
}

TEST(SchemaTest, MutationOptional) {
    Schema schema(Type::object("Query"));

    EXPECT_EQ(schema.mutationType(), nullptr);
    EXPECT_FALSE(schema.hasType("Mutation"));
}

// ═══════════════════════════════════════════
//  Registration
// ═══════════════════════════════════════════

TEST(SchemaTest, BuiltinScalarsComeFirst) {
    Schema schema(Type::object("Query"));

    std::vector<std::string> expected = {"String", "Int", "Boolean", "Float", "ID", "Query"};
    EXPECT_EQ(schema.types(), expected);
    EXPECT_EQ(schema.type("Float"), Type::scalar(ScalarKind::Float));
}

TEST(SchemaTest, ReachableTypesRegistered) {
    auto user = makeUser();
    auto query = Type::object("Query");
    query->addField("user", user);
    query->addField("users", Type::listOf(Type::nonNull(user)));

    Schema schema(query);

    for (const char* name : {"Query", "User", "ID!", "[String]", "[User!]", "User!"}) {
        EXPECT_TRUE(schema.hasType(name)) << name;
    }
    EXPECT_EQ(schema.type("User"), user);
    EXPECT_EQ(schema.type("[User!]")->ofType()->ofType(), user);
}

TEST(SchemaTest, RegistrationOrderIsDepthFirst) {
    auto user = makeUser();
    auto query = Type::object("Query");
    query->addField("user", user);
    query->addField("users", Type::listOf(Type::nonNull(user)));

    Schema schema(query);

    std::vector<std::string> expected = {
        "String", "Int", "Boolean", "Float", "ID",
        "Query", "User", "ID!", "[String]", "[User!]", "User!"
    };
    EXPECT_EQ(schema.types(), expected);
}

TEST(SchemaTest, FirstDescriptorWins) {
    auto first = Type::object("User");
    first->addField("a", Type::scalar(ScalarKind::String));
    auto second = Type::object("User");
    second->addField("b", Type::scalar(ScalarKind::String));

    auto query = Type::object("Query");
    query->addField("one", first);
    query->addField("two", second);

    Schema schema(query);

    EXPECT_EQ(schema.type("User"), first);
    EXPECT_EQ(std::count(schema.types().begin(), schema.types().end(), "User"), 1);
}

TEST(SchemaTest, ArgumentTypesRegistered) {
    auto date = Type::customScalar("Date");
    auto query = Type::object("Query");
    query->addField(FieldDefinition("events", Type::listOf(Type::scalar(ScalarKind::String)))
                        .arg({"since", date, "Lower bound."}));

    Schema schema(query);

    EXPECT_EQ(schema.type("Date"), date);
}

TEST(SchemaTest, UnknownNameIsNull) {
    Schema schema(Type::object("Query"));

    EXPECT_EQ(schema.type("Nope"), nullptr);
    EXPECT_FALSE(schema.hasType("Nope"));
}

TEST(SchemaTest, MutationTypesRegistered) {
    auto query = Type::object("Query");
    auto mutation = Type::object("Mutation");
    mutation->addField("rename", Type::nonNull(Type::scalar(ScalarKind::Boolean)));

    Schema schema(query, mutation);

    EXPECT_TRUE(schema.hasType("Boolean!"));
    EXPECT_EQ(schema.types().back(), "Boolean!");
}
