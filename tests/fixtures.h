#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fixtures.h — Shared test schema: User, Product, Book, Query, Mutation
// ═══════════════════════════════════════════════════════════════════

#include <miniql/miniql.h>
#include <atomic>
#include <memory>
#include <stdexcept>

namespace fixtures {

using namespace miniql;

inline Json alice() {
    return Json{{"id", "1"}, {"name", "Alice"}, {"email", "alice@example.com"},
                {"age", 30}, {"status", "active"}, {"isActive", true}};
}

inline Json bob() {
    return Json{{"id", "2"}, {"name", "Bob"}, {"email", "bob@example.com"},
                {"age", 25}, {"status", "inactive"}, {"isActive", false}};
}

// ── Host object answering through a property and an accessor ──
class BookObject : public HostObject {
public:
    std::optional<Value> property(const std::string& name) const override {
        if (name == "title") return Value("Dune");
        if (name == "label") return Value("from-property");
        return std::nullopt;
    }

    std::optional<Value> invoke(const std::string& name) const override {
        if (name == "year") return Value(1965);
        if (name == "label") return Value("from-accessor");
        return std::nullopt;
    }

    Json toJson() const override {
        return Json{{"title", "Dune"}, {"year", 1965}};
    }
};

// ── Host object whose plain mapping cannot be produced ──
class BrokenObject : public HostObject {
public:
    Json toJson() const override {
        throw std::runtime_error("snapshot failed");
    }
};

inline std::shared_ptr<Type> userType() {
    auto user = Type::object("User", "A test user object.");
    user->addField(FieldDefinition("id", Type::nonNull(Type::scalar(ScalarKind::ID)))
                       .describe("The user ID."));
    user->addField(FieldDefinition("name", Type::scalar(ScalarKind::String))
                       .describe("The user name."));
    user->addField(FieldDefinition("email", Type::nonNull(Type::scalar(ScalarKind::String)))
                       .describe("The user email."));
    user->addField(FieldDefinition("age", Type::scalar(ScalarKind::Int))
                       .describe("The user age.")
                       .resolve([](const Value& parent, const Json&) -> Value {
                           return parent.lookup("age").value_or(Value());
                       }));
    user->addField("status", Type::scalar(ScalarKind::String));
    user->addField("isActive", Type::scalar(ScalarKind::Boolean));
    return user;
}

inline std::shared_ptr<Type> productType() {
    auto product = Type::object("Product", "A test product object.");
    product->addField("id", Type::nonNull(Type::scalar(ScalarKind::ID)));
    product->addField("name", Type::scalar(ScalarKind::String));
    product->addField("price", Type::scalar(ScalarKind::Float));
    return product;
}

inline std::shared_ptr<Type> bookType() {
    auto book = Type::object("Book");
    book->addField("title", Type::scalar(ScalarKind::String));
    book->addField("year", Type::scalar(ScalarKind::Int));
    book->addField("label", Type::scalar(ScalarKind::String));
    book->addField("isbn", Type::scalar(ScalarKind::String));
    return book;
}

// Counts resolver calls made below `nobody`
inline std::atomic<int>& nestedCalls() {
    static std::atomic<int> calls{0};
    return calls;
}

inline std::shared_ptr<Type> queryType(const TypePtr& user) {
    auto string = Type::scalar(ScalarKind::String);
    auto strictString = Type::nonNull(string);

    auto ghost = Type::object("Ghost");
    ghost->addField("name", string, [](const Value&, const Json&) -> Value {
        nestedCalls()++;
        return "boo";
    });

    auto query = Type::object("Query", "The root Query type of the schema.");

    query->addField(FieldDefinition("hello", string)
                        .describe("A simple greeting.")
                        .resolve([](const Value&, const Json&) -> Value { return "World"; }));

    query->addField("user", user, [](const Value& root, const Json&) -> Value {
        if (auto override = root.lookup("user")) {
            return *override;
        }
        return alice();
    });

    query->addField("users", Type::listOf(user), [](const Value&, const Json&) -> Value {
        return Json::array({alice(), bob()});
    });

    query->addField("product", productType(), [](const Value&, const Json&) -> Value {
        return Json{{"id", "P1"}, {"name", "Laptop"}, {"price", 1200.50}};
    });

    query->addField("nullableString", string, [](const Value&, const Json&) -> Value {
        return nullptr;
    });
    query->addField("nonNullableString", strictString, [](const Value&, const Json&) -> Value {
        return "I am not null";
    });
    query->addField("nonNullableStringNullResolver", strictString,
                    [](const Value&, const Json&) -> Value { return nullptr; });

    query->addField("listOfString", Type::listOf(string), [](const Value&, const Json&) -> Value {
        return Json::array({"apple", "banana", "cherry"});
    });
    query->addField("listOfNonNullString", Type::listOf(strictString),
                    [](const Value&, const Json&) -> Value {
                        return Json::array({"one", "two", "three"});
                    });
    query->addField("listOfNonNullStringWithNull", Type::listOf(strictString),
                    [](const Value&, const Json&) -> Value {
                        return Json::array({"valid", nullptr, "another_valid"});
                    });

    query->addField("errorField", string, [](const Value&, const Json&) -> Value {
        throw std::runtime_error("Something went wrong in the resolver!");
    });
    query->addField("ownErrorField", string, [](const Value&, const Json&) -> Value {
        throw Error(ErrorCategory::Execution, "Denied by policy.", Json{{"code", "FORBIDDEN"}});
    });

    query->addField("nobody", ghost, [](const Value&, const Json&) -> Value { return nullptr; });

    query->addField("friendsWithNull", Type::listOf(user), [](const Value&, const Json&) -> Value {
        return Json::array({alice(), nullptr});
    });
    query->addField("strictFriends", Type::listOf(Type::nonNull(user)),
                    [](const Value&, const Json&) -> Value {
                        return Json::array({alice(), nullptr});
                    });
    query->addField("usersNotIterable", Type::listOf(user), [](const Value&, const Json&) -> Value {
        return "oops";
    });

    query->addField("requiredUser", Type::nonNull(user), [](const Value&, const Json&) -> Value {
        return alice();
    });
    query->addField("missingRequiredUser", Type::nonNull(user),
                    [](const Value&, const Json&) -> Value { return nullptr; });

    query->addField("book", bookType(), [](const Value&, const Json&) -> Value {
        return std::make_shared<const BookObject>();
    });
    query->addField("books", Type::listOf(bookType()), [](const Value&, const Json&) -> Value {
        return Value::List{std::make_shared<const BookObject>(), nullptr};
    });
    query->addField("broken", bookType(), [](const Value&, const Json&) -> Value {
        return std::make_shared<const BrokenObject>();
    });

    // Default resolution straight off the root value
    query->addField("motto", string);

    return query;
}

inline std::shared_ptr<Type> mutationType(const TypePtr& user) {
    auto mutation = Type::object("Mutation", "The root Mutation type of the schema.");

    mutation->addField("createUser", user, [](const Value&, const Json&) -> Value {
        return Json{{"id", "new-123"}, {"name", "New User"}, {"email", "new@example.com"},
                    {"age", 22}, {"status", "active"}, {"isActive", true}};
    });
    mutation->addField("updateUserStatus", Type::nonNull(Type::scalar(ScalarKind::Boolean)),
                       [](const Value&, const Json&) -> Value { return true; });

    return mutation;
}

inline std::shared_ptr<const Schema> makeSchema() {
    auto user = userType();
    return std::make_shared<const Schema>(queryType(user), mutationType(user));
}

inline std::shared_ptr<const Schema> makeQueryOnlySchema() {
    return std::make_shared<const Schema>(queryType(userType()));
}

} // namespace fixtures
