#pragma once
// ═══════════════════════════════════════════════════════════════════
//  miniql/type.h — Type descriptors, field and argument definitions
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto user = Type::object("User", "A registered user.");
//    user->addField("id", Type::nonNull(Type::scalar(ScalarKind::ID)));
//    user->addField(FieldDefinition("name", Type::scalar("String"))
//                       .describe("Display name."));
//
//    auto query = Type::object("Query");
//    query->addField("me", user, [](const Value&, const Json&) -> Value {
//        return Json{{"id", "1"}, {"name", "Alice"}};
//    });
//
// ═══════════════════════════════════════════════════════════════════

#include "value.h"
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace miniql {

class Type;
using TypePtr = std::shared_ptr<const Type>;

enum class TypeKind { Scalar, Object, List, NonNull };

// ── Built-in scalars; Custom marks a host-defined leaf ──
enum class ScalarKind { String, Int, Boolean, Float, ID, Custom };

std::string_view toString(TypeKind kind);

// ── Resolver: (parent value, arguments) -> raw field value ──
using Resolver = std::function<Value(const Value& parent, const Json& args)>;

// ── Serializer for custom scalars ──
using ScalarSerializer = std::function<Json(const Value& value)>;

// ── Field argument definition (carried by the schema, unused by execution) ──
struct Argument {
    std::string name;
    TypePtr type;
    std::string description;
    Json defaultValue = nullptr;
};

// ═══════════════════════════════════════════
//  class FieldDefinition
// ═══════════════════════════════════════════
class FieldDefinition {
public:
    FieldDefinition(std::string name, TypePtr type, Resolver resolver = nullptr);

    FieldDefinition& describe(std::string description);
    FieldDefinition& arg(Argument argument);
    FieldDefinition& resolve(Resolver resolver);

    const std::string& name() const { return name_; }
    const TypePtr& type() const { return type_; }
    const std::string& description() const { return description_; }
    const std::vector<Argument>& args() const { return args_; }
    const Resolver& resolver() const { return resolver_; }
    bool hasResolver() const { return static_cast<bool>(resolver_); }

private:
    std::string name_;
    TypePtr type_;
    std::string description_;
    std::vector<Argument> args_;
    Resolver resolver_;
};

// ═══════════════════════════════════════════
//  class Type
//  Tagged union over the four type kinds.
// ═══════════════════════════════════════════
class Type {
public:
    struct Scalar {
        ScalarKind kind;
        ScalarSerializer serialize;
    };

    struct Object {
        std::vector<FieldDefinition> fields;
        std::unordered_map<std::string, std::size_t> index;
    };

    struct List {
        TypePtr ofType;
    };

    struct NonNull {
        TypePtr ofType;
    };

    using Payload = std::variant<Scalar, Object, List, NonNull>;

    // ── Factories ──
    static TypePtr scalar(ScalarKind kind);
    static TypePtr scalar(const std::string& name);
    static TypePtr customScalar(std::string name, ScalarSerializer serialize = nullptr,
                                std::string description = "");
    static std::shared_ptr<Type> object(std::string name, std::string description = "");
    static TypePtr listOf(TypePtr ofType);
    static TypePtr nonNull(TypePtr ofType);

    // ── Object builder ──
    Type& addField(FieldDefinition field);
    Type& addField(std::string name, TypePtr type, Resolver resolver = nullptr);

    // ── Inspection ──
    TypeKind kind() const { return static_cast<TypeKind>(payload_.index()); }
    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }

    bool isScalar() const { return kind() == TypeKind::Scalar; }
    bool isObject() const { return kind() == TypeKind::Object; }
    bool isList() const { return kind() == TypeKind::List; }
    bool isNonNull() const { return kind() == TypeKind::NonNull; }

    // Scalar only
    ScalarKind scalarKind() const;
    const ScalarSerializer& serializer() const;

    // Object only; field() returns nullptr when the field is absent
    const std::vector<FieldDefinition>& fields() const;
    const FieldDefinition* field(const std::string& name) const;

    // List and NonNull only
    const TypePtr& ofType() const;

    // Innermost type with every List/NonNull wrapper removed
    const Type& namedType() const;

private:
    Type(std::string name, std::string description, Payload payload);

    std::string name_;
    std::string description_;
    Payload payload_;
};

} // namespace miniql
