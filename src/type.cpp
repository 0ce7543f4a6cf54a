// ═══════════════════════════════════════════════════════════════════
//  type.cpp — Type factories and kind-checked accessors
// ═══════════════════════════════════════════════════════════════════

#include "miniql/type.h"
#include "miniql/error.h"

namespace miniql {

std::string_view toString(TypeKind kind) {
    switch (kind) {
        case TypeKind::Scalar:  return "SCALAR";
        case TypeKind::Object:  return "OBJECT";
        case TypeKind::List:    return "LIST";
        case TypeKind::NonNull: return "NON_NULL";
    }
    return "UNKNOWN";
}

// ═══════════════════════════════════════════
//  FieldDefinition
// ═══════════════════════════════════════════

FieldDefinition::FieldDefinition(std::string name, TypePtr type, Resolver resolver)
    : name_(std::move(name)), type_(std::move(type)), resolver_(std::move(resolver)) {
    if (!type_) {
        throw Error(ErrorCategory::Schema, "Field '" + name_ + "' has no type.");
    }
}

FieldDefinition& FieldDefinition::describe(std::string description) {
    description_ = std::move(description);
    return *this;
}

FieldDefinition& FieldDefinition::arg(Argument argument) {
    if (!argument.type) {
        throw Error(ErrorCategory::Schema,
                    "Argument '" + argument.name + "' of field '" + name_ + "' has no type.");
    }
    args_.push_back(std::move(argument));
    return *this;
}

FieldDefinition& FieldDefinition::resolve(Resolver resolver) {
    resolver_ = std::move(resolver);
    return *this;
}

// ═══════════════════════════════════════════
//  Type factories
// ═══════════════════════════════════════════

Type::Type(std::string name, std::string description, Payload payload)
    : name_(std::move(name)), description_(std::move(description)), payload_(std::move(payload)) {}

TypePtr Type::scalar(ScalarKind kind) {
    static const TypePtr string(new Type("String",
        "The `String` scalar type represents textual data, represented as UTF-8 "
        "character sequences.", Scalar{ScalarKind::String, nullptr}));
    static const TypePtr integer(new Type("Int",
        "The `Int` scalar type represents a signed whole number.",
        Scalar{ScalarKind::Int, nullptr}));
    static const TypePtr boolean(new Type("Boolean",
        "The `Boolean` scalar type represents `true` or `false`.",
        Scalar{ScalarKind::Boolean, nullptr}));
    static const TypePtr floating(new Type("Float",
        "The `Float` scalar type represents a signed double-precision fractional value.",
        Scalar{ScalarKind::Float, nullptr}));
    static const TypePtr id(new Type("ID",
        "The `ID` scalar type represents a unique identifier, serialized in the same "
        "way as a String.", Scalar{ScalarKind::ID, nullptr}));

    switch (kind) {
        case ScalarKind::String:  return string;
        case ScalarKind::Int:     return integer;
        case ScalarKind::Boolean: return boolean;
        case ScalarKind::Float:   return floating;
        case ScalarKind::ID:      return id;
        case ScalarKind::Custom:  break;
    }
    throw Error(ErrorCategory::Schema, "Custom scalars are created with Type::customScalar().");
}

TypePtr Type::scalar(const std::string& name) {
    if (name == "String")  return scalar(ScalarKind::String);
    if (name == "Int")     return scalar(ScalarKind::Int);
    if (name == "Boolean") return scalar(ScalarKind::Boolean);
    if (name == "Float")   return scalar(ScalarKind::Float);
    if (name == "ID")      return scalar(ScalarKind::ID);
    throw Error(ErrorCategory::Schema, "Unknown scalar type: " + name);
}

TypePtr Type::customScalar(std::string name, ScalarSerializer serialize, std::string description) {
    return TypePtr(new Type(std::move(name), std::move(description),
                            Scalar{ScalarKind::Custom, std::move(serialize)}));
}

std::shared_ptr<Type> Type::object(std::string name, std::string description) {
    return std::shared_ptr<Type>(new Type(std::move(name), std::move(description), Object{}));
}

TypePtr Type::listOf(TypePtr ofType) {
    if (!ofType) {
        throw Error(ErrorCategory::Schema, "List type requires an element type.");
    }
    auto name = "[" + ofType->name() + "]";
    return TypePtr(new Type(std::move(name), "", List{std::move(ofType)}));
}

TypePtr Type::nonNull(TypePtr ofType) {
    if (!ofType) {
        throw Error(ErrorCategory::Schema, "NonNull type requires an inner type.");
    }
    if (ofType->isNonNull()) {
        return ofType;
    }
    auto name = ofType->name() + "!";
    return TypePtr(new Type(std::move(name), "", NonNull{std::move(ofType)}));
}

// ═══════════════════════════════════════════
//  Object builder
// ═══════════════════════════════════════════

Type& Type::addField(FieldDefinition field) {
    auto* object = std::get_if<Object>(&payload_);
    if (!object) {
        throw Error(ErrorCategory::Schema,
                    "Cannot add field '" + field.name() + "' to a non-object type (" + name_ + ").");
    }

    auto it = object->index.find(field.name());
    if (it != object->index.end()) {
        object->fields[it->second] = std::move(field);
    } else {
        object->index.emplace(field.name(), object->fields.size());
        object->fields.push_back(std::move(field));
    }
    return *this;
}

Type& Type::addField(std::string name, TypePtr type, Resolver resolver) {
    return addField(FieldDefinition(std::move(name), std::move(type), std::move(resolver)));
}

// ═══════════════════════════════════════════
//  Kind-checked accessors
// ═══════════════════════════════════════════

ScalarKind Type::scalarKind() const {
    const auto* scalar = std::get_if<Scalar>(&payload_);
    if (!scalar) {
        throw Error(ErrorCategory::Schema, "Type " + name_ + " is not a scalar type.");
    }
    return scalar->kind;
}

const ScalarSerializer& Type::serializer() const {
    const auto* scalar = std::get_if<Scalar>(&payload_);
    if (!scalar) {
        throw Error(ErrorCategory::Schema, "Type " + name_ + " is not a scalar type.");
    }
    return scalar->serialize;
}

const std::vector<FieldDefinition>& Type::fields() const {
    const auto* object = std::get_if<Object>(&payload_);
    if (!object) {
        throw Error(ErrorCategory::Schema,
                    "Cannot get fields from a non-object type (" + name_ + ").");
    }
    return object->fields;
}

const FieldDefinition* Type::field(const std::string& name) const {
    const auto* object = std::get_if<Object>(&payload_);
    if (!object) {
        throw Error(ErrorCategory::Schema,
                    "Cannot get field '" + name + "' from a non-object type (" + name_ + ").");
    }
    auto it = object->index.find(name);
    return it != object->index.end() ? &object->fields[it->second] : nullptr;
}

const TypePtr& Type::ofType() const {
    if (const auto* list = std::get_if<List>(&payload_)) {
        return list->ofType;
    }
    if (const auto* nonNull = std::get_if<NonNull>(&payload_)) {
        return nonNull->ofType;
    }
    throw Error(ErrorCategory::Schema,
                "Cannot get 'ofType' from a non-LIST or non-NON_NULL type (" + name_ + ").");
}

const Type& Type::namedType() const {
    const Type* current = this;
    while (current->isList() || current->isNonNull()) {
        current = current->ofType().get();
    }
    return *current;
}

} // namespace miniql
