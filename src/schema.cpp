// ═══════════════════════════════════════════════════════════════════
//  schema.cpp — Root validation and reachable-type registration
// ═══════════════════════════════════════════════════════════════════

#include "miniql/schema.h"
#include "miniql/console.h"
#include "miniql/error.h"

namespace miniql {

Schema::Schema(TypePtr queryType, TypePtr mutationType)
    : queryType_(std::move(queryType)), mutationType_(std::move(mutationType)) {
    if (!queryType_ || !queryType_->isObject()) {
        throw Error(ErrorCategory::Schema, "Query type must be an ObjectType.");
    }
    if (mutationType_ && !mutationType_->isObject()) {
        throw Error(ErrorCategory::Schema, "Mutation type must be an ObjectType.");
    }

    // Built-in scalars are always available
    registerType(Type::scalar(ScalarKind::String));
    registerType(Type::scalar(ScalarKind::Int));
    registerType(Type::scalar(ScalarKind::Boolean));
    registerType(Type::scalar(ScalarKind::Float));
    registerType(Type::scalar(ScalarKind::ID));

    registerType(queryType_);
    if (mutationType_) {
        registerType(mutationType_);
    }

    console::debug("Schema registered", typeNames_.size(), "types");
}

TypePtr Schema::type(const std::string& name) const {
    auto it = typeMap_.find(name);
    return it != typeMap_.end() ? it->second : nullptr;
}

bool Schema::hasType(const std::string& name) const {
    return typeMap_.count(name) > 0;
}

void Schema::registerType(const TypePtr& type) {
    // First descriptor seen under a name wins; this also stops cycles
    if (!typeMap_.emplace(type->name(), type).second) {
        return;
    }
    typeNames_.push_back(type->name());

    switch (type->kind()) {
        case TypeKind::Object:
            for (const auto& field : type->fields()) {
                registerType(field.type());
                for (const auto& argument : field.args()) {
                    registerType(argument.type);
                }
            }
            break;
        case TypeKind::List:
        case TypeKind::NonNull:
            registerType(type->ofType());
            break;
        case TypeKind::Scalar:
            break;
    }
}

} // namespace miniql
