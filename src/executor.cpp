// ═══════════════════════════════════════════════════════════════════
//  executor.cpp — Field resolution, recursion policy and null checks
// ═══════════════════════════════════════════════════════════════════

#include "miniql/executor.h"
#include "miniql/coercer.h"
#include "miniql/console.h"
#include "miniql/error.h"

namespace miniql {

Executor::Executor(std::shared_ptr<const Schema> schema)
    : schema_(std::move(schema)) {
    if (!schema_) {
        throw Error(ErrorCategory::Schema, "Executor requires a schema.");
    }
}

Json Executor::execute(const ParsedQuery& query, const Value& rootValue) const {
    return execute(query.operationType, query.selections, rootValue);
}

Json Executor::execute(const std::string& operationType, const SelectionSet& selections,
                       const Value& rootValue) const {
    return resolveSelections(selections, rootType(operationType), rootValue);
}

const Type& Executor::rootType(const std::string& operationType) const {
    if (operationType == "query") {
        return *schema_->queryType();
    }
    if (operationType == "mutation") {
        if (!schema_->mutationType()) {
            throw Error(ErrorCategory::Execution, "Schema does not define a Mutation type.");
        }
        return *schema_->mutationType();
    }
    throw Error(ErrorCategory::Execution, "Unsupported operation type: " + operationType);
}

Json Executor::resolveSelections(const SelectionSet& selections, const Type& currentType,
                                 const Value& source) const {
    if (!currentType.isObject()) {
        throw Error(ErrorCategory::Execution,
                    "Cannot resolve selections on a non-object type (" + currentType.name() + ").");
    }

    Json result = Json::object();
    for (const auto& selection : selections) {
        const auto* field = currentType.field(selection.name);
        if (!field) {
            throw Error(ErrorCategory::Execution,
                        "Cannot query field \"" + selection.name + "\" on type \"" +
                            currentType.name() + "\".",
                        Json{{"field", selection.name}, {"type", currentType.name()}});
        }

        console::debug("Resolving", currentType.name() + "." + selection.name);

        auto raw = resolveField(*field, source);
        result[selection.name] = completeValue(*field->type(), selection.selections, raw);
    }
    return result;
}

Value Executor::resolveField(const FieldDefinition& field, const Value& source) const {
    try {
        if (field.hasResolver()) {
            return field.resolver()(source, Json::object());
        }
        return source.lookup(field.name()).value_or(Value());
    } catch (const Error&) {
        // Already carries its own context
        throw;
    } catch (const std::exception& e) {
        throw Error(ErrorCategory::Resolver,
                    "Resolver for field \"" + field.name() + "\" threw an exception: " + e.what(),
                    Json{{"field", field.name()}});
    }
}

Json Executor::completeValue(const Type& type, const SelectionSet& selections,
                             const Value& value) const {
    // Non-null is checked after the wrapped type has been completed
    if (type.isNonNull()) {
        auto completed = completeValue(*type.ofType(), selections, value);
        if (completed.is_null()) {
            throw Error(ErrorCategory::Coercion,
                        "Cannot return null for non-nullable type " + type.name() + ".");
        }
        return completed;
    }

    if (!selections.empty()) {
        if (type.isObject()) {
            if (value.isNull()) {
                return nullptr;
            }
            return resolveSelections(selections, type, value);
        }

        if (type.isList() && type.namedType().isObject()) {
            if (value.isNull()) {
                return nullptr;
            }
            if (!value.isIterable()) {
                throw Error(ErrorCategory::Coercion,
                            "Value is not iterable for List type " + type.name() + ": " +
                                value.dump());
            }
            Json items = Json::array();
            for (const auto& item : value.elements()) {
                items.push_back(completeValue(*type.ofType(), selections, item));
            }
            return items;
        }
    }

    return coercion::coerceValue(value, type);
}

} // namespace miniql
