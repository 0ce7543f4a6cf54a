#pragma once
// ═══════════════════════════════════════════════════════════════════
//  miniql/executor.h — Runs a selection tree against a schema
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    Executor executor(schema);
//    auto parsed = QueryParser().parse("{ user { name } }");
//    Json data = executor.execute(parsed, rootValue);
//
//  Execution is one synchronous depth-first walk. The first error
//  aborts the whole request; there are no partial results.
//
// ═══════════════════════════════════════════════════════════════════

#include "parser.h"
#include "schema.h"
#include "value.h"
#include <memory>
#include <string>

namespace miniql {

class Executor {
public:
    explicit Executor(std::shared_ptr<const Schema> schema);

    Json execute(const ParsedQuery& query, const Value& rootValue = Value()) const;
    Json execute(const std::string& operationType, const SelectionSet& selections,
                 const Value& rootValue = Value()) const;

    // ── Resolve `selections` on an Object type against `source` ──
    Json resolveSelections(const SelectionSet& selections, const Type& currentType,
                           const Value& source) const;

    const Schema& schema() const { return *schema_; }

private:
    const Type& rootType(const std::string& operationType) const;

    // Raw field value from the resolver or by default lookup
    Value resolveField(const FieldDefinition& field, const Value& source) const;

    // Recurse into objects and lists of objects, coerce everything else
    Json completeValue(const Type& type, const SelectionSet& selections, const Value& value) const;

    std::shared_ptr<const Schema> schema_;
};

} // namespace miniql
