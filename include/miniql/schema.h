#pragma once
// ═══════════════════════════════════════════════════════════════════
//  miniql/schema.h — Root operation types and the name → type map
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto schema = std::make_shared<Schema>(queryType, mutationType);
//    auto user = schema->type("User");
//
// ═══════════════════════════════════════════════════════════════════

#include "type.h"
#include <string>
#include <unordered_map>
#include <vector>

namespace miniql {

class Schema {
public:
    // Both roots must be Object types; mutationType may be null.
    explicit Schema(TypePtr queryType, TypePtr mutationType = nullptr);

    const TypePtr& queryType() const { return queryType_; }
    const TypePtr& mutationType() const { return mutationType_; }

    // ── Registered type by name, or nullptr ──
    TypePtr type(const std::string& name) const;
    bool hasType(const std::string& name) const;

    // ── Every registered name, in registration order ──
    const std::vector<std::string>& types() const { return typeNames_; }

private:
    void registerType(const TypePtr& type);

    TypePtr queryType_;
    TypePtr mutationType_;
    std::unordered_map<std::string, TypePtr> typeMap_;
    std::vector<std::string> typeNames_;
};

} // namespace miniql
