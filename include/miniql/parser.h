#pragma once
// ═══════════════════════════════════════════════════════════════════
//  miniql/parser.h — Selection-set parser
// ═══════════════════════════════════════════════════════════════════
//
//  Accepts `query { ... }`, `mutation { ... }` or a bare `{ ... }`
//  made of field names and nested braces. Arguments, aliases,
//  fragments and directives are not part of the grammar.
//
//  Usage:
//    auto parsed = QueryParser().parse("{ user { name } }");
//    parsed.operationType;              // "query"
//    parsed.selections[0].name;         // "user"
//
// ═══════════════════════════════════════════════════════════════════

#include "value.h"
#include <string>
#include <vector>

namespace miniql {

// ── One requested field and the fields requested beneath it ──
struct FieldSelection {
    std::string name;
    std::vector<FieldSelection> selections;

    bool isLeaf() const { return selections.empty(); }
};

using SelectionSet = std::vector<FieldSelection>;

struct ParsedQuery {
    std::string operationType; // "query" or "mutation"
    SelectionSet selections;
};

// ── Insert or replace by name; a repeated name keeps its first position ──
void addSelection(SelectionSet& set, FieldSelection selection);

// ── Selection tree as nested JSON objects, leaves as {} ──
Json toJson(const SelectionSet& set);
Json toJson(const ParsedQuery& query);

// ═══════════════════════════════════════════
//  class QueryParser
// ═══════════════════════════════════════════
class QueryParser {
public:
    ParsedQuery parse(const std::string& queryText) const;

private:
    SelectionSet parseFields(const std::string& body) const;
};

} // namespace miniql
