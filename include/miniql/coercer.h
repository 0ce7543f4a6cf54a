#pragma once
// ═══════════════════════════════════════════════════════════════════
//  miniql/coercer.h — Shapes raw values into their declared types
// ═══════════════════════════════════════════════════════════════════

#include "type.h"
#include "value.h"
#include <cstdint>
#include <optional>
#include <string>

namespace miniql::coercion {

// ── Coerce `value` against `type`, enforcing non-null wrappers ──
// Throws miniql::Error (Coercion) when the value does not fit.
Json coerceValue(const Value& value, const Type& type);

// ── Scalar rules ──
Json coerceScalar(const Value& value, const Type& type);

// Text form used by String and ID
std::string toText(const Value& value, const Type& type);

// Integer value or nullopt when `value` is not an integer literal
std::optional<std::int64_t> parseInt(const Json& value);

// Number or nullopt when `value` is not numeric
std::optional<double> parseFloat(const Json& value);

// Recognized true/false spellings; nullopt for anything else
std::optional<bool> parseBoolean(const Json& value);

// Generic truthiness used when parseBoolean does not recognize the value
bool truthy(const Value& value);

} // namespace miniql::coercion
