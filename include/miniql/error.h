#pragma once
// ═══════════════════════════════════════════════════════════════════
//  miniql/error.h — The error type raised by every stage of a request
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    try {
//        auto data = engine.execute("{ user { name } }");
//    } catch (const miniql::Error& e) {
//        console::error(e.toJson(true));
//    }
//
// ═══════════════════════════════════════════════════════════════════

#include "value.h"
#include <boost/stacktrace.hpp>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace miniql {

// ── Where in the pipeline an error was raised ──
enum class ErrorCategory {
    Schema,     // invalid schema construction
    Syntax,     // malformed query text
    Execution,  // unknown operation, missing root, unknown field
    Resolver,   // a resolver failed with a foreign exception
    Coercion    // value does not fit its declared type
};

std::string_view toString(ErrorCategory category);

// ═══════════════════════════════════════════
//  class Error
// ═══════════════════════════════════════════
class Error : public std::runtime_error {
public:
    Error(ErrorCategory category, const std::string& message,
          Json extensions = Json::object(),
          std::source_location location = std::source_location::current());

    ErrorCategory category() const { return category_; }
    std::string message() const { return what(); }
    const Json& extensions() const { return extensions_; }
    const std::source_location& location() const { return location_; }
    const boost::stacktrace::stacktrace& trace() const { return trace_; }

    // ── {message, extensions?, debug?} ──
    // The debug block carries the throw site and the captured stack.
    Json toJson(bool debug = false) const;

private:
    ErrorCategory category_;
    Json extensions_;
    std::source_location location_;
    boost::stacktrace::stacktrace trace_;
};

} // namespace miniql
