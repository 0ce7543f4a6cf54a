// ═══════════════════════════════════════════════════════════════════
//  engine.cpp — Request entry points for host applications
// ═══════════════════════════════════════════════════════════════════

#include "miniql/engine.h"
#include "miniql/console.h"
#include "miniql/error.h"

#include <chrono>

namespace miniql {

namespace {

Json errorResponse(const Error& error, bool debug) {
    return Json{
        {"data", nullptr},
        {"errors", Json::array({error.toJson(debug)})}
    };
}

} // namespace

Engine::Engine(std::shared_ptr<const Schema> schema, Options options)
    : options_(options), parser_(), executor_(std::move(schema)) {
    console::setLevel(options_.logLevel);
}

Json Engine::execute(const std::string& queryText, const Value& rootValue) const {
    auto start = std::chrono::steady_clock::now();

    auto parsed = parser_.parse(queryText);
    auto data = executor_.execute(parsed, rootValue);

    auto elapsed = std::chrono::steady_clock::now() - start;
    auto ms = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;
    console::debug(parsed.operationType, "executed in", ms, "ms");
    return data;
}

Json Engine::respond(const std::string& queryText, const Value& rootValue) const {
    try {
        return Json{{"data", execute(queryText, rootValue)}};
    } catch (const Error& e) {
        console::warn("Query failed [" + std::string(toString(e.category())) + "]:", e.what());
        return errorResponse(e, options_.debug);
    } catch (const std::exception& e) {
        // Escaped from outside any resolver (allocation, JSON access, ...)
        Error internal(ErrorCategory::Execution, std::string("Internal error: ") + e.what());
        console::error("Query failed:", internal.what());
        return errorResponse(internal, options_.debug);
    }
}

} // namespace miniql
