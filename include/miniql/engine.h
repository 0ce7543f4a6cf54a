#pragma once
// ═══════════════════════════════════════════════════════════════════
//  miniql/engine.h — Parse + execute in one call
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    Engine engine(schema, Options::fromEnv());
//
//    Json data = engine.execute("{ hello }");        // throws miniql::Error
//    Json response = engine.respond("{ hello }");    // {"data": ...} or
//                                                    // {"data": null, "errors": [...]}
//
// ═══════════════════════════════════════════════════════════════════

#include "executor.h"
#include "options.h"
#include "parser.h"
#include "schema.h"
#include "value.h"
#include <memory>
#include <string>

namespace miniql {

class Engine {
public:
    explicit Engine(std::shared_ptr<const Schema> schema, Options options = {});

    // ── Result tree; the first failure is thrown as miniql::Error ──
    Json execute(const std::string& queryText, const Value& rootValue = Value()) const;

    // ── Response document; failures become a single-entry errors array ──
    Json respond(const std::string& queryText, const Value& rootValue = Value()) const;

    const Options& options() const { return options_; }
    const Schema& schema() const { return executor_.schema(); }

private:
    Options options_;
    QueryParser parser_;
    Executor executor_;
};

} // namespace miniql
