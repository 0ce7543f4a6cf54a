#pragma once
// ═══════════════════════════════════════════════════════════════════
//  miniql/miniql.h — Umbrella header for the miniql query engine
// ═══════════════════════════════════════════════════════════════════
//
//  #include "miniql/miniql.h"
//  using namespace miniql;
//
//  This single include gives you:
//    • Type, FieldDefinition, Argument, Schema
//    • QueryParser, Executor, Engine, Options
//    • Value, HostObject, MINIQL_SERIALIZE
//    • Error, console::log(), warn(), debug()
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "value.h"
#include "console.h"
#include "error.h"

// Types & schema
#include "type.h"
#include "schema.h"

// Parsing & execution
#include "parser.h"
#include "coercer.h"
#include "executor.h"

// Facade
#include "options.h"
#include "engine.h"
