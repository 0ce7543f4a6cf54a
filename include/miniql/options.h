#pragma once
// ═══════════════════════════════════════════════════════════════════
//  miniql/options.h — Engine configuration
// ═══════════════════════════════════════════════════════════════════
//
//  Environment variables read by Options::fromEnv():
//    MINIQL_DEBUG       1 / true / yes / on  → include debug blocks in errors
//    MINIQL_LOG_LEVEL   debug | info | warn | error | silent
//
// ═══════════════════════════════════════════════════════════════════

#include "console.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace miniql {

struct Options {
    bool debug = false;                                  // file/line/trace in serialized errors
    console::Level logLevel = console::Level::Warn;

    static Options fromEnv() {
        Options options;

        if (const char* debug = std::getenv("MINIQL_DEBUG")) {
            std::string value(debug);
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            options.debug = value == "1" || value == "true" || value == "yes" || value == "on";
        }

        if (const char* level = std::getenv("MINIQL_LOG_LEVEL")) {
            if (auto parsed = console::parseLevel(level)) {
                options.logLevel = *parsed;
            } else {
                console::warn("Ignoring unknown MINIQL_LOG_LEVEL:", level);
            }
        }

        return options;
    }
};

} // namespace miniql
