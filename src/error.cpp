// ═══════════════════════════════════════════════════════════════════
//  error.cpp — Error construction and wire serialization
// ═══════════════════════════════════════════════════════════════════

#include "miniql/error.h"

namespace miniql {

std::string_view toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Schema:    return "schema";
        case ErrorCategory::Syntax:    return "syntax";
        case ErrorCategory::Execution: return "execution";
        case ErrorCategory::Resolver:  return "resolver";
        case ErrorCategory::Coercion:  return "coercion";
    }
    return "unknown";
}

Error::Error(ErrorCategory category, const std::string& message,
             Json extensions, std::source_location location)
    : std::runtime_error(message),
      category_(category),
      extensions_(extensions.is_object() ? std::move(extensions) : Json::object()),
      location_(location),
      trace_() {}

Json Error::toJson(bool debug) const {
    Json error = {{"message", message()}};

    if (!extensions_.empty()) {
        error["extensions"] = extensions_;
    }

    if (debug) {
        Json frames = Json::array();
        for (const auto& frame : trace_) {
            frames.push_back(boost::stacktrace::to_string(frame));
        }
        error["debug"] = {
            {"file", location_.file_name()},
            {"line", location_.line()},
            {"function", location_.function_name()},
            {"trace", frames}
        };
    }

    return error;
}

} // namespace miniql
