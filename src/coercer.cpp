// ═══════════════════════════════════════════════════════════════════
//  coercer.cpp — Type-directed value coercion and null enforcement
// ═══════════════════════════════════════════════════════════════════

#include "miniql/coercer.h"
#include "miniql/error.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <regex>

namespace miniql::coercion {

namespace detail {

inline std::string formatNumber(double d) {
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    if (ec != std::errc()) {
        return Json(d).dump();
    }
    return std::string(buf, ptr);
}

inline std::string normalize(const std::string& s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    std::string out = s.substr(begin, end - begin);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace detail

// ═══════════════════════════════════════════
//  Literal parsing
// ═══════════════════════════════════════════

std::optional<std::int64_t> parseInt(const Json& value) {
    if (value.is_number_unsigned()) {
        auto n = value.get<std::uint64_t>();
        if (n > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(n);
    }
    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }
    if (value.is_number_float()) {
        auto d = value.get<double>();
        // 2^63 is exactly representable; anything at or past it overflows
        if (!std::isfinite(d) || std::trunc(d) != d ||
            d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(d);
    }
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        std::int64_t n = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
        if (ec != std::errc() || ptr != s.data() + s.size()) {
            return std::nullopt;
        }
        // Canonical spelling only: rejects "01", "-0", "+1"
        if (std::to_string(n) != s) {
            return std::nullopt;
        }
        return n;
    }
    return std::nullopt;
}

std::optional<double> parseFloat(const Json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        static const std::regex numeric(
            R"(^\s*[+-]?([0-9]+(\.[0-9]*)?|\.[0-9]+)([eE][+-]?[0-9]+)?\s*$)");
        const auto& s = value.get_ref<const std::string&>();
        if (!std::regex_match(s, numeric)) {
            return std::nullopt;
        }
        double d = std::strtod(s.c_str(), nullptr);
        if (!std::isfinite(d)) {
            return std::nullopt;
        }
        return d;
    }
    return std::nullopt;
}

std::optional<bool> parseBoolean(const Json& value) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number()) {
        auto d = value.get<double>();
        if (d == 1.0) return true;
        if (d == 0.0) return false;
        return std::nullopt;
    }
    if (value.is_string()) {
        auto s = detail::normalize(value.get_ref<const std::string&>());
        if (s == "1" || s == "true" || s == "on" || s == "yes") return true;
        if (s == "0" || s == "false" || s == "off" || s == "no" || s.empty()) return false;
    }
    return std::nullopt;
}

bool truthy(const Value& value) {
    if (value.isNull()) return false;
    if (value.isHostObject()) return true;

    const auto* data = value.data();
    if (!data) {
        return !value.elements().empty();
    }
    if (data->is_boolean()) return data->get<bool>();
    if (data->is_number()) return data->get<double>() != 0.0;
    if (data->is_string()) {
        const auto& s = data->get_ref<const std::string&>();
        return !(s.empty() || s == "0");
    }
    return !data->empty();
}

// ═══════════════════════════════════════════
//  Scalars
// ═══════════════════════════════════════════

std::string toText(const Value& value, const Type& type) {
    const auto* data = value.data();
    if (data) {
        if (data->is_string()) return data->get<std::string>();
        if (data->is_boolean()) return data->get<bool>() ? "true" : "false";
        if (data->is_number_unsigned()) return std::to_string(data->get<std::uint64_t>());
        if (data->is_number_integer()) return std::to_string(data->get<std::int64_t>());
        if (data->is_number_float()) return detail::formatNumber(data->get<double>());
    }
    throw Error(ErrorCategory::Coercion,
                "Value is not a valid " + type.name() + ": " + value.dump());
}

Json coerceScalar(const Value& value, const Type& type) {
    if (value.isNull()) {
        return nullptr;
    }

    const auto* data = value.data();

    switch (type.scalarKind()) {
        case ScalarKind::String:
        case ScalarKind::ID:
            return toText(value, type);

        case ScalarKind::Int: {
            auto parsed = data ? parseInt(*data) : std::nullopt;
            if (!parsed) {
                throw Error(ErrorCategory::Coercion, "Value is not a valid Int: " + value.dump());
            }
            return *parsed;
        }

        case ScalarKind::Boolean: {
            if (data) {
                if (auto parsed = parseBoolean(*data)) {
                    return *parsed;
                }
            }
            return truthy(value);
        }

        case ScalarKind::Float: {
            auto parsed = data ? parseFloat(*data) : std::nullopt;
            if (!parsed) {
                throw Error(ErrorCategory::Coercion, "Value is not a valid Float: " + value.dump());
            }
            return *parsed;
        }

        case ScalarKind::Custom: {
            const auto& serialize = type.serializer();
            if (!serialize) {
                break;
            }
            try {
                return serialize(value);
            } catch (const Error&) {
                throw;
            } catch (const std::exception& e) {
                throw Error(ErrorCategory::Coercion,
                            "Cannot serialize value as " + type.name() + ": " + e.what());
            }
        }
    }

    throw Error(ErrorCategory::Coercion, "Unknown scalar type: " + type.name());
}

// ═══════════════════════════════════════════
//  coerceValue
// ═══════════════════════════════════════════

Json coerceValue(const Value& value, const Type& type) {
    switch (type.kind()) {
        case TypeKind::NonNull: {
            auto coerced = coerceValue(value, *type.ofType());
            if (coerced.is_null()) {
                throw Error(ErrorCategory::Coercion,
                            "Cannot return null for non-nullable type " + type.name() + ".");
            }
            return coerced;
        }

        case TypeKind::List: {
            if (value.isNull()) {
                return nullptr;
            }
            // A lone value stands for a one-element list
            auto items = value.isIterable() ? value.elements() : Value::List{value};
            Json coerced = Json::array();
            for (const auto& item : items) {
                coerced.push_back(coerceValue(item, *type.ofType()));
            }
            return coerced;
        }

        case TypeKind::Scalar:
            return coerceScalar(value, type);

        case TypeKind::Object: {
            if (value.isNull()) {
                return nullptr;
            }
            if (value.isComposite()) {
                return value.toJson();
            }
            throw Error(ErrorCategory::Coercion,
                        "Value cannot be coerced to object type " + type.name() + ": " + value.dump());
        }
    }

    throw Error(ErrorCategory::Coercion,
                "Unsupported type kind for coercion: " + std::string(toString(type.kind())));
}

} // namespace miniql::coercion
