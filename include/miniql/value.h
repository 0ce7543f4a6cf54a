#pragma once
// ═══════════════════════════════════════════════════════════════════
//  miniql/value.h — Raw values exchanged between host and executor
// ═══════════════════════════════════════════════════════════════════
//  A Value is what a resolver returns and what the executor walks:
//  null, plain JSON data, a host object that answers field lookups,
//  or an ordered list of further Values.
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace miniql {

// Result trees keep keys in the order the fields were selected.
using Json = nlohmann::ordered_json;

// ─────────────────────────────────────────────
//  Macro: MINIQL_SERIALIZE
//  Makes a host struct usable as JSON data.
//
//  Usage:
//    struct Book {
//        std::string title;
//        int year;
//        MINIQL_SERIALIZE(Book, title, year)
//    };
// ─────────────────────────────────────────────
#define MINIQL_SERIALIZE(Type, ...) \
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Type, __VA_ARGS__)

// ─────────────────────────────────────────────
//  Concept: JsonSerializable
//  Any type T that nlohmann::json can construct from.
// ─────────────────────────────────────────────
template <typename T>
concept JsonSerializable = requires(T t) {
    { nlohmann::json(t) } -> std::convertible_to<nlohmann::json>;
};

class HostObject;

// ─────────────────────────────────────────────
//  class Value
// ─────────────────────────────────────────────
class Value {
public:
    using List = std::vector<Value>;
    using Lookup = std::function<std::optional<Value>(const std::string& name)>;

    Value() : data_(nullptr) {}
    Value(std::nullptr_t) : data_(nullptr) {}
    Value(const Json& j);
    Value(Json&& j);
    Value(List items) : data_(std::in_place_type<List>, std::move(items)) {}
    Value(std::shared_ptr<const HostObject> object);

    // Derived host objects, const or not
    template <typename T>
        requires std::derived_from<T, HostObject>
    Value(std::shared_ptr<T> object)
        : Value(std::shared_ptr<const HostObject>(std::move(object))) {}

    // Construct from any serializable type (strings, numbers, MINIQL_SERIALIZE structs)
    template <JsonSerializable T>
        requires (!std::is_same_v<std::decay_t<T>, Json>)
    Value(const T& value) : Value(Json(nlohmann::json(value))) {}

    // ── Wrap a lookup callable as a host object ──
    static Value fromLookup(Lookup lookup);

    // ── Inspection ──
    bool isNull() const { return std::holds_alternative<std::nullptr_t>(data_); }
    bool isData() const { return std::holds_alternative<Json>(data_); }
    bool isHostObject() const {
        return std::holds_alternative<std::shared_ptr<const HostObject>>(data_);
    }

    // JSON arrays and Value lists can be iterated
    bool isIterable() const;

    // Objects, arrays, lists and host objects
    bool isComposite() const;

    // ── Access ──
    const Json* data() const { return std::get_if<Json>(&data_); }
    const HostObject* hostObject() const;
    List elements() const;

    // ── Default field resolution ──
    // Keyed lookup on JSON objects, then the host object's property,
    // then its zero-argument accessor. nullopt when nothing matches.
    std::optional<Value> lookup(const std::string& name) const;

    // ── Serialization ──
    Json toJson() const;
    std::string dump() const { return toJson().dump(); }

private:
    std::variant<std::nullptr_t, Json, List, std::shared_ptr<const HostObject>> data_;
};

// ─────────────────────────────────────────────
//  class HostObject
//  Host-side value exposing its fields to the executor.
//  Override what the host type actually has; the defaults
//  report "no such member".
// ─────────────────────────────────────────────
class HostObject {
public:
    virtual ~HostObject() = default;

    // ── Data member named `name` ──
    virtual std::optional<Value> property(const std::string& name) const;

    // ── Zero-argument accessor named `name` ──
    virtual std::optional<Value> invoke(const std::string& name) const;

    // ── Plain mapping used when the object is returned without a selection ──
    virtual Json toJson() const;
};

} // namespace miniql
