// ═══════════════════════════════════════════════════════════════════
//  value.cpp — Value inspection, default lookup and serialization
// ═══════════════════════════════════════════════════════════════════

#include "miniql/value.h"

namespace miniql {

namespace detail {

// ── Host object backed by a single lookup callable ──
class LookupObject : public HostObject {
public:
    explicit LookupObject(Value::Lookup lookup) : lookup_(std::move(lookup)) {}

    std::optional<Value> property(const std::string& name) const override {
        return lookup_ ? lookup_(name) : std::nullopt;
    }

private:
    Value::Lookup lookup_;
};

} // namespace detail

Value::Value(const Json& j) {
    if (j.is_null()) {
        data_ = nullptr;
    } else {
        data_.emplace<Json>(j);
    }
}

Value::Value(Json&& j) {
    if (j.is_null()) {
        data_ = nullptr;
    } else {
        data_.emplace<Json>(std::move(j));
    }
}

Value::Value(std::shared_ptr<const HostObject> object) {
    if (object) {
        data_ = std::move(object);
    } else {
        data_ = nullptr;
    }
}

Value Value::fromLookup(Lookup lookup) {
    return Value(std::make_shared<const detail::LookupObject>(std::move(lookup)));
}

bool Value::isIterable() const {
    if (std::holds_alternative<List>(data_)) return true;
    const auto* json = data();
    return json && json->is_array();
}

bool Value::isComposite() const {
    if (isIterable() || isHostObject()) return true;
    const auto* json = data();
    return json && json->is_object();
}

const HostObject* Value::hostObject() const {
    const auto* object = std::get_if<std::shared_ptr<const HostObject>>(&data_);
    return object ? object->get() : nullptr;
}

Value::List Value::elements() const {
    if (const auto* list = std::get_if<List>(&data_)) {
        return *list;
    }
    List items;
    const auto* json = data();
    if (json && json->is_array()) {
        items.reserve(json->size());
        for (const auto& item : *json) {
            items.emplace_back(item);
        }
    }
    return items;
}

std::optional<Value> Value::lookup(const std::string& name) const {
    if (const auto* json = data()) {
        if (json->is_object()) {
            auto it = json->find(name);
            if (it != json->end()) {
                return Value(*it);
            }
        }
        return std::nullopt;
    }

    if (const auto* object = hostObject()) {
        if (auto value = object->property(name)) {
            return value;
        }
        return object->invoke(name);
    }

    return std::nullopt;
}

Json Value::toJson() const {
    if (const auto* json = data()) {
        return *json;
    }
    if (const auto* list = std::get_if<List>(&data_)) {
        Json arr = Json::array();
        for (const auto& item : *list) {
            arr.push_back(item.toJson());
        }
        return arr;
    }
    if (const auto* object = hostObject()) {
        return object->toJson();
    }
    return nullptr;
}

// ── HostObject defaults ──

std::optional<Value> HostObject::property(const std::string&) const {
    return std::nullopt;
}

std::optional<Value> HostObject::invoke(const std::string&) const {
    return std::nullopt;
}

Json HostObject::toJson() const {
    return Json::object();
}

} // namespace miniql
