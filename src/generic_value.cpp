#include "adaptr/value/generic_value.hpp"

#include "adaptr/codec/base64.hpp"

#include <cmath>
#include <type_traits>

namespace adaptr {

rfl::Generic to_generic(const Value& value) {
    switch (value.kind()) {
        case ValueKind::Null:
            return rfl::Generic(std::nullopt);
        case ValueKind::Bool:
            return rfl::Generic(value.as_bool());
        case ValueKind::Int:
            return rfl::Generic(value.as_int());
        case ValueKind::Float: {
            double d = value.as_float();
            if (!std::isfinite(d)) {
                throw RangeError("non-finite float " + value.to_debug_string() + " cannot be written as JSON");
            }
            return rfl::Generic(d);
        }
        case ValueKind::Text:
            return rfl::Generic(value.as_text());
        case ValueKind::Bytes:
            return rfl::Generic(base64_encode(value.as_bytes()));
        case ValueKind::Array: {
            rfl::Generic::Array items;
            items.reserve(value.as_array().size());
            for (const auto& item : value.as_array()) {
                items.push_back(to_generic(item));
            }
            return rfl::Generic(std::move(items));
        }
        case ValueKind::Object: {
            rfl::Generic::Object entries;
            for (const auto& [key, item] : value.as_object()) {
                entries[key] = to_generic(item);
            }
            return rfl::Generic(std::move(entries));
        }
    }
    return rfl::Generic(std::nullopt);
}

Value from_generic(const rfl::Generic& generic) {
    return std::visit([](const auto& v) -> Value {
        using V = std::remove_cvref_t<decltype(v)>;
        if constexpr (std::is_same_v<V, bool>) {
            return Value(v);
        } else if constexpr (std::is_same_v<V, std::int64_t>) {
            return Value(v);
        } else if constexpr (std::is_same_v<V, double>) {
            return Value(v);
        } else if constexpr (std::is_same_v<V, std::string>) {
            return Value(v);
        } else if constexpr (std::is_same_v<V, rfl::Generic::Array>) {
            Array items;
            items.reserve(v.size());
            for (const auto& item : v) {
                items.push_back(from_generic(item));
            }
            return Value(std::move(items));
        } else if constexpr (std::is_same_v<V, rfl::Generic::Object>) {
            Object entries;
            for (const auto& [key, item] : v) {
                entries.insert_or_assign(key, from_generic(item));
            }
            return Value(std::move(entries));
        } else {
            return Value{};
        }
    }, generic.variant());
}

} // namespace adaptr
