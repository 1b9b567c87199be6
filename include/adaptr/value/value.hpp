/**
 * @file value.hpp
 * @brief Intermediate Value Model - the canonical, format-agnostic value tree
 *
 * Every object is converted into a Value before a codec sees it, and every
 * codec produces a Value before it is converted back into an object. The model
 * is closed: null, bool, 64-bit signed integer, double, UTF-8 text, raw bytes,
 * ordered array, and an insertion-ordered text-keyed object.
 *
 * Equality is strict and structural (object entries compare in order, NaN
 * equals NaN so that round trips of NaN-carrying values hold).
 *
 * Example:
 * @code
 * using adaptr::Value;
 * Value point = Value::object({{"x", 1}, {"y", 2}});
 * Value list  = Value::array({point, Value{}});
 * assert(list.as_array()[0].as_object().find("x")->as_int() == 1);
 * @endcode
 */

#pragma once

#include "adaptr/errors.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace adaptr {

class Value;

using Bytes = std::vector<std::byte>;
using Array = std::vector<Value>;

enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Int,
    Float,
    Text,
    Bytes,
    Array,
    Object
};

constexpr const char* to_string(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null:   return "null";
        case ValueKind::Bool:   return "bool";
        case ValueKind::Int:    return "int";
        case ValueKind::Float:  return "float";
        case ValueKind::Text:   return "text";
        case ValueKind::Bytes:  return "bytes";
        case ValueKind::Array:  return "array";
        case ValueKind::Object: return "object";
        default:                return "unknown";
    }
}

/**
 * @brief Text-keyed mapping that preserves insertion order
 *
 * Lookup is linear; objects produced from records are small and the order is
 * part of the value.
 */
class Object {
public:
    using Entry = std::pair<std::string, Value>;
    using Storage = std::vector<Entry>;

    Object() = default;
    Object(std::initializer_list<Entry> entries);

    /// Inserts at the end, or overwrites in place when the key already exists
    void insert_or_assign(std::string key, Value value);

    [[nodiscard]] const Value* find(std::string_view key) const;
    [[nodiscard]] Value* find(std::string_view key);
    [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    Storage::const_iterator begin() const noexcept { return entries_.begin(); }
    Storage::const_iterator end() const noexcept { return entries_.end(); }
    Storage::iterator begin() noexcept { return entries_.begin(); }
    Storage::iterator end() noexcept { return entries_.end(); }

    bool operator==(const Object& other) const;

private:
    Storage entries_;
};

class Value {
public:
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string, Bytes, Array, Object>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : data_(b) {}

    template<std::integral I>
        requires (!std::same_as<I, bool>)
    Value(I i) : data_(checked_int(i)) {}

    template<std::floating_point F>
    Value(F f) : data_(static_cast<double>(f)) {}

    Value(std::string s) : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(Bytes b) : data_(std::move(b)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(Object o) : data_(std::move(o)) {}

    static Value array(std::initializer_list<Value> items) { return Value(Array(items)); }
    static Value object(std::initializer_list<Object::Entry> entries) { return Value(Object(entries)); }

    [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(data_.index()); }

    [[nodiscard]] bool is_null() const noexcept { return kind() == ValueKind::Null; }
    [[nodiscard]] bool is_bool() const noexcept { return kind() == ValueKind::Bool; }
    [[nodiscard]] bool is_int() const noexcept { return kind() == ValueKind::Int; }
    [[nodiscard]] bool is_float() const noexcept { return kind() == ValueKind::Float; }
    [[nodiscard]] bool is_text() const noexcept { return kind() == ValueKind::Text; }
    [[nodiscard]] bool is_bytes() const noexcept { return kind() == ValueKind::Bytes; }
    [[nodiscard]] bool is_array() const noexcept { return kind() == ValueKind::Array; }
    [[nodiscard]] bool is_object() const noexcept { return kind() == ValueKind::Object; }

    // Typed accessors throw SchemaMismatchError on a kind mismatch
    [[nodiscard]] bool as_bool() const { return get<bool>(ValueKind::Bool); }
    [[nodiscard]] std::int64_t as_int() const { return get<std::int64_t>(ValueKind::Int); }
    [[nodiscard]] double as_float() const { return get<double>(ValueKind::Float); }
    [[nodiscard]] const std::string& as_text() const { return get<std::string>(ValueKind::Text); }
    [[nodiscard]] const Bytes& as_bytes() const { return get<Bytes>(ValueKind::Bytes); }
    [[nodiscard]] const Array& as_array() const { return get<Array>(ValueKind::Array); }
    [[nodiscard]] Array& as_array() { return get<Array>(ValueKind::Array); }
    [[nodiscard]] const Object& as_object() const { return get<Object>(ValueKind::Object); }
    [[nodiscard]] Object& as_object() { return get<Object>(ValueKind::Object); }

    [[nodiscard]] const Storage& storage() const noexcept { return data_; }

    bool operator==(const Value& other) const;

    /// Compact JSON-like rendering for diagnostics
    [[nodiscard]] std::string to_debug_string() const;

private:
    template<std::integral I>
    static std::int64_t checked_int(I i) {
        if constexpr (std::is_unsigned_v<I> && sizeof(I) >= sizeof(std::int64_t)) {
            if (i > static_cast<I>(std::numeric_limits<std::int64_t>::max())) {
                throw RangeError("unsigned value " + std::to_string(i) + " exceeds the 64-bit signed integer range");
            }
        }
        return static_cast<std::int64_t>(i);
    }

    template<typename T>
    const T& get(ValueKind expected) const {
        if (const T* p = std::get_if<T>(&data_)) {
            return *p;
        }
        throw SchemaMismatchError(std::string("expected ") + to_string(expected) + ", got " + to_string(kind()));
    }

    template<typename T>
    T& get(ValueKind expected) {
        if (T* p = std::get_if<T>(&data_)) {
            return *p;
        }
        throw SchemaMismatchError(std::string("expected ") + to_string(expected) + ", got " + to_string(kind()));
    }

    Storage data_;
};

/// Structural hash consistent with operator==
[[nodiscard]] std::size_t hash_value(const Value& value);

/// True when `value` fits an integer of the given width and signedness
inline bool int_fits(std::int64_t value, std::uint8_t bits, bool is_signed) {
    if (bits >= 64) {
        return is_signed || value >= 0;
    }
    if (is_signed) {
        const std::int64_t limit = std::int64_t{1} << (bits - 1);
        return value >= -limit && value < limit;
    }
    return value >= 0 && value < (std::int64_t{1} << bits);
}

inline void hash_combine(std::size_t& seed, std::size_t h) {
    seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // namespace adaptr

template<>
struct std::hash<adaptr::Value> {
    std::size_t operator()(const adaptr::Value& v) const { return adaptr::hash_value(v); }
};
