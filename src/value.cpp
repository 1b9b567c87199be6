#include "adaptr/value/value.hpp"

#include <cmath>
#include <functional>
#include <sstream>

namespace adaptr {

// ============================================================================
// Object
// ============================================================================

Object::Object(std::initializer_list<Entry> entries) {
    for (const auto& [key, value] : entries) {
        insert_or_assign(key, value);
    }
}

void Object::insert_or_assign(std::string key, Value value) {
    if (Value* existing = find(key)) {
        *existing = std::move(value);
        return;
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

const Value* Object::find(std::string_view key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

Value* Object::find(std::string_view key) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

bool Object::operator==(const Object& other) const {
    return entries_ == other.entries_;
}

// ============================================================================
// Value
// ============================================================================

bool Value::operator==(const Value& other) const {
    if (kind() != other.kind()) {
        return false;
    }
    if (is_float()) {
        double a = std::get<double>(data_);
        double b = std::get<double>(other.data_);
        return a == b || (std::isnan(a) && std::isnan(b));
    }
    return data_ == other.data_;
}

namespace {

void write_debug(std::ostringstream& out, const Value& value) {
    switch (value.kind()) {
        case ValueKind::Null:
            out << "null";
            break;
        case ValueKind::Bool:
            out << (value.as_bool() ? "true" : "false");
            break;
        case ValueKind::Int:
            out << value.as_int();
            break;
        case ValueKind::Float:
            out << value.as_float();
            break;
        case ValueKind::Text:
            out << '"' << value.as_text() << '"';
            break;
        case ValueKind::Bytes:
            out << "b<" << value.as_bytes().size() << ">";
            break;
        case ValueKind::Array: {
            out << '[';
            bool first = true;
            for (const auto& item : value.as_array()) {
                if (!first) out << ',';
                first = false;
                write_debug(out, item);
            }
            out << ']';
            break;
        }
        case ValueKind::Object: {
            out << '{';
            bool first = true;
            for (const auto& [key, item] : value.as_object()) {
                if (!first) out << ',';
                first = false;
                out << '"' << key << "\":";
                write_debug(out, item);
            }
            out << '}';
            break;
        }
    }
}

} // namespace

std::string Value::to_debug_string() const {
    std::ostringstream out;
    write_debug(out, *this);
    return out.str();
}

std::size_t hash_value(const Value& value) {
    std::size_t seed = static_cast<std::size_t>(value.kind());
    switch (value.kind()) {
        case ValueKind::Null:
            break;
        case ValueKind::Bool:
            hash_combine(seed, std::hash<bool>{}(value.as_bool()));
            break;
        case ValueKind::Int:
            hash_combine(seed, std::hash<std::int64_t>{}(value.as_int()));
            break;
        case ValueKind::Float: {
            double d = value.as_float();
            // all NaNs compare equal, so they must hash equal
            hash_combine(seed, std::isnan(d) ? 0x7ff8u : std::hash<double>{}(d == 0.0 ? 0.0 : d));
            break;
        }
        case ValueKind::Text:
            hash_combine(seed, std::hash<std::string>{}(value.as_text()));
            break;
        case ValueKind::Bytes:
            for (std::byte b : value.as_bytes()) {
                hash_combine(seed, static_cast<std::size_t>(b));
            }
            break;
        case ValueKind::Array:
            for (const auto& item : value.as_array()) {
                hash_combine(seed, hash_value(item));
            }
            break;
        case ValueKind::Object:
            for (const auto& [key, item] : value.as_object()) {
                hash_combine(seed, std::hash<std::string>{}(key));
                hash_combine(seed, hash_value(item));
            }
            break;
    }
    return seed;
}

} // namespace adaptr
