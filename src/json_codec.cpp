#include "adaptr/codec/json_codec.hpp"

#include "adaptr/codec/base64.hpp"
#include "adaptr/value/generic_value.hpp"

#include <rfl/json.hpp>

#include <algorithm>
#include <stdexcept>

namespace adaptr {

namespace {

[[noreturn]] void mismatch(const Schema& schema, const Value& value) {
    throw SchemaMismatchError("expected " + schema.to_string() + ", got " + std::string(to_string(value.kind())) +
                              " " + value.to_debug_string());
}

Value parse_document(std::string_view text) {
    rfl::Generic generic;
    try {
        generic = rfl::json::read<rfl::Generic>(std::string(text)).value();
    } catch (const std::exception& e) {
        throw DecodeError(std::string("invalid JSON: ") + e.what());
    }
    return from_generic(generic);
}

Value coerce_non_null(const Value& value, const Schema& schema) {
    switch (schema.kind) {
        case SchemaKind::Null:
            mismatch(schema, value);
        case SchemaKind::Bool:
            if (!value.is_bool()) mismatch(schema, value);
            return value;
        case SchemaKind::Int:
            if (!value.is_int()) mismatch(schema, value);
            if (!int_fits(value.as_int(), schema.bits, schema.is_signed)) {
                throw RangeError(value.to_debug_string() + " does not fit " + schema.to_string());
            }
            return value;
        case SchemaKind::Float:
            if (value.is_float()) {
                return value;
            }
            if (value.is_int()) {
                double d = static_cast<double>(value.as_int());
                // 2^63 is where rounding up leaves the int64 range
                if (d >= 9223372036854775808.0 || static_cast<std::int64_t>(d) != value.as_int()) {
                    throw RangeError(value.to_debug_string() + " is not exactly representable as a float");
                }
                return Value(d);
            }
            mismatch(schema, value);
        case SchemaKind::Text:
            if (!value.is_text()) mismatch(schema, value);
            return value;
        case SchemaKind::Bytes: {
            if (value.is_bytes()) {
                return value;
            }
            if (!value.is_text()) mismatch(schema, value);
            auto decoded = base64_decode(value.as_text());
            if (!decoded) {
                throw SchemaMismatchError("'" + value.as_text() + "' is not valid base64");
            }
            return Value(std::move(*decoded));
        }
        case SchemaKind::Enum:
            if (!value.is_text() ||
                std::find(schema.symbols.begin(), schema.symbols.end(), value.as_text()) == schema.symbols.end()) {
                mismatch(schema, value);
            }
            return value;
        case SchemaKind::Array: {
            if (!value.is_array()) mismatch(schema, value);
            Array items;
            items.reserve(value.as_array().size());
            for (const auto& item : value.as_array()) {
                items.push_back(coerce(item, *schema.items));
            }
            return Value(std::move(items));
        }
        case SchemaKind::Map: {
            if (!value.is_object()) mismatch(schema, value);
            Object entries;
            for (const auto& [key, item] : value.as_object()) {
                entries.insert_or_assign(key, coerce(item, *schema.items));
            }
            return Value(std::move(entries));
        }
        case SchemaKind::Record: {
            if (!value.is_object()) mismatch(schema, value);
            const auto& provided = value.as_object();
            Object entries;
            for (const auto& field : schema.fields) {
                if (const Value* item = provided.find(field.name)) {
                    entries.insert_or_assign(field.name, coerce(*item, *field.schema));
                } else if (field.default_value) {
                    entries.insert_or_assign(field.name, *field.default_value);
                } else if (field.schema->nullable) {
                    entries.insert_or_assign(field.name, Value{});
                } else {
                    throw SchemaMismatchError("missing required field '" + field.name + "' of " + schema.name);
                }
            }
            // unknown keys are left for the record converter to judge
            for (const auto& [key, item] : provided) {
                if (schema.field(key) == nullptr) {
                    entries.insert_or_assign(key, item);
                }
            }
            return Value(std::move(entries));
        }
        case SchemaKind::Union: {
            std::vector<std::pair<double, std::size_t>> ranked;
            for (std::size_t i = 0; i < schema.branches.size(); ++i) {
                double score = match_score(*schema.branches[i], value);
                if (score > 0.0) {
                    ranked.emplace_back(score, i);
                }
            }
            std::stable_sort(ranked.begin(), ranked.end(),
                             [](const auto& a, const auto& b) { return a.first > b.first; });
            for (const auto& [score, index] : ranked) {
                try {
                    return coerce(value, *schema.branches[index]);
                } catch (const SchemaMismatchError&) {
                    // next candidate
                }
            }
            mismatch(schema, value);
        }
    }
    mismatch(schema, value);
}

} // namespace

Value coerce(const Value& value, const Schema& schema) {
    if (value.is_null()) {
        if (schema.nullable || schema.kind == SchemaKind::Null) {
            return value;
        }
        mismatch(schema, value);
    }
    return coerce_non_null(value, schema);
}

Bytes JsonCodec::encode(const Value& value, const Schema*) const {
    return to_bytes(rfl::json::write(to_generic(value)));
}

Value JsonCodec::decode(std::span<const std::byte> data, const Schema* schema) const {
    Value value = parse_document(as_text(data));
    return schema ? coerce(value, *schema) : value;
}

Bytes JsonCodec::encode_many(const std::vector<Value>& values, const Schema*) const {
    std::string text;
    for (const auto& value : values) {
        text += rfl::json::write(to_generic(value));
        text += '\n';
    }
    return to_bytes(text);
}

std::vector<Value> JsonCodec::decode_many(std::span<const std::byte> data, const Schema* schema) const {
    std::vector<Value> values;
    std::string_view text = as_text(data);
    while (!text.empty()) {
        auto end = text.find('\n');
        std::string_view line = text.substr(0, end);
        text = end == std::string_view::npos ? std::string_view{} : text.substr(end + 1);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.find_first_not_of(" \t") == std::string_view::npos) {
            continue;
        }
        Value value = parse_document(line);
        values.push_back(schema ? coerce(value, *schema) : std::move(value));
    }
    return values;
}

} // namespace adaptr
