#include "adaptr/codec/binary_codec.hpp"

#include "adaptr/codec/byte_buffer.hpp"

#include <algorithm>
#include <cmath>

namespace adaptr {

namespace {

[[noreturn]] void mismatch(const Schema& schema, const Value& value) {
    throw SchemaMismatchError("cannot encode " + std::string(to_string(value.kind())) + " " +
                              value.to_debug_string() + " as " + schema.to_string());
}

Value missing_field(const Schema& record, const SchemaField& field) {
    if (field.default_value) {
        return *field.default_value;
    }
    if (field.schema->nullable) {
        return Value{};
    }
    throw SchemaMismatchError("payload lacks required field '" + field.name + "' of " + record.name);
}

void write_value(ByteWriter& out, const Value& value, const Schema& schema);

void write_non_null(ByteWriter& out, const Value& value, const Schema& schema) {
    switch (schema.kind) {
        case SchemaKind::Null:
            if (!value.is_null()) mismatch(schema, value);
            return;
        case SchemaKind::Bool:
            if (!value.is_bool()) mismatch(schema, value);
            out.byte(value.as_bool() ? 1 : 0);
            return;
        case SchemaKind::Int:
            if (!value.is_int()) mismatch(schema, value);
            if (!int_fits(value.as_int(), schema.bits, schema.is_signed)) {
                throw RangeError(value.to_debug_string() + " does not fit " + schema.to_string());
            }
            out.signed_varint(value.as_int());
            return;
        case SchemaKind::Float: {
            double d = 0.0;
            if (value.is_float()) {
                d = value.as_float();
            } else if (value.is_int()) {
                d = static_cast<double>(value.as_int());
            } else {
                mismatch(schema, value);
            }
            if (schema.bits == 32) {
                float f = static_cast<float>(d);
                if (!std::isnan(d) && static_cast<double>(f) != d) {
                    throw RangeError(value.to_debug_string() + " is not exactly representable as float32");
                }
                out.float32(f);
            } else {
                out.float64(d);
            }
            return;
        }
        case SchemaKind::Text:
            if (!value.is_text()) mismatch(schema, value);
            out.text(value.as_text());
            return;
        case SchemaKind::Bytes:
            if (!value.is_bytes()) mismatch(schema, value);
            out.bytes(value.as_bytes());
            return;
        case SchemaKind::Enum: {
            if (!value.is_text()) mismatch(schema, value);
            auto it = std::find(schema.symbols.begin(), schema.symbols.end(), value.as_text());
            if (it == schema.symbols.end()) mismatch(schema, value);
            out.varint(static_cast<std::uint64_t>(it - schema.symbols.begin()));
            return;
        }
        case SchemaKind::Array:
            if (!value.is_array()) mismatch(schema, value);
            out.varint(value.as_array().size());
            for (const auto& item : value.as_array()) {
                write_value(out, item, *schema.items);
            }
            return;
        case SchemaKind::Map:
            if (!value.is_object()) mismatch(schema, value);
            out.varint(value.as_object().size());
            for (const auto& [key, item] : value.as_object()) {
                out.text(key);
                write_value(out, item, *schema.items);
            }
            return;
        case SchemaKind::Record: {
            if (!value.is_object()) mismatch(schema, value);
            const auto& provided = value.as_object();
            out.varint(schema.fields.size());
            for (const auto& field : schema.fields) {
                if (const Value* item = provided.find(field.name)) {
                    write_value(out, *item, *field.schema);
                } else if (field.default_value) {
                    write_value(out, *field.default_value, *field.schema);
                } else if (field.schema->nullable) {
                    write_value(out, Value{}, *field.schema);
                } else {
                    throw SchemaMismatchError("missing required field '" + field.name + "' of " + schema.name);
                }
            }
            return;
        }
        case SchemaKind::Union: {
            auto branch = best_branch(schema, value);
            if (!branch) mismatch(schema, value);
            out.varint(*branch);
            write_value(out, value, *schema.branches[*branch]);
            return;
        }
    }
}

void write_value(ByteWriter& out, const Value& value, const Schema& schema) {
    if (schema.nullable && schema.kind != SchemaKind::Null) {
        if (value.is_null()) {
            out.byte(0);
            return;
        }
        out.byte(1);
    }
    write_non_null(out, value, schema);
}

Value read_value(ByteReader& in, const Schema& schema);

Value read_non_null(ByteReader& in, const Schema& schema) {
    switch (schema.kind) {
        case SchemaKind::Null:
            return Value{};
        case SchemaKind::Bool: {
            std::uint8_t b = in.byte();
            if (b > 1) {
                throw DecodeError("invalid bool byte " + std::to_string(b));
            }
            return Value(b == 1);
        }
        case SchemaKind::Int: {
            std::int64_t v = in.signed_varint();
            if (!int_fits(v, schema.bits, schema.is_signed)) {
                throw RangeError(std::to_string(v) + " does not fit " + schema.to_string());
            }
            return Value(v);
        }
        case SchemaKind::Float:
            return schema.bits == 32 ? Value(static_cast<double>(in.float32())) : Value(in.float64());
        case SchemaKind::Text:
            return Value(in.text());
        case SchemaKind::Bytes:
            return Value(in.bytes());
        case SchemaKind::Enum: {
            std::uint64_t index = in.varint();
            if (index >= schema.symbols.size()) {
                throw DecodeError("enum index " + std::to_string(index) + " out of range for " + schema.name);
            }
            return Value(schema.symbols[index]);
        }
        case SchemaKind::Array: {
            // items take at least one byte each, except plain null items
            const bool empty_items = schema.items->kind == SchemaKind::Null;
            std::size_t count = 0;
            if (empty_items) {
                std::uint64_t n = in.varint();
                if (n > MAX_NULL_ITEMS) {
                    throw DecodeError("array of " + std::to_string(n) + " null items exceeds the limit of " +
                                      std::to_string(MAX_NULL_ITEMS));
                }
                count = static_cast<std::size_t>(n);
            } else {
                count = in.length();
            }
            Array items;
            items.reserve(empty_items ? 0 : count);
            for (std::size_t i = 0; i < count; ++i) {
                items.push_back(read_value(in, *schema.items));
            }
            return Value(std::move(items));
        }
        case SchemaKind::Map: {
            std::size_t count = in.length();
            Object entries;
            for (std::size_t i = 0; i < count; ++i) {
                std::string key = in.text();
                entries.insert_or_assign(std::move(key), read_value(in, *schema.items));
            }
            return Value(std::move(entries));
        }
        case SchemaKind::Record: {
            std::uint64_t count = in.varint();
            if (count > schema.fields.size()) {
                throw DecodeError("record " + schema.name + " has " + std::to_string(schema.fields.size()) +
                                  " fields, payload has " + std::to_string(count));
            }
            Object entries;
            for (std::size_t i = 0; i < schema.fields.size(); ++i) {
                const auto& field = schema.fields[i];
                entries.insert_or_assign(field.name, i < count ? read_value(in, *field.schema)
                                                               : missing_field(schema, field));
            }
            return Value(std::move(entries));
        }
        case SchemaKind::Union: {
            std::uint64_t index = in.varint();
            if (index >= schema.branches.size()) {
                throw DecodeError("union branch " + std::to_string(index) + " out of range for " + schema.to_string());
            }
            return read_value(in, *schema.branches[index]);
        }
    }
    throw DecodeError("unknown schema node");
}

Value read_value(ByteReader& in, const Schema& schema) {
    if (schema.nullable && schema.kind != SchemaKind::Null) {
        std::uint8_t flag = in.byte();
        if (flag == 0) {
            return Value{};
        }
        if (flag != 1) {
            throw DecodeError("invalid null flag " + std::to_string(flag) + " at offset " +
                              std::to_string(in.offset() - 1));
        }
    }
    return read_non_null(in, schema);
}

/// Reshapes a value read under the writer's schema into the reader's
Value conform(const Value& value, const Schema& reader) {
    if (value.is_null()) {
        if (!reader.nullable && reader.kind != SchemaKind::Null) mismatch(reader, value);
        return Value{};
    }
    switch (reader.kind) {
        case SchemaKind::Record: {
            if (!value.is_object()) mismatch(reader, value);
            const auto& written = value.as_object();
            Object entries;
            for (const auto& field : reader.fields) {
                const Value* found = written.find(field.name);
                entries.insert_or_assign(field.name, found ? conform(*found, *field.schema)
                                                           : missing_field(reader, field));
            }
            return Value(std::move(entries));
        }
        case SchemaKind::Array: {
            if (!value.is_array()) mismatch(reader, value);
            Array items;
            items.reserve(value.as_array().size());
            for (const auto& item : value.as_array()) {
                items.push_back(conform(item, *reader.items));
            }
            return Value(std::move(items));
        }
        case SchemaKind::Map: {
            if (!value.is_object()) mismatch(reader, value);
            Object entries;
            for (const auto& [key, item] : value.as_object()) {
                entries.insert_or_assign(key, conform(item, *reader.items));
            }
            return Value(std::move(entries));
        }
        case SchemaKind::Union: {
            auto branch = best_branch(reader, value);
            if (!branch) mismatch(reader, value);
            return conform(value, *reader.branches[*branch]);
        }
        case SchemaKind::Int:
            if (value.is_int() && !int_fits(value.as_int(), reader.bits, reader.is_signed)) {
                throw RangeError(value.to_debug_string() + " does not fit " + reader.to_string());
            }
            break;
        case SchemaKind::Float:
            // int64 widened to double
            if (value.is_int()) {
                return Value(static_cast<double>(value.as_int()));
            }
            break;
        default:
            break;
    }
    if (match_score(reader, value) < 1.0) mismatch(reader, value);
    return value;
}

} // namespace

Bytes BinaryCodec::encode(const Value& value, const Schema* schema) const {
    require_schema(schema);
    ByteWriter out;
    write_value(out, value, *schema);
    return out.take();
}

Value BinaryCodec::decode(std::span<const std::byte> data, const Schema* schema) const {
    require_schema(schema);
    ByteReader in(data);
    Value value = read_value(in, *schema);
    if (in.remaining() != 0) {
        throw DecodeError(std::to_string(in.remaining()) + " trailing bytes after " + schema->to_string());
    }
    return value;
}

Value BinaryCodec::decode(std::span<const std::byte> data, const Schema* schema, const Schema* writer_schema) const {
    if (writer_schema == nullptr) {
        return decode(data, schema);
    }
    require_schema(schema);
    ByteReader in(data);
    Value written = read_value(in, *writer_schema);
    if (in.remaining() != 0) {
        throw DecodeError(std::to_string(in.remaining()) + " trailing bytes after " + writer_schema->to_string());
    }
    return conform(written, *schema);
}

} // namespace adaptr
