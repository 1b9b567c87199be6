#include "adaptr/schema/schema_export.hpp"

#include "adaptr/value/generic_value.hpp"

#include <rfl/json.hpp>

namespace adaptr {

namespace {

using GenericObject = rfl::Generic::Object;
using GenericArray = rfl::Generic::Array;

rfl::Generic text(const std::string& s) {
    return rfl::Generic(s);
}

std::string primitive_name(const Schema& schema) {
    switch (schema.kind) {
        case SchemaKind::Null:  return "null";
        case SchemaKind::Bool:  return "boolean";
        case SchemaKind::Int:   return schema.bits > 32 || (schema.bits == 32 && !schema.is_signed) ? "long" : "int";
        case SchemaKind::Float: return schema.bits == 32 ? "float" : "double";
        case SchemaKind::Text:  return "string";
        case SchemaKind::Bytes: return "bytes";
        default:                return to_string(schema.kind);
    }
}

bool plain_width(const Schema& schema) {
    if (schema.kind != SchemaKind::Int) {
        return true;
    }
    return schema.is_signed && (schema.bits == 32 || schema.bits == 64);
}

rfl::Generic non_null(const Schema& schema) {
    switch (schema.kind) {
        case SchemaKind::Enum: {
            GenericObject obj;
            obj["type"] = text("enum");
            obj["name"] = text(schema.name);
            GenericArray symbols;
            for (const auto& s : schema.symbols) {
                symbols.push_back(text(s));
            }
            obj["symbols"] = rfl::Generic(std::move(symbols));
            return rfl::Generic(std::move(obj));
        }
        case SchemaKind::Array: {
            GenericObject obj;
            obj["type"] = text("array");
            obj["items"] = to_generic(*schema.items);
            return rfl::Generic(std::move(obj));
        }
        case SchemaKind::Map: {
            GenericObject obj;
            obj["type"] = text("map");
            obj["values"] = to_generic(*schema.items);
            return rfl::Generic(std::move(obj));
        }
        case SchemaKind::Record: {
            GenericObject obj;
            obj["type"] = text("record");
            obj["name"] = text(schema.name);
            GenericArray fields;
            for (const auto& field : schema.fields) {
                GenericObject f;
                f["name"] = text(field.name);
                f["type"] = to_generic(*field.schema);
                if (field.default_value) {
                    f["default"] = to_generic(*field.default_value);
                }
                fields.push_back(rfl::Generic(std::move(f)));
            }
            obj["fields"] = rfl::Generic(std::move(fields));
            return rfl::Generic(std::move(obj));
        }
        case SchemaKind::Union: {
            GenericArray branches;
            for (const auto& branch : schema.branches) {
                branches.push_back(to_generic(*branch));
            }
            return rfl::Generic(std::move(branches));
        }
        default:
            break;
    }

    if (schema.logical == LogicalType::None && plain_width(schema)) {
        return text(primitive_name(schema));
    }
    GenericObject obj;
    obj["type"] = text(primitive_name(schema));
    if (!plain_width(schema)) {
        obj["bits"] = rfl::Generic(static_cast<std::int64_t>(schema.bits));
        obj["signed"] = rfl::Generic(schema.is_signed);
    }
    if (schema.logical != LogicalType::None) {
        obj["logicalType"] = text(to_string(schema.logical));
    }
    return rfl::Generic(std::move(obj));
}

} // namespace

rfl::Generic to_generic(const Schema& schema) {
    auto inner = non_null(schema);
    if (!schema.nullable || schema.kind == SchemaKind::Null) {
        return inner;
    }
    GenericArray branches{text("null")};
    if (schema.kind == SchemaKind::Union) {
        // a nullable union is one flat Avro union
        for (const auto& branch : schema.branches) {
            branches.push_back(to_generic(*branch));
        }
    } else {
        branches.push_back(std::move(inner));
    }
    return rfl::Generic(std::move(branches));
}

std::string to_json(const Schema& schema) {
    return rfl::json::write(to_generic(schema));
}

} // namespace adaptr
