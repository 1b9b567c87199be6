/**
 * @file schema.hpp
 * @brief Structural description of a type, as codecs see it
 *
 * A Schema mirrors a TypeDescriptor but keeps only what a codec needs to lay
 * out bytes: node kind, nullability, widths, enum symbols, children and field
 * defaults. Domain scalars appear as their canonical intermediate kind plus a
 * logical annotation:
 *
 * | Descriptor | Schema node (EpochMillis)   | Schema node (Iso8601)    |
 * |------------|-----------------------------|--------------------------|
 * | timestamp  | int64, logical timestamp    | text, logical timestamp  |
 * | date       | int64, logical date         | text, logical date       |
 * | decimal    | text, logical decimal       | text, logical decimal    |
 * | uuid       | text, logical uuid          | text, logical uuid       |
 *
 * Optional(X) is the schema of X with `nullable` set.
 */

#pragma once

#include "adaptr/value/value.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace adaptr {

enum class SchemaKind : std::uint8_t {
    Null,
    Bool,
    Int,
    Float,
    Text,
    Bytes,
    Enum,
    Array,
    Map,
    Record,
    Union
};

constexpr const char* to_string(SchemaKind kind) {
    switch (kind) {
        case SchemaKind::Null:   return "null";
        case SchemaKind::Bool:   return "bool";
        case SchemaKind::Int:    return "int";
        case SchemaKind::Float:  return "float";
        case SchemaKind::Text:   return "text";
        case SchemaKind::Bytes:  return "bytes";
        case SchemaKind::Enum:   return "enum";
        case SchemaKind::Array:  return "array";
        case SchemaKind::Map:    return "map";
        case SchemaKind::Record: return "record";
        case SchemaKind::Union:  return "union";
        default:                 return "unknown";
    }
}

enum class LogicalType : std::uint8_t {
    None,
    Timestamp,
    Date,
    Decimal,
    Uuid
};

constexpr const char* to_string(LogicalType logical) {
    switch (logical) {
        case LogicalType::None:      return "none";
        case LogicalType::Timestamp: return "timestamp-millis";
        case LogicalType::Date:      return "date";
        case LogicalType::Decimal:   return "decimal";
        case LogicalType::Uuid:      return "uuid";
        default:                     return "unknown";
    }
}

struct Schema;
using SchemaPtr = std::shared_ptr<const Schema>;

struct SchemaField {
    std::string name;
    SchemaPtr schema;
    std::optional<Value> default_value;
};

struct Schema {
    SchemaKind kind = SchemaKind::Null;
    LogicalType logical = LogicalType::None;
    bool nullable = false;

    std::string name;                   // record and enum names
    std::uint8_t bits = 0;              // int / float width
    bool is_signed = true;
    std::vector<std::string> symbols;   // enum

    SchemaPtr items;                    // array elements, map values
    std::vector<SchemaPtr> branches;    // union
    std::vector<SchemaField> fields;    // record, declaration order

    [[nodiscard]] const SchemaField* field(std::string_view field_name) const {
        for (const auto& f : fields) {
            if (f.name == field_name) {
                return &f;
            }
        }
        return nullptr;
    }

    /// Compact rendering for error messages, e.g. "record Point{x: int64, y: int64}"
    [[nodiscard]] std::string to_string() const;
};

bool operator==(const Schema& a, const Schema& b);

/// Copy of `schema` with the nullable flag set
[[nodiscard]] SchemaPtr make_nullable(const Schema& schema);

/**
 * @brief How well a value fits a schema node, in [0, 1]
 *
 * 0 means it cannot fit. Records score by key overlap (intersection over
 * union). Used to pick union branches.
 */
[[nodiscard]] double match_score(const Schema& schema, const Value& value);

/// Index of the best matching union branch (ties by declaration order), or nullopt
[[nodiscard]] std::optional<std::size_t> best_branch(const Schema& schema, const Value& value);

} // namespace adaptr
