/**
 * @file type_descriptor.hpp
 * @brief Normalized, immutable, hashable dispatch key for a type
 *
 * Descriptors are produced by the TypeResolver and shared as
 * std::shared_ptr<const TypeDescriptor>. Equality is deep (including field
 * defaults) and the hash is computed once at construction.
 *
 * Records, enums and opaque types carry a nominal name: two records with the
 * same fields but different names are different descriptors. structural_of()
 * strips those names, which is the second step of the registry's lookup chain.
 *
 * Pattern descriptors (pattern(Kind::Record), any()) never come out of the
 * resolver; they are registration keys that match every descriptor of a kind,
 * or every descriptor at all.
 */

#pragma once

#include "adaptr/value/value.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace adaptr {

enum class Kind : std::uint8_t {
    Any,
    Null,
    Bool,
    Int,
    Float,
    Text,
    Bytes,
    Timestamp,
    Date,
    Decimal,
    Uuid,
    Enum,
    Optional,
    Sequence,
    Mapping,
    Record,
    Union,
    Opaque
};

constexpr const char* to_string(Kind kind) {
    switch (kind) {
        case Kind::Any:       return "any";
        case Kind::Null:      return "null";
        case Kind::Bool:      return "bool";
        case Kind::Int:       return "int";
        case Kind::Float:     return "float";
        case Kind::Text:      return "text";
        case Kind::Bytes:     return "bytes";
        case Kind::Timestamp: return "timestamp";
        case Kind::Date:      return "date";
        case Kind::Decimal:   return "decimal";
        case Kind::Uuid:      return "uuid";
        case Kind::Enum:      return "enum";
        case Kind::Optional:  return "optional";
        case Kind::Sequence:  return "sequence";
        case Kind::Mapping:   return "mapping";
        case Kind::Record:    return "record";
        case Kind::Union:     return "union";
        case Kind::Opaque:    return "opaque";
        default:              return "unknown";
    }
}

class TypeDescriptor;
using TypeDescriptorPtr = std::shared_ptr<const TypeDescriptor>;

struct FieldDescriptor {
    std::string name;
    TypeDescriptorPtr type;
    std::optional<Value> default_value;

    /// True when the field's type is Optional
    [[nodiscard]] bool optional() const;
    [[nodiscard]] bool has_default() const noexcept { return default_value.has_value(); }

    bool operator==(const FieldDescriptor& other) const;
};

class TypeDescriptor {
public:
    static TypeDescriptorPtr any();
    static TypeDescriptorPtr pattern(Kind kind);

    static TypeDescriptorPtr null();
    static TypeDescriptorPtr boolean();
    static TypeDescriptorPtr integer(std::uint8_t bits = 64, bool is_signed = true);
    static TypeDescriptorPtr floating(std::uint8_t bits = 64);
    static TypeDescriptorPtr text();
    static TypeDescriptorPtr bytes();
    static TypeDescriptorPtr timestamp();
    static TypeDescriptorPtr date();
    static TypeDescriptorPtr decimal();
    static TypeDescriptorPtr uuid();
    static TypeDescriptorPtr enumeration(std::string name, std::vector<std::string> symbols);
    static TypeDescriptorPtr optional(TypeDescriptorPtr inner);
    static TypeDescriptorPtr sequence(TypeDescriptorPtr element);
    static TypeDescriptorPtr mapping(TypeDescriptorPtr key, TypeDescriptorPtr value);
    static TypeDescriptorPtr record(std::string name, std::vector<FieldDescriptor> fields);
    static TypeDescriptorPtr union_of(std::vector<TypeDescriptorPtr> branches);
    static TypeDescriptorPtr opaque(std::string name);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_pattern() const noexcept { return pattern_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] std::uint8_t bits() const noexcept { return bits_; }
    [[nodiscard]] bool is_signed() const noexcept { return is_signed_; }
    [[nodiscard]] const std::vector<std::string>& symbols() const noexcept { return symbols_; }

    /// Optional: wrapped type; Sequence: element; Mapping: value type
    [[nodiscard]] const TypeDescriptorPtr& inner() const;
    /// Mapping only
    [[nodiscard]] const TypeDescriptorPtr& key() const;
    [[nodiscard]] const std::vector<TypeDescriptorPtr>& branches() const noexcept { return children_; }
    [[nodiscard]] const std::vector<FieldDescriptor>& fields() const noexcept { return fields_; }

    [[nodiscard]] std::size_t hash() const noexcept { return hash_; }
    bool operator==(const TypeDescriptor& other) const;

    /// Human-readable rendering used in error messages, e.g. "record Point{x: int64, y: int64}"
    [[nodiscard]] std::string to_string() const;

private:
    explicit TypeDescriptor(Kind kind) : kind_(kind) {}
    static TypeDescriptorPtr finish(TypeDescriptor&& d);

    Kind kind_;
    bool pattern_ = false;
    std::string name_;
    std::uint8_t bits_ = 0;
    bool is_signed_ = true;
    std::vector<std::string> symbols_;
    std::vector<TypeDescriptorPtr> children_;
    std::vector<FieldDescriptor> fields_;
    std::size_t hash_ = 0;
};

/// Same descriptor with record and enum names removed recursively (opaque names stay)
[[nodiscard]] TypeDescriptorPtr structural_of(const TypeDescriptorPtr& descriptor);

struct DescriptorPtrHash {
    std::size_t operator()(const TypeDescriptorPtr& d) const noexcept { return d ? d->hash() : 0; }
};

struct DescriptorPtrEqual {
    bool operator()(const TypeDescriptorPtr& a, const TypeDescriptorPtr& b) const {
        return a == b || (a && b && *a == *b);
    }
};

} // namespace adaptr
