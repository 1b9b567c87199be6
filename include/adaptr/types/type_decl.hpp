/**
 * @file type_decl.hpp
 * @brief Type declarations - the input spelling of a type
 *
 * A TypeDecl is what a caller (or declare<T>() for a static C++ type) says a
 * type is. It may use several spellings for the same thing (a nullable wrapper,
 * a union containing null) and may contain constructs that cannot be
 * represented at all. The TypeResolver turns it into a normalized
 * TypeDescriptor or rejects it.
 *
 * Example (runtime declaration, no C++ type involved):
 * @code
 * using adaptr::TypeDecl;
 * auto point = TypeDecl::record("Point", {
 *     {"x", TypeDecl::integer(64)},
 *     {"y", TypeDecl::integer(64)},
 *     {"label", TypeDecl::nullable(TypeDecl::text())},
 * });
 * @endcode
 */

#pragma once

#include "adaptr/objects/binding.hpp"
#include "adaptr/value/value.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace adaptr {

enum class DeclKind : std::uint8_t {
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
    Nullable,
    Union,
    Sequence,
    Mapping,
    Record,
    Opaque,
    Reference,      // back-edge of a recursive type
    Unsupported
};

struct FieldDecl {
    std::string name;
    TypeDeclPtr type;
    std::optional<Value> default_value;     // literal default
    ObjectRef default_object;               // default taken from a prototype instance

    FieldDecl(std::string n, TypeDeclPtr t, std::optional<Value> def = std::nullopt, ObjectRef obj = {})
        : name(std::move(n)), type(std::move(t)), default_value(std::move(def)), default_object(obj) {}

    bool operator==(const FieldDecl& other) const;
};

class TypeDecl {
public:
    static TypeDeclPtr null();
    static TypeDeclPtr boolean();
    static TypeDeclPtr integer(std::uint8_t bits = 64, bool is_signed = true);
    static TypeDeclPtr floating(std::uint8_t bits = 64);
    static TypeDeclPtr text();
    static TypeDeclPtr bytes();
    static TypeDeclPtr timestamp();
    static TypeDeclPtr date();
    static TypeDeclPtr decimal();
    static TypeDeclPtr uuid();
    static TypeDeclPtr enumeration(std::string name, std::vector<std::string> symbols);
    static TypeDeclPtr nullable(TypeDeclPtr inner);
    static TypeDeclPtr union_of(std::vector<TypeDeclPtr> branches);
    static TypeDeclPtr sequence(TypeDeclPtr element);
    static TypeDeclPtr mapping(TypeDeclPtr key, TypeDeclPtr value);
    static TypeDeclPtr record(std::string name, std::vector<FieldDecl> fields);
    static TypeDeclPtr opaque(std::string name);
    static TypeDeclPtr reference(std::string name);
    static TypeDeclPtr unsupported(std::string reason);

    [[nodiscard]] DeclKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::uint8_t bits() const noexcept { return bits_; }
    [[nodiscard]] bool is_signed() const noexcept { return is_signed_; }
    [[nodiscard]] const std::vector<std::string>& symbols() const noexcept { return symbols_; }
    /// Nullable: [inner]; Union: branches; Sequence: [element]; Mapping: [key, value]
    [[nodiscard]] const std::vector<TypeDeclPtr>& children() const noexcept { return children_; }
    [[nodiscard]] const std::vector<FieldDecl>& fields() const noexcept { return fields_; }

    [[nodiscard]] std::size_t hash() const noexcept { return hash_; }
    bool operator==(const TypeDecl& other) const;

    [[nodiscard]] std::string to_string() const;

private:
    explicit TypeDecl(DeclKind kind) : kind_(kind) {}
    static TypeDeclPtr finish(TypeDecl&& decl);

    DeclKind kind_;
    std::string name_;
    std::uint8_t bits_ = 0;
    bool is_signed_ = true;
    std::vector<std::string> symbols_;
    std::vector<TypeDeclPtr> children_;
    std::vector<FieldDecl> fields_;
    std::size_t hash_ = 0;
};

/// Hash/equality functors for using TypeDeclPtr as an unordered_map key by value
struct DeclPtrHash {
    std::size_t operator()(const TypeDeclPtr& d) const noexcept { return d ? d->hash() : 0; }
};

struct DeclPtrEqual {
    bool operator()(const TypeDeclPtr& a, const TypeDeclPtr& b) const {
        return a == b || (a && b && *a == *b);
    }
};

} // namespace adaptr
