#include "adaptr/types/type_decl.hpp"

#include <functional>

namespace adaptr {

namespace {

bool same_children(const std::vector<TypeDeclPtr>& a, const std::vector<TypeDeclPtr>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!DeclPtrEqual{}(a[i], b[i])) {
            return false;
        }
    }
    return true;
}

const char* kind_name(DeclKind kind) {
    switch (kind) {
        case DeclKind::Null:        return "null";
        case DeclKind::Bool:        return "bool";
        case DeclKind::Int:         return "int";
        case DeclKind::Float:       return "float";
        case DeclKind::Text:        return "text";
        case DeclKind::Bytes:       return "bytes";
        case DeclKind::Timestamp:   return "timestamp";
        case DeclKind::Date:        return "date";
        case DeclKind::Decimal:     return "decimal";
        case DeclKind::Uuid:        return "uuid";
        case DeclKind::Enum:        return "enum";
        case DeclKind::Nullable:    return "nullable";
        case DeclKind::Union:       return "union";
        case DeclKind::Sequence:    return "sequence";
        case DeclKind::Mapping:     return "mapping";
        case DeclKind::Record:      return "record";
        case DeclKind::Opaque:      return "opaque";
        case DeclKind::Reference:   return "ref";
        case DeclKind::Unsupported: return "unsupported";
        default:                    return "?";
    }
}

} // namespace

bool FieldDecl::operator==(const FieldDecl& other) const {
    return name == other.name && DeclPtrEqual{}(type, other.type) &&
           default_value == other.default_value && default_object == other.default_object;
}

TypeDeclPtr TypeDecl::finish(TypeDecl&& decl) {
    std::size_t seed = static_cast<std::size_t>(decl.kind_);
    hash_combine(seed, std::hash<std::string>{}(decl.name_));
    hash_combine(seed, decl.bits_);
    hash_combine(seed, decl.is_signed_ ? 1u : 0u);
    for (const auto& s : decl.symbols_) {
        hash_combine(seed, std::hash<std::string>{}(s));
    }
    for (const auto& child : decl.children_) {
        hash_combine(seed, DeclPtrHash{}(child));
    }
    for (const auto& field : decl.fields_) {
        hash_combine(seed, std::hash<std::string>{}(field.name));
        hash_combine(seed, DeclPtrHash{}(field.type));
        if (field.default_value) {
            hash_combine(seed, hash_value(*field.default_value));
        }
        hash_combine(seed, std::hash<const void*>{}(field.default_object.get()));
    }
    decl.hash_ = seed;
    return std::make_shared<const TypeDecl>(std::move(decl));
}

TypeDeclPtr TypeDecl::null() { return finish(TypeDecl(DeclKind::Null)); }
TypeDeclPtr TypeDecl::boolean() { return finish(TypeDecl(DeclKind::Bool)); }

TypeDeclPtr TypeDecl::integer(std::uint8_t bits, bool is_signed) {
    TypeDecl d(DeclKind::Int);
    d.bits_ = bits;
    d.is_signed_ = is_signed;
    return finish(std::move(d));
}

TypeDeclPtr TypeDecl::floating(std::uint8_t bits) {
    TypeDecl d(DeclKind::Float);
    d.bits_ = bits;
    return finish(std::move(d));
}

TypeDeclPtr TypeDecl::text() { return finish(TypeDecl(DeclKind::Text)); }
TypeDeclPtr TypeDecl::bytes() { return finish(TypeDecl(DeclKind::Bytes)); }
TypeDeclPtr TypeDecl::timestamp() { return finish(TypeDecl(DeclKind::Timestamp)); }
TypeDeclPtr TypeDecl::date() { return finish(TypeDecl(DeclKind::Date)); }
TypeDeclPtr TypeDecl::decimal() { return finish(TypeDecl(DeclKind::Decimal)); }
TypeDeclPtr TypeDecl::uuid() { return finish(TypeDecl(DeclKind::Uuid)); }

TypeDeclPtr TypeDecl::enumeration(std::string name, std::vector<std::string> symbols) {
    TypeDecl d(DeclKind::Enum);
    d.name_ = std::move(name);
    d.symbols_ = std::move(symbols);
    return finish(std::move(d));
}

TypeDeclPtr TypeDecl::nullable(TypeDeclPtr inner) {
    TypeDecl d(DeclKind::Nullable);
    d.children_.push_back(std::move(inner));
    return finish(std::move(d));
}

TypeDeclPtr TypeDecl::union_of(std::vector<TypeDeclPtr> branches) {
    TypeDecl d(DeclKind::Union);
    d.children_ = std::move(branches);
    return finish(std::move(d));
}

TypeDeclPtr TypeDecl::sequence(TypeDeclPtr element) {
    TypeDecl d(DeclKind::Sequence);
    d.children_.push_back(std::move(element));
    return finish(std::move(d));
}

TypeDeclPtr TypeDecl::mapping(TypeDeclPtr key, TypeDeclPtr value) {
    TypeDecl d(DeclKind::Mapping);
    d.children_.push_back(std::move(key));
    d.children_.push_back(std::move(value));
    return finish(std::move(d));
}

TypeDeclPtr TypeDecl::record(std::string name, std::vector<FieldDecl> fields) {
    TypeDecl d(DeclKind::Record);
    d.name_ = std::move(name);
    d.fields_ = std::move(fields);
    return finish(std::move(d));
}

TypeDeclPtr TypeDecl::opaque(std::string name) {
    TypeDecl d(DeclKind::Opaque);
    d.name_ = std::move(name);
    return finish(std::move(d));
}

TypeDeclPtr TypeDecl::reference(std::string name) {
    TypeDecl d(DeclKind::Reference);
    d.name_ = std::move(name);
    return finish(std::move(d));
}

TypeDeclPtr TypeDecl::unsupported(std::string reason) {
    TypeDecl d(DeclKind::Unsupported);
    d.name_ = std::move(reason);
    return finish(std::move(d));
}

bool TypeDecl::operator==(const TypeDecl& other) const {
    return hash_ == other.hash_ && kind_ == other.kind_ && name_ == other.name_ &&
           bits_ == other.bits_ && is_signed_ == other.is_signed_ && symbols_ == other.symbols_ &&
           same_children(children_, other.children_) && fields_ == other.fields_;
}

std::string TypeDecl::to_string() const {
    std::string out = kind_name(kind_);
    if (!name_.empty()) {
        out += " " + name_;
    }
    if (kind_ == DeclKind::Int || kind_ == DeclKind::Float) {
        out += (kind_ == DeclKind::Int && !is_signed_ ? "<u" : "<") + std::to_string(bits_) + ">";
    }
    if (!children_.empty()) {
        out += "<";
        for (std::size_t i = 0; i < children_.size(); ++i) {
            if (i) out += ", ";
            out += children_[i] ? children_[i]->to_string() : "?";
        }
        out += ">";
    }
    if (!fields_.empty()) {
        out += "{";
        for (std::size_t i = 0; i < fields_.size(); ++i) {
            if (i) out += ", ";
            out += fields_[i].name + ": " + (fields_[i].type ? fields_[i].type->to_string() : "?");
        }
        out += "}";
    }
    return out;
}

} // namespace adaptr
