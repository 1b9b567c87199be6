#include "adaptr/types/type_descriptor.hpp"

#include <functional>
#include <stdexcept>

namespace adaptr {

namespace {

bool same_children(const std::vector<TypeDescriptorPtr>& a, const std::vector<TypeDescriptorPtr>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!DescriptorPtrEqual{}(a[i], b[i])) {
            return false;
        }
    }
    return true;
}

} // namespace

bool FieldDescriptor::optional() const {
    return type && type->kind() == Kind::Optional;
}

bool FieldDescriptor::operator==(const FieldDescriptor& other) const {
    return name == other.name && DescriptorPtrEqual{}(type, other.type) && default_value == other.default_value;
}

// ============================================================================
// Construction
// ============================================================================

TypeDescriptorPtr TypeDescriptor::finish(TypeDescriptor&& d) {
    std::size_t seed = static_cast<std::size_t>(d.kind_) * 31 + (d.pattern_ ? 7 : 0);
    hash_combine(seed, std::hash<std::string>{}(d.name_));
    hash_combine(seed, d.bits_);
    hash_combine(seed, d.is_signed_ ? 1u : 0u);
    for (const auto& s : d.symbols_) {
        hash_combine(seed, std::hash<std::string>{}(s));
    }
    for (const auto& child : d.children_) {
        hash_combine(seed, DescriptorPtrHash{}(child));
    }
    for (const auto& field : d.fields_) {
        hash_combine(seed, std::hash<std::string>{}(field.name));
        hash_combine(seed, DescriptorPtrHash{}(field.type));
        hash_combine(seed, field.default_value ? hash_value(*field.default_value) : 0u);
    }
    d.hash_ = seed;
    return std::make_shared<const TypeDescriptor>(std::move(d));
}

TypeDescriptorPtr TypeDescriptor::any() {
    static const TypeDescriptorPtr instance = pattern(Kind::Any);
    return instance;
}

TypeDescriptorPtr TypeDescriptor::pattern(Kind kind) {
    TypeDescriptor d(kind);
    d.pattern_ = true;
    return finish(std::move(d));
}

TypeDescriptorPtr TypeDescriptor::null() {
    static const TypeDescriptorPtr instance = finish(TypeDescriptor(Kind::Null));
    return instance;
}

TypeDescriptorPtr TypeDescriptor::boolean() {
    static const TypeDescriptorPtr instance = finish(TypeDescriptor(Kind::Bool));
    return instance;
}

TypeDescriptorPtr TypeDescriptor::integer(std::uint8_t bits, bool is_signed) {
    TypeDescriptor d(Kind::Int);
    d.bits_ = bits;
    d.is_signed_ = is_signed;
    return finish(std::move(d));
}

TypeDescriptorPtr TypeDescriptor::floating(std::uint8_t bits) {
    TypeDescriptor d(Kind::Float);
    d.bits_ = bits;
    return finish(std::move(d));
}

TypeDescriptorPtr TypeDescriptor::text() { return finish(TypeDescriptor(Kind::Text)); }
TypeDescriptorPtr TypeDescriptor::bytes() { return finish(TypeDescriptor(Kind::Bytes)); }
TypeDescriptorPtr TypeDescriptor::timestamp() { return finish(TypeDescriptor(Kind::Timestamp)); }
TypeDescriptorPtr TypeDescriptor::date() { return finish(TypeDescriptor(Kind::Date)); }
TypeDescriptorPtr TypeDescriptor::decimal() { return finish(TypeDescriptor(Kind::Decimal)); }
TypeDescriptorPtr TypeDescriptor::uuid() { return finish(TypeDescriptor(Kind::Uuid)); }

TypeDescriptorPtr TypeDescriptor::enumeration(std::string name, std::vector<std::string> symbols) {
    TypeDescriptor d(Kind::Enum);
    d.name_ = std::move(name);
    d.symbols_ = std::move(symbols);
    return finish(std::move(d));
}

TypeDescriptorPtr TypeDescriptor::optional(TypeDescriptorPtr inner) {
    TypeDescriptor d(Kind::Optional);
    d.children_.push_back(std::move(inner));
    return finish(std::move(d));
}

TypeDescriptorPtr TypeDescriptor::sequence(TypeDescriptorPtr element) {
    TypeDescriptor d(Kind::Sequence);
    d.children_.push_back(std::move(element));
    return finish(std::move(d));
}

TypeDescriptorPtr TypeDescriptor::mapping(TypeDescriptorPtr key, TypeDescriptorPtr value) {
    TypeDescriptor d(Kind::Mapping);
    d.children_.push_back(std::move(key));
    d.children_.push_back(std::move(value));
    return finish(std::move(d));
}

TypeDescriptorPtr TypeDescriptor::record(std::string name, std::vector<FieldDescriptor> fields) {
    TypeDescriptor d(Kind::Record);
    d.name_ = std::move(name);
    d.fields_ = std::move(fields);
    return finish(std::move(d));
}

TypeDescriptorPtr TypeDescriptor::union_of(std::vector<TypeDescriptorPtr> branches) {
    TypeDescriptor d(Kind::Union);
    d.children_ = std::move(branches);
    return finish(std::move(d));
}

TypeDescriptorPtr TypeDescriptor::opaque(std::string name) {
    TypeDescriptor d(Kind::Opaque);
    d.name_ = std::move(name);
    return finish(std::move(d));
}

// ============================================================================
// Accessors
// ============================================================================

const TypeDescriptorPtr& TypeDescriptor::inner() const {
    if ((kind_ != Kind::Optional && kind_ != Kind::Sequence && kind_ != Kind::Mapping) || children_.empty()) {
        throw std::logic_error(std::string("TypeDescriptor: ") + adaptr::to_string(kind_) + " has no inner type");
    }
    return children_.back();
}

const TypeDescriptorPtr& TypeDescriptor::key() const {
    if (kind_ != Kind::Mapping || children_.size() != 2) {
        throw std::logic_error(std::string("TypeDescriptor: ") + adaptr::to_string(kind_) + " has no key type");
    }
    return children_.front();
}

bool TypeDescriptor::operator==(const TypeDescriptor& other) const {
    return hash_ == other.hash_ && kind_ == other.kind_ && pattern_ == other.pattern_ &&
           name_ == other.name_ && bits_ == other.bits_ && is_signed_ == other.is_signed_ &&
           symbols_ == other.symbols_ && same_children(children_, other.children_) &&
           fields_ == other.fields_;
}

std::string TypeDescriptor::to_string() const {
    if (pattern_) {
        return kind_ == Kind::Any ? "<any>" : std::string("<any ") + adaptr::to_string(kind_) + ">";
    }
    switch (kind_) {
        case Kind::Int:
            return (is_signed_ ? "int" : "uint") + std::to_string(bits_);
        case Kind::Float:
            return "float" + std::to_string(bits_);
        case Kind::Enum:
        case Kind::Opaque:
            return std::string(adaptr::to_string(kind_)) + " " + name_;
        case Kind::Optional:
            return "optional<" + inner()->to_string() + ">";
        case Kind::Sequence:
            return "sequence<" + inner()->to_string() + ">";
        case Kind::Mapping:
            return "mapping<" + key()->to_string() + ", " + inner()->to_string() + ">";
        case Kind::Union: {
            std::string out = "union<";
            for (std::size_t i = 0; i < children_.size(); ++i) {
                if (i) out += ", ";
                out += children_[i]->to_string();
            }
            return out + ">";
        }
        case Kind::Record: {
            std::string out = name_.empty() ? "record{" : "record " + name_ + "{";
            for (std::size_t i = 0; i < fields_.size(); ++i) {
                if (i) out += ", ";
                out += fields_[i].name + ": " + fields_[i].type->to_string();
            }
            return out + "}";
        }
        default:
            return adaptr::to_string(kind_);
    }
}

// ============================================================================
// Structural shape
// ============================================================================

TypeDescriptorPtr structural_of(const TypeDescriptorPtr& descriptor) {
    if (!descriptor || descriptor->is_pattern()) {
        return descriptor;
    }
    switch (descriptor->kind()) {
        case Kind::Enum:
            return TypeDescriptor::enumeration({}, descriptor->symbols());
        case Kind::Optional:
            return TypeDescriptor::optional(structural_of(descriptor->inner()));
        case Kind::Sequence:
            return TypeDescriptor::sequence(structural_of(descriptor->inner()));
        case Kind::Mapping:
            return TypeDescriptor::mapping(structural_of(descriptor->key()), structural_of(descriptor->inner()));
        case Kind::Union: {
            std::vector<TypeDescriptorPtr> branches;
            for (const auto& b : descriptor->branches()) {
                branches.push_back(structural_of(b));
            }
            return TypeDescriptor::union_of(std::move(branches));
        }
        case Kind::Record: {
            std::vector<FieldDescriptor> fields;
            for (const auto& f : descriptor->fields()) {
                fields.push_back({f.name, structural_of(f.type), f.default_value});
            }
            return TypeDescriptor::record({}, std::move(fields));
        }
        default:
            return descriptor;
    }
}

} // namespace adaptr
