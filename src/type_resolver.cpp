#include "adaptr/types/type_resolver.hpp"

#include <mutex>
#include <set>

namespace adaptr {

namespace {

bool valid_int_width(std::uint8_t bits) {
    return bits == 8 || bits == 16 || bits == 32 || bits == 64;
}

} // namespace

TypeDescriptorPtr TypeResolver::resolve(const TypeDeclPtr& decl) const {
    if (!decl) {
        throw UnsupportedTypeError("null type declaration");
    }

    const bool caching = config_.caching();
    if (caching) {
        std::shared_lock lock(cache_mutex_);
        auto it = decl_cache_.find(decl);
        if (it != decl_cache_.end()) {
            return it->second;
        }
    }
    const auto generation = generation_.load(std::memory_order_acquire);

    TypeDescriptorPtr result;
    if (hooks_.policy(HookPoint::ResolveType) == HookPolicy::FirstSuccess) {
        if (auto hooked = hooks_.invoke<HookPoint::ResolveType>(*decl)) {
            result = std::move(*hooked);
        } else {
            result = resolve_builtin(*decl);
        }
    } else {
        auto builtin = resolve_builtin(*decl);
        auto hooked = hooks_.invoke<HookPoint::ResolveType>(*decl, &builtin);
        result = hooked ? std::move(*hooked) : std::move(builtin);
    }
    if (!result) {
        throw UnsupportedTypeError("ResolveType hook produced no descriptor", decl->to_string());
    }

    if (caching) {
        std::unique_lock lock(cache_mutex_);
        if (generation == generation_.load(std::memory_order_acquire)) {
            decl_cache_.emplace(decl, result);
        }
    }
    return result;
}

TypeDescriptorPtr TypeResolver::resolve(const Binding& binding) const {
    const bool caching = config_.caching();
    if (caching) {
        std::shared_lock lock(cache_mutex_);
        auto it = binding_cache_.find(&binding);
        if (it != binding_cache_.end()) {
            return it->second;
        }
    }
    const auto generation = generation_.load(std::memory_order_acquire);

    auto result = resolve(binding.declaration());

    if (caching) {
        std::unique_lock lock(cache_mutex_);
        if (generation == generation_.load(std::memory_order_acquire)) {
            binding_cache_.emplace(&binding, result);
        }
    }
    return result;
}

void TypeResolver::invalidate() {
    std::unique_lock lock(cache_mutex_);
    generation_.fetch_add(1, std::memory_order_acq_rel);
    decl_cache_.clear();
    binding_cache_.clear();
}

// ============================================================================
// Built-in resolution
// ============================================================================

TypeDescriptorPtr TypeResolver::resolve_builtin(const TypeDecl& decl) const {
    switch (decl.kind()) {
        case DeclKind::Null:      return TypeDescriptor::null();
        case DeclKind::Bool:      return TypeDescriptor::boolean();
        case DeclKind::Text:      return TypeDescriptor::text();
        case DeclKind::Bytes:     return TypeDescriptor::bytes();
        case DeclKind::Timestamp: return TypeDescriptor::timestamp();
        case DeclKind::Date:      return TypeDescriptor::date();
        case DeclKind::Decimal:   return TypeDescriptor::decimal();
        case DeclKind::Uuid:      return TypeDescriptor::uuid();

        case DeclKind::Int:
            if (!valid_int_width(decl.bits())) {
                throw UnsupportedTypeError("integer width " + std::to_string(decl.bits()) + " is not supported",
                                           decl.to_string());
            }
            return TypeDescriptor::integer(decl.bits(), decl.is_signed());

        case DeclKind::Float:
            if (decl.bits() != 32 && decl.bits() != 64) {
                throw UnsupportedTypeError("float width " + std::to_string(decl.bits()) + " is not supported",
                                           decl.to_string());
            }
            return TypeDescriptor::floating(decl.bits());

        case DeclKind::Enum: {
            if (decl.symbols().empty()) {
                throw UnsupportedTypeError("enumeration without symbols", decl.to_string());
            }
            std::set<std::string> seen(decl.symbols().begin(), decl.symbols().end());
            if (seen.size() != decl.symbols().size()) {
                throw UnsupportedTypeError("enumeration with duplicate symbols", decl.to_string());
            }
            return TypeDescriptor::enumeration(decl.name(), decl.symbols());
        }

        case DeclKind::Nullable: {
            auto inner = resolve(decl.children().at(0));
            if (inner->kind() == Kind::Optional || inner->kind() == Kind::Null) {
                return inner;
            }
            return TypeDescriptor::optional(std::move(inner));
        }

        case DeclKind::Union:
            return resolve_union(decl);

        case DeclKind::Sequence:
            return TypeDescriptor::sequence(resolve(decl.children().at(0)));

        case DeclKind::Mapping: {
            auto key = resolve(decl.children().at(0));
            if (key->kind() != Kind::Text && key->kind() != Kind::Int && key->kind() != Kind::Enum) {
                throw UnsupportedTypeError("mapping keys must be text, integer or enum, not " + key->to_string(),
                                           decl.to_string());
            }
            return TypeDescriptor::mapping(std::move(key), resolve(decl.children().at(1)));
        }

        case DeclKind::Record:
            return resolve_record(decl);

        case DeclKind::Opaque:
            return TypeDescriptor::opaque(decl.name());

        case DeclKind::Reference: {
            auto target = TypeDescriptor::opaque(decl.name());
            if (converter_probe_ && converter_probe_(target)) {
                return target;
            }
            throw UnsupportedTypeError("recursive type '" + decl.name() + "' has no registered converter",
                                       decl.name());
        }

        case DeclKind::Unsupported:
        default:
            throw UnsupportedTypeError("type cannot be represented: " + decl.name(), decl.name());
    }
}

TypeDescriptorPtr TypeResolver::resolve_union(const TypeDecl& decl) const {
    std::vector<TypeDescriptorPtr> branches;
    bool has_null = false;

    // null and optional branches lift into one outer optional; nested unions flatten
    auto add = [&](auto&& self, const TypeDescriptorPtr& branch) -> void {
        switch (branch->kind()) {
            case Kind::Null:
                has_null = true;
                return;
            case Kind::Optional:
                has_null = true;
                self(self, branch->inner());
                return;
            case Kind::Union:
                for (const auto& nested : branch->branches()) {
                    self(self, nested);
                }
                return;
            default:
                break;
        }
        for (const auto& existing : branches) {
            if (*existing == *branch) {
                return;
            }
        }
        branches.push_back(branch);
    };
    for (const auto& child : decl.children()) {
        add(add, resolve(child));
    }

    if (branches.size() > config_.union_branch_limit()) {
        throw UnsupportedTypeError("union has " + std::to_string(branches.size()) + " branches, limit is " +
                                   std::to_string(config_.union_branch_limit()), decl.to_string());
    }
    if (branches.empty()) {
        return TypeDescriptor::null();
    }

    auto inner = branches.size() == 1 ? branches.front() : TypeDescriptor::union_of(std::move(branches));
    if (has_null) {
        return TypeDescriptor::optional(std::move(inner));
    }
    return inner;
}

TypeDescriptorPtr TypeResolver::resolve_record(const TypeDecl& decl) const {
    std::vector<FieldDescriptor> fields;
    std::set<std::string> names;
    for (const auto& field : decl.fields()) {
        if (!names.insert(field.name).second) {
            throw UnsupportedTypeError("duplicate field '" + field.name + "'", decl.to_string());
        }
        FieldDescriptor fd{field.name, resolve(field.type), field.default_value};
        if (!fd.default_value && field.default_object && default_converter_) {
            fd.default_value = default_converter_(field.default_object);
        }
        if (!fd.default_value && fd.optional()) {
            fd.default_value = Value{};
        }
        fields.push_back(std::move(fd));
    }
    return TypeDescriptor::record(decl.name(), std::move(fields));
}

} // namespace adaptr
