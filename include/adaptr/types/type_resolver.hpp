/**
 * @file type_resolver.hpp
 * @brief Turns type declarations into normalized TypeDescriptors
 *
 * Normalization rule: a nullable wrapper and a union containing the null type
 * both become Optional(X), where X is the union of the remaining branches (or
 * the single remaining branch). Optional never directly wraps Optional, and a
 * union of one branch is that branch.
 *
 * Results are memoized per declaration and per Binding. The memo is cleared by
 * invalidate(), which the Adapter calls on every registration because both
 * ResolveType hooks and registered converters (for recursive references) feed
 * into resolution.
 */

#pragma once

#include "adaptr/config.hpp"
#include "adaptr/hooks/hook_registry.hpp"
#include "adaptr/objects/binding.hpp"
#include "adaptr/types/type_decl.hpp"
#include "adaptr/types/type_descriptor.hpp"

#include <atomic>
#include <functional>
#include <shared_mutex>
#include <unordered_map>

namespace adaptr {

class TypeResolver {
public:
    /// Converts a prototype field into the Value recorded as the field's default
    using DefaultConverter = std::function<Value(const ObjectRef&)>;
    /// Answers whether a converter exists for a descriptor (recursive references)
    using ConverterProbe = std::function<bool(const TypeDescriptorPtr&)>;

    TypeResolver(const HookRegistry& hooks, const AdapterConfig& config)
        : hooks_(hooks), config_(config) {}

    TypeResolver(const TypeResolver&) = delete;
    TypeResolver& operator=(const TypeResolver&) = delete;

    /**
     * @brief Resolve a declaration
     *
     * @throws UnsupportedTypeError if the declaration cannot be represented
     */
    [[nodiscard]] TypeDescriptorPtr resolve(const TypeDeclPtr& decl) const;

    /// Resolve the declaration of a bound C++ type, memoized per binding
    [[nodiscard]] TypeDescriptorPtr resolve(const Binding& binding) const;

    void set_default_converter(DefaultConverter converter) { default_converter_ = std::move(converter); }
    void set_converter_probe(ConverterProbe probe) { converter_probe_ = std::move(probe); }

    void invalidate();

private:
    TypeDescriptorPtr resolve_builtin(const TypeDecl& decl) const;
    TypeDescriptorPtr resolve_union(const TypeDecl& decl) const;
    TypeDescriptorPtr resolve_record(const TypeDecl& decl) const;

    const HookRegistry& hooks_;
    const AdapterConfig& config_;
    DefaultConverter default_converter_;
    ConverterProbe converter_probe_;

    mutable std::shared_mutex cache_mutex_;
    mutable std::unordered_map<TypeDeclPtr, TypeDescriptorPtr, DeclPtrHash, DeclPtrEqual> decl_cache_;
    mutable std::unordered_map<const Binding*, TypeDescriptorPtr> binding_cache_;
    std::atomic<std::uint64_t> generation_{0};
};

} // namespace adaptr
