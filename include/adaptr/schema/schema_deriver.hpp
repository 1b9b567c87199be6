/**
 * @file schema_deriver.hpp
 * @brief TypeDescriptor -> Schema, memoized, with DeriveSchema hooks
 *
 * DeriveSchema hooks are consulted at every node, so a hook can supply a
 * fragment for an opaque type nested deep inside a record. Under FirstSuccess
 * a hook pre-empts the built-in derivation; under Chained it receives the
 * built-in result as the partial.
 */

#pragma once

#include "adaptr/config.hpp"
#include "adaptr/hooks/hook_registry.hpp"
#include "adaptr/schema/schema.hpp"
#include "adaptr/types/type_descriptor.hpp"

#include <atomic>
#include <shared_mutex>
#include <unordered_map>

namespace adaptr {

class SchemaDeriver {
public:
    SchemaDeriver(const HookRegistry& hooks, const AdapterConfig& config)
        : hooks_(hooks), config_(config) {}

    SchemaDeriver(const SchemaDeriver&) = delete;
    SchemaDeriver& operator=(const SchemaDeriver&) = delete;

    /**
     * @brief Derive the schema of a resolved descriptor
     *
     * @throws SchemaError for pattern descriptors and for opaque types no hook covers
     */
    [[nodiscard]] SchemaPtr derive(const TypeDescriptorPtr& descriptor) const;

    void invalidate();

private:
    SchemaPtr derive_builtin(const TypeDescriptor& descriptor) const;

    const HookRegistry& hooks_;
    const AdapterConfig& config_;

    mutable std::shared_mutex cache_mutex_;
    mutable std::unordered_map<TypeDescriptorPtr, SchemaPtr, DescriptorPtrHash, DescriptorPtrEqual> cache_;
    std::atomic<std::uint64_t> generation_{0};
};

} // namespace adaptr
