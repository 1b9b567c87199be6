/**
 * @file converter_registry.hpp
 * @brief Descriptor-keyed converter table with specificity ranking
 *
 * Lookup walks the candidate keys of a descriptor from most to least specific:
 *
 *   1. the exact descriptor
 *   2. its structural shape (record and enum names stripped)
 *   3. the kind pattern, TypeDescriptor::pattern(kind)
 *   4. TypeDescriptor::any()
 *
 * Every entry found under any of these keys competes; the highest specificity
 * wins and a tie at the top raises AmbiguousConverterError. Successful lookups
 * are cached per descriptor. The table is an immutable snapshot replaced on
 * each registration, so concurrent lookups see either the old or the new table.
 */

#pragma once

#include "adaptr/registry/converter.hpp"
#include "adaptr/types/type_descriptor.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace adaptr {

class ConverterRegistry {
public:
    struct Entry {
        TypeDescriptorPtr key;
        ConverterPtr converter;
        Specificity specificity;
    };

    explicit ConverterRegistry(bool caching = true)
        : caching_(caching), table_(std::make_shared<const Table>()) {}

    ConverterRegistry(const ConverterRegistry&) = delete;
    ConverterRegistry& operator=(const ConverterRegistry&) = delete;

    /**
     * @brief Register a converter under a key descriptor
     *
     * @throws AmbiguousConverterError when a converter of the same name already
     *         exists for the key, or in Exclusive mode when any entry already
     *         exists at the same key and specificity
     */
    void register_converter(const TypeDescriptorPtr& key, Converter converter, Specificity specificity,
                            RegistrationMode mode = RegistrationMode::Add);

    /// Returns the number of entries removed
    std::size_t unregister_converter(const TypeDescriptorPtr& key, std::string_view name);

    /**
     * @brief Select the converter for a descriptor
     *
     * @throws NoConverterError naming the descriptor when nothing applies
     * @throws AmbiguousConverterError when two entries tie at the top
     */
    [[nodiscard]] ConverterPtr lookup(const TypeDescriptorPtr& descriptor) const;

    /// True when at least one entry applies to the descriptor
    [[nodiscard]] bool contains(const TypeDescriptorPtr& descriptor) const;

    /// All applicable entries, most specific first
    [[nodiscard]] std::vector<Entry> candidates(const TypeDescriptorPtr& descriptor) const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_.load(std::memory_order_acquire); }

private:
    using Table = std::unordered_map<TypeDescriptorPtr, std::vector<Entry>, DescriptorPtrHash, DescriptorPtrEqual>;

    std::shared_ptr<const Table> snapshot() const;
    void publish(std::shared_ptr<const Table> next);

    bool caching_;

    std::mutex write_mutex_;
    mutable std::shared_mutex table_mutex_;
    std::shared_ptr<const Table> table_;
    std::atomic<std::uint64_t> generation_{0};

    mutable std::shared_mutex cache_mutex_;
    mutable std::unordered_map<TypeDescriptorPtr, ConverterPtr, DescriptorPtrHash, DescriptorPtrEqual> cache_;
};

/// Lookup keys of a descriptor, most specific first, without duplicates
[[nodiscard]] std::vector<TypeDescriptorPtr> lookup_keys(const TypeDescriptorPtr& descriptor);

} // namespace adaptr
