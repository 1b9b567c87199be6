#include "adaptr/registry/converter_registry.hpp"

#include <algorithm>

namespace adaptr {

Specificity default_specificity(const TypeDescriptor& key) {
    if (key.is_pattern()) {
        return key.kind() == Kind::Any ? Specificity::Fallback : Specificity::Kind;
    }
    if (!key.name().empty()) {
        return Specificity::Nominal;
    }
    return Specificity::Structural;
}

std::vector<TypeDescriptorPtr> lookup_keys(const TypeDescriptorPtr& descriptor) {
    std::vector<TypeDescriptorPtr> keys;
    auto add = [&keys](TypeDescriptorPtr key) {
        for (const auto& existing : keys) {
            if (DescriptorPtrEqual{}(existing, key)) {
                return;
            }
        }
        keys.push_back(std::move(key));
    };
    add(descriptor);
    add(structural_of(descriptor));
    add(TypeDescriptor::pattern(descriptor->kind()));
    add(TypeDescriptor::any());
    return keys;
}

// ============================================================================
// Registration
// ============================================================================

std::shared_ptr<const ConverterRegistry::Table> ConverterRegistry::snapshot() const {
    std::shared_lock lock(table_mutex_);
    return table_;
}

void ConverterRegistry::publish(std::shared_ptr<const Table> next) {
    {
        std::unique_lock lock(table_mutex_);
        table_ = std::move(next);
    }
    // Cache entries computed against the old table must not survive
    std::unique_lock lock(cache_mutex_);
    generation_.fetch_add(1, std::memory_order_acq_rel);
    cache_.clear();
}

void ConverterRegistry::register_converter(const TypeDescriptorPtr& key, Converter converter,
                                           Specificity specificity, RegistrationMode mode) {
    if (!key) {
        throw std::invalid_argument("converter key must not be null");
    }
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<Table>(*snapshot());
    auto& entries = (*next)[key];

    // Replace also drops an entry of the same name, so re-registering a converter succeeds
    if (mode == RegistrationMode::Replace) {
        std::erase_if(entries, [&](const Entry& e) {
            return e.specificity == specificity || e.converter->name == converter.name;
        });
    }

    for (const auto& existing : entries) {
        if (existing.converter->name == converter.name) {
            throw AmbiguousConverterError("converter '" + converter.name + "' is already registered for " +
                                          key->to_string(), key->to_string());
        }
    }

    if (mode == RegistrationMode::Exclusive) {
        for (const auto& existing : entries) {
            if (existing.specificity == specificity) {
                throw AmbiguousConverterError("converter '" + converter.name + "' conflicts with '" +
                                              existing.converter->name + "' for " + key->to_string() +
                                              " at " + to_string(specificity) + " specificity",
                                              key->to_string());
            }
        }
    }

    entries.push_back(Entry{key, std::make_shared<const Converter>(std::move(converter)), specificity});
    publish(std::move(next));
}

std::size_t ConverterRegistry::unregister_converter(const TypeDescriptorPtr& key, std::string_view name) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<Table>(*snapshot());
    auto it = next->find(key);
    if (it == next->end()) {
        return 0;
    }
    auto removed = std::erase_if(it->second, [&](const Entry& e) { return e.converter->name == name; });
    if (it->second.empty()) {
        next->erase(it);
    }
    if (removed > 0) {
        publish(std::move(next));
    }
    return removed;
}

// ============================================================================
// Lookup
// ============================================================================

std::vector<ConverterRegistry::Entry> ConverterRegistry::candidates(const TypeDescriptorPtr& descriptor) const {
    auto table = snapshot();
    std::vector<Entry> found;
    for (const auto& key : lookup_keys(descriptor)) {
        auto it = table->find(key);
        if (it != table->end()) {
            found.insert(found.end(), it->second.begin(), it->second.end());
        }
    }
    std::stable_sort(found.begin(), found.end(), [](const Entry& a, const Entry& b) {
        return static_cast<int>(a.specificity) > static_cast<int>(b.specificity);
    });
    return found;
}

ConverterPtr ConverterRegistry::lookup(const TypeDescriptorPtr& descriptor) const {
    if (caching_) {
        std::shared_lock lock(cache_mutex_);
        auto it = cache_.find(descriptor);
        if (it != cache_.end()) {
            return it->second;
        }
    }
    const auto generation = generation_.load(std::memory_order_acquire);

    auto found = candidates(descriptor);
    if (found.empty()) {
        throw NoConverterError("no converter registered for " + descriptor->to_string(), descriptor->to_string());
    }
    if (found.size() > 1 && found[0].specificity == found[1].specificity) {
        std::string names;
        for (const auto& e : found) {
            if (e.specificity != found[0].specificity) break;
            names += names.empty() ? "'" + e.converter->name + "'" : ", '" + e.converter->name + "'";
        }
        throw AmbiguousConverterError("converters " + names + " tie at " + to_string(found[0].specificity) +
                                      " specificity for " + descriptor->to_string(), descriptor->to_string());
    }

    if (caching_) {
        std::unique_lock lock(cache_mutex_);
        if (generation == generation_.load(std::memory_order_acquire)) {
            cache_.emplace(descriptor, found[0].converter);
        }
    }
    return found[0].converter;
}

bool ConverterRegistry::contains(const TypeDescriptorPtr& descriptor) const {
    auto table = snapshot();
    for (const auto& key : lookup_keys(descriptor)) {
        if (table->count(key) > 0) {
            return true;
        }
    }
    return false;
}

std::size_t ConverterRegistry::size() const {
    auto table = snapshot();
    std::size_t total = 0;
    for (const auto& [key, entries] : *table) {
        total += entries.size();
    }
    return total;
}

} // namespace adaptr
