/**
 * @file hook_registry.hpp
 * @brief Ordered extension hooks with per-point resolution policy
 *
 * Five hook points let plugins intercept the engine without touching it:
 *
 * | Point            | Input          | Result            | Default policy |
 * |------------------|----------------|-------------------|----------------|
 * | ResolveType      | TypeDecl       | TypeDescriptorPtr | FirstSuccess   |
 * | ToIntermediate   | TypeDescriptor | Value             | Chained        |
 * | FromIntermediate | TypeDescriptor | Value             | Chained        |
 * | SelectCodec      | format name    | CodecPtr          | FirstSuccess   |
 * | DeriveSchema     | TypeDescriptor | SchemaPtr         | FirstSuccess   |
 *
 * Implementations run in ascending `order`, ties broken by registration
 * sequence. Each receives the input and the partial result so far (nullptr when
 * there is none) and returns either a definite result or HookResult::not_applicable().
 * FirstSuccess stops at the first definite result; Chained feeds each definite
 * result to the next implementation. Exceptions thrown by an implementation
 * abort the chain and propagate unchanged.
 *
 * The tables are immutable snapshots: registration copies, modifies and swaps
 * them, so invocation never holds a lock while calling user code.
 *
 * Example:
 * @code
 * hooks.register_hook<adaptr::HookPoint::ToIntermediate>("redact",
 *     [](const adaptr::TypeDescriptor& type, const adaptr::Value* partial)
 *         -> adaptr::HookResult<adaptr::Value> {
 *         if (type.name() != "Password") return adaptr::HookResult<adaptr::Value>::not_applicable();
 *         return adaptr::Value("***");
 *     });
 * @endcode
 */

#pragma once

#include "adaptr/types/type_decl.hpp"
#include "adaptr/types/type_descriptor.hpp"
#include "adaptr/value/value.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace adaptr {

class Codec;
using CodecPtr = std::shared_ptr<const Codec>;
struct Schema;
using SchemaPtr = std::shared_ptr<const Schema>;

enum class HookPoint : std::uint8_t {
    ResolveType,
    ToIntermediate,
    FromIntermediate,
    SelectCodec,
    DeriveSchema
};

constexpr std::size_t HOOK_POINT_COUNT = 5;

enum class HookPolicy : std::uint8_t {
    FirstSuccess,
    Chained
};

constexpr const char* to_string(HookPoint point) {
    switch (point) {
        case HookPoint::ResolveType:      return "resolve_type";
        case HookPoint::ToIntermediate:   return "to_intermediate";
        case HookPoint::FromIntermediate: return "from_intermediate";
        case HookPoint::SelectCodec:      return "select_codec";
        case HookPoint::DeriveSchema:     return "derive_schema";
        default:                          return "unknown";
    }
}

/// Maps "resolve_type", "select_codec", ... to a HookPoint
[[nodiscard]] std::optional<HookPoint> parse_hook_point(std::string_view name);

constexpr HookPolicy default_policy(HookPoint point) {
    switch (point) {
        case HookPoint::ToIntermediate:
        case HookPoint::FromIntermediate:
            return HookPolicy::Chained;
        default:
            return HookPolicy::FirstSuccess;
    }
}

// ============================================================================
// HookResult
// ============================================================================

/**
 * @brief Result of one hook implementation: a value or "not applicable"
 *
 * Not-applicable is a sentinel, not an error; failures are exceptions.
 */
template<typename T>
class HookResult {
public:
    HookResult(T value) : value_(std::move(value)) {}

    static HookResult not_applicable() { return HookResult(); }

    explicit operator bool() const { return value_.has_value(); }
    [[nodiscard]] bool applicable() const { return value_.has_value(); }

    T& value() { return *value_; }
    const T& value() const { return *value_; }
    T&& take() { return std::move(*value_); }

private:
    HookResult() = default;
    std::optional<T> value_;
};

// ============================================================================
// Hook signatures per point
// ============================================================================

template<HookPoint P> struct HookTraits;

template<> struct HookTraits<HookPoint::ResolveType> {
    using Input = TypeDecl;
    using Output = TypeDescriptorPtr;
};

template<> struct HookTraits<HookPoint::ToIntermediate> {
    using Input = TypeDescriptor;
    using Output = Value;
};

template<> struct HookTraits<HookPoint::FromIntermediate> {
    using Input = TypeDescriptor;
    using Output = Value;
};

template<> struct HookTraits<HookPoint::SelectCodec> {
    using Input = std::string;
    using Output = CodecPtr;
};

template<> struct HookTraits<HookPoint::DeriveSchema> {
    using Input = TypeDescriptor;
    using Output = SchemaPtr;
};

template<HookPoint P>
using HookInput = typename HookTraits<P>::Input;

template<HookPoint P>
using HookOutput = typename HookTraits<P>::Output;

template<HookPoint P>
using HookFn = std::function<HookResult<HookOutput<P>>(const HookInput<P>&, const HookOutput<P>* partial)>;

// ============================================================================
// HookRegistry
// ============================================================================

class HookRegistry {
public:
    template<HookPoint P>
    struct Entry {
        std::string name;
        int order;
        std::uint64_t sequence;
        HookFn<P> fn;
    };

    HookRegistry() : tables_(std::make_shared<const Tables>()) {}

    /**
     * @brief Register an implementation at hook point P
     *
     * @throws std::invalid_argument if `name` is already registered at P
     */
    template<HookPoint P>
    void register_hook(std::string name, HookFn<P> fn, int order = 0) {
        std::unique_lock lock(write_mutex_);
        auto next = std::make_shared<Tables>(*snapshot());
        auto& entries = std::get<static_cast<std::size_t>(P)>(next->entries);
        for (const auto& e : entries) {
            if (e.name == name) {
                throw std::invalid_argument("hook '" + name + "' already registered at " + to_string(P));
            }
        }
        Entry<P> entry{std::move(name), order, next_sequence_++, std::move(fn)};
        auto pos = entries.begin();
        while (pos != entries.end() && pos->order <= entry.order) {
            ++pos;
        }
        entries.insert(pos, std::move(entry));
        publish(std::move(next));
    }

    /// Returns false when no implementation named `name` exists at P
    template<HookPoint P>
    bool unregister_hook(std::string_view name) {
        std::unique_lock lock(write_mutex_);
        auto next = std::make_shared<Tables>(*snapshot());
        auto& entries = std::get<static_cast<std::size_t>(P)>(next->entries);
        auto before = entries.size();
        std::erase_if(entries, [&](const Entry<P>& e) { return e.name == name; });
        if (entries.size() == before) {
            return false;
        }
        publish(std::move(next));
        return true;
    }

    void set_policy(HookPoint point, HookPolicy policy);
    [[nodiscard]] HookPolicy policy(HookPoint point) const;

    template<HookPoint P>
    [[nodiscard]] std::size_t size() const {
        return std::get<static_cast<std::size_t>(P)>(snapshot()->entries).size();
    }

    template<HookPoint P>
    [[nodiscard]] bool empty() const { return size<P>() == 0; }

    /**
     * @brief Run the implementations registered at P under its policy
     *
     * @param input   Hook input
     * @param seed    Partial result to start from (nullptr for none)
     * @return The final result, or std::nullopt when nothing produced one
     */
    template<HookPoint P>
    std::optional<HookOutput<P>> invoke(const HookInput<P>& input, const HookOutput<P>* seed = nullptr) const {
        auto tables = snapshot();
        const auto& entries = std::get<static_cast<std::size_t>(P)>(tables->entries);
        if (entries.empty()) {
            return std::nullopt;
        }

        if (tables->policies[static_cast<std::size_t>(P)] == HookPolicy::FirstSuccess) {
            for (const auto& e : entries) {
                auto result = e.fn(input, seed);
                if (result) {
                    return result.take();
                }
            }
            return std::nullopt;
        }

        std::optional<HookOutput<P>> current;
        if (seed) {
            current = *seed;
        }
        for (const auto& e : entries) {
            auto result = e.fn(input, current ? &*current : nullptr);
            if (result) {
                current = result.take();
            }
        }
        return current;
    }

    /// Incremented on every change; caches derived from hooks compare against it
    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_.load(std::memory_order_acquire); }

private:
    struct Tables {
        std::tuple<std::vector<Entry<HookPoint::ResolveType>>,
                   std::vector<Entry<HookPoint::ToIntermediate>>,
                   std::vector<Entry<HookPoint::FromIntermediate>>,
                   std::vector<Entry<HookPoint::SelectCodec>>,
                   std::vector<Entry<HookPoint::DeriveSchema>>> entries;
        std::array<HookPolicy, HOOK_POINT_COUNT> policies{
            default_policy(HookPoint::ResolveType),
            default_policy(HookPoint::ToIntermediate),
            default_policy(HookPoint::FromIntermediate),
            default_policy(HookPoint::SelectCodec),
            default_policy(HookPoint::DeriveSchema)};
    };

    std::shared_ptr<const Tables> snapshot() const {
        std::shared_lock lock(snapshot_mutex_);
        return tables_;
    }

    void publish(std::shared_ptr<const Tables> next) {
        {
            std::unique_lock lock(snapshot_mutex_);
            tables_ = std::move(next);
        }
        generation_.fetch_add(1, std::memory_order_acq_rel);
    }

    std::mutex write_mutex_;                // serializes writers
    mutable std::shared_mutex snapshot_mutex_;
    std::shared_ptr<const Tables> tables_;
    std::uint64_t next_sequence_ = 0;
    std::atomic<std::uint64_t> generation_{0};
};

} // namespace adaptr
