/**
 * @file conversion_context.hpp
 * @brief Per-call state threaded through converters
 *
 * Converters convert nested objects through the context rather than directly,
 * so the registry (and the ToIntermediate/FromIntermediate hooks) apply at
 * every level. The context also tracks the field path used in error messages:
 * "$.crew[1].name".
 */

#pragma once

#include "adaptr/config.hpp"
#include "adaptr/log.hpp"
#include "adaptr/objects/binding.hpp"
#include "adaptr/types/type_descriptor.hpp"
#include "adaptr/value/value.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace adaptr {

class Adapter;

class ConversionContext {
public:
    explicit ConversionContext(const Adapter& adapter) : adapter_(adapter) {}

    ConversionContext(const ConversionContext&) = delete;
    ConversionContext& operator=(const ConversionContext&) = delete;

    /// Convert a nested object through the registry
    Value to_intermediate(const ObjectRef& object);

    /// Load a nested object through the registry
    void from_intermediate(const Value& value, const MutableRef& object);

    [[nodiscard]] TypeDescriptorPtr descriptor_of(const Binding& binding) const;
    [[nodiscard]] const AdapterConfig& config() const;
    [[nodiscard]] const Logger& logger() const;

    /// RAII path segment; pops on destruction
    class Scope {
    public:
        Scope(std::vector<std::string>& path, std::string segment) : path_(path) {
            path_.push_back(std::move(segment));
        }
        ~Scope() { path_.pop_back(); }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        std::vector<std::string>& path_;
    };

    [[nodiscard]] Scope field(std::string_view name) { return Scope(path_, "." + std::string(name)); }
    [[nodiscard]] Scope index(std::size_t i) { return Scope(path_, "[" + std::to_string(i) + "]"); }
    [[nodiscard]] Scope key(std::string_view k) { return Scope(path_, "[" + std::string(k) + "]"); }

    [[nodiscard]] std::string path() const;

    [[noreturn]] void mismatch(const std::string& message) const;
    [[noreturn]] void out_of_range(const std::string& message) const;

private:
    const Adapter& adapter_;
    std::vector<std::string> path_;
};

} // namespace adaptr
