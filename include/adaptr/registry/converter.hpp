/**
 * @file converter.hpp
 * @brief Converter entries and specificity ranks
 *
 * A converter is a pair of functions between an object (reached through an
 * ObjectRef/MutableRef) and its intermediate Value. Both receive the resolved
 * descriptor of the object and the ConversionContext, through which they
 * convert nested objects so that more specific converters still apply inside
 * containers.
 */

#pragma once

#include "adaptr/objects/binding.hpp"
#include "adaptr/types/type_descriptor.hpp"
#include "adaptr/value/value.hpp"

#include <functional>
#include <memory>
#include <string>

namespace adaptr {

class ConversionContext;

/// Ranking of how narrowly a converter applies; higher wins. Other integer ranks are allowed.
enum class Specificity : int {
    Fallback = 0,       // registered for TypeDescriptor::any()
    Kind = 100,         // registered for TypeDescriptor::pattern(kind)
    Structural = 200,   // registered for an unnamed shape
    Nominal = 300       // registered for a named record, enum or opaque type
};

constexpr const char* to_string(Specificity specificity) {
    switch (specificity) {
        case Specificity::Fallback:   return "fallback";
        case Specificity::Kind:       return "kind";
        case Specificity::Structural: return "structural";
        case Specificity::Nominal:    return "nominal";
        default:                      return "custom";
    }
}

/// Specificity implied by the shape of a registration key
[[nodiscard]] Specificity default_specificity(const TypeDescriptor& key);

enum class RegistrationMode {
    Add,        // keep existing entries; a tie surfaces as AmbiguousConverterError on lookup
    Exclusive,  // a tie raises AmbiguousConverterError at registration
    Replace     // remove entries with the same key and specificity, or the same name, first
};

struct Converter {
    using ToFn = std::function<Value(const ObjectRef& object, const TypeDescriptor& type, ConversionContext& ctx)>;
    using FromFn = std::function<void(const Value& value, const MutableRef& object, const TypeDescriptor& type,
                                      ConversionContext& ctx)>;

    std::string name;
    ToFn to_intermediate;
    FromFn from_intermediate;
};

using ConverterPtr = std::shared_ptr<const Converter>;

} // namespace adaptr
