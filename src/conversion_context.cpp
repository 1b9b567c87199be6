#include "adaptr/registry/conversion_context.hpp"

#include "adaptr/adapter.hpp"

namespace adaptr {

Value ConversionContext::to_intermediate(const ObjectRef& object) {
    return adapter_.convert_to(object, *this);
}

void ConversionContext::from_intermediate(const Value& value, const MutableRef& object) {
    adapter_.convert_from(value, object, *this);
}

TypeDescriptorPtr ConversionContext::descriptor_of(const Binding& binding) const {
    return adapter_.resolver().resolve(binding);
}

const AdapterConfig& ConversionContext::config() const {
    return adapter_.config();
}

const Logger& ConversionContext::logger() const {
    return adapter_.logger();
}

std::string ConversionContext::path() const {
    std::string out = "$";
    for (const auto& segment : path_) {
        out += segment;
    }
    return out;
}

void ConversionContext::mismatch(const std::string& message) const {
    throw SchemaMismatchError(message, path());
}

void ConversionContext::out_of_range(const std::string& message) const {
    throw RangeError(message, path());
}

} // namespace adaptr
