#include "adaptr/codec/codec.hpp"

#include "adaptr/errors.hpp"

#include <cstring>

namespace adaptr {

namespace {

std::shared_ptr<const Schema> array_of(const Schema* schema) {
    if (schema == nullptr) {
        return nullptr;
    }
    auto wrapper = std::make_shared<Schema>();
    wrapper->kind = SchemaKind::Array;
    wrapper->items = std::make_shared<Schema>(*schema);
    return wrapper;
}

} // namespace

Bytes Codec::encode_many(const std::vector<Value>& values, const Schema* schema) const {
    auto wrapper = array_of(schema);
    return encode(Value(Array(values.begin(), values.end())), wrapper.get());
}

Value Codec::decode(std::span<const std::byte> data, const Schema* schema, const Schema*) const {
    return decode(data, schema);
}

std::vector<Value> Codec::decode_many(std::span<const std::byte> data, const Schema* schema) const {
    auto wrapper = array_of(schema);
    Value decoded = decode(data, wrapper.get());
    if (!decoded.is_array()) {
        throw DecodeError(name() + " payload does not hold a sequence of values");
    }
    return decoded.as_array();
}

void Codec::require_schema(const Schema* schema) const {
    if (schema == nullptr) {
        throw SchemaError("the " + name() + " format requires a schema");
    }
}

Bytes to_bytes(std::string_view text) {
    Bytes out(text.size());
    if (!text.empty()) {
        std::memcpy(out.data(), text.data(), text.size());
    }
    return out;
}

std::string_view as_text(std::span<const std::byte> data) {
    return std::string_view(reinterpret_cast<const char*>(data.data()), data.size());
}

} // namespace adaptr
