/**
 * @file json_codec.hpp
 * @brief JSON text format ("json") on top of rfl::json
 *
 * Values travel through rfl::Generic. JSON has no bytes type, so bytes are
 * written as base64 text; NaN and infinities cannot be written and raise
 * RangeError.
 *
 * Without a schema, decoding yields exactly what the text says. With a schema
 * it is coerced into the schema's shape: base64 text back into bytes, integers
 * into floats, missing record fields into their defaults (or null), and union
 * values onto their best matching branch. Several values are written as
 * newline-delimited JSON, one document per line.
 */

#pragma once

#include "adaptr/codec/codec.hpp"

namespace adaptr {

class JsonCodec : public Codec {
public:
    [[nodiscard]] std::string name() const override { return "json"; }
    [[nodiscard]] SchemaUse schema_use() const override { return SchemaUse::Optional; }

    [[nodiscard]] Bytes encode(const Value& value, const Schema* schema) const override;
    using Codec::decode;
    [[nodiscard]] Value decode(std::span<const std::byte> data, const Schema* schema) const override;

    [[nodiscard]] Bytes encode_many(const std::vector<Value>& values, const Schema* schema) const override;
    [[nodiscard]] std::vector<Value> decode_many(std::span<const std::byte> data, const Schema* schema) const override;
};

/**
 * @brief Coerce a value read from a text format into the shape of `schema`
 *
 * Shared by the text codecs.
 *
 * @throws SchemaMismatchError when the value cannot take that shape
 * @throws RangeError for integers beyond the schema's width
 */
[[nodiscard]] Value coerce(const Value& value, const Schema& schema);

} // namespace adaptr
