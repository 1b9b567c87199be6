/**
 * @file codec.hpp
 * @brief Codec contract: Value <-> bytes for one wire format
 *
 * Codecs only ever see intermediate Values; they know nothing about C++
 * types. Schema-aware codecs receive the Schema derived from the target type.
 *
 * Contract:
 * - decode(encode(v, s), s) == v for every v a converter can produce for s
 * - integers beyond the format's native width raise RangeError
 * - malformed bytes raise DecodeError
 * - values that do not fit the schema raise SchemaMismatchError
 */

#pragma once

#include "adaptr/schema/schema.hpp"
#include "adaptr/value/value.hpp"

#include <memory>
#include <span>
#include <string>
#include <vector>

namespace adaptr {

enum class SchemaUse {
    Ignored,    // the codec never looks at the schema
    Optional,   // used for coercion when present
    Required    // encode/decode raise SchemaError without one
};

constexpr const char* to_string(SchemaUse use) {
    switch (use) {
        case SchemaUse::Ignored:  return "ignored";
        case SchemaUse::Optional: return "optional";
        case SchemaUse::Required: return "required";
        default:                  return "unknown";
    }
}

class Codec {
public:
    virtual ~Codec() = default;

    /// Format name used for selection, matched case-insensitively
    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual SchemaUse schema_use() const = 0;

    [[nodiscard]] virtual Bytes encode(const Value& value, const Schema* schema) const = 0;
    [[nodiscard]] virtual Value decode(std::span<const std::byte> data, const Schema* schema) const = 0;

    /**
     * @brief Decode data written under `writer_schema` into the shape of `schema`
     *
     * Lets a reader consume payloads produced by an older or newer version of
     * its type. The default ignores the writer's schema; formats whose layout
     * depends on the schema override it.
     */
    [[nodiscard]] virtual Value decode(std::span<const std::byte> data, const Schema* schema,
                                       const Schema* writer_schema) const;

    /**
     * @brief Encode several values of the same type
     *
     * The default encodes them as one array value (with an array schema
     * wrapping `schema`).
     */
    [[nodiscard]] virtual Bytes encode_many(const std::vector<Value>& values, const Schema* schema) const;
    [[nodiscard]] virtual std::vector<Value> decode_many(std::span<const std::byte> data, const Schema* schema) const;

protected:
    /// Throws SchemaError when the codec requires a schema and none was given
    void require_schema(const Schema* schema) const;
};

using CodecPtr = std::shared_ptr<const Codec>;

/// Views text as bytes and back
[[nodiscard]] Bytes to_bytes(std::string_view text);
[[nodiscard]] std::string_view as_text(std::span<const std::byte> data);

} // namespace adaptr
