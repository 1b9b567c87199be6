/**
 * @file binary_codec.hpp
 * @brief Compact schema-driven binary format ("binary")
 *
 * Layout per schema node:
 *
 * | Node      | Encoding                                               |
 * |-----------|--------------------------------------------------------|
 * | nullable  | 0x00 for null, 0x01 followed by the value              |
 * | bool      | 0x00 / 0x01                                            |
 * | int       | zig-zag LEB128 varint, range-checked against the width |
 * | float     | IEEE-754 little endian, 4 or 8 bytes                   |
 * | text      | varint length + UTF-8                                  |
 * | bytes     | varint length + raw bytes                              |
 * | enum      | varint symbol index                                    |
 * | array     | varint count + items                                   |
 * | map       | varint count + (text key, value) pairs                 |
 * | record    | varint field count + fields in declaration order       |
 * | union     | varint branch index + branch value                     |
 *
 * A record written with fewer fields than the reader's schema declares decodes
 * the missing trailing fields from their defaults, so appending a field with a
 * default keeps old payloads readable. With the writer's schema at hand,
 * record fields are matched by name instead: fields only the writer knows are
 * skipped and fields only the reader knows take their defaults.
 *
 * Arrays of null items occupy no bytes per item, so their count is capped at
 * MAX_NULL_ITEMS; every other count is bounded by the remaining input.
 */

#pragma once

#include "adaptr/codec/codec.hpp"

#include <cstdint>

namespace adaptr {

/// Largest count accepted for an array whose items are null
constexpr std::uint64_t MAX_NULL_ITEMS = 1u << 20;

class BinaryCodec : public Codec {
public:
    [[nodiscard]] std::string name() const override { return "binary"; }
    [[nodiscard]] SchemaUse schema_use() const override { return SchemaUse::Required; }

    [[nodiscard]] Bytes encode(const Value& value, const Schema* schema) const override;
    [[nodiscard]] Value decode(std::span<const std::byte> data, const Schema* schema) const override;
    [[nodiscard]] Value decode(std::span<const std::byte> data, const Schema* schema,
                               const Schema* writer_schema) const override;
};

} // namespace adaptr
