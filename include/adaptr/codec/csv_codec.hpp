/**
 * @file csv_codec.hpp
 * @brief RFC 4180 CSV for flat records ("csv")
 *
 * The header row lists field names in declaration order (or, without a
 * schema, in the order of the first record's keys); each record is one CRLF
 * terminated row.
 *
 * | Value         | Cell                                  |
 * |---------------|---------------------------------------|
 * | null          | empty                                 |
 * | ""            | ""  (quoted empty)                    |
 * | text          | as is, quoted when it holds , " CR LF |
 * |               | or in a union column with scalars     |
 * | bool          | true / false                          |
 * | int, float    | decimal, shortest round-trip form     |
 * | bytes         | base64                                |
 *
 * Without a schema every quoted or non-empty cell decodes as text. With a
 * schema cells are parsed back to the declared scalar kinds. Nested values
 * (arrays, objects, record-typed fields) raise SchemaMismatchError.
 *
 * Blank lines are skipped, except in a single-column file where an empty line
 * is the row of a record whose only field is null.
 */

#pragma once

#include "adaptr/codec/codec.hpp"

namespace adaptr {

class CsvCodec : public Codec {
public:
    [[nodiscard]] std::string name() const override { return "csv"; }
    [[nodiscard]] SchemaUse schema_use() const override { return SchemaUse::Optional; }

    [[nodiscard]] Bytes encode(const Value& value, const Schema* schema) const override;
    using Codec::decode;
    [[nodiscard]] Value decode(std::span<const std::byte> data, const Schema* schema) const override;

    [[nodiscard]] Bytes encode_many(const std::vector<Value>& values, const Schema* schema) const override;
    [[nodiscard]] std::vector<Value> decode_many(std::span<const std::byte> data, const Schema* schema) const override;
};

} // namespace adaptr
