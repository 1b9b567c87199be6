#include "adaptr/codec/csv_codec.hpp"

#include "adaptr/codec/base64.hpp"

#include <charconv>
#include <cmath>

namespace adaptr {

namespace {

struct Cell {
    std::string text;
    bool quoted = false;
};

using Row = std::vector<Cell>;

// ============================================================================
// Writing
// ============================================================================

std::string quote(std::string_view text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"') {
            out += '"';
        }
        out += c;
    }
    out += '"';
    return out;
}

std::string format_float(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
    char buffer[32];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), d);
    return std::string(buffer, ptr);
}

// A bare cell in a union column would parse back as the first scalar branch
bool quotes_text(const Schema* schema) {
    if (schema == nullptr || schema->kind != SchemaKind::Union) {
        return false;
    }
    for (const auto& branch : schema->branches) {
        if (branch->kind != SchemaKind::Text) {
            return true;
        }
    }
    return false;
}

std::string format_cell(const Value& value, std::string_view column, const Schema* schema) {
    switch (value.kind()) {
        case ValueKind::Null:
            return {};
        case ValueKind::Bool:
            return value.as_bool() ? "true" : "false";
        case ValueKind::Int:
            return std::to_string(value.as_int());
        case ValueKind::Float:
            return format_float(value.as_float());
        case ValueKind::Text: {
            const auto& text = value.as_text();
            if (text.empty() || quotes_text(schema) || text.find_first_of(",\"\r\n") != std::string::npos) {
                return quote(text);
            }
            return text;
        }
        case ValueKind::Bytes:
            return base64_encode(value.as_bytes());
        default:
            throw SchemaMismatchError("nested " + std::string(to_string(value.kind())) +
                                      " cannot be written as a CSV cell", std::string(column));
    }
}

std::vector<std::string> header_of(const Value& first, const Schema* schema) {
    std::vector<std::string> header;
    if (schema) {
        if (schema->kind != SchemaKind::Record) {
            throw SchemaMismatchError("CSV holds flat records, not " + schema->to_string());
        }
        for (const auto& field : schema->fields) {
            header.push_back(field.name);
        }
    } else {
        for (const auto& [key, item] : first.as_object()) {
            header.push_back(key);
        }
    }
    return header;
}

void write_row(std::string& out, const std::vector<std::string>& columns) {
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (i) out += ',';
        out += columns[i];
    }
    out += "\r\n";
}

Bytes write_records(const std::vector<Value>& records, const Schema* schema) {
    for (const auto& record : records) {
        if (!record.is_object()) {
            throw SchemaMismatchError("CSV rows must be records, got " + std::string(to_string(record.kind())));
        }
    }
    if (records.empty() && schema == nullptr) {
        return {};
    }

    auto header = header_of(records.empty() ? Value(Object{}) : records.front(), schema);
    std::string out;
    std::vector<std::string> columns;
    for (const auto& name : header) {
        columns.push_back(format_cell(Value(name), name, nullptr));
    }
    write_row(out, columns);

    std::vector<const Schema*> column_schemas;
    for (const auto& name : header) {
        const SchemaField* field = schema ? schema->field(name) : nullptr;
        column_schemas.push_back(field ? field->schema.get() : nullptr);
    }

    for (const auto& record : records) {
        columns.clear();
        for (std::size_t c = 0; c < header.size(); ++c) {
            const Value* item = record.as_object().find(header[c]);
            columns.push_back(item ? format_cell(*item, header[c], column_schemas[c]) : std::string());
        }
        write_row(out, columns);
    }
    return to_bytes(out);
}

// ============================================================================
// Reading
// ============================================================================

std::vector<Row> parse_rows(std::string_view text) {
    std::vector<Row> rows;
    Row row;
    Cell cell;
    bool in_quotes = false;
    bool after_quote = false;   // closing quote seen, only a separator may follow
    bool row_started = false;

    auto end_cell = [&]() {
        row.push_back(std::move(cell));
        cell = Cell{};
        after_quote = false;
    };
    auto end_row = [&]() {
        end_cell();
        rows.push_back(std::move(row));
        row.clear();
        row_started = false;
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    cell.text += '"';
                    ++i;
                } else {
                    in_quotes = false;
                    after_quote = true;
                }
            } else {
                cell.text += c;
            }
            continue;
        }
        if (c == ',') {
            row_started = true;
            end_cell();
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            if (!row_started && row.empty()) {
                // with a single column an empty line is a row holding one null cell
                if (rows.empty() || rows.front().size() != 1) {
                    continue;   // blank line
                }
            }
            end_row();
        } else if (after_quote) {
            throw DecodeError("unexpected character after closing quote in CSV row " + std::to_string(rows.size() + 1));
        } else if (c == '"') {
            if (!cell.text.empty()) {
                throw DecodeError("quote inside unquoted CSV cell in row " + std::to_string(rows.size() + 1));
            }
            in_quotes = true;
            cell.quoted = true;
            row_started = true;
        } else {
            cell.text += c;
            row_started = true;
        }
    }
    if (in_quotes) {
        throw DecodeError("unterminated quoted CSV cell");
    }
    if (row_started || !cell.text.empty() || cell.quoted) {
        end_row();
    }
    return rows;
}

Value parse_scalar(const Cell& cell, const Schema& schema, const std::string& column) {
    const std::string& text = cell.text;
    auto fail = [&]() -> Value {
        throw SchemaMismatchError("cell '" + text + "' is not a valid " + schema.to_string(), column);
    };

    switch (schema.kind) {
        case SchemaKind::Bool:
            if (text == "true") return Value(true);
            if (text == "false") return Value(false);
            return fail();
        case SchemaKind::Int: {
            std::int64_t v = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
            if (ec == std::errc::result_out_of_range) {
                throw RangeError("cell '" + text + "' exceeds int64", column);
            }
            if (ec != std::errc{} || ptr != text.data() + text.size()) return fail();
            if (!int_fits(v, schema.bits, schema.is_signed)) {
                throw RangeError("cell '" + text + "' does not fit " + schema.to_string(), column);
            }
            return Value(v);
        }
        case SchemaKind::Float: {
            double d = 0.0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), d);
            if (ec != std::errc{} || ptr != text.data() + text.size()) return fail();
            return Value(d);
        }
        case SchemaKind::Text:
            return Value(text);
        case SchemaKind::Bytes: {
            auto decoded = base64_decode(text);
            if (!decoded) return fail();
            return Value(std::move(*decoded));
        }
        case SchemaKind::Enum:
            for (const auto& symbol : schema.symbols) {
                if (symbol == text) return Value(text);
            }
            return fail();
        case SchemaKind::Union:
            // quoted cells were written as text
            if (cell.quoted) {
                for (const auto& branch : schema.branches) {
                    if (branch->kind == SchemaKind::Text) {
                        return Value(text);
                    }
                }
            }
            for (const auto& branch : schema.branches) {
                try {
                    return parse_scalar(cell, *branch, column);
                } catch (const SchemaMismatchError&) {
                    // next branch
                }
            }
            return fail();
        default:
            throw SchemaMismatchError("CSV cannot hold " + schema.to_string(), column);
    }
}

Value read_cell(const Cell* cell, const SchemaField& field) {
    const Schema& schema = *field.schema;
    const bool empty = cell == nullptr || (cell->text.empty() && !cell->quoted);
    if (empty) {
        if (schema.nullable || schema.kind == SchemaKind::Null) {
            return Value{};
        }
        if (field.default_value) {
            return *field.default_value;
        }
        throw SchemaMismatchError("missing value for required column", field.name);
    }
    return parse_scalar(*cell, schema, field.name);
}

std::vector<Value> read_records(std::string_view text, const Schema* schema) {
    auto rows = parse_rows(text);
    if (rows.empty()) {
        return {};
    }
    std::vector<std::string> header;
    for (auto& cell : rows.front()) {
        header.push_back(std::move(cell.text));
    }
    if (schema && schema->kind != SchemaKind::Record) {
        throw SchemaMismatchError("CSV holds flat records, not " + schema->to_string());
    }

    std::vector<Value> records;
    for (std::size_t r = 1; r < rows.size(); ++r) {
        const Row& row = rows[r];
        if (row.size() != header.size()) {
            throw DecodeError("CSV row " + std::to_string(r + 1) + " has " + std::to_string(row.size()) +
                              " cells, header has " + std::to_string(header.size()));
        }
        Object record;
        if (schema) {
            for (const auto& field : schema->fields) {
                const Cell* cell = nullptr;
                for (std::size_t c = 0; c < header.size(); ++c) {
                    if (header[c] == field.name) {
                        cell = &row[c];
                        break;
                    }
                }
                record.insert_or_assign(field.name, read_cell(cell, field));
            }
        } else {
            for (std::size_t c = 0; c < header.size(); ++c) {
                const Cell& cell = row[c];
                record.insert_or_assign(header[c], cell.text.empty() && !cell.quoted ? Value{} : Value(cell.text));
            }
        }
        records.push_back(Value(std::move(record)));
    }
    return records;
}

} // namespace

Bytes CsvCodec::encode(const Value& value, const Schema* schema) const {
    return write_records({value}, schema);
}

Value CsvCodec::decode(std::span<const std::byte> data, const Schema* schema) const {
    auto records = read_records(as_text(data), schema);
    if (records.size() != 1) {
        throw DecodeError("expected one CSV record, found " + std::to_string(records.size()));
    }
    return std::move(records.front());
}

Bytes CsvCodec::encode_many(const std::vector<Value>& values, const Schema* schema) const {
    return write_records(values, schema);
}

std::vector<Value> CsvCodec::decode_many(std::span<const std::byte> data, const Schema* schema) const {
    return read_records(as_text(data), schema);
}

} // namespace adaptr
