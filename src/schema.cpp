#include "adaptr/schema/schema.hpp"

#include <algorithm>
#include <set>

namespace adaptr {

namespace {

bool same(const SchemaPtr& a, const SchemaPtr& b) {
    return a == b || (a && b && *a == *b);
}

} // namespace

bool operator==(const Schema& a, const Schema& b) {
    if (a.kind != b.kind || a.logical != b.logical || a.nullable != b.nullable || a.name != b.name ||
        a.bits != b.bits || a.is_signed != b.is_signed || a.symbols != b.symbols || !same(a.items, b.items) ||
        a.branches.size() != b.branches.size() || a.fields.size() != b.fields.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.branches.size(); ++i) {
        if (!same(a.branches[i], b.branches[i])) {
            return false;
        }
    }
    for (std::size_t i = 0; i < a.fields.size(); ++i) {
        const auto& fa = a.fields[i];
        const auto& fb = b.fields[i];
        if (fa.name != fb.name || !same(fa.schema, fb.schema) || fa.default_value != fb.default_value) {
            return false;
        }
    }
    return true;
}

SchemaPtr make_nullable(const Schema& schema) {
    auto copy = std::make_shared<Schema>(schema);
    copy->nullable = true;
    return copy;
}

std::string Schema::to_string() const {
    std::string out;
    switch (kind) {
        case SchemaKind::Int:
            out = (is_signed ? "int" : "uint") + std::to_string(bits);
            break;
        case SchemaKind::Float:
            out = "float" + std::to_string(bits);
            break;
        case SchemaKind::Enum:
            out = "enum " + name;
            break;
        case SchemaKind::Array:
            out = "array<" + (items ? items->to_string() : std::string("?")) + ">";
            break;
        case SchemaKind::Map:
            out = "map<" + (items ? items->to_string() : std::string("?")) + ">";
            break;
        case SchemaKind::Record:
            out = "record " + name + "{";
            for (std::size_t i = 0; i < fields.size(); ++i) {
                if (i) out += ", ";
                out += fields[i].name + ": " + (fields[i].schema ? fields[i].schema->to_string() : "?");
            }
            out += "}";
            break;
        case SchemaKind::Union:
            out = "union<";
            for (std::size_t i = 0; i < branches.size(); ++i) {
                if (i) out += ", ";
                out += branches[i] ? branches[i]->to_string() : "?";
            }
            out += ">";
            break;
        default:
            out = adaptr::to_string(kind);
            break;
    }
    if (logical != LogicalType::None) {
        out += "(" + std::string(adaptr::to_string(logical)) + ")";
    }
    return nullable ? out + "?" : out;
}

// ============================================================================
// Matching
// ============================================================================

double match_score(const Schema& schema, const Value& value) {
    if (value.is_null()) {
        return schema.nullable || schema.kind == SchemaKind::Null ? 1.0 : 0.0;
    }
    switch (schema.kind) {
        case SchemaKind::Null:
            return 0.0;
        case SchemaKind::Bool:
            return value.is_bool() ? 1.0 : 0.0;
        case SchemaKind::Int:
            return value.is_int() && int_fits(value.as_int(), schema.bits, schema.is_signed) ? 1.0 : 0.0;
        case SchemaKind::Float:
            return value.is_float() ? 1.0 : (value.is_int() ? 0.5 : 0.0);
        case SchemaKind::Text:
            return value.is_text() ? 1.0 : 0.0;
        case SchemaKind::Bytes:
            // text formats carry bytes as base64
            return value.is_bytes() ? 1.0 : (value.is_text() ? 0.25 : 0.0);
        case SchemaKind::Enum:
            return value.is_text() &&
                   std::find(schema.symbols.begin(), schema.symbols.end(), value.as_text()) != schema.symbols.end()
                       ? 1.0 : 0.0;
        case SchemaKind::Array:
            if (!value.is_array()) return 0.0;
            for (const auto& item : value.as_array()) {
                if (match_score(*schema.items, item) == 0.0) return 0.0;
            }
            return 1.0;
        case SchemaKind::Map:
            if (!value.is_object()) return 0.0;
            for (const auto& [key, item] : value.as_object()) {
                if (match_score(*schema.items, item) == 0.0) return 0.0;
            }
            return 1.0;
        case SchemaKind::Record: {
            if (!value.is_object()) return 0.0;
            std::set<std::string> all;
            std::size_t common = 0;
            for (const auto& f : schema.fields) {
                all.insert(f.name);
            }
            for (const auto& [key, item] : value.as_object()) {
                if (const auto* f = schema.field(key)) {
                    if (match_score(*f->schema, item) == 0.0) return 0.0;
                    ++common;
                }
                all.insert(key);
            }
            return all.empty() ? 1.0 : static_cast<double>(common) / static_cast<double>(all.size());
        }
        case SchemaKind::Union: {
            double best = 0.0;
            for (const auto& branch : schema.branches) {
                best = std::max(best, match_score(*branch, value));
            }
            return best;
        }
    }
    return 0.0;
}

std::optional<std::size_t> best_branch(const Schema& schema, const Value& value) {
    std::optional<std::size_t> best;
    double best_score = 0.0;
    for (std::size_t i = 0; i < schema.branches.size(); ++i) {
        double score = match_score(*schema.branches[i], value);
        if (score > best_score) {
            best_score = score;
            best = i;
        }
    }
    return best;
}

} // namespace adaptr
