#include "adaptr/registry/builtin_converters.hpp"

#include "adaptr/registry/conversion_context.hpp"
#include "adaptr/value/domain_types.hpp"

#include <algorithm>
#include <charconv>
#include <set>

namespace adaptr {

namespace {

Converter::ToFn read_scalar() {
    return [](const ObjectRef& object, const TypeDescriptor&, ConversionContext& ctx) {
        try {
            return object.binding().read_scalar(object.get());
        } catch (const RangeError& e) {
            ctx.out_of_range(e.what());
        }
    };
}

Converter::FromFn write_scalar() {
    return [](const Value& value, const MutableRef& object, const TypeDescriptor& type, ConversionContext& ctx) {
        switch (object.binding().write_scalar(object.get(), value)) {
            case ScalarStatus::Ok:
                return;
            case ScalarStatus::KindMismatch:
                ctx.mismatch("expected " + type.to_string() + ", got " + to_string(value.kind()));
            case ScalarStatus::OutOfRange:
                ctx.out_of_range(value.to_debug_string() + " does not fit " + type.to_string());
        }
    };
}

void register_kind(ConverterRegistry& registry, Kind kind, Converter::ToFn to, Converter::FromFn from) {
    registry.register_converter(TypeDescriptor::pattern(kind),
                                Converter{std::string("builtin.") + to_string(kind), std::move(to), std::move(from)},
                                Specificity::Kind);
}

// ============================================================================
// Temporal and domain scalars
// ============================================================================

Value timestamp_to(const ObjectRef& object, const TypeDescriptor&, ConversionContext& ctx) {
    const auto& ts = object.as<Timestamp>();
    if (ctx.config().temporal() == TemporalEncoding::Iso8601) {
        return Value(format_timestamp(ts));
    }
    return Value(static_cast<std::int64_t>(ts.time_since_epoch().count()));
}

void timestamp_from(const Value& value, const MutableRef& object, const TypeDescriptor&, ConversionContext& ctx) {
    auto& ts = object.as<Timestamp>();
    if (value.is_int()) {
        ts = Timestamp{std::chrono::milliseconds{value.as_int()}};
    } else if (value.is_text()) {
        auto parsed = parse_timestamp(value.as_text());
        if (!parsed) {
            ctx.mismatch("'" + value.as_text() + "' is not an ISO-8601 timestamp");
        }
        ts = *parsed;
    } else {
        ctx.mismatch(std::string("expected timestamp, got ") + to_string(value.kind()));
    }
}

Value date_to(const ObjectRef& object, const TypeDescriptor&, ConversionContext& ctx) {
    const auto& date = object.as<Date>();
    if (ctx.config().temporal() == TemporalEncoding::Iso8601) {
        return Value(format_date(date));
    }
    return Value(date_to_epoch_millis(date));
}

void date_from(const Value& value, const MutableRef& object, const TypeDescriptor&, ConversionContext& ctx) {
    auto& date = object.as<Date>();
    if (value.is_int()) {
        date = date_from_epoch_millis(value.as_int());
    } else if (value.is_text()) {
        auto parsed = parse_date(value.as_text());
        if (!parsed) {
            ctx.mismatch("'" + value.as_text() + "' is not an ISO-8601 date");
        }
        date = *parsed;
    } else {
        ctx.mismatch(std::string("expected date, got ") + to_string(value.kind()));
    }
}

Value decimal_to(const ObjectRef& object, const TypeDescriptor&, ConversionContext&) {
    return Value(object.as<Decimal>().to_string());
}

void decimal_from(const Value& value, const MutableRef& object, const TypeDescriptor&, ConversionContext& ctx) {
    std::string text;
    if (value.is_text()) {
        text = value.as_text();
    } else if (value.is_int()) {
        text = std::to_string(value.as_int());
    } else {
        ctx.mismatch(std::string("expected decimal text, got ") + to_string(value.kind()));
    }
    auto parsed = Decimal::parse(text);
    if (!parsed) {
        ctx.mismatch("'" + text + "' is not a decimal number");
    }
    object.as<Decimal>() = *parsed;
}

Value uuid_to(const ObjectRef& object, const TypeDescriptor&, ConversionContext&) {
    return Value(object.as<Uuid>().to_string());
}

void uuid_from(const Value& value, const MutableRef& object, const TypeDescriptor&, ConversionContext& ctx) {
    if (!value.is_text()) {
        ctx.mismatch(std::string("expected uuid text, got ") + to_string(value.kind()));
    }
    auto parsed = Uuid::parse(value.as_text());
    if (!parsed) {
        ctx.mismatch("'" + value.as_text() + "' is not a UUID");
    }
    object.as<Uuid>() = *parsed;
}

Value enum_to(const ObjectRef& object, const TypeDescriptor&, ConversionContext&) {
    return Value(object.binding().enum_symbol(object.get()));
}

void enum_from(const Value& value, const MutableRef& object, const TypeDescriptor& type, ConversionContext& ctx) {
    if (!value.is_text()) {
        ctx.mismatch(std::string("expected enum symbol, got ") + to_string(value.kind()));
    }
    if (!object.binding().set_enum_symbol(object.get(), value.as_text())) {
        ctx.mismatch("'" + value.as_text() + "' is not a symbol of " + type.to_string());
    }
}

// ============================================================================
// Containers
// ============================================================================

Value optional_to(const ObjectRef& object, const TypeDescriptor&, ConversionContext& ctx) {
    const auto& binding = object.binding();
    if (!binding.has_value(object.get())) {
        return Value{};
    }
    return ctx.to_intermediate(binding.value_of(object.get()));
}

void optional_from(const Value& value, const MutableRef& object, const TypeDescriptor&, ConversionContext& ctx) {
    const auto& binding = object.binding();
    if (value.is_null()) {
        binding.reset(object.get());
        return;
    }
    ctx.from_intermediate(value, binding.emplace_value(object.get()));
}

Value sequence_to(const ObjectRef& object, const TypeDescriptor&, ConversionContext& ctx) {
    const auto& binding = object.binding();
    const std::size_t count = binding.size(object.get());
    Array items;
    items.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto scope = ctx.index(i);
        items.push_back(ctx.to_intermediate(binding.element(object.get(), i)));
    }
    return Value(std::move(items));
}

void sequence_from(const Value& value, const MutableRef& object, const TypeDescriptor&, ConversionContext& ctx) {
    if (!value.is_array()) {
        ctx.mismatch(std::string("expected array, got ") + to_string(value.kind()));
    }
    const auto& binding = object.binding();
    const auto& items = value.as_array();
    if (!binding.resize(object.get(), items.size())) {
        ctx.mismatch("expected " + std::to_string(binding.size(object.get())) + " elements, got " +
                     std::to_string(items.size()));
    }
    for (std::size_t i = 0; i < items.size(); ++i) {
        auto scope = ctx.index(i);
        ctx.from_intermediate(items[i], binding.mutable_element(object.get(), i));
    }
}

std::string key_text(const Value& key, ConversionContext& ctx) {
    if (key.is_text()) {
        return key.as_text();
    }
    if (key.is_int()) {
        return std::to_string(key.as_int());
    }
    ctx.mismatch(std::string("mapping key must convert to text or int, got ") + to_string(key.kind()));
}

Value mapping_to(const ObjectRef& object, const TypeDescriptor&, ConversionContext& ctx) {
    const auto& binding = object.binding();
    std::vector<std::pair<std::string, ObjectRef>> entries;
    binding.for_each_entry(object.get(), [&](ObjectRef key, ObjectRef value) {
        entries.emplace_back(key_text(ctx.to_intermediate(key), ctx), value);
    });
    if (!binding.ordered()) {
        std::sort(entries.begin(), entries.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });
    }

    const bool private_keys = ctx.config().private_keys();
    Object result;
    for (const auto& [key, value] : entries) {
        if (!private_keys && !key.empty() && key.front() == '_') {
            continue;
        }
        auto scope = ctx.key(key);
        result.insert_or_assign(key, ctx.to_intermediate(value));
    }
    return Value(std::move(result));
}

void mapping_from(const Value& value, const MutableRef& object, const TypeDescriptor& type, ConversionContext& ctx) {
    if (!value.is_object()) {
        ctx.mismatch(std::string("expected object, got ") + to_string(value.kind()));
    }
    const auto& binding = object.binding();
    const bool int_keys = type.key()->kind() == Kind::Int;
    binding.clear(object.get());
    for (const auto& [key, item] : value.as_object()) {
        auto scope = ctx.key(key);
        Value key_value(key);
        if (int_keys) {
            std::int64_t parsed = 0;
            auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), parsed);
            if (ec != std::errc{} || ptr != key.data() + key.size()) {
                ctx.mismatch("mapping key '" + key + "' is not an integer");
            }
            key_value = Value(parsed);
        }
        auto slot = binding.insert_entry(object.get(), [&](MutableRef key_ref) {
            ctx.from_intermediate(key_value, key_ref);
        });
        ctx.from_intermediate(item, slot);
    }
}

Value record_to(const ObjectRef& object, const TypeDescriptor& type, ConversionContext& ctx) {
    const auto& fields = type.fields();
    Object result;
    object.binding().for_each_field(object.get(), [&](std::size_t index, ObjectRef field) {
        if (index >= fields.size()) {
            ctx.mismatch("object has more fields than " + type.to_string());
        }
        auto scope = ctx.field(fields[index].name);
        result.insert_or_assign(fields[index].name, ctx.to_intermediate(field));
    });
    return Value(std::move(result));
}

void record_from(const Value& value, const MutableRef& object, const TypeDescriptor& type, ConversionContext& ctx) {
    if (!value.is_object()) {
        ctx.mismatch("expected object for " + type.to_string() + ", got " + to_string(value.kind()));
    }
    const auto& fields = type.fields();
    const auto& provided = value.as_object();

    object.binding().for_each_mutable_field(object.get(), [&](std::size_t index, MutableRef field) {
        if (index >= fields.size()) {
            ctx.mismatch("object has more fields than " + type.to_string());
        }
        const auto& fd = fields[index];
        auto scope = ctx.field(fd.name);
        if (const Value* item = provided.find(fd.name)) {
            ctx.from_intermediate(*item, field);
        } else if (fd.default_value) {
            ctx.from_intermediate(*fd.default_value, field);
        } else {
            ctx.mismatch("missing required field '" + fd.name + "'");
        }
    });

    for (const auto& [key, item] : provided) {
        bool declared = std::any_of(fields.begin(), fields.end(), [&](const auto& f) { return f.name == key; });
        if (declared) {
            continue;
        }
        if (ctx.config().strict_fields()) {
            ctx.mismatch("unknown field '" + key + "' for " + type.to_string());
        }
        ctx.logger().warning("Adapter", "ignoring unknown field '" + key + "' at " + ctx.path() +
                                        " while loading " + type.to_string());
    }
}

Value union_to(const ObjectRef& object, const TypeDescriptor&, ConversionContext& ctx) {
    return ctx.to_intermediate(object.binding().branch(object.get()));
}

void union_from(const Value& value, const MutableRef& object, const TypeDescriptor& type, ConversionContext& ctx) {
    const auto& branches = type.branches();
    std::vector<std::pair<double, std::size_t>> ranked;
    for (std::size_t i = 0; i < branches.size(); ++i) {
        double score = match_score(*branches[i], value);
        if (score > 0.0) {
            ranked.emplace_back(score, i);
        }
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    for (const auto& [score, index] : ranked) {
        try {
            ctx.from_intermediate(value, object.binding().emplace_branch(object.get(), index));
            return;
        } catch (const SchemaMismatchError&) {
            // next candidate
        }
    }
    ctx.mismatch(value.to_debug_string() + " does not match any branch of " + type.to_string());
}

} // namespace

// ============================================================================
// Matching
// ============================================================================

double match_score(const TypeDescriptor& type, const Value& value) {
    switch (type.kind()) {
        case Kind::Any:
            return 1.0;
        case Kind::Null:
            return value.is_null() ? 1.0 : 0.0;
        case Kind::Bool:
            return value.is_bool() ? 1.0 : 0.0;
        case Kind::Int:
            return value.is_int() && int_fits(value.as_int(), type.bits(), type.is_signed()) ? 1.0 : 0.0;
        case Kind::Float:
            return value.is_float() ? 1.0 : (value.is_int() ? 0.5 : 0.0);
        case Kind::Text:
            return value.is_text() ? 1.0 : 0.0;
        case Kind::Bytes:
            return value.is_bytes() ? 1.0 : 0.0;
        case Kind::Timestamp:
            return value.is_int() || (value.is_text() && parse_timestamp(value.as_text())) ? 1.0 : 0.0;
        case Kind::Date:
            return value.is_int() || (value.is_text() && parse_date(value.as_text())) ? 1.0 : 0.0;
        case Kind::Decimal:
            return (value.is_text() && Decimal::parse(value.as_text())) || value.is_int() ? 1.0 : 0.0;
        case Kind::Uuid:
            return value.is_text() && Uuid::parse(value.as_text()) ? 1.0 : 0.0;
        case Kind::Enum: {
            if (!value.is_text()) return 0.0;
            const auto& symbols = type.symbols();
            return std::find(symbols.begin(), symbols.end(), value.as_text()) != symbols.end() ? 1.0 : 0.0;
        }
        case Kind::Optional:
            return value.is_null() ? 1.0 : match_score(*type.inner(), value);
        case Kind::Sequence: {
            if (!value.is_array()) return 0.0;
            for (const auto& item : value.as_array()) {
                if (match_score(*type.inner(), item) == 0.0) return 0.0;
            }
            return 1.0;
        }
        case Kind::Mapping: {
            if (!value.is_object()) return 0.0;
            for (const auto& [key, item] : value.as_object()) {
                if (match_score(*type.inner(), item) == 0.0) return 0.0;
            }
            return 1.0;
        }
        case Kind::Record: {
            if (!value.is_object()) return 0.0;
            std::set<std::string> declared;
            for (const auto& f : type.fields()) declared.insert(f.name);
            std::set<std::string> all = declared;
            std::size_t common = 0;
            for (const auto& [key, item] : value.as_object()) {
                common += declared.count(key);
                all.insert(key);
            }
            return all.empty() ? 1.0 : static_cast<double>(common) / static_cast<double>(all.size());
        }
        case Kind::Union: {
            double best = 0.0;
            for (const auto& branch : type.branches()) {
                best = std::max(best, match_score(*branch, value));
            }
            return best;
        }
        case Kind::Opaque:
            return 0.5;
        default:
            return 0.0;
    }
}

// ============================================================================
// Installation
// ============================================================================

void install_builtin_converters(ConverterRegistry& registry) {
    register_kind(registry, Kind::Null,
        [](const ObjectRef&, const TypeDescriptor&, ConversionContext&) { return Value{}; },
        [](const Value& value, const MutableRef&, const TypeDescriptor&, ConversionContext& ctx) {
            if (!value.is_null()) {
                ctx.mismatch(std::string("expected null, got ") + to_string(value.kind()));
            }
        });

    for (Kind kind : {Kind::Bool, Kind::Int, Kind::Float, Kind::Text, Kind::Bytes}) {
        register_kind(registry, kind, read_scalar(), write_scalar());
    }

    register_kind(registry, Kind::Timestamp, timestamp_to, timestamp_from);
    register_kind(registry, Kind::Date, date_to, date_from);
    register_kind(registry, Kind::Decimal, decimal_to, decimal_from);
    register_kind(registry, Kind::Uuid, uuid_to, uuid_from);
    register_kind(registry, Kind::Enum, enum_to, enum_from);
    register_kind(registry, Kind::Optional, optional_to, optional_from);
    register_kind(registry, Kind::Sequence, sequence_to, sequence_from);
    register_kind(registry, Kind::Mapping, mapping_to, mapping_from);
    register_kind(registry, Kind::Record, record_to, record_from);
    register_kind(registry, Kind::Union, union_to, union_from);
}

} // namespace adaptr
