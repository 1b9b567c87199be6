#include "adaptr/schema/schema_deriver.hpp"

#include "adaptr/errors.hpp"

#include <mutex>

namespace adaptr {

SchemaPtr SchemaDeriver::derive(const TypeDescriptorPtr& descriptor) const {
    if (!descriptor) {
        throw SchemaError("null type descriptor");
    }
    if (descriptor->is_pattern()) {
        throw SchemaError("pattern descriptors have no schema", descriptor->to_string());
    }

    const bool caching = config_.caching();
    if (caching) {
        std::shared_lock lock(cache_mutex_);
        auto it = cache_.find(descriptor);
        if (it != cache_.end()) {
            return it->second;
        }
    }
    const auto generation = generation_.load(std::memory_order_acquire);

    SchemaPtr result;
    // Opaque types have nothing built in to chain from
    if (hooks_.policy(HookPoint::DeriveSchema) == HookPolicy::FirstSuccess || descriptor->kind() == Kind::Opaque) {
        if (auto hooked = hooks_.invoke<HookPoint::DeriveSchema>(*descriptor)) {
            result = std::move(*hooked);
        }
        if (!result) {
            result = derive_builtin(*descriptor);
        }
    } else {
        auto builtin = derive_builtin(*descriptor);
        auto hooked = hooks_.invoke<HookPoint::DeriveSchema>(*descriptor, &builtin);
        result = hooked && *hooked ? std::move(*hooked) : std::move(builtin);
    }

    if (caching) {
        std::unique_lock lock(cache_mutex_);
        if (generation == generation_.load(std::memory_order_acquire)) {
            cache_.emplace(descriptor, result);
        }
    }
    return result;
}

void SchemaDeriver::invalidate() {
    std::unique_lock lock(cache_mutex_);
    generation_.fetch_add(1, std::memory_order_acq_rel);
    cache_.clear();
}

SchemaPtr SchemaDeriver::derive_builtin(const TypeDescriptor& descriptor) const {
    auto schema = std::make_shared<Schema>();
    const bool iso = config_.temporal() == TemporalEncoding::Iso8601;

    switch (descriptor.kind()) {
        case Kind::Null:
            schema->kind = SchemaKind::Null;
            break;
        case Kind::Bool:
            schema->kind = SchemaKind::Bool;
            break;
        case Kind::Int:
            schema->kind = SchemaKind::Int;
            schema->bits = descriptor.bits();
            schema->is_signed = descriptor.is_signed();
            break;
        case Kind::Float:
            schema->kind = SchemaKind::Float;
            schema->bits = descriptor.bits();
            break;
        case Kind::Text:
            schema->kind = SchemaKind::Text;
            break;
        case Kind::Bytes:
            schema->kind = SchemaKind::Bytes;
            break;
        case Kind::Timestamp:
        case Kind::Date:
            schema->logical = descriptor.kind() == Kind::Timestamp ? LogicalType::Timestamp : LogicalType::Date;
            if (iso) {
                schema->kind = SchemaKind::Text;
            } else {
                schema->kind = SchemaKind::Int;
                schema->bits = 64;
            }
            break;
        case Kind::Decimal:
            schema->kind = SchemaKind::Text;
            schema->logical = LogicalType::Decimal;
            break;
        case Kind::Uuid:
            schema->kind = SchemaKind::Text;
            schema->logical = LogicalType::Uuid;
            break;
        case Kind::Enum:
            schema->kind = SchemaKind::Enum;
            schema->name = descriptor.name();
            schema->symbols = descriptor.symbols();
            break;
        case Kind::Optional:
            return make_nullable(*derive(descriptor.inner()));
        case Kind::Sequence:
            schema->kind = SchemaKind::Array;
            schema->items = derive(descriptor.inner());
            break;
        case Kind::Mapping:
            schema->kind = SchemaKind::Map;
            schema->items = derive(descriptor.inner());
            break;
        case Kind::Record:
            schema->kind = SchemaKind::Record;
            schema->name = descriptor.name();
            for (const auto& field : descriptor.fields()) {
                schema->fields.push_back(SchemaField{field.name, derive(field.type), field.default_value});
            }
            break;
        case Kind::Union:
            schema->kind = SchemaKind::Union;
            for (const auto& branch : descriptor.branches()) {
                schema->branches.push_back(derive(branch));
            }
            break;
        case Kind::Opaque:
            throw SchemaError("opaque type '" + descriptor.name() + "' has no schema; register a DeriveSchema hook",
                              descriptor.to_string());
        default:
            throw SchemaError("cannot derive a schema", descriptor.to_string());
    }
    return schema;
}

} // namespace adaptr
