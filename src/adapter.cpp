#include "adaptr/adapter.hpp"

#include "adaptr/codec/json_codec.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <iterator>
#include <ostream>
#include <stdexcept>

namespace adaptr {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

} // namespace

Adapter::Adapter(AdapterConfig config)
    : config_(std::move(config))
    , logger_(config_.verbosity())
    , resolver_(hooks_, config_)
    , converters_(config_.caching())
    , schemas_(hooks_, config_) {
    resolver_.set_default_converter([this](const ObjectRef& object) {
        ConversionContext ctx(*this);
        return convert_to(object, ctx);
    });
    resolver_.set_converter_probe([this](const TypeDescriptorPtr& descriptor) {
        return converters_.contains(descriptor);
    });

    install(BuiltinConvertersPlugin{});
    install(BinaryPlugin{});
    install(JsonPlugin{});
    install(CsvPlugin{});
}

// ============================================================================
// Conversion
// ============================================================================

Value Adapter::convert_to(const ObjectRef& object, ConversionContext& ctx) const {
    auto descriptor = resolver_.resolve(object.binding());
    auto converter = converters_.lookup(descriptor);
    Value value = converter->to_intermediate(object, *descriptor, ctx);
    if (!hooks_.empty<HookPoint::ToIntermediate>()) {
        if (auto hooked = hooks_.invoke<HookPoint::ToIntermediate>(*descriptor, &value)) {
            value = std::move(*hooked);
        }
    }
    return value;
}

void Adapter::convert_from(const Value& value, const MutableRef& object, ConversionContext& ctx) const {
    auto descriptor = resolver_.resolve(object.binding());
    auto converter = converters_.lookup(descriptor);
    if (!hooks_.empty<HookPoint::FromIntermediate>()) {
        if (auto hooked = hooks_.invoke<HookPoint::FromIntermediate>(*descriptor, &value)) {
            converter->from_intermediate(*hooked, object, *descriptor, ctx);
            return;
        }
    }
    converter->from_intermediate(value, object, *descriptor, ctx);
}

Value Adapter::to_intermediate(const ObjectRef& object) const {
    ConversionContext ctx(*this);
    return convert_to(object, ctx);
}

void Adapter::from_intermediate(const Value& value, const MutableRef& object) const {
    ConversionContext ctx(*this);
    convert_from(value, object, ctx);
}

// ============================================================================
// Dump / load
// ============================================================================

SchemaPtr Adapter::schema_for_codec(const Codec& codec, const TypeDescriptorPtr& descriptor) const {
    switch (codec.schema_use()) {
        case SchemaUse::Ignored:
            return nullptr;
        case SchemaUse::Required:
            return schema_for(descriptor);
        case SchemaUse::Optional:
            break;
    }
    try {
        return schema_for(descriptor);
    } catch (const SchemaError& e) {
        logger_.debug("Adapter", "no schema for " + codec.name() + ", continuing without: " + e.what());
        return nullptr;
    }
}

Bytes Adapter::dump(const ObjectRef& object, std::string_view format) const {
    auto selected = codec(format);
    auto descriptor = resolver_.resolve(object.binding());
    Value value = to_intermediate(object);
    auto schema = schema_for_codec(*selected, descriptor);
    return selected->encode(value, schema.get());
}

void Adapter::load(std::span<const std::byte> data, const MutableRef& object, std::string_view format,
                   const Schema* writer_schema) const {
    auto selected = codec(format);
    auto descriptor = resolver_.resolve(object.binding());
    auto schema = schema_for_codec(*selected, descriptor);
    Value value = writer_schema ? selected->decode(data, schema.get(), writer_schema)
                                : selected->decode(data, schema.get());
    from_intermediate(value, object);
}

Value Adapter::load_value(std::span<const std::byte> data, const TypeDeclPtr& declaration,
                          std::string_view format) const {
    auto selected = codec(format);
    auto descriptor = resolve(declaration);
    auto schema = schema_for(descriptor);
    Value value = selected->decode(data, selected->schema_use() == SchemaUse::Ignored ? nullptr : schema.get());
    return coerce(value, *schema);
}

Bytes Adapter::dump_many(const Binding& binding, const std::vector<ObjectRef>& objects,
                         std::string_view format) const {
    auto selected = codec(format);
    auto descriptor = resolver_.resolve(binding);
    std::vector<Value> values;
    values.reserve(objects.size());
    for (const auto& object : objects) {
        values.push_back(to_intermediate(object));
    }
    auto schema = schema_for_codec(*selected, descriptor);
    return selected->encode_many(values, schema.get());
}

std::vector<Value> Adapter::decode_many(const Binding& binding, std::span<const std::byte> data,
                                        std::string_view format) const {
    auto selected = codec(format);
    auto descriptor = resolver_.resolve(binding);
    auto schema = schema_for_codec(*selected, descriptor);
    return selected->decode_many(data, schema.get());
}

void Adapter::write_stream(const Bytes& data, std::ostream& out) {
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw std::runtime_error("failed to write serialized data to stream");
    }
}

Bytes Adapter::read_stream(std::istream& in) {
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("failed to read serialized data from stream");
    }
    return to_bytes(text);
}

// ============================================================================
// Types and schemas
// ============================================================================

TypeDescriptorPtr Adapter::resolve(const TypeDeclPtr& declaration) const {
    return resolver_.resolve(declaration);
}

SchemaPtr Adapter::schema_for(const TypeDescriptorPtr& descriptor) const {
    return schemas_.derive(descriptor);
}

TypeDescriptorPtr Adapter::key_for(const Binding& binding) const {
    auto declaration = binding.declaration();
    try {
        return resolver_.resolve(declaration);
    } catch (const UnsupportedTypeError&) {
        // A recursive record cannot resolve before its converter exists; it is
        // registered under the opaque name its back-references resolve to.
        if (declaration->kind() != DeclKind::Record) {
            throw;
        }
        return TypeDescriptor::opaque(declaration->name());
    }
}

// ============================================================================
// Registration
// ============================================================================

void Adapter::register_converter(const TypeDescriptorPtr& key, Converter converter,
                                 std::optional<Specificity> specificity, RegistrationMode mode) {
    if (!key) {
        throw std::invalid_argument("converter key must not be null");
    }
    const Specificity rank = specificity.value_or(default_specificity(*key));
    logger_.info("Registry", "registering converter '" + converter.name + "' for " + key->to_string() +
                             " (" + to_string(rank) + ")");
    if (mode == RegistrationMode::Replace && !converters_.candidates(key).empty()) {
        logger_.info("Registry", "replacing converters registered for " + key->to_string());
    }
    converters_.register_converter(key, std::move(converter), rank, mode);
    invalidate_caches();
}

void Adapter::register_converter(const TypeDeclPtr& declaration, Converter converter,
                                 std::optional<Specificity> specificity, RegistrationMode mode) {
    register_converter(resolve(declaration), std::move(converter), specificity, mode);
}

std::size_t Adapter::unregister_converter(const TypeDescriptorPtr& key, std::string_view name) {
    std::size_t removed = converters_.unregister_converter(key, name);
    invalidate_caches();
    return removed;
}

void Adapter::set_hook_policy(HookPoint point, HookPolicy policy) {
    hooks_.set_policy(point, policy);
    invalidate_caches();
}

void Adapter::register_codec(CodecPtr codec, int order) {
    if (!codec) {
        throw std::invalid_argument("codec must not be null");
    }
    const std::string name = codec->name();
    register_hook<HookPoint::SelectCodec>(
        "codec." + name,
        [codec = std::move(codec)](const std::string& format, const CodecPtr*) -> HookResult<CodecPtr> {
            if (!iequals(format, codec->name())) {
                return HookResult<CodecPtr>::not_applicable();
            }
            return codec;
        },
        order);
}

CodecPtr Adapter::codec(std::string_view format) const {
    auto selected = hooks_.invoke<HookPoint::SelectCodec>(std::string(format));
    if (!selected || !*selected) {
        throw UnknownFormatError(std::string(format));
    }
    return *selected;
}

void Adapter::install(const Plugin& plugin) {
    const std::string name = plugin.name();
    {
        std::lock_guard<std::mutex> lock(plugin_mutex_);
        if (!plugins_.insert(name).second) {
            throw std::invalid_argument("plugin '" + name + "' is already installed");
        }
    }
    try {
        plugin.install(*this);
    } catch (...) {
        std::lock_guard<std::mutex> lock(plugin_mutex_);
        plugins_.erase(name);
        throw;
    }
    logger_.info("Adapter", "installed plugin '" + name + "'");
}

bool Adapter::installed(std::string_view plugin_name) const {
    std::lock_guard<std::mutex> lock(plugin_mutex_);
    return plugins_.find(plugin_name) != plugins_.end();
}

void Adapter::invalidate_caches() {
    resolver_.invalidate();
    schemas_.invalidate();
}

Adapter& default_adapter() {
    static Adapter instance;
    return instance;
}

} // namespace adaptr
