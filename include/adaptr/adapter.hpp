/**
 * @file adapter.hpp
 * @brief The facade: objects <-> Values <-> bytes
 *
 * An Adapter owns one set of registration tables (hooks, converters, codecs,
 * installed plugins) and the caches derived from them. default_adapter() is
 * the process-wide instance behind the free functions at the bottom of this
 * header; independent Adapters can be created for isolated configurations.
 *
 * Every Adapter starts with the built-in converters and the binary, json and
 * csv codecs installed.
 *
 * Example:
 * @code
 * struct Ship {
 *     std::string name;
 *     std::optional<adaptr::Date> build_on;
 * };
 *
 * adaptr::Bytes data = adaptr::dump(Ship{"Elvira", std::nullopt}, "json");
 * Ship ship = adaptr::load<Ship>(data, "json");
 * @endcode
 *
 * Conversion order for one object:
 *   dump: resolve descriptor -> lookup converter -> to_intermediate ->
 *         ToIntermediate hooks -> codec.encode
 *   load: codec.decode -> FromIntermediate hooks -> lookup converter ->
 *         from_intermediate
 * Nested objects go through the same steps via the ConversionContext.
 */

#pragma once

#include "adaptr/codec/codec.hpp"
#include "adaptr/config.hpp"
#include "adaptr/hooks/hook_registry.hpp"
#include "adaptr/log.hpp"
#include "adaptr/objects/typed_binding.hpp"
#include "adaptr/plugin/plugin.hpp"
#include "adaptr/registry/conversion_context.hpp"
#include "adaptr/registry/converter_registry.hpp"
#include "adaptr/schema/schema_deriver.hpp"
#include "adaptr/types/type_resolver.hpp"

#include <iosfwd>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace adaptr {

class Adapter {
public:
    explicit Adapter(AdapterConfig config = {});

    Adapter(const Adapter&) = delete;
    Adapter& operator=(const Adapter&) = delete;

    // ========================================================================
    // Static-type API
    // ========================================================================

    template<typename T>
    [[nodiscard]] Bytes dump(const T& object, std::string_view format) const {
        return dump(ref(object), format);
    }

    template<typename T>
    [[nodiscard]] T load(std::span<const std::byte> data, std::string_view format) const {
        T object{};
        load(data, mutable_ref(object), format);
        return object;
    }

    /// Load data written under an earlier (or later) schema of T
    template<typename T>
    [[nodiscard]] T load(std::span<const std::byte> data, std::string_view format,
                         const Schema& writer_schema) const {
        T object{};
        load(data, mutable_ref(object), format, &writer_schema);
        return object;
    }

    template<typename T>
    [[nodiscard]] Value to_intermediate(const T& object) const {
        return to_intermediate(ref(object));
    }

    template<typename T>
    [[nodiscard]] T from_intermediate(const Value& value) const {
        T object{};
        from_intermediate(value, mutable_ref(object));
        return object;
    }

    template<typename T>
    [[nodiscard]] Bytes dump_many(const std::vector<T>& objects, std::string_view format) const {
        std::vector<ObjectRef> refs;
        refs.reserve(objects.size());
        for (const auto& object : objects) {
            refs.push_back(ref(object));
        }
        return dump_many(binding_of<T>(), refs, format);
    }

    template<typename T>
    [[nodiscard]] std::vector<T> load_many(std::span<const std::byte> data, std::string_view format) const {
        auto values = decode_many(binding_of<T>(), data, format);
        std::vector<T> objects(values.size());
        for (std::size_t i = 0; i < values.size(); ++i) {
            from_intermediate(values[i], mutable_ref(objects[i]));
        }
        return objects;
    }

    template<typename T>
    void dump_to_stream(const T& object, std::ostream& out, std::string_view format) const {
        write_stream(dump(ref(object), format), out);
    }

    template<typename T>
    [[nodiscard]] T load_from_stream(std::istream& in, std::string_view format) const {
        Bytes data = read_stream(in);
        return load<T>(data, format);
    }

    template<typename T>
    [[nodiscard]] TypeDescriptorPtr resolve() const {
        return resolver_.resolve(binding_of<T>());
    }

    template<typename T>
    [[nodiscard]] SchemaPtr schema_for() const {
        return schema_for(resolve<T>());
    }

    // ========================================================================
    // Type-erased API
    // ========================================================================

    [[nodiscard]] Bytes dump(const ObjectRef& object, std::string_view format) const;
    void load(std::span<const std::byte> data, const MutableRef& object, std::string_view format,
              const Schema* writer_schema = nullptr) const;

    [[nodiscard]] Value to_intermediate(const ObjectRef& object) const;
    void from_intermediate(const Value& value, const MutableRef& object) const;

    /**
     * @brief Decode bytes against a runtime declaration, without a C++ type
     *
     * The decoded value is checked against (and completed from) the schema of
     * the declaration: missing fields take their defaults.
     *
     * @throws SchemaMismatchError when the decoded value does not fit
     */
    [[nodiscard]] Value load_value(std::span<const std::byte> data, const TypeDeclPtr& declaration,
                                   std::string_view format) const;

    [[nodiscard]] TypeDescriptorPtr resolve(const TypeDeclPtr& declaration) const;
    [[nodiscard]] SchemaPtr schema_for(const TypeDescriptorPtr& descriptor) const;

    // ========================================================================
    // Registration
    // ========================================================================

    /**
     * @brief Register a converter
     *
     * Without an explicit specificity the rank follows from the key: Nominal
     * for named records/enums/opaque types, Structural for unnamed shapes,
     * Kind for TypeDescriptor::pattern(), Fallback for TypeDescriptor::any().
     */
    void register_converter(const TypeDescriptorPtr& key, Converter converter,
                            std::optional<Specificity> specificity = std::nullopt,
                            RegistrationMode mode = RegistrationMode::Add);

    void register_converter(const TypeDeclPtr& declaration, Converter converter,
                            std::optional<Specificity> specificity = std::nullopt,
                            RegistrationMode mode = RegistrationMode::Add);

    /// Register for the declaration of a static type; works for types the resolver cannot resolve yet
    template<typename T>
    void register_converter(Converter converter, std::optional<Specificity> specificity = std::nullopt,
                            RegistrationMode mode = RegistrationMode::Add) {
        register_converter(key_for(binding_of<T>()), std::move(converter), specificity, mode);
    }

    std::size_t unregister_converter(const TypeDescriptorPtr& key, std::string_view name);

    template<HookPoint P>
    void register_hook(std::string name, HookFn<P> fn, int order = 0) {
        logger_.info("Adapter", "registering " + std::string(to_string(P)) + " hook '" + name + "'");
        hooks_.register_hook<P>(std::move(name), std::move(fn), order);
        invalidate_caches();
    }

    template<HookPoint P>
    bool unregister_hook(std::string_view name) {
        bool removed = hooks_.unregister_hook<P>(name);
        invalidate_caches();
        return removed;
    }

    void set_hook_policy(HookPoint point, HookPolicy policy);

    /**
     * @brief Make a codec selectable by its name
     *
     * Registered as a SelectCodec hook; registering a second codec with the
     * same name raises std::invalid_argument.
     */
    void register_codec(CodecPtr codec, int order = 0);

    /// @throws UnknownFormatError when no codec answers to `format`
    [[nodiscard]] CodecPtr codec(std::string_view format) const;

    /// @throws std::invalid_argument when a plugin with the same name is installed
    void install(const Plugin& plugin);
    [[nodiscard]] bool installed(std::string_view plugin_name) const;

    /// Drops every memoized resolution and schema
    void invalidate_caches();

    // ========================================================================
    // Components
    // ========================================================================

    [[nodiscard]] const AdapterConfig& config() const noexcept { return config_; }
    [[nodiscard]] Logger& logger() noexcept { return logger_; }
    [[nodiscard]] const Logger& logger() const noexcept { return logger_; }
    [[nodiscard]] HookRegistry& hooks() noexcept { return hooks_; }
    [[nodiscard]] ConverterRegistry& converters() noexcept { return converters_; }
    [[nodiscard]] const ConverterRegistry& converters() const noexcept { return converters_; }
    [[nodiscard]] const TypeResolver& resolver() const noexcept { return resolver_; }

private:
    friend class ConversionContext;

    Value convert_to(const ObjectRef& object, ConversionContext& ctx) const;
    void convert_from(const Value& value, const MutableRef& object, ConversionContext& ctx) const;

    SchemaPtr schema_for_codec(const Codec& codec, const TypeDescriptorPtr& descriptor) const;
    Bytes dump_many(const Binding& binding, const std::vector<ObjectRef>& objects, std::string_view format) const;
    std::vector<Value> decode_many(const Binding& binding, std::span<const std::byte> data,
                                   std::string_view format) const;
    TypeDescriptorPtr key_for(const Binding& binding) const;

    static void write_stream(const Bytes& data, std::ostream& out);
    static Bytes read_stream(std::istream& in);

    AdapterConfig config_;
    Logger logger_;
    HookRegistry hooks_;
    TypeResolver resolver_;
    ConverterRegistry converters_;
    SchemaDeriver schemas_;

    mutable std::mutex plugin_mutex_;
    std::set<std::string, std::less<>> plugins_;
};

/// Process-wide adapter behind the free functions
Adapter& default_adapter();

// ============================================================================
// Free functions on the default adapter
// ============================================================================

template<typename T>
[[nodiscard]] Bytes dump(const T& object, std::string_view format) {
    return default_adapter().dump(object, format);
}

template<typename T>
[[nodiscard]] T load(std::span<const std::byte> data, std::string_view format) {
    return default_adapter().load<T>(data, format);
}

template<typename T>
[[nodiscard]] T load(std::span<const std::byte> data, std::string_view format, const Schema& writer_schema) {
    return default_adapter().load<T>(data, format, writer_schema);
}

template<typename T>
[[nodiscard]] Value to_intermediate(const T& object) {
    return default_adapter().to_intermediate(object);
}

template<typename T>
[[nodiscard]] T from_intermediate(const Value& value) {
    return default_adapter().from_intermediate<T>(value);
}

template<typename T>
[[nodiscard]] Bytes dump_many(const std::vector<T>& objects, std::string_view format) {
    return default_adapter().dump_many(objects, format);
}

template<typename T>
[[nodiscard]] std::vector<T> load_many(std::span<const std::byte> data, std::string_view format) {
    return default_adapter().load_many<T>(data, format);
}

} // namespace adaptr
