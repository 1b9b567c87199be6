/**
 * @file binding.hpp
 * @brief Type-erased structural access to C++ objects
 *
 * Converters are ordinary runtime objects, so they cannot be templates over the
 * C++ type they handle. A Binding is the per-type bridge: one static instance
 * per C++ type exposes the structure generic converters need (scalar read and
 * write, optional engagement, sequence elements, mapping entries, record fields,
 * variant branches, enum symbols). ObjectRef and MutableRef pair a Binding with
 * an object address.
 *
 * A Binding only answers for the structure its type actually has; asking a
 * std::vector binding for record fields raises NoConverterError naming the C++
 * type, which is what happens when a generic converter is registered for a
 * descriptor whose C++ type it cannot walk.
 *
 * Bindings for concrete types live in typed_binding.hpp.
 */

#pragma once

#include "adaptr/errors.hpp"
#include "adaptr/value/value.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>

namespace adaptr {

class Binding;
class TypeDecl;
using TypeDeclPtr = std::shared_ptr<const TypeDecl>;

/// Read-only reference to an object together with its Binding
class ObjectRef {
public:
    ObjectRef() = default;
    ObjectRef(const Binding* binding, const void* object) : binding_(binding), object_(object) {}

    [[nodiscard]] const Binding& binding() const { return *binding_; }
    [[nodiscard]] const void* get() const noexcept { return object_; }
    explicit operator bool() const noexcept { return binding_ != nullptr && object_ != nullptr; }

    /// Typed access; throws std::logic_error when T is not the bound type
    template<typename T>
    const T& as() const;

    template<typename T>
    [[nodiscard]] bool is() const;

    bool operator==(const ObjectRef& other) const noexcept {
        return binding_ == other.binding_ && object_ == other.object_;
    }

private:
    const Binding* binding_ = nullptr;
    const void* object_ = nullptr;
};

/// Mutable reference used while loading an object from a Value
class MutableRef {
public:
    MutableRef() = default;
    MutableRef(const Binding* binding, void* object) : binding_(binding), object_(object) {}

    [[nodiscard]] const Binding& binding() const { return *binding_; }
    [[nodiscard]] void* get() const noexcept { return object_; }
    explicit operator bool() const noexcept { return binding_ != nullptr && object_ != nullptr; }

    template<typename T>
    T& as() const;

    template<typename T>
    [[nodiscard]] bool is() const;

    operator ObjectRef() const noexcept { return ObjectRef(binding_, object_); }

private:
    const Binding* binding_ = nullptr;
    void* object_ = nullptr;
};

enum class ScalarStatus {
    Ok,
    KindMismatch,
    OutOfRange
};

class Binding {
public:
    virtual ~Binding() = default;

    [[nodiscard]] virtual std::type_index type() const = 0;
    [[nodiscard]] virtual std::string type_name() const = 0;

    /// Declaration of the bound type, resolved into a descriptor by the resolver
    [[nodiscard]] virtual TypeDeclPtr declaration() const = 0;

    // ========================================================================
    // Scalars (null, bool, integers, floats, text, bytes)
    // ========================================================================

    [[nodiscard]] virtual Value read_scalar(const void* object) const;
    [[nodiscard]] virtual ScalarStatus write_scalar(void* object, const Value& value) const;

    // ========================================================================
    // Enumerations
    // ========================================================================

    [[nodiscard]] virtual std::string enum_symbol(const void* object) const;
    [[nodiscard]] virtual bool set_enum_symbol(void* object, std::string_view symbol) const;

    // ========================================================================
    // Optional values (std::optional, variants holding std::monostate)
    // ========================================================================

    [[nodiscard]] virtual bool has_value(const void* object) const;
    [[nodiscard]] virtual ObjectRef value_of(const void* object) const;
    virtual MutableRef emplace_value(void* object) const;
    virtual void reset(void* object) const;

    // ========================================================================
    // Sequences
    // ========================================================================

    [[nodiscard]] virtual std::size_t size(const void* object) const;
    [[nodiscard]] virtual ObjectRef element(const void* object, std::size_t index) const;
    [[nodiscard]] virtual MutableRef mutable_element(void* object, std::size_t index) const;
    /// Returns false when the container has a fixed size different from `count`
    [[nodiscard]] virtual bool resize(void* object, std::size_t count) const;

    // ========================================================================
    // Mappings
    // ========================================================================

    using EntryVisitor = std::function<void(ObjectRef key, ObjectRef value)>;
    using KeyFiller = std::function<void(MutableRef key)>;

    virtual void for_each_entry(const void* object, const EntryVisitor& visit) const;
    virtual void clear(void* object) const;
    /// Builds a key through `fill_key`, inserts it, returns the value slot
    virtual MutableRef insert_entry(void* object, const KeyFiller& fill_key) const;
    /// True when iteration order is already deterministic (ordered containers)
    [[nodiscard]] virtual bool ordered() const;

    // ========================================================================
    // Records
    // ========================================================================

    using FieldVisitor = std::function<void(std::size_t index, ObjectRef field)>;
    using MutableFieldVisitor = std::function<void(std::size_t index, MutableRef field)>;

    virtual void for_each_field(const void* object, const FieldVisitor& visit) const;
    virtual void for_each_mutable_field(void* object, const MutableFieldVisitor& visit) const;

    // ========================================================================
    // Unions
    // ========================================================================

    [[nodiscard]] virtual std::size_t active_branch(const void* object) const;
    [[nodiscard]] virtual ObjectRef branch(const void* object) const;
    virtual MutableRef emplace_branch(void* object, std::size_t index) const;

protected:
    [[noreturn]] void unsupported(std::string_view access) const;
};

// ============================================================================
// ObjectRef / MutableRef typed access
// ============================================================================

template<typename T>
bool ObjectRef::is() const {
    return binding_ != nullptr && binding_->type() == std::type_index(typeid(T));
}

template<typename T>
const T& ObjectRef::as() const {
    if (!is<T>()) {
        throw std::logic_error("ObjectRef: bound type " + (binding_ ? binding_->type_name() : std::string("<none>")) +
                               " is not " + typeid(T).name());
    }
    return *static_cast<const T*>(object_);
}

template<typename T>
bool MutableRef::is() const {
    return binding_ != nullptr && binding_->type() == std::type_index(typeid(T));
}

template<typename T>
T& MutableRef::as() const {
    if (!is<T>()) {
        throw std::logic_error("MutableRef: bound type " + (binding_ ? binding_->type_name() : std::string("<none>")) +
                               " is not " + typeid(T).name());
    }
    return *static_cast<T*>(object_);
}

} // namespace adaptr
