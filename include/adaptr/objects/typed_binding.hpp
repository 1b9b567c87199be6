/**
 * @file typed_binding.hpp
 * @brief Binding implementations for static C++ types
 *
 * binding_of<T>() returns the process-wide Binding for T. One class template
 * covers every category from type_traits.hpp; each accessor answers only for
 * the categories where it makes sense and defers to the throwing base version
 * otherwise.
 *
 * Records are walked through reflect-cpp views (rfl::to_view), so any
 * default-constructible aggregate works without registration. Record members
 * wrapped in rfl::DefaultVal<X> are exposed as plain X fields with a declared
 * default taken from a default-constructed prototype.
 *
 * Variants holding std::monostate present themselves as optional values, the
 * same shape the resolver gives them; the remaining alternatives are reached
 * through a second binding (VariantTailBinding) that presents the union.
 * Branch indices must stay aligned with the alternatives, so variants the
 * resolver would reshape (optional or variant alternatives, two alternatives
 * with the same declaration) are declared unsupported.
 */

#pragma once

#include "adaptr/objects/binding.hpp"
#include "adaptr/types/type_decl.hpp"
#include "adaptr/types/type_name.hpp"
#include "adaptr/types/type_traits.hpp"

#include <rfl.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <tuple>
#include <typeindex>
#include <utility>
#include <vector>

namespace adaptr {

template<typename T>
const Binding& binding_of();

template<typename T>
ObjectRef ref(const T& object) {
    return ObjectRef(&binding_of<T>(), &object);
}

template<typename T>
MutableRef mutable_ref(T& object) {
    return MutableRef(&binding_of<T>(), &object);
}

namespace detail {

// ============================================================================
// Recursion guard for record declarations
// ============================================================================

class DeclarationGuard {
public:
    explicit DeclarationGuard(std::type_index type) { stack().push_back(type); }
    ~DeclarationGuard() { stack().pop_back(); }

    DeclarationGuard(const DeclarationGuard&) = delete;
    DeclarationGuard& operator=(const DeclarationGuard&) = delete;

    static bool active(std::type_index type) {
        const auto& s = stack();
        return std::find(s.begin(), s.end(), type) != s.end();
    }

private:
    static std::vector<std::type_index>& stack() {
        thread_local std::vector<std::type_index> types;
        return types;
    }
};

/// True when `value` is representable in the integer type I
template<typename I>
bool fits(std::int64_t value) {
    if constexpr (std::is_signed_v<I>) {
        return value >= static_cast<std::int64_t>(std::numeric_limits<I>::min()) &&
               value <= static_cast<std::int64_t>(std::numeric_limits<I>::max());
    } else {
        return value >= 0 &&
               static_cast<std::uint64_t>(value) <= static_cast<std::uint64_t>(std::numeric_limits<I>::max());
    }
}

/// Default-constructed instance used for reading declared defaults
template<typename T>
T& prototype() {
    static T instance{};
    return instance;
}

// ============================================================================
// Variant helpers
// ============================================================================

template<typename A>
constexpr bool is_null_alternative() {
    return std::is_same_v<A, std::monostate> || std::is_same_v<A, std::nullptr_t>;
}

template<std::size_t N>
constexpr std::size_t first_null(const std::array<bool, N>& flags) {
    for (std::size_t i = 0; i < N; ++i) {
        if (flags[i]) return i;
    }
    return N;
}

template<std::size_t N>
constexpr std::size_t count_branches(const std::array<bool, N>& flags) {
    std::size_t n = 0;
    for (bool is_null : flags) {
        if (!is_null) ++n;
    }
    return n;
}

// variant index of the k-th non-null alternative
template<std::size_t N>
constexpr std::array<std::size_t, N> branch_indices(const std::array<bool, N>& flags) {
    std::array<std::size_t, N> out{};
    std::size_t k = 0;
    for (std::size_t i = 0; i < N; ++i) {
        if (!flags[i]) out[k++] = i;
    }
    return out;
}

template<typename V>
struct VariantOps;

template<typename... Ts>
struct VariantOps<std::variant<Ts...>> {
    using V = std::variant<Ts...>;
    static constexpr std::size_t size = sizeof...(Ts);
    static constexpr std::array<bool, sizeof...(Ts)> null_alternative{is_null_alternative<Ts>()...};
    static constexpr std::size_t null_index = first_null<sizeof...(Ts)>({is_null_alternative<Ts>()...});
    static constexpr bool nullable = null_index < sizeof...(Ts);
    static constexpr std::size_t branch_count = count_branches<sizeof...(Ts)>({is_null_alternative<Ts>()...});
    static constexpr std::array<std::size_t, sizeof...(Ts)> branch_index =
        branch_indices<sizeof...(Ts)>({is_null_alternative<Ts>()...});
    // the resolver would merge these into neighbouring branches
    static constexpr bool nested = (is_optional<Ts>::value || ...) || (is_variant<Ts>::value || ...);

    static std::size_t branch_of(std::size_t variant_index) {
        for (std::size_t k = 0; k < branch_count; ++k) {
            if (branch_index[k] == variant_index) return k;
        }
        return branch_count;
    }

    static std::vector<TypeDeclPtr> branch_declarations() {
        std::vector<TypeDeclPtr> out;
        ((is_null_alternative<Ts>() ? void() : out.push_back(binding_of<Ts>().declaration())), ...);
        return out;
    }

    static ObjectRef alternative(const V& v) {
        return std::visit([](const auto& a) { return ref(a); }, v);
    }

    static MutableRef emplace(V& v, std::size_t index) {
        return emplace_impl(v, index, std::index_sequence_for<Ts...>{});
    }

private:
    template<std::size_t... I>
    static MutableRef emplace_impl(V& v, std::size_t index, std::index_sequence<I...>) {
        MutableRef result;
        ((I == index ? (void)(result = mutable_ref(v.template emplace<I>())) : void()), ...);
        return result;
    }
};

/// Union view over the non-null alternatives of a variant holding std::monostate
template<typename V>
class VariantTailBinding final : public Binding {
    using Ops = VariantOps<V>;

public:
    static const VariantTailBinding& instance() {
        static const VariantTailBinding binding;
        return binding;
    }

    std::type_index type() const override { return std::type_index(typeid(V)); }
    std::string type_name() const override { return get_type_name<V>(); }

    TypeDeclPtr declaration() const override {
        return TypeDecl::union_of(Ops::branch_declarations());
    }

    std::size_t active_branch(const void* object) const override {
        return Ops::branch_of(static_cast<const V*>(object)->index());
    }

    ObjectRef branch(const void* object) const override {
        return Ops::alternative(*static_cast<const V*>(object));
    }

    MutableRef emplace_branch(void* object, std::size_t index) const override {
        if (index >= Ops::branch_count) {
            throw std::out_of_range("union branch index out of range");
        }
        return Ops::emplace(*static_cast<V*>(object), Ops::branch_index[index]);
    }
};

template<typename F>
ObjectRef field_ref(const F& field) {
    if constexpr (is_default_val<F>::value) {
        return ref(field.value());
    } else {
        return ref(field);
    }
}

template<typename F>
MutableRef field_mutable_ref(F& field) {
    if constexpr (is_default_val<F>::value) {
        return mutable_ref(field.value());
    } else {
        return mutable_ref(field);
    }
}

} // namespace detail

// ============================================================================
// TypedBinding
// ============================================================================

template<typename T>
class TypedBinding final : public Binding {
    static constexpr Category category = category_of<T>();

public:
    std::type_index type() const override { return std::type_index(typeid(T)); }
    std::string type_name() const override { return get_type_name<T>(); }

    TypeDeclPtr declaration() const override {
        if constexpr (category == Category::Custom) {
            return Declare<T>::declaration();
        } else if constexpr (category == Category::Null) {
            return TypeDecl::null();
        } else if constexpr (category == Category::Bool) {
            return TypeDecl::boolean();
        } else if constexpr (category == Category::Integer) {
            return TypeDecl::integer(static_cast<std::uint8_t>(sizeof(T) * 8), std::is_signed_v<T>);
        } else if constexpr (category == Category::Floating) {
            return TypeDecl::floating(static_cast<std::uint8_t>(sizeof(T) * 8));
        } else if constexpr (category == Category::Text) {
            return TypeDecl::text();
        } else if constexpr (category == Category::Bytes) {
            return TypeDecl::bytes();
        } else if constexpr (category == Category::Timestamp) {
            return TypeDecl::timestamp();
        } else if constexpr (category == Category::Date) {
            return TypeDecl::date();
        } else if constexpr (category == Category::Decimal) {
            return TypeDecl::decimal();
        } else if constexpr (category == Category::Uuid) {
            return TypeDecl::uuid();
        } else if constexpr (category == Category::Enum) {
            return TypeDecl::enumeration(get_type_name<T>(), EnumName<T>::symbols());
        } else if constexpr (category == Category::Optional) {
            return TypeDecl::nullable(binding_of<typename T::value_type>().declaration());
        } else if constexpr (category == Category::Variant) {
            using Ops = detail::VariantOps<T>;
            if constexpr (Ops::branch_count < (Ops::nullable ? 1u : 2u)) {
                return TypeDecl::unsupported(get_type_name<T>() + " (variant needs more alternatives)");
            } else if constexpr (Ops::nested) {
                return TypeDecl::unsupported(get_type_name<T>() + " (variant alternatives must not be optional or variants)");
            } else {
                auto branches = Ops::branch_declarations();
                for (std::size_t i = 0; i < branches.size(); ++i) {
                    for (std::size_t j = 0; j < i; ++j) {
                        if (*branches[i] == *branches[j]) {
                            return TypeDecl::unsupported(get_type_name<T>() + " (two alternatives declare " +
                                                         branches[i]->to_string() + ")");
                        }
                    }
                }
                if constexpr (Ops::nullable) {
                    branches.insert(branches.begin(), TypeDecl::null());
                }
                return TypeDecl::union_of(std::move(branches));
            }
        } else if constexpr (category == Category::Sequence || category == Category::FixedSequence) {
            return TypeDecl::sequence(binding_of<typename T::value_type>().declaration());
        } else if constexpr (category == Category::Mapping) {
            return TypeDecl::mapping(binding_of<typename T::key_type>().declaration(),
                                     binding_of<typename T::mapped_type>().declaration());
        } else if constexpr (category == Category::Record) {
            return declare_record();
        } else if constexpr (category == Category::Opaque) {
            return TypeDecl::opaque(get_type_name<T>());
        } else {
            return TypeDecl::unsupported(get_type_name<T>());
        }
    }

    // ========================================================================
    // Scalars
    // ========================================================================

    Value read_scalar(const void* object) const override {
        const T& v = *static_cast<const T*>(object);
        if constexpr (category == Category::Null) {
            return Value{};
        } else if constexpr (category == Category::Bool || category == Category::Integer ||
                             category == Category::Floating || category == Category::Text ||
                             category == Category::Bytes) {
            return Value(v);
        } else {
            return Binding::read_scalar(object);
        }
    }

    ScalarStatus write_scalar(void* object, const Value& value) const override {
        T& v = *static_cast<T*>(object);
        if constexpr (category == Category::Null) {
            return value.is_null() ? ScalarStatus::Ok : ScalarStatus::KindMismatch;
        } else if constexpr (category == Category::Bool) {
            if (!value.is_bool()) return ScalarStatus::KindMismatch;
            v = value.as_bool();
            return ScalarStatus::Ok;
        } else if constexpr (category == Category::Integer) {
            if (!value.is_int()) return ScalarStatus::KindMismatch;
            if (!detail::fits<T>(value.as_int())) return ScalarStatus::OutOfRange;
            v = static_cast<T>(value.as_int());
            return ScalarStatus::Ok;
        } else if constexpr (category == Category::Floating) {
            double d = 0.0;
            if (value.is_float()) {
                d = value.as_float();
            } else if (value.is_int()) {
                auto i = value.as_int();
                d = static_cast<double>(i);
                // 2^63 is not an int64, so the round trip check must not cast it back
                if (d >= 9223372036854775808.0 || static_cast<std::int64_t>(d) != i) {
                    return ScalarStatus::OutOfRange;
                }
            } else {
                return ScalarStatus::KindMismatch;
            }
            if constexpr (std::is_same_v<T, float>) {
                if (std::isfinite(d) && std::fabs(d) > static_cast<double>(std::numeric_limits<float>::max())) {
                    return ScalarStatus::OutOfRange;
                }
            }
            v = static_cast<T>(d);
            return ScalarStatus::Ok;
        } else if constexpr (category == Category::Text) {
            if (!value.is_text()) return ScalarStatus::KindMismatch;
            v = value.as_text();
            return ScalarStatus::Ok;
        } else if constexpr (category == Category::Bytes) {
            if (!value.is_bytes()) return ScalarStatus::KindMismatch;
            v = value.as_bytes();
            return ScalarStatus::Ok;
        } else {
            return Binding::write_scalar(object, value);
        }
    }

    // ========================================================================
    // Enumerations
    // ========================================================================

    std::string enum_symbol(const void* object) const override {
        if constexpr (category == Category::Enum) {
            return EnumName<T>::get(*static_cast<const T*>(object));
        } else {
            return Binding::enum_symbol(object);
        }
    }

    bool set_enum_symbol(void* object, std::string_view symbol) const override {
        if constexpr (category == Category::Enum) {
            auto parsed = rfl::string_to_enum<T>(std::string(symbol));
            if (!parsed) {
                return false;
            }
            *static_cast<T*>(object) = parsed.value();
            return true;
        } else {
            return Binding::set_enum_symbol(object, symbol);
        }
    }

    // ========================================================================
    // Optional
    // ========================================================================

    bool has_value(const void* object) const override {
        const T& v = *static_cast<const T*>(object);
        if constexpr (category == Category::Optional) {
            return v.has_value();
        } else if constexpr (category == Category::Variant && detail::VariantOps<T>::nullable) {
            return !detail::VariantOps<T>::null_alternative[v.index()];
        } else {
            return Binding::has_value(object);
        }
    }

    ObjectRef value_of(const void* object) const override {
        const T& v = *static_cast<const T*>(object);
        if constexpr (category == Category::Optional) {
            return ref(*v);
        } else if constexpr (category == Category::Variant && detail::VariantOps<T>::nullable) {
            if constexpr (detail::VariantOps<T>::branch_count == 1) {
                return detail::VariantOps<T>::alternative(v);
            } else {
                return ObjectRef(&detail::VariantTailBinding<T>::instance(), object);
            }
        } else {
            return Binding::value_of(object);
        }
    }

    MutableRef emplace_value(void* object) const override {
        T& v = *static_cast<T*>(object);
        if constexpr (category == Category::Optional) {
            return mutable_ref(v.emplace());
        } else if constexpr (category == Category::Variant && detail::VariantOps<T>::nullable) {
            using Ops = detail::VariantOps<T>;
            if constexpr (Ops::branch_count == 1) {
                return Ops::emplace(v, Ops::branch_index[0]);
            } else {
                return MutableRef(&detail::VariantTailBinding<T>::instance(), object);
            }
        } else {
            return Binding::emplace_value(object);
        }
    }

    void reset(void* object) const override {
        T& v = *static_cast<T*>(object);
        if constexpr (category == Category::Optional) {
            v.reset();
        } else if constexpr (category == Category::Variant && detail::VariantOps<T>::nullable) {
            detail::VariantOps<T>::emplace(v, detail::VariantOps<T>::null_index);
        } else {
            Binding::reset(object);
        }
    }

    // ========================================================================
    // Sequences
    // ========================================================================

    std::size_t size(const void* object) const override {
        if constexpr (category == Category::Sequence || category == Category::FixedSequence) {
            return static_cast<const T*>(object)->size();
        } else {
            return Binding::size(object);
        }
    }

    ObjectRef element(const void* object, std::size_t index) const override {
        if constexpr (category == Category::Sequence || category == Category::FixedSequence) {
            const T& v = *static_cast<const T*>(object);
            return ref(*std::next(v.begin(), static_cast<std::ptrdiff_t>(index)));
        } else {
            return Binding::element(object, index);
        }
    }

    MutableRef mutable_element(void* object, std::size_t index) const override {
        if constexpr (category == Category::Sequence || category == Category::FixedSequence) {
            T& v = *static_cast<T*>(object);
            return mutable_ref(*std::next(v.begin(), static_cast<std::ptrdiff_t>(index)));
        } else {
            return Binding::mutable_element(object, index);
        }
    }

    bool resize(void* object, std::size_t count) const override {
        if constexpr (category == Category::Sequence) {
            static_cast<T*>(object)->resize(count);
            return true;
        } else if constexpr (category == Category::FixedSequence) {
            return count == std::tuple_size_v<T>;
        } else {
            return Binding::resize(object, count);
        }
    }

    // ========================================================================
    // Mappings
    // ========================================================================

    void for_each_entry(const void* object, const EntryVisitor& visit) const override {
        if constexpr (category == Category::Mapping) {
            for (const auto& [key, value] : *static_cast<const T*>(object)) {
                visit(ref(key), ref(value));
            }
        } else {
            Binding::for_each_entry(object, visit);
        }
    }

    void clear(void* object) const override {
        if constexpr (category == Category::Mapping) {
            static_cast<T*>(object)->clear();
        } else {
            Binding::clear(object);
        }
    }

    MutableRef insert_entry(void* object, const KeyFiller& fill_key) const override {
        if constexpr (category == Category::Mapping) {
            typename T::key_type key{};
            fill_key(mutable_ref(key));
            auto [it, inserted] = static_cast<T*>(object)->try_emplace(std::move(key));
            (void)inserted;
            return mutable_ref(it->second);
        } else {
            return Binding::insert_entry(object, fill_key);
        }
    }

    bool ordered() const override {
        if constexpr (category == Category::Mapping) {
            return is_ordered_mapping<T>::value;
        } else {
            return true;
        }
    }

    // ========================================================================
    // Records
    // ========================================================================

    void for_each_field(const void* object, const FieldVisitor& visit) const override {
        if constexpr (category == Category::Record) {
            // to_view needs a mutable object; the refs handed out are read-only
            auto view = rfl::to_view(*const_cast<T*>(static_cast<const T*>(object)));
            std::size_t index = 0;
            view.apply([&](const auto& f) { visit(index++, detail::field_ref(*f.value())); });
        } else {
            Binding::for_each_field(object, visit);
        }
    }

    void for_each_mutable_field(void* object, const MutableFieldVisitor& visit) const override {
        if constexpr (category == Category::Record) {
            auto view = rfl::to_view(*static_cast<T*>(object));
            std::size_t index = 0;
            view.apply([&](const auto& f) { visit(index++, detail::field_mutable_ref(*f.value())); });
        } else {
            Binding::for_each_mutable_field(object, visit);
        }
    }

    // ========================================================================
    // Unions
    // ========================================================================

    std::size_t active_branch(const void* object) const override {
        if constexpr (category == Category::Variant && !detail::VariantOps<T>::nullable) {
            return static_cast<const T*>(object)->index();
        } else {
            return Binding::active_branch(object);
        }
    }

    ObjectRef branch(const void* object) const override {
        if constexpr (category == Category::Variant && !detail::VariantOps<T>::nullable) {
            return detail::VariantOps<T>::alternative(*static_cast<const T*>(object));
        } else {
            return Binding::branch(object);
        }
    }

    MutableRef emplace_branch(void* object, std::size_t index) const override {
        if constexpr (category == Category::Variant && !detail::VariantOps<T>::nullable) {
            if (index >= std::variant_size_v<T>) {
                throw std::out_of_range("union branch index out of range");
            }
            return detail::VariantOps<T>::emplace(*static_cast<T*>(object), index);
        } else {
            return Binding::emplace_branch(object, index);
        }
    }

private:
    TypeDeclPtr declare_record() const {
        const std::string name = get_type_name<T>();
        if (detail::DeclarationGuard::active(type())) {
            return TypeDecl::reference(name);
        }
        detail::DeclarationGuard guard(type());

        std::vector<FieldDecl> fields;
        auto view = rfl::to_view(detail::prototype<T>());
        view.apply([&](const auto& f) {
            using F = std::remove_cvref_t<decltype(*f.value())>;
            if constexpr (is_default_val<F>::value) {
                using Inner = std::remove_cvref_t<decltype(f.value()->value())>;
                fields.emplace_back(std::string(f.name()), binding_of<Inner>().declaration(), std::nullopt,
                                    detail::field_ref(*f.value()));
            } else {
                fields.emplace_back(std::string(f.name()), binding_of<F>().declaration());
            }
        });
        return TypeDecl::record(name, std::move(fields));
    }
};

template<typename T>
const Binding& binding_of() {
    static const TypedBinding<std::remove_cv_t<T>> instance;
    return instance;
}

/// Declaration of a static C++ type
template<typename T>
TypeDeclPtr declare() {
    return binding_of<T>().declaration();
}

} // namespace adaptr
