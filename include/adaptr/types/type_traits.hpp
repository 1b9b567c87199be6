/**
 * @file type_traits.hpp
 * @brief Classification of static C++ types for declaration and binding
 *
 * Declare<T> is the customization point: specialize it to give a type a
 * declaration of your own (typically TypeDecl::opaque("geo.LatLon")) and
 * register a converter for the resulting descriptor.
 *
 * @code
 * template<> struct adaptr::Declare<LatLon> {
 *     static adaptr::TypeDeclPtr declaration() { return adaptr::TypeDecl::opaque("geo.LatLon"); }
 * };
 * @endcode
 */

#pragma once

#include "adaptr/types/type_decl.hpp"
#include "adaptr/value/domain_types.hpp"
#include "adaptr/value/value.hpp"

#include <rfl.hpp>

#include <array>
#include <concepts>
#include <cstddef>
#include <deque>
#include <list>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace adaptr {

template<typename T>
struct Declare;

template<typename T>
concept CustomDeclared = requires {
    { Declare<T>::declaration() } -> std::convertible_to<TypeDeclPtr>;
};

// ============================================================================
// Standard library shapes
// ============================================================================

template<typename T> struct is_optional : std::false_type {};
template<typename T> struct is_optional<std::optional<T>> : std::true_type {};

template<typename T> struct is_variant : std::false_type {};
template<typename... Ts> struct is_variant<std::variant<Ts...>> : std::true_type {};

template<typename T> struct is_dynamic_sequence : std::false_type {};
template<typename T, typename A> struct is_dynamic_sequence<std::vector<T, A>> : std::true_type {};
template<typename T, typename A> struct is_dynamic_sequence<std::deque<T, A>> : std::true_type {};
template<typename T, typename A> struct is_dynamic_sequence<std::list<T, A>> : std::true_type {};

template<typename T> struct is_std_array : std::false_type {};
template<typename T, std::size_t N> struct is_std_array<std::array<T, N>> : std::true_type {};

template<typename T> struct is_mapping : std::false_type {};
template<typename K, typename V, typename C, typename A>
struct is_mapping<std::map<K, V, C, A>> : std::true_type {};
template<typename K, typename V, typename H, typename E, typename A>
struct is_mapping<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template<typename T> struct is_ordered_mapping : std::false_type {};
template<typename K, typename V, typename C, typename A>
struct is_ordered_mapping<std::map<K, V, C, A>> : std::true_type {};

template<typename T> struct is_default_val : std::false_type {};
template<typename T> struct is_default_val<rfl::DefaultVal<T>> : std::true_type {};

// ============================================================================
// Category
// ============================================================================

enum class Category {
    Custom,
    Null,
    Bool,
    Integer,
    Floating,
    Text,
    Bytes,
    Timestamp,
    Date,
    Decimal,
    Uuid,
    Enum,
    Optional,
    Variant,
    Sequence,
    FixedSequence,
    Mapping,
    Record,
    Opaque,
    Unsupported
};

template<typename T>
constexpr Category category_of() {
    using U = std::remove_cv_t<T>;
    if constexpr (CustomDeclared<U>) {
        return Category::Custom;
    } else if constexpr (std::is_same_v<U, std::monostate> || std::is_same_v<U, std::nullptr_t>) {
        return Category::Null;
    } else if constexpr (std::is_same_v<U, bool>) {
        return Category::Bool;
    } else if constexpr (std::is_integral_v<U>) {
        return Category::Integer;
    } else if constexpr (std::is_same_v<U, float> || std::is_same_v<U, double>) {
        return Category::Floating;
    } else if constexpr (std::is_floating_point_v<U> || std::is_pointer_v<U> ||
                         std::is_same_v<U, std::vector<bool>>) {
        return Category::Unsupported;
    } else if constexpr (std::is_same_v<U, std::string>) {
        return Category::Text;
    } else if constexpr (std::is_same_v<U, Bytes>) {
        return Category::Bytes;
    } else if constexpr (std::is_same_v<U, Timestamp>) {
        return Category::Timestamp;
    } else if constexpr (std::is_same_v<U, Date>) {
        return Category::Date;
    } else if constexpr (std::is_same_v<U, Decimal>) {
        return Category::Decimal;
    } else if constexpr (std::is_same_v<U, Uuid>) {
        return Category::Uuid;
    } else if constexpr (std::is_enum_v<U>) {
        return Category::Enum;
    } else if constexpr (is_optional<U>::value) {
        return Category::Optional;
    } else if constexpr (is_variant<U>::value) {
        return Category::Variant;
    } else if constexpr (is_dynamic_sequence<U>::value) {
        return Category::Sequence;
    } else if constexpr (is_std_array<U>::value) {
        return Category::FixedSequence;
    } else if constexpr (is_mapping<U>::value) {
        return Category::Mapping;
    } else if constexpr (std::is_class_v<U> && std::is_aggregate_v<U> && std::is_default_constructible_v<U>) {
        return Category::Record;
    } else {
        return Category::Opaque;
    }
}

} // namespace adaptr
