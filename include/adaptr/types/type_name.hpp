/**
 * @file type_name.hpp
 * @brief Readable type names via reflect-cpp
 *
 * Nominal identity of records, enums and opaque types comes from here, so
 * "Point" rather than a mangled "5Point".
 *
 * Example:
 * @code
 * struct SensorData {};
 * auto name = adaptr::get_type_name<SensorData>();   // "SensorData"
 * auto sym  = adaptr::EnumName<Color>::get(Color::Green);  // "Green"
 * @endcode
 */

#pragma once

#include <rfl.hpp>

#include <string>
#include <type_traits>
#include <vector>

namespace adaptr {

template<typename T>
struct TypeName {
    static std::string get() {
        return rfl::type_name_t<T>().str();
    }
};

template<typename T>
std::string get_type_name() {
    return TypeName<std::remove_cvref_t<T>>::get();
}

/**
 * @brief Enumerator names of an enum, in declaration order
 */
template<typename EnumType> requires std::is_enum_v<EnumType>
struct EnumName {
    static std::vector<std::string> symbols() {
        constexpr auto enumerator_array = rfl::get_enumerator_array<EnumType>();
        std::vector<std::string> names;
        names.reserve(enumerator_array.size());
        for (const auto& enumerator : enumerator_array) {
            names.emplace_back(enumerator.first);
        }
        return names;
    }

    static std::string get(const EnumType value) {
        return rfl::enum_to_string(value);
    }
};

} // namespace adaptr
