/**
 * @file generic_value.hpp
 * @brief Bridge between adaptr::Value and rfl::Generic
 *
 * rfl::Generic is reflect-cpp's dynamic JSON-like tree; converting through it
 * lets the JSON codec and the schema exporter reuse rfl::json for parsing and
 * writing. Generic has no bytes alternative, so bytes become base64 text.
 */

#pragma once

#include "adaptr/value/value.hpp"

#include <rfl/Generic.hpp>

namespace adaptr {

/**
 * @brief Value -> rfl::Generic
 *
 * @throws RangeError for NaN and infinite floats, which JSON cannot carry
 */
[[nodiscard]] rfl::Generic to_generic(const Value& value);

[[nodiscard]] Value from_generic(const rfl::Generic& generic);

} // namespace adaptr
