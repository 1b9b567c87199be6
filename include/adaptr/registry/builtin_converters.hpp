/**
 * @file builtin_converters.hpp
 * @brief Converters for every kind the engine supports out of the box
 *
 * All of them are registered at Specificity::Kind under
 * TypeDescriptor::pattern(kind), so a converter registered for a specific
 * descriptor (Nominal or Structural) always takes precedence, including inside
 * containers because nested values are converted through the context.
 *
 * | Kind      | Intermediate form                                        |
 * |-----------|----------------------------------------------------------|
 * | timestamp | int epoch millis, or ISO-8601 text (temporal_encoding)   |
 * | date      | int epoch millis at midnight UTC, or "YYYY-MM-DD"        |
 * | decimal   | text, scale preserved                                    |
 * | uuid      | canonical text                                           |
 * | enum      | symbol text                                              |
 * | optional  | null or the inner value                                  |
 * | sequence  | array                                                    |
 * | mapping   | object, integer keys as decimal text                     |
 * | record    | object in field declaration order                        |
 * | union     | the active branch's value, untagged                      |
 *
 * Loading a union picks the best matching branch (see match_score), trying
 * the next candidate when a branch does not fit.
 */

#pragma once

#include "adaptr/registry/converter_registry.hpp"
#include "adaptr/types/type_descriptor.hpp"
#include "adaptr/value/value.hpp"

namespace adaptr {

void install_builtin_converters(ConverterRegistry& registry);

/**
 * @brief How well a value fits a descriptor, in [0, 1]
 *
 * 0 means it cannot fit. Records score by the overlap of provided keys and
 * declared fields (intersection over union), so the branch sharing the most
 * keys wins.
 */
[[nodiscard]] double match_score(const TypeDescriptor& type, const Value& value);

} // namespace adaptr
