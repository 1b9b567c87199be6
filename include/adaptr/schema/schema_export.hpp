/**
 * @file schema_export.hpp
 * @brief Schema documents in Avro-flavoured JSON
 *
 * Example output for `struct Point { int64_t x; std::optional<std::string> label; }`:
 * @code
 * {"type":"record","name":"Point","fields":[
 *   {"name":"x","type":"long"},
 *   {"name":"label","type":["null","string"],"default":null}]}
 * @endcode
 *
 * Widths Avro cannot spell (int8, uint32, ...) carry "bits" and "signed".
 */

#pragma once

#include "adaptr/schema/schema.hpp"

#include <rfl/Generic.hpp>

#include <string>

namespace adaptr {

[[nodiscard]] rfl::Generic to_generic(const Schema& schema);

[[nodiscard]] std::string to_json(const Schema& schema);

} // namespace adaptr
