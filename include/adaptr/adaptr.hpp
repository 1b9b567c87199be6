#pragma once

/**
 * @file adaptr.hpp
 * @brief Main adaptr header - include this to get everything you need
 *
 * This header provides:
 * - The Adapter facade and the dump/load free functions
 * - Runtime type declarations and descriptors
 * - Converter and hook registration
 * - The built-in binary, json and csv codecs
 * - Schema derivation and export
 *
 * Users include this and declare their types as plain aggregates.
 */

#include "adaptr/adapter.hpp"
#include "adaptr/codec/binary_codec.hpp"
#include "adaptr/codec/csv_codec.hpp"
#include "adaptr/codec/json_codec.hpp"
#include "adaptr/config.hpp"
#include "adaptr/errors.hpp"
#include "adaptr/registry/builtin_converters.hpp"
#include "adaptr/schema/schema_export.hpp"
#include "adaptr/value/domain_types.hpp"
#include "adaptr/value/generic_value.hpp"
#include "adaptr/value/value.hpp"

/**
 * @namespace adaptr
 * @brief Type-directed round-trip conversion between C++ objects and wire formats
 *
 * Key Features:
 * - Reflection-driven support for aggregates, standard containers and domain scalars
 * - Converters ranked by specificity, replaceable per type, shape or kind
 * - Hook points for resolution, conversion, codec selection and schema derivation
 * - Pluggable codecs behind one Value model
 */
