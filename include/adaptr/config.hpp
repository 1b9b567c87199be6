/**
 * @file config.hpp
 * @brief Adapter configuration, loadable from JSON via reflect-cpp
 *
 * Every field is an rfl::DefaultVal so a configuration file only needs to name
 * what it changes:
 * @code
 * {"temporal_encoding": "Iso8601", "log_level": "Debug"}
 * @endcode
 */

#pragma once

#include <rfl.hpp>

#include <cstdint>
#include <string>

namespace adaptr {

constexpr std::uint32_t DEFAULT_MAX_UNION_BRANCHES = 16;

/// Canonical intermediate form of timestamps and dates
enum class TemporalEncoding {
    EpochMillis,    // integer milliseconds since 1970-01-01T00:00:00Z
    Iso8601         // text, "2021-03-04T05:06:07.089Z" / "2021-03-04"
};

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Off
};

struct AdapterConfig {
    // Unions wider than this are rejected at resolution time
    rfl::DefaultVal<std::uint32_t> max_union_branches = DEFAULT_MAX_UNION_BRANCHES;
    rfl::DefaultVal<TemporalEncoding> temporal_encoding = TemporalEncoding::EpochMillis;

    // Mapping keys starting with '_' are emitted only when set
    rfl::DefaultVal<bool> include_private_keys = true;

    // Loading a record from an object with keys the record does not declare
    rfl::DefaultVal<bool> reject_unknown_fields = false;

    rfl::DefaultVal<LogLevel> log_level = LogLevel::Warning;
    rfl::DefaultVal<bool> cache_lookups = true;

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] std::uint32_t union_branch_limit() const { return max_union_branches.value(); }
    [[nodiscard]] TemporalEncoding temporal() const { return temporal_encoding.value(); }
    [[nodiscard]] bool private_keys() const { return include_private_keys.value(); }
    [[nodiscard]] bool strict_fields() const { return reject_unknown_fields.value(); }
    [[nodiscard]] LogLevel verbosity() const { return log_level.value(); }
    [[nodiscard]] bool caching() const { return cache_lookups.value(); }
};

/// Loads a configuration file; throws std::runtime_error when the file is unreadable or invalid
[[nodiscard]] AdapterConfig load_config(const std::string& filename);

/// Parses a configuration from a JSON document
[[nodiscard]] AdapterConfig parse_config(const std::string& json);

[[nodiscard]] std::string write_config(const AdapterConfig& config);

} // namespace adaptr
