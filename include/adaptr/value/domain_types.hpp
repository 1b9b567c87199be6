/**
 * @file domain_types.hpp
 * @brief Domain scalar types with canonical text or integer forms
 *
 * - Timestamp: millisecond precision UTC instant, canonical form is epoch
 *   milliseconds or ISO-8601 text ("2021-03-04T05:06:07.089Z")
 * - Date: calendar date, canonical form "YYYY-MM-DD" or epoch milliseconds of
 *   midnight UTC
 * - Decimal: arbitrary precision decimal kept as digits plus scale, so
 *   "12.50" keeps its trailing zero
 * - Uuid: 16 raw bytes, canonical form "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx"
 *
 * Parsing functions return std::nullopt on malformed input; callers decide
 * which error kind applies.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace adaptr {

using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;
using Date = std::chrono::year_month_day;

// ============================================================================
// Temporal helpers
// ============================================================================

[[nodiscard]] std::string format_timestamp(Timestamp ts);
[[nodiscard]] std::optional<Timestamp> parse_timestamp(std::string_view text);

[[nodiscard]] std::string format_date(Date date);
[[nodiscard]] std::optional<Date> parse_date(std::string_view text);

[[nodiscard]] std::int64_t date_to_epoch_millis(Date date);
[[nodiscard]] Date date_from_epoch_millis(std::int64_t millis);

// ============================================================================
// Decimal
// ============================================================================

class Decimal {
public:
    Decimal() = default;

    /// Parses "[-]digits[.digits]"; returns std::nullopt when malformed
    static std::optional<Decimal> parse(std::string_view text);

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool negative() const noexcept { return negative_; }
    [[nodiscard]] const std::string& digits() const noexcept { return digits_; }
    [[nodiscard]] std::uint32_t scale() const noexcept { return scale_; }

    bool operator==(const Decimal&) const = default;

private:
    bool negative_ = false;
    std::string digits_ = "0";    // unscaled magnitude, no leading zeros
    std::uint32_t scale_ = 0;     // number of digits after the point
};

// ============================================================================
// Uuid
// ============================================================================

class Uuid {
public:
    Uuid() = default;
    explicit Uuid(const std::array<std::uint8_t, 16>& bytes) : bytes_(bytes) {}

    /// Accepts the canonical hyphenated form, case-insensitive
    static std::optional<Uuid> parse(std::string_view text);

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] const std::array<std::uint8_t, 16>& bytes() const noexcept { return bytes_; }
    [[nodiscard]] bool is_nil() const noexcept;

    bool operator==(const Uuid&) const = default;

private:
    std::array<std::uint8_t, 16> bytes_{};
};

} // namespace adaptr
