#include "adaptr/value/domain_types.hpp"

#include <cctype>
#include <cstdio>

namespace adaptr {

namespace {

using namespace std::chrono;

// Reads exactly `width` decimal digits starting at `pos`
bool read_fixed(std::string_view text, std::size_t& pos, std::size_t width, int& out) {
    if (pos + width > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        char c = text[pos + i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    pos += width;
    return true;
}

bool expect(std::string_view text, std::size_t& pos, char c) {
    if (pos < text.size() && text[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

std::optional<Date> read_date(std::string_view text, std::size_t& pos) {
    int y = 0, m = 0, d = 0;
    if (!read_fixed(text, pos, 4, y) || !expect(text, pos, '-') ||
        !read_fixed(text, pos, 2, m) || !expect(text, pos, '-') ||
        !read_fixed(text, pos, 2, d)) {
        return std::nullopt;
    }
    Date date{year{y}, month{static_cast<unsigned>(m)}, day{static_cast<unsigned>(d)}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// ============================================================================
// Temporal
// ============================================================================

std::string format_timestamp(Timestamp ts) {
    auto day_point = floor<days>(ts);
    Date date{day_point};
    hh_mm_ss<milliseconds> tod{ts - day_point};

    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()),
                  static_cast<int>(tod.hours().count()),
                  static_cast<int>(tod.minutes().count()),
                  static_cast<int>(tod.seconds().count()),
                  static_cast<int>(tod.subseconds().count()));
    return buffer;
}

std::optional<Timestamp> parse_timestamp(std::string_view text) {
    std::size_t pos = 0;
    auto date = read_date(text, pos);
    if (!date) {
        return std::nullopt;
    }
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        ++pos;
    } else if (pos == text.size()) {
        return Timestamp{sys_days{*date}};
    } else {
        return std::nullopt;
    }

    int h = 0, m = 0, s = 0;
    if (!read_fixed(text, pos, 2, h) || !expect(text, pos, ':') ||
        !read_fixed(text, pos, 2, m)) {
        return std::nullopt;
    }
    if (expect(text, pos, ':') && !read_fixed(text, pos, 2, s)) {
        return std::nullopt;
    }
    if (h > 23 || m > 59 || s > 60) {
        return std::nullopt;
    }

    // Fractional seconds: keep millisecond precision, drop the rest
    int millis = 0;
    if (expect(text, pos, '.')) {
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }

    minutes offset{0};
    if (pos < text.size()) {
        if (text[pos] == 'Z' || text[pos] == 'z') {
            ++pos;
        } else if (text[pos] == '+' || text[pos] == '-') {
            int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            int oh = 0, om = 0;
            if (!read_fixed(text, pos, 2, oh)) {
                return std::nullopt;
            }
            expect(text, pos, ':');
            if (!read_fixed(text, pos, 2, om)) {
                return std::nullopt;
            }
            offset = minutes{sign * (oh * 60 + om)};
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    return Timestamp{sys_days{*date}} + hours{h} + minutes{m} + seconds{s} + milliseconds{millis} - offset;
}

std::string format_date(Date date) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u",
                  static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()));
    return buffer;
}

std::optional<Date> parse_date(std::string_view text) {
    std::size_t pos = 0;
    auto date = read_date(text, pos);
    if (!date || pos != text.size()) {
        return std::nullopt;
    }
    return date;
}

std::int64_t date_to_epoch_millis(Date date) {
    return duration_cast<milliseconds>(sys_days{date}.time_since_epoch()).count();
}

Date date_from_epoch_millis(std::int64_t millis) {
    return Date{floor<days>(Timestamp{milliseconds{millis}})};
}

// ============================================================================
// Decimal
// ============================================================================

std::optional<Decimal> Decimal::parse(std::string_view text) {
    Decimal result;
    std::size_t pos = 0;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        result.negative_ = text[pos] == '-';
        ++pos;
    }

    std::string digits;
    std::uint32_t scale = 0;
    bool seen_point = false;
    bool seen_digit = false;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.' && !seen_point) {
            seen_point = true;
        } else if (c >= '0' && c <= '9') {
            digits.push_back(c);
            seen_digit = true;
            if (seen_point) {
                ++scale;
            }
        } else {
            return std::nullopt;
        }
    }
    if (!seen_digit) {
        return std::nullopt;
    }

    std::size_t first = digits.find_first_not_of('0');
    result.digits_ = first == std::string::npos ? "0" : digits.substr(first);
    result.scale_ = scale;
    if (result.digits_ == "0") {
        result.negative_ = false;
    }
    return result;
}

std::string Decimal::to_string() const {
    std::string magnitude = digits_;
    if (scale_ > 0) {
        if (magnitude.size() <= scale_) {
            magnitude.insert(0, scale_ + 1 - magnitude.size(), '0');
        }
        magnitude.insert(magnitude.size() - scale_, 1, '.');
    }
    return negative_ ? "-" + magnitude : magnitude;
}

// ============================================================================
// Uuid
// ============================================================================

std::optional<Uuid> Uuid::parse(std::string_view text) {
    if (text.size() != 36) {
        return std::nullopt;
    }
    std::array<std::uint8_t, 16> bytes{};
    std::size_t out = 0;
    for (std::size_t i = 0; i < text.size();) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') {
                return std::nullopt;
            }
            ++i;
            continue;
        }
        int hi = hex_digit(text[i]);
        int lo = i + 1 < text.size() ? hex_digit(text[i + 1]) : -1;
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        bytes[out++] = static_cast<std::uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Uuid{bytes};
}

std::string Uuid::to_string() const {
    static constexpr char hex[] = "0123456789abcdef";
    std::string text;
    text.reserve(36);
    for (std::size_t i = 0; i < bytes_.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            text.push_back('-');
        }
        text.push_back(hex[bytes_[i] >> 4]);
        text.push_back(hex[bytes_[i] & 0x0f]);
    }
    return text;
}

bool Uuid::is_nil() const noexcept {
    for (auto b : bytes_) {
        if (b != 0) return false;
    }
    return true;
}

} // namespace adaptr
