#include "adaptr/codec/base64.hpp"

namespace adaptr {

namespace {

constexpr char ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decode_char(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace

std::string base64_encode(std::span<const std::byte> data) {
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);
    std::size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        std::uint32_t n = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                          (std::to_integer<std::uint32_t>(data[i + 1]) << 8) |
                          std::to_integer<std::uint32_t>(data[i + 2]);
        out.push_back(ALPHABET[(n >> 18) & 0x3f]);
        out.push_back(ALPHABET[(n >> 12) & 0x3f]);
        out.push_back(ALPHABET[(n >> 6) & 0x3f]);
        out.push_back(ALPHABET[n & 0x3f]);
    }
    const std::size_t rest = data.size() - i;
    if (rest == 1) {
        std::uint32_t n = std::to_integer<std::uint32_t>(data[i]) << 16;
        out.push_back(ALPHABET[(n >> 18) & 0x3f]);
        out.push_back(ALPHABET[(n >> 12) & 0x3f]);
        out += "==";
    } else if (rest == 2) {
        std::uint32_t n = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                          (std::to_integer<std::uint32_t>(data[i + 1]) << 8);
        out.push_back(ALPHABET[(n >> 18) & 0x3f]);
        out.push_back(ALPHABET[(n >> 12) & 0x3f]);
        out.push_back(ALPHABET[(n >> 6) & 0x3f]);
        out.push_back('=');
    }
    return out;
}

std::optional<Bytes> base64_decode(std::string_view text) {
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }
    Bytes out;
    out.reserve(text.size() / 4 * 3);
    for (std::size_t i = 0; i < text.size(); i += 4) {
        const bool last = i + 4 == text.size();
        int pad = 0;
        std::uint32_t n = 0;
        for (std::size_t j = 0; j < 4; ++j) {
            char c = text[i + j];
            if (c == '=') {
                // padding only in the last two positions of the final quantum
                if (!last || j < 2) {
                    return std::nullopt;
                }
                ++pad;
                n <<= 6;
                continue;
            }
            int d = decode_char(c);
            if (d < 0 || pad > 0) {
                return std::nullopt;
            }
            n = (n << 6) | static_cast<std::uint32_t>(d);
        }
        out.push_back(static_cast<std::byte>((n >> 16) & 0xff));
        if (pad < 2) out.push_back(static_cast<std::byte>((n >> 8) & 0xff));
        if (pad < 1) out.push_back(static_cast<std::byte>(n & 0xff));
    }
    return out;
}

} // namespace adaptr
