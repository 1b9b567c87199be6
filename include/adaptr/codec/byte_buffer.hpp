/**
 * @file byte_buffer.hpp
 * @brief Little-endian writer/reader with LEB128 varints and zig-zag integers
 *
 * The reader raises DecodeError on truncation and oversized varints; length
 * prefixes are checked against the remaining input before allocating.
 */

#pragma once

#include "adaptr/errors.hpp"
#include "adaptr/value/value.hpp"

#include <bit>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>

namespace adaptr {

constexpr std::uint64_t zigzag_encode(std::int64_t v) {
    return (static_cast<std::uint64_t>(v) << 1) ^ static_cast<std::uint64_t>(v >> 63);
}

constexpr std::int64_t zigzag_decode(std::uint64_t v) {
    return static_cast<std::int64_t>(v >> 1) ^ -static_cast<std::int64_t>(v & 1);
}

class ByteWriter {
public:
    void byte(std::uint8_t b) { out_.push_back(static_cast<std::byte>(b)); }

    void varint(std::uint64_t v) {
        while (v > 0x7f) {
            byte(static_cast<std::uint8_t>((v & 0x7f) | 0x80));
            v >>= 7;
        }
        byte(static_cast<std::uint8_t>(v));
    }

    void signed_varint(std::int64_t v) { varint(zigzag_encode(v)); }

    void float64(double d) { little_endian(std::bit_cast<std::uint64_t>(d), 8); }
    void float32(float f) { little_endian(std::bit_cast<std::uint32_t>(f), 4); }

    void raw(std::span<const std::byte> data) { out_.insert(out_.end(), data.begin(), data.end()); }

    void text(std::string_view s) {
        varint(s.size());
        raw(std::as_bytes(std::span<const char>(s.data(), s.size())));
    }

    void bytes(std::span<const std::byte> data) {
        varint(data.size());
        raw(data);
    }

    [[nodiscard]] Bytes take() { return std::move(out_); }

private:
    void little_endian(std::uint64_t v, int width) {
        for (int i = 0; i < width; ++i) {
            byte(static_cast<std::uint8_t>(v >> (8 * i)));
        }
    }

    Bytes out_;
};

class ByteReader {
public:
    explicit ByteReader(std::span<const std::byte> data) : data_(data) {}

    std::uint8_t byte() {
        need(1);
        return std::to_integer<std::uint8_t>(data_[pos_++]);
    }

    std::uint64_t varint() {
        std::uint64_t result = 0;
        for (int shift = 0; shift < 64; shift += 7) {
            std::uint8_t b = byte();
            result |= static_cast<std::uint64_t>(b & 0x7f) << shift;
            if ((b & 0x80) == 0) {
                return result;
            }
        }
        throw DecodeError("varint longer than 10 bytes at offset " + std::to_string(pos_));
    }

    std::int64_t signed_varint() { return zigzag_decode(varint()); }

    double float64() { return std::bit_cast<double>(little_endian(8)); }
    float float32() { return std::bit_cast<float>(static_cast<std::uint32_t>(little_endian(4))); }

    /// Reads a length prefix and checks it against the remaining input
    std::size_t length() {
        std::uint64_t n = varint();
        if (n > remaining()) {
            throw DecodeError("length " + std::to_string(n) + " exceeds remaining " +
                              std::to_string(remaining()) + " bytes");
        }
        return static_cast<std::size_t>(n);
    }

    std::string text() {
        std::size_t n = length();
        std::string s(reinterpret_cast<const char*>(data_.data() + pos_), n);
        pos_ += n;
        return s;
    }

    Bytes bytes() {
        std::size_t n = length();
        Bytes b(data_.begin() + pos_, data_.begin() + pos_ + n);
        pos_ += n;
        return b;
    }

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }
    [[nodiscard]] std::size_t offset() const noexcept { return pos_; }

private:
    void need(std::size_t n) const {
        if (remaining() < n) {
            throw DecodeError("unexpected end of input at offset " + std::to_string(pos_));
        }
    }

    std::uint64_t little_endian(int width) {
        need(static_cast<std::size_t>(width));
        std::uint64_t v = 0;
        for (int i = 0; i < width; ++i) {
            v |= static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(data_[pos_++])) << (8 * i);
        }
        return v;
    }

    std::span<const std::byte> data_;
    std::size_t pos_ = 0;
};

} // namespace adaptr
