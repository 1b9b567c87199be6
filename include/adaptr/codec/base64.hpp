/**
 * @file base64.hpp
 * @brief RFC 4648 base64 (standard alphabet, padded) for bytes in text formats
 */

#pragma once

#include "adaptr/value/value.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace adaptr {

[[nodiscard]] std::string base64_encode(std::span<const std::byte> data);

/// Returns nullopt on characters outside the alphabet or bad padding
[[nodiscard]] std::optional<Bytes> base64_decode(std::string_view text);

} // namespace adaptr
