#pragma once

#include <string>
#include <string_view>

#include "termoracle/core/buffer.hpp"
#include "termoracle/core/errors.hpp"
#include "termoracle/core/types.hpp"

namespace termoracle::core {
    enum class Base64Mode : u8 {
        // Rejects any character outside the alphabet and malformed padding.
        Strict = 0,
        // Discards characters outside the alphabet before decoding.
        Lenient = 1,
    };

    // Lowercase hex.
    [[nodiscard]] std::string hex_encode(BufferView data);

    // Pairs of hex digits; ASCII whitespace between pairs is ignored.
    [[nodiscard]] Status hex_decode(std::string_view text, Bytes* out);

    [[nodiscard]] std::string base64_encode(BufferView data);
    [[nodiscard]] Status base64_decode(std::string_view text, Base64Mode mode, Bytes* out);
} // namespace termoracle::core
