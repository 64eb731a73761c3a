#pragma once

#include <string>
#include <string_view>

#include "termoracle/core/json.hpp"
#include "termoracle/core/types.hpp"

namespace termoracle::net {
    using Json = termoracle::core::Json;

    // {"type":"resize","cols":n,"rows":n}
    [[nodiscard]] std::string encode_resize_message(termoracle::core::Geometry g);

    struct DecodedFrame {
        termoracle::core::Bytes data{};
        Json overrides{Json::object()};
    };

    // Structured frame: a JSON object (optionally wrapping a `payload` object
    // whose members take precedence) with type "frame" and its bytes in
    // data_b64, bytes_b64 or data. Anything else returns false and the caller
    // treats the text as raw output.
    [[nodiscard]] bool decode_frame_message(std::string_view text, DecodedFrame* out);

    // Keeps only well-typed frame metadata; invalid values are dropped.
    [[nodiscard]] Json extract_frame_overrides(const Json& frame);
} // namespace termoracle::net
