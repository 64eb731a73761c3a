#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "termoracle/core/types.hpp"

namespace termoracle::core {
    // Insertion-ordered so emitted events keep their field order.
    using Json = nlohmann::ordered_json;

    // On failure returns false and stores the parser message (without the
    // library's "[json.exception...]" prefix) in *error.
    [[nodiscard]] bool json_parse(std::string_view text, Json* out, std::string* error);

    // Compact single-line form; invalid UTF-8 is replaced, never thrown.
    [[nodiscard]] std::string json_dump_compact(const Json& v);
    [[nodiscard]] std::string json_dump_pretty(const Json& v);

    // Runtime kind of a value using schema vocabulary:
    // string, integer, number, boolean, null, object, array.
    [[nodiscard]] const char* json_kind_name(const Json& v) noexcept;

    // Non-boolean integer representable as i64.
    [[nodiscard]] bool json_get_i64(const Json& v, i64* out) noexcept;

    // Non-boolean number (integer or float).
    [[nodiscard]] bool json_get_number(const Json& v, double* out) noexcept;

    // Returns the string member `key` or nullptr when absent or not a string.
    [[nodiscard]] const std::string* json_find_string(const Json& obj, const char* key) noexcept;

    // Returns member `key` or nullptr when absent (or obj is not an object).
    [[nodiscard]] const Json* json_find(const Json& obj, const char* key) noexcept;
} // namespace termoracle::core
