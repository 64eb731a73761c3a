#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "termoracle/core/json.hpp"
#include "termoracle/core/types.hpp"
#include "termoracle/schema/schema.hpp"

namespace termoracle::schema {
    using u64 = termoracle::core::u64;

    // Line numbers are 1-based; line 0 is used for whole-file failures.
    struct ValidationFailure {
        u64 line{0};
        std::string message{};
    };

    // Checks one decoded event. Returns every failure found except for the
    // two early stops (bad or unknown type), which return just one.
    [[nodiscard]] std::vector<std::string> validate_event(const Schema& schema, const Json& event);

    // Decodes and checks one raw line. Blank lines yield no failures.
    [[nodiscard]] std::vector<std::string> validate_line(const Schema& schema, std::string_view raw);

    [[nodiscard]] std::vector<ValidationFailure> validate_trace(const Schema& schema, const std::vector<std::string>& lines);

    [[nodiscard]] bool is_blank(std::string_view line) noexcept;
} // namespace termoracle::schema
