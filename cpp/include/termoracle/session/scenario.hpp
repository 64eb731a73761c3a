#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "termoracle/core/errors.hpp"
#include "termoracle/core/json.hpp"
#include "termoracle/core/types.hpp"

namespace termoracle::session {
    using termoracle::core::Geometry;
    using termoracle::core::i64;
    using termoracle::core::u8;

    enum class StepType : u8 {
        Send = 0,
        Resize,
        Wait,
        Drain,
    };

    [[nodiscard]] const char* step_type_name(StepType t) noexcept;
    [[nodiscard]] bool step_type_from_name(std::string_view name, StepType* out) noexcept;

    inline constexpr double kDefaultWaitMs = 100.0;

    struct Step {
        StepType type{StepType::Wait};
        // Delays are milliseconds and may be fractional.
        double delay_ms{0.0};

        // send
        std::optional<std::string> data_hex{};
        std::optional<std::string> data_b64{};
        std::optional<std::string> data_text{};
        std::string input_type{"keys"};
        std::string comment{};

        // resize
        Geometry geometry{};

        // wait
        double wait_ms{kDefaultWaitMs};
    };

    struct Scenario {
        std::string name{};
        std::string description{};
        Geometry initial{120, 40};
        double timeout_s{30.0};
        std::vector<Step> steps{};
    };

    termoracle::core::Status parse_scenario(const termoracle::core::Json& doc, Scenario* out, std::string* error);
    termoracle::core::Status load_scenario_text(std::string_view text, Scenario* out, std::string* error);
    termoracle::core::Status load_scenario_file(const std::string& path, Scenario* out, std::string* error);

    // Payload of a send step: data_hex, then data_b64, then data; empty when
    // none is set.
    termoracle::core::Status decode_step_data(const Step& step, termoracle::core::Bytes* out);

    // Reference summary a session is compared against.
    struct GoldenTranscript {
        std::string checksum_chain{};
        i64 frames{-1};
    };

    termoracle::core::Status load_golden_file(const std::string& path, GoldenTranscript* out, std::string* error);
} // namespace termoracle::session
