#pragma once

#include <string>

#include "termoracle/core/errors.hpp"
#include "termoracle/core/types.hpp"

namespace termoracle::session {
    using i64 = termoracle::core::i64;

    inline constexpr char kDefaultSchemaPath[] = "schemas/e2e_jsonl_schema.json";

    // Run settings taken from E2E_* environment variables.
    struct EnvConfig {
        bool deterministic{true};
        i64 time_step_ms{100};
        i64 seed{0};
        std::string log_dir{};
        std::string results_dir{};
        std::string browser{"termoracle-ws"};
        std::string browser_version{};
        std::string user_agent{};
        double dpr{1.0};
        bool headless{true};
    };

    // Unset variables keep their defaults. A malformed number returns Invalid
    // and names the offending variable in *error.
    termoracle::core::Status load_env_config(EnvConfig* out, std::string* error);

    // Value of `name`, or `fallback` when unset.
    [[nodiscard]] std::string env_or(const char* name, const char* fallback);

    // TERMORACLE_SCHEMA when set, otherwise kDefaultSchemaPath.
    [[nodiscard]] std::string default_schema_path();
} // namespace termoracle::session
