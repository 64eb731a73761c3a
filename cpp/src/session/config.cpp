#include "termoracle/session/config.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <utility>

namespace termoracle::session {
    namespace {
        using termoracle::core::Status;
        using termoracle::core::StatusCode;
        using termoracle::core::StatusDomain;
        using termoracle::core::make_status;

        Status bad_value(const char* name, const char* value, std::string* error) {
            if (error) {
                *error = std::string("invalid value for ") + name + ": " + value;
            }
            return make_status(StatusDomain::Session, StatusCode::Invalid);
        }

        Status read_i64(const char* name, i64* out, std::string* error) {
            const char* v = std::getenv(name);
            if (!v) {
                return termoracle::core::ok_status();
            }
            errno = 0;
            char* end = nullptr;
            const long long parsed = std::strtoll(v, &end, 10);
            if (end == v || *end != '\0' || errno == ERANGE) {
                return bad_value(name, v, error);
            }
            *out = static_cast<i64>(parsed);
            return termoracle::core::ok_status();
        }

        Status read_f64(const char* name, double* out, std::string* error) {
            const char* v = std::getenv(name);
            if (!v) {
                return termoracle::core::ok_status();
            }
            errno = 0;
            char* end = nullptr;
            const double parsed = std::strtod(v, &end);
            if (end == v || *end != '\0' || errno == ERANGE) {
                return bad_value(name, v, error);
            }
            *out = parsed;
            return termoracle::core::ok_status();
        }

        bool equals_ignore_case(const char* a, const char* b) noexcept {
            for (; *a && *b; ++a, ++b) {
                if (std::tolower(static_cast<unsigned char>(*a)) != std::tolower(static_cast<unsigned char>(*b))) {
                    return false;
                }
            }
            return *a == *b;
        }
    } // namespace

    std::string env_or(const char* name, const char* fallback) {
        const char* v = std::getenv(name);
        return v ? std::string(v) : std::string(fallback);
    }

    std::string default_schema_path() {
        return env_or("TERMORACLE_SCHEMA", kDefaultSchemaPath);
    }

    Status load_env_config(EnvConfig* out, std::string* error) {
        if (out == nullptr) {
            return make_status(StatusDomain::Session, StatusCode::Invalid);
        }

        EnvConfig cfg{};
        cfg.deterministic = env_or("E2E_DETERMINISTIC", "1") == "1";

        Status s = read_i64("E2E_TIME_STEP_MS", &cfg.time_step_ms, error);
        if (termoracle::core::is_ok(s)) {
            s = read_i64("E2E_SEED", &cfg.seed, error);
        }
        if (termoracle::core::is_ok(s)) {
            s = read_f64("E2E_BROWSER_DPR", &cfg.dpr, error);
        }
        if (!termoracle::core::is_ok(s)) {
            return s;
        }
        if (cfg.time_step_ms < 0) {
            return bad_value("E2E_TIME_STEP_MS", std::getenv("E2E_TIME_STEP_MS"), error);
        }

        cfg.log_dir = env_or("E2E_LOG_DIR", "");
        cfg.results_dir = env_or("E2E_RESULTS_DIR", "");
        cfg.browser = env_or("E2E_BROWSER", "termoracle-ws");
        cfg.browser_version = env_or("E2E_BROWSER_VERSION", "");
        cfg.user_agent = env_or("E2E_BROWSER_USER_AGENT", "termoracle-ws/1");
        cfg.headless = equals_ignore_case(env_or("E2E_HEADLESS", "true").c_str(), "true");

        *out = std::move(cfg);
        return termoracle::core::ok_status();
    }
} // namespace termoracle::session
