#include "termoracle/session/scenario.hpp"

#include <utility>

#include "termoracle/core/encoding.hpp"
#include "termoracle/trace/trace_io.hpp"

namespace termoracle::session {
    namespace {
        using termoracle::core::Json;
        using termoracle::core::Status;
        using termoracle::core::StatusCode;
        using termoracle::core::StatusDomain;
        using termoracle::core::make_status;

        struct StepName {
            StepType type;
            const char* name;
        };

        constexpr StepName kStepNames[] = {
            {StepType::Send, "send"},
            {StepType::Resize, "resize"},
            {StepType::Wait, "wait"},
            {StepType::Drain, "drain"},
        };

        Status fail(std::string* error, std::string message) {
            if (error) {
                *error = std::move(message);
            }
            return make_status(StatusDomain::Session, StatusCode::Invalid);
        }

        // Absent keeps *out. Present must be a non-boolean integer.
        bool read_int(const Json& obj, const char* key, i64* out) {
            const Json* v = termoracle::core::json_find(obj, key);
            if (!v) {
                return true;
            }
            return termoracle::core::json_get_i64(*v, out);
        }

        bool read_ms(const Json& obj, const char* key, double* out) {
            const Json* v = termoracle::core::json_find(obj, key);
            if (!v) {
                return true;
            }
            return termoracle::core::json_get_number(*v, out) && *out >= 0.0;
        }

        bool read_opt_string(const Json& obj, const char* key, std::optional<std::string>* out) {
            const Json* v = termoracle::core::json_find(obj, key);
            if (!v) {
                return true;
            }
            if (!v->is_string()) {
                return false;
            }
            *out = v->get<std::string>();
            return true;
        }

        bool read_string(const Json& obj, const char* key, std::string* out) {
            std::optional<std::string> v;
            if (!read_opt_string(obj, key, &v)) {
                return false;
            }
            if (v) {
                *out = std::move(*v);
            }
            return true;
        }

        Status parse_step(const Json& doc, size_t idx, Step* out, std::string* error) {
            const std::string where = "step " + std::to_string(idx);
            if (!doc.is_object()) {
                return fail(error, where + " must be an object");
            }
            const std::string* type = termoracle::core::json_find_string(doc, "type");
            if (!type) {
                return fail(error, where + " type must be a string");
            }

            Step step{};
            if (!step_type_from_name(*type, &step.type)) {
                return fail(error, where + " has unknown type: " + *type);
            }
            if (!read_ms(doc, "delay_ms", &step.delay_ms)) {
                return fail(error, where + " delay_ms must be a non-negative number");
            }

            switch (step.type) {
                case StepType::Send:
                    if (!read_opt_string(doc, "data_hex", &step.data_hex) || !read_opt_string(doc, "data_b64", &step.data_b64) ||
                        !read_opt_string(doc, "data", &step.data_text)) {
                        return fail(error, where + " data fields must be strings");
                    }
                    if (!read_string(doc, "input_type", &step.input_type) || !read_string(doc, "comment", &step.comment)) {
                        return fail(error, where + " input_type and comment must be strings");
                    }
                    break;
                case StepType::Resize: {
                    i64 cols = 0;
                    i64 rows = 0;
                    const Json* c = termoracle::core::json_find(doc, "cols");
                    const Json* r = termoracle::core::json_find(doc, "rows");
                    if (!c || !r || !termoracle::core::json_get_i64(*c, &cols) || !termoracle::core::json_get_i64(*r, &rows) || cols <= 0 ||
                        rows <= 0 || cols > 0xffff || rows > 0xffff) {
                        return fail(error, where + " resize needs positive integer cols and rows");
                    }
                    step.geometry = Geometry{static_cast<termoracle::core::u32>(cols), static_cast<termoracle::core::u32>(rows)};
                    if (!read_string(doc, "comment", &step.comment)) {
                        return fail(error, where + " comment must be a string");
                    }
                    break;
                }
                case StepType::Wait:
                    if (!read_ms(doc, "ms", &step.wait_ms)) {
                        return fail(error, where + " ms must be a non-negative number");
                    }
                    break;
                case StepType::Drain:
                    break;
            }

            *out = std::move(step);
            return termoracle::core::ok_status();
        }
    } // namespace

    const char* step_type_name(StepType t) noexcept {
        for (const StepName& s : kStepNames) {
            if (s.type == t) {
                return s.name;
            }
        }
        return "unknown";
    }

    bool step_type_from_name(std::string_view name, StepType* out) noexcept {
        for (const StepName& s : kStepNames) {
            if (name == s.name) {
                if (out) {
                    *out = s.type;
                }
                return true;
            }
        }
        return false;
    }

    Status parse_scenario(const Json& doc, Scenario* out, std::string* error) {
        if (out == nullptr) {
            return make_status(StatusDomain::Session, StatusCode::Invalid);
        }
        if (!doc.is_object()) {
            return fail(error, "scenario root must be an object");
        }

        Scenario sc{};
        const std::string* name = termoracle::core::json_find_string(doc, "name");
        if (!name || name->empty()) {
            return fail(error, "scenario name must be a non-empty string");
        }
        sc.name = *name;
        if (!read_string(doc, "description", &sc.description)) {
            return fail(error, "scenario description must be a string");
        }

        i64 cols = sc.initial.cols;
        i64 rows = sc.initial.rows;
        if (!read_int(doc, "initial_cols", &cols) || !read_int(doc, "initial_rows", &rows) || cols <= 0 || rows <= 0 || cols > 0xffff ||
            rows > 0xffff) {
            return fail(error, "initial_cols and initial_rows must be positive integers");
        }
        sc.initial = Geometry{static_cast<termoracle::core::u32>(cols), static_cast<termoracle::core::u32>(rows)};

        if (const Json* t = termoracle::core::json_find(doc, "timeout_s")) {
            double timeout = 0.0;
            if (!termoracle::core::json_get_number(*t, &timeout) || timeout <= 0.0) {
                return fail(error, "timeout_s must be a positive number");
            }
            sc.timeout_s = timeout;
        }

        const Json* steps = termoracle::core::json_find(doc, "steps");
        if (steps) {
            if (!steps->is_array()) {
                return fail(error, "steps must be an array");
            }
            sc.steps.reserve(steps->size());
            size_t idx = 0;
            for (const Json& item : *steps) {
                Step step{};
                const Status s = parse_step(item, idx, &step, error);
                if (!termoracle::core::is_ok(s)) {
                    return s;
                }
                sc.steps.push_back(std::move(step));
                ++idx;
            }
        }

        *out = std::move(sc);
        return termoracle::core::ok_status();
    }

    Status load_scenario_text(std::string_view text, Scenario* out, std::string* error) {
        Json doc;
        std::string parse_error;
        if (!termoracle::core::json_parse(text, &doc, &parse_error)) {
            return fail(error, "scenario is not valid json: " + parse_error);
        }
        return parse_scenario(doc, out, error);
    }

    Status load_scenario_file(const std::string& path, Scenario* out, std::string* error) {
        std::string text;
        const Status s = termoracle::trace::read_text_file(path, &text);
        if (!termoracle::core::is_ok(s)) {
            if (error) {
                *error = "cannot read scenario file: " + path;
            }
            return s;
        }
        return load_scenario_text(text, out, error);
    }

    Status decode_step_data(const Step& step, termoracle::core::Bytes* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Session, StatusCode::Invalid);
        }
        if (step.data_hex) {
            return termoracle::core::hex_decode(*step.data_hex, out);
        }
        if (step.data_b64) {
            return termoracle::core::base64_decode(*step.data_b64, termoracle::core::Base64Mode::Lenient, out);
        }
        out->clear();
        if (step.data_text) {
            out->assign(step.data_text->begin(), step.data_text->end());
        }
        return termoracle::core::ok_status();
    }

    Status load_golden_file(const std::string& path, GoldenTranscript* out, std::string* error) {
        if (out == nullptr) {
            return make_status(StatusDomain::Session, StatusCode::Invalid);
        }
        std::string text;
        Status s = termoracle::trace::read_text_file(path, &text);
        if (!termoracle::core::is_ok(s)) {
            if (error) {
                *error = "cannot read golden file: " + path;
            }
            return s;
        }
        Json doc;
        std::string parse_error;
        if (!termoracle::core::json_parse(text, &doc, &parse_error)) {
            return fail(error, "golden file is not valid json: " + parse_error);
        }
        if (!doc.is_object()) {
            return fail(error, "golden root must be an object");
        }

        GoldenTranscript g{};
        if (!read_string(doc, "checksum_chain", &g.checksum_chain)) {
            return fail(error, "golden checksum_chain must be a string");
        }
        if (!read_int(doc, "frames", &g.frames)) {
            return fail(error, "golden frames must be an integer");
        }
        *out = std::move(g);
        return termoracle::core::ok_status();
    }
} // namespace termoracle::session
