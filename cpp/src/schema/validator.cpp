#include "termoracle/schema/validator.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace termoracle::schema {
    namespace {
        bool is_space(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        std::string_view trim(std::string_view s) noexcept {
            while (!s.empty() && is_space(s.front())) {
                s.remove_prefix(1);
            }
            while (!s.empty() && is_space(s.back())) {
                s.remove_suffix(1);
            }
            return s;
        }

        std::string scalar_text(const Json& v) {
            if (v.is_string()) {
                return v.get<std::string>();
            }
            return termoracle::core::json_dump_compact(v);
        }
    } // namespace

    bool is_blank(std::string_view line) noexcept {
        return trim(line).empty();
    }

    std::vector<std::string> validate_event(const Schema& schema, const Json& event) {
        std::vector<std::string> errors;

        const std::string* type = termoracle::core::json_find_string(event, "type");
        if (!type) {
            errors.emplace_back("type must be a string");
            return errors;
        }

        auto es = schema.events.find(*type);
        if (es == schema.events.end()) {
            errors.push_back("unknown event type: " + *type);
            return errors;
        }

        std::vector<std::string> required = schema.common_required;
        for (const std::string& f : es->second.required) {
            if (std::find(required.begin(), required.end(), f) == required.end()) {
                required.push_back(f);
            }
        }
        for (const std::string& f : required) {
            if (!event.contains(f)) {
                errors.push_back("missing required field: " + f);
            }
        }

        if (const Json* version = termoracle::core::json_find(event, "schema_version")) {
            if (!version->is_null() && !(version->is_string() && version->get_ref<const std::string&>() == schema.version)) {
                errors.push_back("schema_version mismatch: expected " + schema.version + ", got " + scalar_text(*version));
            }
        }

        std::map<std::string, TypeConstraint> types = schema.common_types;
        for (const auto& [field, c] : es->second.types) {
            types[field] = c;
        }
        for (const auto& [field, c] : types) {
            const Json* value = termoracle::core::json_find(event, field.c_str());
            if (!value) {
                continue;
            }
            if (!type_matches(c, *value)) {
                errors.push_back("field " + field + " has wrong type: expected " + constraint_to_string(c) + ", got " +
                                 termoracle::core::json_kind_name(*value));
            }
        }

        return errors;
    }

    std::vector<std::string> validate_line(const Schema& schema, std::string_view raw) {
        const std::string_view line = trim(raw);
        if (line.empty()) {
            return {};
        }

        Json doc;
        std::string parse_error;
        if (!termoracle::core::json_parse(line, &doc, &parse_error)) {
            return {"invalid json: " + parse_error};
        }
        if (!doc.is_object()) {
            return {"jsonl line must be an object"};
        }
        return validate_event(schema, doc);
    }

    std::vector<ValidationFailure> validate_trace(const Schema& schema, const std::vector<std::string>& lines) {
        std::vector<ValidationFailure> failures;
        for (size_t i = 0; i < lines.size(); ++i) {
            for (std::string& msg : validate_line(schema, lines[i])) {
                failures.push_back(ValidationFailure{static_cast<u64>(i + 1), std::move(msg)});
            }
        }
        return failures;
    }
} // namespace termoracle::schema
