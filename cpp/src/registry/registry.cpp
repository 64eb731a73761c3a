#include "termoracle/registry/registry.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <tuple>
#include <utility>

#include "termoracle/trace/trace_io.hpp"

namespace termoracle::registry {
    namespace {
        using termoracle::core::Status;
        using termoracle::core::StatusCode;
        using termoracle::core::StatusDomain;
        using termoracle::core::i64;
        using termoracle::core::make_status;
        using termoracle::core::u64;

        Status fail(std::string* error, std::string message, StatusCode code = StatusCode::Invalid) {
            if (error) {
                *error = std::move(message);
            }
            return make_status(StatusDomain::Registry, code);
        }

        std::optional<std::string> seed_to_string(const Json* seed) {
            if (!seed || seed->is_boolean()) {
                return std::nullopt;
            }
            if (seed->is_number_integer()) {
                return termoracle::core::json_dump_compact(*seed);
            }
            if (seed->is_number_float()) {
                const double d = seed->get<double>();
                if (std::isfinite(d) && std::floor(d) == d) {
                    char buf[400];
                    std::snprintf(buf, sizeof(buf), "%.0f", d == 0.0 ? 0.0 : d);
                    return std::string(buf);
                }
                return termoracle::core::json_dump_compact(*seed);
            }
            if (seed->is_string() && !seed->get_ref<const std::string&>().empty()) {
                return seed->get<std::string>();
            }
            return std::nullopt;
        }

        const Json* event_mode(const Json& event) noexcept {
            const Json* mode = termoracle::core::json_find(event, "mode");
            if (!mode || mode->is_null()) {
                mode = termoracle::core::json_find(event, "screen_mode");
            }
            return mode;
        }

        std::string context_value(const Json* v) {
            if (!v || v->is_null()) {
                return "null";
            }
            if (v->is_string()) {
                return v->get<std::string>();
            }
            return termoracle::core::json_dump_compact(*v);
        }

        // "mode=.. cols=.. rows=.. seed=.. case=.. step=.. screen=.."
        std::string event_context(const Json& event) {
            std::string out;
            out += "mode=" + context_value(event_mode(event));
            out += " cols=" + context_value(termoracle::core::json_find(event, "cols"));
            out += " rows=" + context_value(termoracle::core::json_find(event, "rows"));
            out += " seed=" + context_value(termoracle::core::json_find(event, "seed"));
            out += " case=" + context_value(termoracle::core::json_find(event, "case"));
            out += " step=" + context_value(termoracle::core::json_find(event, "step"));
            out += " screen=" + context_value(termoracle::core::json_find(event, "screen"));
            return out;
        }

        bool optional_matches(const std::optional<std::string>& want, const Json& event, const char* key) {
            if (!want) {
                return true;
            }
            const std::string* have = termoracle::core::json_find_string(event, key);
            return have && *have == *want;
        }

        std::optional<std::string> optional_string(const Json& event, const char* key) {
            const std::string* s = termoracle::core::json_find_string(event, key);
            if (!s) {
                return std::nullopt;
            }
            return *s;
        }

        // Parses an event line; false for blanks, bad JSON, non-objects and
        // events without a string type.
        bool parse_event(const std::string& line, Json* out, const std::string** type) {
            if (termoracle::schema::is_blank(line)) {
                return false;
            }
            std::string ignored;
            if (!termoracle::core::json_parse(line, out, &ignored) || !out->is_object()) {
                return false;
            }
            *type = termoracle::core::json_find_string(*out, "type");
            return *type != nullptr;
        }

        Status optional_entry_string(const Json& item, const char* key, size_t idx, std::optional<std::string>* out, std::string* error) {
            const Json* v = termoracle::core::json_find(item, key);
            if (!v || v->is_null()) {
                out->reset();
                return termoracle::core::ok_status();
            }
            if (!v->is_string()) {
                return fail(error, "registry entry " + std::to_string(idx) + " " + key + " must be a string");
            }
            *out = v->get<std::string>();
            return termoracle::core::ok_status();
        }

        bool non_empty_string(const Json& item, const char* key, std::string* out) {
            const std::string* s = termoracle::core::json_find_string(item, key);
            if (!s || s->empty()) {
                return false;
            }
            *out = *s;
            return true;
        }

        std::string optional_text(const std::optional<std::string>& v) {
            return v ? *v : std::string("null");
        }
    } // namespace

    const RegistryFieldTable& default_registry_fields() {
        static const RegistryFieldTable table{
            {"span_diff_case", {"diff_hash"}},
            {"tile_skip_case", {"diff_hash"}},
            {"selector_case", {"decision_hash"}},
            {"budgeted_refresh_case", {"widget_refresh_hash"}},
        };
        return table;
    }

    std::optional<std::string> compute_hash_key(const Json& event) {
        if (!event.is_object()) {
            return std::nullopt;
        }
        if (const std::string* explicit_key = termoracle::core::json_find_string(event, "hash_key")) {
            if (!explicit_key->empty()) {
                return *explicit_key;
            }
        }

        const Json* mode = event_mode(event);
        if (!mode || !mode->is_string()) {
            return std::nullopt;
        }

        i64 cols = 0;
        i64 rows = 0;
        const Json* cols_v = termoracle::core::json_find(event, "cols");
        const Json* rows_v = termoracle::core::json_find(event, "rows");
        if (!cols_v || !termoracle::core::json_get_i64(*cols_v, &cols) || cols < 0) {
            return std::nullopt;
        }
        if (!rows_v || !termoracle::core::json_get_i64(*rows_v, &rows) || rows < 0) {
            return std::nullopt;
        }

        const std::optional<std::string> seed = seed_to_string(termoracle::core::json_find(event, "seed"));
        if (!seed) {
            return std::nullopt;
        }

        return mode->get<std::string>() + "-" + std::to_string(cols) + "x" + std::to_string(rows) + "-seed" + *seed;
    }

    bool is_pass_status(const Json& event) noexcept {
        const std::string* status = termoracle::core::json_find_string(event, "status");
        if (!status) {
            return true;
        }
        std::string lower;
        lower.reserve(status->size());
        for (char c : *status) {
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return lower == "pass" || lower == "passed" || lower == "success";
    }

    Status load_registry(const Json& doc, HashRegistry* out, std::string* error) {
        if (out == nullptr) {
            return make_status(StatusDomain::Registry, StatusCode::Invalid);
        }
        if (!doc.is_object()) {
            return fail(error, "registry root must be an object");
        }

        const std::string* version = termoracle::core::json_find_string(doc, "registry_version");
        if (!version) {
            return fail(error, "registry_version must be a string");
        }
        if (*version != kRegistryVersion) {
            return fail(error, std::string("registry_version must be ") + kRegistryVersion + ", got " + *version);
        }

        const Json* items = termoracle::core::json_find(doc, "entries");
        if (!items || !items->is_array()) {
            return fail(error, "entries must be a list");
        }

        HashRegistry reg{};
        reg.version = *version;
        reg.entries.reserve(items->size());

        size_t idx = 0;
        for (const Json& item : *items) {
            ++idx;
            const std::string prefix = "registry entry " + std::to_string(idx);
            if (!item.is_object()) {
                return fail(error, prefix + " must be an object");
            }
            HashRegistryEntry e{};
            if (!non_empty_string(item, "event_type", &e.event_type)) {
                return fail(error, prefix + " missing event_type");
            }
            if (!non_empty_string(item, "hash_key", &e.hash_key)) {
                return fail(error, prefix + " missing hash_key");
            }
            if (!non_empty_string(item, "field", &e.field)) {
                return fail(error, prefix + " missing field");
            }
            const std::string* value = termoracle::core::json_find_string(item, "value");
            if (!value) {
                return fail(error, prefix + " value must be a string");
            }
            e.value = *value;

            Status s = optional_entry_string(item, "case", idx, &e.case_name, error);
            if (termoracle::core::is_ok(s)) {
                s = optional_entry_string(item, "step", idx, &e.step, error);
            }
            if (termoracle::core::is_ok(s)) {
                s = optional_entry_string(item, "note", idx, &e.note, error);
            }
            if (!termoracle::core::is_ok(s)) {
                return s;
            }
            reg.entries.push_back(std::move(e));
        }

        *out = std::move(reg);
        return termoracle::core::ok_status();
    }

    Status load_registry_text(std::string_view text, HashRegistry* out, std::string* error) {
        Json doc;
        std::string parse_error;
        if (!termoracle::core::json_parse(text, &doc, &parse_error)) {
            return fail(error, "registry is not valid json: " + parse_error);
        }
        return load_registry(doc, out, error);
    }

    Status load_registry_file(const std::string& path, HashRegistry* out, std::string* error) {
        std::string text;
        const Status s = termoracle::trace::read_text_file(path, &text);
        if (!termoracle::core::is_ok(s)) {
            if (error) {
                *error = s.code == StatusCode::NotFound ? "registry file not found: " + path : "cannot read registry file: " + path;
            }
            return s;
        }
        return load_registry_text(text, out, error);
    }

    std::vector<ValidationFailure> check_registry(const HashRegistry& registry, const std::vector<std::string>& lines) {
        std::map<std::pair<std::string, std::string>, std::vector<const HashRegistryEntry*>> index;
        for (const HashRegistryEntry& e : registry.entries) {
            index[{e.event_type, e.hash_key}].push_back(&e);
        }

        std::vector<ValidationFailure> failures;
        for (size_t i = 0; i < lines.size(); ++i) {
            Json event;
            const std::string* type = nullptr;
            if (!parse_event(lines[i], &event, &type)) {
                continue;
            }
            if (!is_pass_status(event)) {
                continue;
            }
            const std::optional<std::string> key = compute_hash_key(event);
            if (!key || key->empty()) {
                continue;
            }
            auto it = index.find({*type, *key});
            if (it == index.end()) {
                continue;
            }

            const u64 line_no = static_cast<u64>(i + 1);
            for (const HashRegistryEntry* e : it->second) {
                if (!optional_matches(e->case_name, event, "case") || !optional_matches(e->step, event, "step")) {
                    continue;
                }
                const Json* actual = termoracle::core::json_find(event, e->field.c_str());
                if (!actual) {
                    failures.push_back({line_no, "missing hash field " + e->field + " for " + *type + " " + *key + " " + event_context(event)});
                    continue;
                }
                if (!actual->is_string()) {
                    failures.push_back({line_no, "hash field " + e->field + " for " + *type + " " + *key + " " + event_context(event) + " is not a string"});
                    continue;
                }
                const std::string& got = actual->get_ref<const std::string&>();
                if (got != e->value) {
                    failures.push_back({line_no, "hash mismatch " + *type + " " + *key + " " + event_context(event) + " field=" + e->field +
                                                     " expected=" + e->value + " got=" + got});
                }
            }
        }
        return failures;
    }

    Status derive_registry(const std::vector<std::string>& lines,
        const RegistryFieldTable& fields,
        std::vector<HashRegistryEntry>* out,
        std::string* error) {
        if (out == nullptr) {
            return make_status(StatusDomain::Registry, StatusCode::Invalid);
        }

        using Key = std::tuple<std::string, std::string, std::string, std::optional<std::string>, std::optional<std::string>>;
        std::map<Key, HashRegistryEntry> entries;

        for (size_t i = 0; i < lines.size(); ++i) {
            Json event;
            const std::string* type = nullptr;
            if (!parse_event(lines[i], &event, &type)) {
                continue;
            }
            auto table_it = fields.find(*type);
            if (table_it == fields.end() || table_it->second.empty()) {
                continue;
            }
            if (!is_pass_status(event)) {
                continue;
            }
            const std::optional<std::string> key = compute_hash_key(event);
            if (!key || key->empty()) {
                continue;
            }
            const std::optional<std::string> case_name = optional_string(event, "case");
            const std::optional<std::string> step = optional_string(event, "step");

            for (const std::string& field : table_it->second) {
                const std::string* value = termoracle::core::json_find_string(event, field.c_str());
                if (!value || value->empty()) {
                    continue;
                }
                Key k{*type, *key, field, case_name, step};
                auto existing = entries.find(k);
                if (existing != entries.end()) {
                    if (existing->second.value != *value) {
                        return fail(error,
                            "conflicting registry values for " + *type + " " + *key + " case=" + optional_text(case_name) +
                                " step=" + optional_text(step) + " field=" + field + ": " + existing->second.value + " vs " + *value +
                                " (line " + std::to_string(i + 1) + ")",
                            StatusCode::Conflict);
                    }
                    continue;
                }
                HashRegistryEntry e{};
                e.event_type = *type;
                e.hash_key = *key;
                e.field = field;
                e.value = *value;
                e.case_name = case_name;
                e.step = step;
                entries.emplace(std::move(k), std::move(e));
            }
        }

        std::vector<HashRegistryEntry> sorted;
        sorted.reserve(entries.size());
        for (auto& [k, e] : entries) {
            sorted.push_back(std::move(e));
        }
        std::sort(sorted.begin(), sorted.end(), [](const HashRegistryEntry& a, const HashRegistryEntry& b) {
            return std::forward_as_tuple(a.event_type, a.hash_key, a.case_name.value_or(""), a.step.value_or(""), a.field) <
                   std::forward_as_tuple(b.event_type, b.hash_key, b.case_name.value_or(""), b.step.value_or(""), b.field);
        });

        *out = std::move(sorted);
        return termoracle::core::ok_status();
    }

    Json registry_to_json(const std::vector<HashRegistryEntry>& entries) {
        auto opt = [](const std::optional<std::string>& v) -> Json {
            if (v) {
                return Json(*v);
            }
            return Json(nullptr);
        };

        Json items = Json::array();
        for (const HashRegistryEntry& e : entries) {
            Json item = Json::object();
            item["event_type"] = e.event_type;
            item["hash_key"] = e.hash_key;
            item["field"] = e.field;
            item["value"] = e.value;
            item["case"] = opt(e.case_name);
            item["step"] = opt(e.step);
            item["note"] = opt(e.note);
            items.push_back(std::move(item));
        }

        Json doc = Json::object();
        doc["registry_version"] = kRegistryVersion;
        doc["entries"] = std::move(items);
        return doc;
    }
} // namespace termoracle::registry
