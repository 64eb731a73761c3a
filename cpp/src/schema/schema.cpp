#include "termoracle/schema/schema.hpp"

#include <utility>

#include "termoracle/trace/trace_io.hpp"

namespace termoracle::schema {
    namespace {
        using termoracle::core::Status;
        using termoracle::core::StatusCode;
        using termoracle::core::StatusDomain;
        using termoracle::core::make_status;

        struct KindName {
            TypeKind kind;
            const char* name;
        };

        constexpr KindName kKindNames[] = {
            {TypeKind::String, "string"},
            {TypeKind::Number, "number"},
            {TypeKind::Integer, "integer"},
            {TypeKind::Boolean, "boolean"},
            {TypeKind::Null, "null"},
            {TypeKind::Object, "object"},
            {TypeKind::Array, "array"},
        };

        Status fail(std::string* error, std::string message) {
            if (error) {
                *error = std::move(message);
            }
            return make_status(StatusDomain::Schema, StatusCode::Invalid);
        }

        Status parse_string_list(const Json& doc, const std::string& what, std::vector<std::string>* out, std::string* error) {
            if (!doc.is_array()) {
                return fail(error, what + " must be an array of strings");
            }
            out->clear();
            out->reserve(doc.size());
            for (const Json& item : doc) {
                if (!item.is_string()) {
                    return fail(error, what + " must be an array of strings");
                }
                out->push_back(item.get<std::string>());
            }
            return termoracle::core::ok_status();
        }

        Status parse_type_map(const Json& doc, const std::string& what, std::map<std::string, TypeConstraint>* out, std::string* error) {
            if (!doc.is_object()) {
                return fail(error, what + " must be an object");
            }
            out->clear();
            for (auto it = doc.begin(); it != doc.end(); ++it) {
                TypeConstraint c{};
                std::string inner;
                const Status s = parse_constraint(it.value(), &c, &inner);
                if (!termoracle::core::is_ok(s)) {
                    return fail(error, what + "." + it.key() + ": " + inner);
                }
                (*out)[it.key()] = std::move(c);
            }
            return termoracle::core::ok_status();
        }
    } // namespace

    const char* type_kind_name(TypeKind kind) noexcept {
        for (const KindName& k : kKindNames) {
            if (k.kind == kind) {
                return k.name;
            }
        }
        return "unknown";
    }

    bool type_kind_from_name(std::string_view name, TypeKind* out) noexcept {
        for (const KindName& k : kKindNames) {
            if (name == k.name) {
                if (out) {
                    *out = k.kind;
                }
                return true;
            }
        }
        return false;
    }

    bool type_kind_matches(TypeKind kind, const Json& value) noexcept {
        switch (kind) {
            case TypeKind::String:
                return value.is_string();
            case TypeKind::Number:
                return value.is_number() && !value.is_boolean();
            case TypeKind::Integer:
                return value.is_number_integer() && !value.is_boolean();
            case TypeKind::Boolean:
                return value.is_boolean();
            case TypeKind::Null:
                return value.is_null();
            case TypeKind::Object:
                return value.is_object();
            case TypeKind::Array:
                return value.is_array();
        }
        return false;
    }

    bool type_matches(const TypeConstraint& constraint, const Json& value) noexcept {
        for (TypeKind k : constraint.any_of) {
            if (type_kind_matches(k, value)) {
                return true;
            }
        }
        return false;
    }

    std::string constraint_to_string(const TypeConstraint& constraint) {
        if (!constraint.one_of && constraint.any_of.size() == 1) {
            return type_kind_name(constraint.any_of.front());
        }
        std::string out = "[";
        for (size_t i = 0; i < constraint.any_of.size(); ++i) {
            if (i > 0) {
                out += ", ";
            }
            out += type_kind_name(constraint.any_of[i]);
        }
        out += "]";
        return out;
    }

    Status parse_constraint(const Json& doc, TypeConstraint* out, std::string* error) {
        if (out == nullptr) {
            return make_status(StatusDomain::Schema, StatusCode::Invalid);
        }

        TypeConstraint c{};
        if (doc.is_string()) {
            TypeKind k{};
            const std::string& name = doc.get_ref<const std::string&>();
            if (!type_kind_from_name(name, &k)) {
                return fail(error, "unknown type name: " + name);
            }
            c.any_of.push_back(k);
        } else if (doc.is_array()) {
            if (doc.empty()) {
                return fail(error, "type list must not be empty");
            }
            c.one_of = true;
            for (const Json& item : doc) {
                if (!item.is_string()) {
                    return fail(error, "type list entries must be strings");
                }
                TypeKind k{};
                const std::string& name = item.get_ref<const std::string&>();
                if (!type_kind_from_name(name, &k)) {
                    return fail(error, "unknown type name: " + name);
                }
                c.any_of.push_back(k);
            }
        } else {
            return fail(error, "type must be a name or a list of names");
        }

        *out = std::move(c);
        return termoracle::core::ok_status();
    }

    Status load_schema(const Json& doc, Schema* out, std::string* error) {
        if (out == nullptr) {
            return make_status(StatusDomain::Schema, StatusCode::Invalid);
        }
        if (!doc.is_object()) {
            return fail(error, "schema root must be an object");
        }

        Schema schema{};

        const std::string* version = termoracle::core::json_find_string(doc, "schema_version");
        if (!version) {
            return fail(error, "schema_version must be a string");
        }
        schema.version = *version;

        Status s{};
        if (const Json* req = termoracle::core::json_find(doc, "common_required")) {
            s = parse_string_list(*req, "common_required", &schema.common_required, error);
            if (!termoracle::core::is_ok(s)) {
                return s;
            }
        }
        if (const Json* types = termoracle::core::json_find(doc, "common_types")) {
            s = parse_type_map(*types, "common_types", &schema.common_types, error);
            if (!termoracle::core::is_ok(s)) {
                return s;
            }
        }

        const Json* events = termoracle::core::json_find(doc, "events");
        if (!events || !events->is_object()) {
            return fail(error, "events must be an object");
        }
        for (auto it = events->begin(); it != events->end(); ++it) {
            const std::string where = "events." + it.key();
            const Json& ev = it.value();
            if (!ev.is_object()) {
                return fail(error, where + " must be an object");
            }
            EventSchema es{};
            if (const Json* req = termoracle::core::json_find(ev, "required")) {
                s = parse_string_list(*req, where + ".required", &es.required, error);
                if (!termoracle::core::is_ok(s)) {
                    return s;
                }
            }
            if (const Json* types = termoracle::core::json_find(ev, "types")) {
                s = parse_type_map(*types, where + ".types", &es.types, error);
                if (!termoracle::core::is_ok(s)) {
                    return s;
                }
            }
            schema.events[it.key()] = std::move(es);
        }

        *out = std::move(schema);
        return termoracle::core::ok_status();
    }

    Status load_schema_text(std::string_view text, Schema* out, std::string* error) {
        Json doc;
        std::string parse_error;
        if (!termoracle::core::json_parse(text, &doc, &parse_error)) {
            return fail(error, "schema is not valid json: " + parse_error);
        }
        return load_schema(doc, out, error);
    }

    Status load_schema_file(const std::string& path, Schema* out, std::string* error) {
        std::string text;
        const Status s = termoracle::trace::read_text_file(path, &text);
        if (!termoracle::core::is_ok(s)) {
            if (error) {
                *error = "cannot read schema file: " + path;
            }
            return s;
        }
        return load_schema_text(text, out, error);
    }
} // namespace termoracle::schema
