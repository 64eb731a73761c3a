#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "termoracle/core/errors.hpp"
#include "termoracle/core/json.hpp"
#include "termoracle/core/types.hpp"

namespace termoracle::schema {
    using u8 = termoracle::core::u8;
    using Json = termoracle::core::Json;

    enum class TypeKind : u8 {
        String = 0,
        Number,
        Integer,
        Boolean,
        Null,
        Object,
        Array,
    };

    // A single kind or a one-of set of kinds (any member matches).
    struct TypeConstraint {
        std::vector<TypeKind> any_of{};
        bool one_of{false};
    };

    struct EventSchema {
        std::vector<std::string> required{};
        std::map<std::string, TypeConstraint> types{};
    };

    struct Schema {
        std::string version{};
        std::vector<std::string> common_required{};
        std::map<std::string, TypeConstraint> common_types{};
        std::map<std::string, EventSchema> events{};
    };

    [[nodiscard]] const char* type_kind_name(TypeKind kind) noexcept;
    [[nodiscard]] bool type_kind_from_name(std::string_view name, TypeKind* out) noexcept;

    // Total over TypeKind. Booleans never satisfy Number or Integer.
    [[nodiscard]] bool type_kind_matches(TypeKind kind, const Json& value) noexcept;
    [[nodiscard]] bool type_matches(const TypeConstraint& constraint, const Json& value) noexcept;

    // "number" for a single kind, "[string, null]" for a one-of set.
    [[nodiscard]] std::string constraint_to_string(const TypeConstraint& constraint);

    // Accepts a kind name or an array of kind names.
    termoracle::core::Status parse_constraint(const Json& doc, TypeConstraint* out, std::string* error);

    termoracle::core::Status load_schema(const Json& doc, Schema* out, std::string* error);
    termoracle::core::Status load_schema_text(std::string_view text, Schema* out, std::string* error);
    termoracle::core::Status load_schema_file(const std::string& path, Schema* out, std::string* error);
} // namespace termoracle::schema
