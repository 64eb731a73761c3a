#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "termoracle/core/errors.hpp"
#include "termoracle/core/json.hpp"
#include "termoracle/core/types.hpp"
#include "termoracle/schema/validator.hpp"

namespace termoracle::registry {
    using Json = termoracle::core::Json;
    using termoracle::schema::ValidationFailure;

    inline constexpr char kRegistryVersion[] = "e2e-hash-registry-v1";

    // At most one entry per (event_type, hash_key, field, case, step).
    struct HashRegistryEntry {
        std::string event_type{};
        std::string hash_key{};
        std::string field{};
        std::string value{};
        std::optional<std::string> case_name{};
        std::optional<std::string> step{};
        std::optional<std::string> note{};
    };

    struct HashRegistry {
        std::string version{kRegistryVersion};
        std::vector<HashRegistryEntry> entries{};
    };

    // event type -> hash-bearing fields eligible for derivation.
    using RegistryFieldTable = std::map<std::string, std::vector<std::string>>;

    [[nodiscard]] const RegistryFieldTable& default_registry_fields();

    // Explicit non-empty `hash_key`, otherwise "{mode}-{cols}x{rows}-seed{seed}"
    // with mode falling back to screen_mode. No key when any part is unusable.
    [[nodiscard]] std::optional<std::string> compute_hash_key(const Json& event);

    // Absent or non-string status counts as a pass.
    [[nodiscard]] bool is_pass_status(const Json& event) noexcept;

    termoracle::core::Status load_registry(const Json& doc, HashRegistry* out, std::string* error);
    termoracle::core::Status load_registry_text(std::string_view text, HashRegistry* out, std::string* error);
    termoracle::core::Status load_registry_file(const std::string& path, HashRegistry* out, std::string* error);

    [[nodiscard]] std::vector<ValidationFailure> check_registry(const HashRegistry& registry, const std::vector<std::string>& lines);

    // Sorted by (event_type, hash_key, case, step, field). A second value for
    // an existing key returns Conflict and describes both values in *error.
    termoracle::core::Status derive_registry(const std::vector<std::string>& lines,
        const RegistryFieldTable& fields,
        std::vector<HashRegistryEntry>* out,
        std::string* error);

    [[nodiscard]] Json registry_to_json(const std::vector<HashRegistryEntry>& entries);
} // namespace termoracle::registry
