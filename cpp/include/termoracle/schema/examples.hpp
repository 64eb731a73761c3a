#pragma once

#include <string_view>

#include "termoracle/core/json.hpp"

namespace termoracle::schema {
    // Canonical example set: an object mapping each event type to one
    // representative event stamped with `schema_version`. Every example
    // validates cleanly against the shipped schema.
    [[nodiscard]] termoracle::core::Json example_events(std::string_view schema_version);
} // namespace termoracle::schema
