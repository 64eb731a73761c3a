#pragma once

#include <string>

namespace termoracle::session {
    // Best-effort description of the machine running a session. Every probe
    // degrades to "unknown" (false for git_dirty) instead of failing.
    struct EnvSnapshot {
        std::string host{"unknown"};
        std::string platform{"unknown"};
        std::string git_commit{"unknown"};
        bool git_dirty{false};
        std::string rustc{"unknown"};
        std::string cargo{"unknown"};
        std::string term{};
        std::string colorterm{};
        std::string no_color{};
        std::string locale{};
        std::string timezone{};
    };

    [[nodiscard]] EnvSnapshot probe_environment();

    // First line of `<tool> --version`, or "unknown".
    [[nodiscard]] std::string command_version(const char* tool);
} // namespace termoracle::session
