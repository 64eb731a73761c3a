#pragma once

#include <type_traits>
#include <vector>

#include "termoracle/core/errors.hpp"
#include "termoracle/core/types.hpp"

namespace termoracle::cli {
    using u8 = termoracle::core::u8;
    using u32 = termoracle::core::u32;
    using i64 = termoracle::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
        F64 = 3,
    };

    enum class OptionId : u32 {
        None = 0,
        Schema = 1,
        Registry = 2,
        EmitRegistry = 3,
        Strict = 4,
        Warn = 5,
        Url = 6,
        Scenario = 7,
        Golden = 8,
        Jsonl = 9,
        Transcript = 10,
        Summary = 11,
        Help = 12,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        double f64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Values point into argv; argv must outlive the parsed result.
    struct ParsedOptions {
        std::vector<ParsedOption> options{};
        std::vector<const char*> positionals{};
    };

    // Long (--name value, --name=value) and short (-n value, -nvalue) forms.
    // Positionals may be interleaved with options; "--" ends option parsing
    // and a lone "-" is a positional. Unknown options and malformed values
    // return Invalid with the offending token index in aux.
    termoracle::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out) noexcept;

    // Last occurrence of `id`, or nullptr.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& parsed, OptionId id) noexcept;

    [[nodiscard]] bool has_flag(const ParsedOptions& parsed, OptionId id) noexcept;

    // String value of `id`, or `fallback` when absent.
    [[nodiscard]] const char* option_string(const ParsedOptions& parsed, OptionId id, const char* fallback) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);

} // namespace termoracle::cli
