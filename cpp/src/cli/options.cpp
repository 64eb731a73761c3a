#include "termoracle/cli/options.hpp"

#include <charconv>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <new>

namespace termoracle::cli {
    namespace {
        using termoracle::core::Status;
        using termoracle::core::StatusCode;
        using termoracle::core::StatusDomain;
        using termoracle::core::make_status;

        [[nodiscard]] Status invalid_at(u32 index) noexcept {
            return make_status(StatusDomain::Cli, StatusCode::Invalid, index);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name, size_t name_len) noexcept {
            if (name == nullptr) {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len && std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.short_name == c) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (out == nullptr || s == nullptr) {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool parse_f64(const char* s, double* out) noexcept {
            if (out == nullptr || s == nullptr) {
                return false;
            }
            errno = 0;
            char* end = nullptr;
            const double v = std::strtod(s, &end);
            if (end == s || end == nullptr || *end != '\0' || errno != 0) {
                return false;
            }
            *out = v;
            return true;
        }

        // Fills opt->value from text according to its type.
        [[nodiscard]] bool set_value(ParsedOption* opt, const char* value) noexcept {
            switch (opt->type) {
                case OptionType::String:
                    opt->value.str = value;
                    return true;
                case OptionType::I64:
                    return parse_i64(value, &opt->value.i64v);
                case OptionType::F64:
                    return parse_f64(value, &opt->value.f64v);
                case OptionType::Flag:
                    break;
            }
            return false;
        }

        [[nodiscard]] Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            try {
                out->options.push_back(opt);
            } catch (const std::bad_alloc&) {
                return make_status(StatusDomain::Cli, StatusCode::Unavailable);
            }
            return termoracle::core::ok_status();
        }

        [[nodiscard]] Status push_positional(ParsedOptions* out, const char* tok) noexcept {
            try {
                out->positionals.push_back(tok);
            } catch (const std::bad_alloc&) {
                return make_status(StatusDomain::Cli, StatusCode::Unavailable);
            }
            return termoracle::core::ok_status();
        }
    } // namespace

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        out->options.clear();
        out->positionals.clear();

        if (args.argc > 0 && args.argv == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        u32 i = 0;
        bool options_done = false;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr) {
                break;
            }
            if (options_done || tok[0] != '-' || tok[1] == '\0') {
                const Status s = push_positional(out, tok);
                if (!termoracle::core::is_ok(s)) {
                    return s;
                }
                ++i;
                continue;
            }
            if (std::strcmp(tok, "--") == 0) {
                options_done = true;
                ++i;
                continue;
            }

            const u32 tok_index = i;
            const OptionSpec* spec = nullptr;
            const char* value = nullptr;

            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const size_t name_len = eq != nullptr ? static_cast<size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return invalid_at(tok_index);
                }
                spec = find_long(specs, spec_count, name, name_len);
                if (spec == nullptr) {
                    return invalid_at(tok_index);
                }
                if (eq != nullptr) {
                    value = eq + 1;
                }
                if (spec->type == OptionType::Flag && value != nullptr) {
                    return invalid_at(tok_index);
                }
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (spec == nullptr) {
                    return invalid_at(tok_index);
                }
                if (tok[2] != '\0') {
                    if (spec->type == OptionType::Flag) {
                        return invalid_at(tok_index);
                    }
                    value = tok + 2;
                }
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;
            ++i;

            if (spec->type == OptionType::Flag) {
                opt.value.boolv = 1;
            } else {
                if (value == nullptr) {
                    if (i >= args.argc || args.argv[i] == nullptr) {
                        return invalid_at(tok_index);
                    }
                    value = args.argv[i];
                    ++i;
                }
                if (!set_value(&opt, value)) {
                    return invalid_at(tok_index);
                }
            }

            const Status s = push_option(out, opt);
            if (!termoracle::core::is_ok(s)) {
                return s;
            }
        }

        return termoracle::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& parsed, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (const ParsedOption& o : parsed.options) {
            if (o.id == id) {
                found = &o;
            }
        }
        return found;
    }

    bool has_flag(const ParsedOptions& parsed, OptionId id) noexcept {
        const ParsedOption* o = find_option(parsed, id);
        return o != nullptr && o->type == OptionType::Flag && o->value.boolv != 0;
    }

    const char* option_string(const ParsedOptions& parsed, OptionId id, const char* fallback) noexcept {
        const ParsedOption* o = find_option(parsed, id);
        if (o == nullptr || o->type != OptionType::String) {
            return fallback;
        }
        return o->value.str;
    }
} // namespace termoracle::cli
