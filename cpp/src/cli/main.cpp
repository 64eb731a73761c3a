#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "termoracle/cli/options.hpp"
#include "termoracle/core/errors.hpp"
#include "termoracle/core/json.hpp"
#include "termoracle/net/websocket.hpp"
#include "termoracle/registry/registry.hpp"
#include "termoracle/schema/examples.hpp"
#include "termoracle/schema/schema.hpp"
#include "termoracle/schema/validator.hpp"
#include "termoracle/session/config.hpp"
#include "termoracle/session/driver.hpp"
#include "termoracle/session/env_probe.hpp"
#include "termoracle/session/recorder.hpp"
#include "termoracle/session/scenario.hpp"
#include "termoracle/trace/trace_io.hpp"

namespace core = termoracle::core;
namespace cli = termoracle::cli;

// ========================================================================
// Exit codes
// ========================================================================

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

// ========================================================================
// Error Reporting
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

void print_status_error(const char* context, core::Status s) {
    fprintf(stderr,
            "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
            context,
            core::status_code_name(s.code),
            static_cast<unsigned>(s.code),
            core::status_domain_name(s.domain),
            static_cast<unsigned>(s.domain),
            s.aux);
    if ((s.code == core::StatusCode::Io || s.code == core::StatusCode::Network) && s.aux != 0) {
        fprintf(stderr, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
    }
}

// Loader failures carry a message; fall back to the status line without one.
void print_load_error(const char* context, core::Status s, const std::string& message) {
    if (message.empty()) {
        print_status_error(context, s);
        return;
    }
    fprintf(stderr, "error: %s: %s\n", context, message.c_str());
}

void print_failures(const char* title, const std::vector<termoracle::schema::ValidationFailure>& failures) {
    fprintf(stderr, "%s\n", title);
    for (const auto& f : failures) {
        fprintf(stderr, "line %llu: %s\n", static_cast<unsigned long long>(f.line), f.message.c_str());
    }
}

// ========================================================================
// Option Tables
// ========================================================================

const cli::OptionSpec kValidateOptions[] = {
    {cli::OptionId::Schema, cli::OptionType::String, "schema", 's'},
    {cli::OptionId::Registry, cli::OptionType::String, "registry", 'r'},
    {cli::OptionId::EmitRegistry, cli::OptionType::String, "emit-registry", '\0'},
    {cli::OptionId::Strict, cli::OptionType::Flag, "strict", '\0'},
    {cli::OptionId::Warn, cli::OptionType::Flag, "warn", 'w'},
    {cli::OptionId::Help, cli::OptionType::Flag, "help", 'h'},
};

const cli::OptionSpec kExamplesOptions[] = {
    {cli::OptionId::Schema, cli::OptionType::String, "schema", 's'},
    {cli::OptionId::Help, cli::OptionType::Flag, "help", 'h'},
};

const cli::OptionSpec kSessionOptions[] = {
    {cli::OptionId::Url, cli::OptionType::String, "url", 'u'},
    {cli::OptionId::Scenario, cli::OptionType::String, "scenario", 'c'},
    {cli::OptionId::Golden, cli::OptionType::String, "golden", 'g'},
    {cli::OptionId::Jsonl, cli::OptionType::String, "jsonl", 'j'},
    {cli::OptionId::Transcript, cli::OptionType::String, "transcript", 't'},
    {cli::OptionId::Summary, cli::OptionType::Flag, "summary", '\0'},
    {cli::OptionId::Help, cli::OptionType::Flag, "help", 'h'},
};

int handle_help_command(const cli::CliArgs& args);
int handle_validate(const cli::CliArgs& args);
int handle_examples(const cli::CliArgs& args);
int handle_session(const cli::CliArgs& args);

using CommandHandler = int (*)(const cli::CliArgs& args);

struct CommandEntry {
    const char* name;
    const char* summary;
    CommandHandler handler;
};

const CommandEntry kCommands[] = {
    {"help", "Show this help", handle_help_command},
    {"validate", "Validate a JSONL trace against the schema and hash registry", handle_validate},
    {"examples", "Print one canonical event per schema type as JSONL", handle_examples},
    {"session", "Run a scripted WebSocket terminal session and record a trace", handle_session},
};

const CommandEntry* find_command(const char* name) {
    for (const CommandEntry& c : kCommands) {
        if (std::strcmp(c.name, name) == 0) {
            return &c;
        }
    }
    return nullptr;
}

template <typename T, size_t N>
constexpr core::u32 table_size(const T (&)[N]) noexcept {
    return static_cast<core::u32>(N);
}

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help() {
    printf("Usage: termoracle <command> [options]\n\n");
    printf("Commands:\n");
    for (const CommandEntry& c : kCommands) {
        printf("  %-10s %s\n", c.name, c.summary);
    }
    printf("\n");
    printf("validate <trace.jsonl> [--schema P] [--registry P] [--emit-registry P|-] [--strict] [--warn]\n");
    printf("examples [--schema P]\n");
    printf("session --url ws://host:port/path --scenario P [--golden P] [--jsonl P] [--transcript P] [--summary]\n");
    printf("\n");
    printf("Environment: E2E_DETERMINISTIC, E2E_TIME_STEP_MS, E2E_SEED, E2E_LOG_DIR, E2E_RESULTS_DIR,\n");
    printf("             E2E_BROWSER, E2E_BROWSER_VERSION, E2E_BROWSER_USER_AGENT, E2E_BROWSER_DPR,\n");
    printf("             E2E_HEADLESS, TERMORACLE_SCHEMA\n");
}

int handle_help_command(const cli::CliArgs&) {
    handle_help();
    return kExitOk;
}

bool parse_command_options(const char* name,
                           const cli::CliArgs& args,
                           const cli::OptionSpec* specs,
                           core::u32 spec_count,
                           cli::ParsedOptions* out) {
    const core::Status s = cli::parse_options(args, specs, spec_count, out);
    if (core::is_ok(s)) {
        return true;
    }
    if (s.code == core::StatusCode::Invalid && s.aux < args.argc && args.argv[s.aux] != nullptr) {
        fprintf(stderr, "error: %s: bad option or missing value: %s\n", name, args.argv[s.aux]);
    } else {
        print_status_error(name, s);
    }
    return false;
}

bool load_schema_option(const cli::ParsedOptions& opts, termoracle::schema::Schema* out) {
    const std::string fallback = termoracle::session::default_schema_path();
    const std::string path = cli::option_string(opts, cli::OptionId::Schema, fallback.c_str());
    std::string error;
    const core::Status s = termoracle::schema::load_schema_file(path, out, &error);
    if (!core::is_ok(s)) {
        print_load_error("schema", s, error);
        return false;
    }
    return true;
}

int handle_validate(const cli::CliArgs& args) {
    cli::ParsedOptions opts;
    if (!parse_command_options("validate", args, kValidateOptions, table_size(kValidateOptions), &opts)) {
        return kExitUsage;
    }
    if (cli::has_flag(opts, cli::OptionId::Help)) {
        handle_help();
        return kExitOk;
    }
    if (opts.positionals.size() != 1) {
        print_error("validate expects exactly one trace path");
        return kExitUsage;
    }
    const std::string trace_path = opts.positionals[0];
    const bool strict = cli::has_flag(opts, cli::OptionId::Strict);

    termoracle::schema::Schema schema;
    if (!load_schema_option(opts, &schema)) {
        return kExitUsage;
    }

    std::vector<std::string> lines;
    core::Status s = termoracle::trace::read_lines(trace_path, &lines);
    if (!core::is_ok(s)) {
        fprintf(stderr, "error: cannot read trace: %s\n", trace_path.c_str());
        print_status_error("read trace", s);
        return kExitUsage;
    }

    const auto failures = termoracle::schema::validate_trace(schema, lines);
    if (!failures.empty()) {
        print_failures("JSONL schema validation failed:", failures);
    }

    std::vector<termoracle::schema::ValidationFailure> registry_failures;
    if (const char* registry_path = cli::option_string(opts, cli::OptionId::Registry, nullptr)) {
        termoracle::registry::HashRegistry reg;
        std::string error;
        s = termoracle::registry::load_registry_file(registry_path, &reg, &error);
        if (s.code == core::StatusCode::NotFound) {
            registry_failures.push_back({0, error});
        } else if (!core::is_ok(s)) {
            print_load_error("registry", s, error);
            return kExitUsage;
        } else {
            registry_failures = termoracle::registry::check_registry(reg, lines);
        }
        if (!registry_failures.empty()) {
            print_failures("JSONL hash registry validation failed:", registry_failures);
        }
    }

    const bool clean = failures.empty() && registry_failures.empty();
    if (!clean) {
        if (!strict && cli::has_flag(opts, cli::OptionId::Warn)) {
            fprintf(stderr, "warning: validation failures ignored (pass --strict to fail)\n");
        }
        return strict ? kExitFailed : kExitOk;
    }

    if (const char* emit_path = cli::option_string(opts, cli::OptionId::EmitRegistry, nullptr)) {
        std::vector<termoracle::registry::HashRegistryEntry> entries;
        std::string error;
        s = termoracle::registry::derive_registry(lines, termoracle::registry::default_registry_fields(), &entries, &error);
        if (!core::is_ok(s)) {
            print_load_error("emit-registry", s, error);
            return kExitFailed;
        }
        const std::string text = core::json_dump_pretty(termoracle::registry::registry_to_json(entries)) + "\n";
        if (std::strcmp(emit_path, "-") == 0) {
            fputs(text.c_str(), stdout);
        } else {
            s = termoracle::trace::write_file(emit_path, core::as_view(text));
            if (!core::is_ok(s)) {
                print_status_error("emit-registry write", s);
                return kExitFailed;
            }
        }
    }
    return kExitOk;
}

int handle_examples(const cli::CliArgs& args) {
    cli::ParsedOptions opts;
    if (!parse_command_options("examples", args, kExamplesOptions, table_size(kExamplesOptions), &opts)) {
        return kExitUsage;
    }
    if (cli::has_flag(opts, cli::OptionId::Help)) {
        handle_help();
        return kExitOk;
    }

    std::string version = termoracle::session::kTraceSchemaVersion;
    if (cli::find_option(opts, cli::OptionId::Schema) != nullptr) {
        termoracle::schema::Schema schema;
        if (!load_schema_option(opts, &schema)) {
            return kExitUsage;
        }
        version = schema.version;
    }

    const core::Json examples = termoracle::schema::example_events(version);
    for (auto it = examples.begin(); it != examples.end(); ++it) {
        printf("%s\n", core::json_dump_compact(it.value()).c_str());
    }
    return kExitOk;
}

int handle_session(const cli::CliArgs& args) {
    namespace session = termoracle::session;

    cli::ParsedOptions opts;
    if (!parse_command_options("session", args, kSessionOptions, table_size(kSessionOptions), &opts)) {
        return kExitUsage;
    }
    if (cli::has_flag(opts, cli::OptionId::Help)) {
        handle_help();
        return kExitOk;
    }
    const char* url = cli::option_string(opts, cli::OptionId::Url, nullptr);
    const char* scenario_path = cli::option_string(opts, cli::OptionId::Scenario, nullptr);
    if (url == nullptr || scenario_path == nullptr) {
        print_error("session requires --url and --scenario");
        return kExitUsage;
    }
    if (!opts.positionals.empty()) {
        fprintf(stderr, "error: session: unexpected argument: %s\n", opts.positionals[0]);
        return kExitUsage;
    }

    session::Scenario scenario;
    std::string error;
    core::Status s = session::load_scenario_file(scenario_path, &scenario, &error);
    if (!core::is_ok(s)) {
        print_load_error("scenario", s, error);
        return kExitUsage;
    }

    session::DriverConfig cfg;
    s = session::load_env_config(&cfg.env, &error);
    if (!core::is_ok(s)) {
        print_load_error("config", s, error);
        return kExitUsage;
    }
    cfg.url = url;
    cfg.golden_path = cli::option_string(opts, cli::OptionId::Golden, "");
    cfg.snapshot = session::probe_environment();

    session::RecorderConfig rec_cfg;
    rec_cfg.deterministic = cfg.env.deterministic;
    rec_cfg.time_step_ms = cfg.env.time_step_ms;
    rec_cfg.seed = cfg.env.seed;

    session::SessionRecorder recorder(rec_cfg, session::make_run_id(rec_cfg), scenario.name, scenario.initial);
    const char* jsonl_path = cli::option_string(opts, cli::OptionId::Jsonl, nullptr);
    if (jsonl_path != nullptr) {
        s = recorder.open_sink(jsonl_path);
        if (!core::is_ok(s)) {
            fprintf(stderr, "error: cannot open trace sink: %s\n", jsonl_path);
            print_status_error("open trace", s);
            return kExitUsage;
        }
    }

    const std::string url_text = url;
    const session::ChannelFactory connect = [&url_text](std::unique_ptr<termoracle::net::Channel>* out, std::string* err) {
        std::unique_ptr<termoracle::net::WebSocketClient> client;
        const core::Status cs = termoracle::net::WebSocketClient::connect(url_text, termoracle::net::WsClientOptions{}, &client, err);
        if (core::is_ok(cs)) {
            *out = std::move(client);
        }
        return cs;
    };

    session::RunResult result;
    s = session::run_session(connect, scenario, recorder, cfg, &result);
    recorder.close();
    if (!core::is_ok(s)) {
        print_status_error("session", s);
        return kExitFailed;
    }

    if (const char* transcript_path = cli::option_string(opts, cli::OptionId::Transcript, nullptr)) {
        const core::Bytes& output = recorder.full_output();
        s = termoracle::trace::write_file(transcript_path, core::as_view(output));
        if (!core::is_ok(s)) {
            print_status_error("transcript write", s);
            return kExitFailed;
        }
    }

    if (cli::has_flag(opts, cli::OptionId::Summary) || jsonl_path == nullptr) {
        printf("%s\n", core::json_dump_pretty(session::run_result_to_json(result)).c_str());
    }
    return result.outcome == "pass" ? kExitOk : kExitFailed;
}

// ========================================================================
// Entry Point
// ========================================================================

int main(int argc, char** argv) {
    cli::CliArgs args{argv + 1, argc > 1 ? static_cast<core::u32>(argc - 1) : 0u};
    if (args.argc == 0) {
        handle_help();
        return kExitUsage;
    }

    const CommandEntry* cmd = find_command(argv[1]);
    if (cmd == nullptr) {
        if (std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0) {
            handle_help();
            return kExitOk;
        }
        fprintf(stderr, "error: unknown command: %s\n", argv[1]);
        handle_help();
        return kExitUsage;
    }
    return cmd->handler(cli::CliArgs{args.argv + 1, args.argc - 1});
}
