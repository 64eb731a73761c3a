#include <array>

#include <benchmark/benchmark.h>

#include "termoracle/cli/options.hpp"

static void BM_CliParseOptions(benchmark::State& state) {
    const std::array<termoracle::cli::OptionSpec, 4> specs = {{
        {termoracle::cli::OptionId::Schema, termoracle::cli::OptionType::String, "schema", 's'},
        {termoracle::cli::OptionId::Registry, termoracle::cli::OptionType::String, "registry", 'r'},
        {termoracle::cli::OptionId::Strict, termoracle::cli::OptionType::Flag, "strict", '\0'},
        {termoracle::cli::OptionId::Warn, termoracle::cli::OptionType::Flag, "warn", 'w'},
    }};

    const char* argv[] = {"--strict", "--schema", "s.json", "trace.jsonl", "--registry=r.json", "-w", "--", "-x"};
    const termoracle::cli::CliArgs args{argv, 8};
    for (auto _ : state) {
        termoracle::cli::ParsedOptions out;
        const termoracle::core::Status s = termoracle::cli::parse_options(args, specs.data(), specs.size(), &out);
        benchmark::DoNotOptimize(static_cast<termoracle::core::u16>(s.code));
        benchmark::DoNotOptimize(out.options.size());
    }
}
BENCHMARK(BM_CliParseOptions);
