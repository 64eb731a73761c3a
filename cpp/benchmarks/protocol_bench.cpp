#include <string>

#include <benchmark/benchmark.h>

#include "termoracle/net/protocol.hpp"

static void BM_ProtocolEncodeResize(benchmark::State& state) {
    for (auto _ : state) {
        std::string msg = termoracle::net::encode_resize_message({132, 43});
        benchmark::DoNotOptimize(msg.data());
    }
}
BENCHMARK(BM_ProtocolEncodeResize);

static void BM_ProtocolDecodeDataB64(benchmark::State& state) {
    const std::string text = R"({"type":"frame","data_b64":"aGVsbG8gd29ybGQNCg==","frame_hash":"sha256:00","cursor":[1,2]})";
    for (auto _ : state) {
        termoracle::net::DecodedFrame out;
        const bool ok = termoracle::net::decode_frame_message(text, &out);
        benchmark::DoNotOptimize(ok);
        benchmark::DoNotOptimize(out.data.data());
    }
}
BENCHMARK(BM_ProtocolDecodeDataB64);

static void BM_ProtocolDecodeRaw(benchmark::State& state) {
    const std::string text(static_cast<size_t>(state.range(0)), 'a');
    for (auto _ : state) {
        termoracle::net::DecodedFrame out;
        const bool ok = termoracle::net::decode_frame_message(text, &out);
        benchmark::DoNotOptimize(ok);
        benchmark::DoNotOptimize(out.data.data());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_ProtocolDecodeRaw)->Arg(16)->Arg(1024);
