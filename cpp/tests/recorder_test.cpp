#include <filesystem>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "termoracle/core/buffer.hpp"
#include "termoracle/session/recorder.hpp"
#include "termoracle/trace/trace_io.hpp"

namespace tss = termoracle::session;
using termoracle::core::Json;
using termoracle::core::StatusCode;
using termoracle::core::as_view;

namespace {
    tss::RecorderConfig deterministic_config() {
        tss::RecorderConfig cfg{};
        cfg.deterministic = true;
        cfg.time_step_ms = 100;
        cfg.seed = 0;
        return cfg;
    }
} // namespace

TEST(Histogram, EmptyIsAllZero) {
    const tss::HistogramSummary h = tss::histogram_summary({});
    EXPECT_EQ(h.count, 0u);
    EXPECT_DOUBLE_EQ(h.min, 0.0);
    EXPECT_DOUBLE_EQ(h.max, 0.0);
    EXPECT_DOUBLE_EQ(h.p50, 0.0);
    EXPECT_DOUBLE_EQ(h.mean, 0.0);
}

TEST(Histogram, SingleSampleFillsEveryStatistic) {
    const tss::HistogramSummary h = tss::histogram_summary({12.3456});
    EXPECT_EQ(h.count, 1u);
    EXPECT_DOUBLE_EQ(h.min, 12.346);
    EXPECT_DOUBLE_EQ(h.max, 12.346);
    EXPECT_DOUBLE_EQ(h.p50, 12.346);
    EXPECT_DOUBLE_EQ(h.p95, 12.346);
    EXPECT_DOUBLE_EQ(h.p99, 12.346);
    EXPECT_DOUBLE_EQ(h.mean, 12.346);
}

TEST(Histogram, RoundsOnExactBinaryValue) {
    // 1.0005 is stored just below the tie, so it rounds down.
    const tss::HistogramSummary h = tss::histogram_summary({1.0005, 2.0});
    EXPECT_DOUBLE_EQ(h.min, 1.0);
    EXPECT_DOUBLE_EQ(tss::round3(2.0005), 2.001);
    EXPECT_DOUBLE_EQ(tss::round3(-0.1234), -0.123);
}

TEST(Histogram, InterpolatesPercentiles) {
    const tss::HistogramSummary h = tss::histogram_summary({40.0, 10.0, 30.0, 20.0});
    EXPECT_EQ(h.count, 4u);
    EXPECT_DOUBLE_EQ(h.min, 10.0);
    EXPECT_DOUBLE_EQ(h.max, 40.0);
    EXPECT_DOUBLE_EQ(h.p50, 25.0);
    EXPECT_DOUBLE_EQ(h.p95, 38.5);
    EXPECT_DOUBLE_EQ(h.mean, 25.0);

    const Json j = tss::histogram_to_json(h);
    std::vector<std::string> keys;
    for (auto it = j.begin(); it != j.end(); ++it) {
        keys.push_back(it.key());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"count", "min", "max", "p50", "p95", "p99", "mean"}));
}

TEST(RunId, DeterministicFromSeed) {
    tss::RecorderConfig cfg = deterministic_config();
    cfg.seed = 255;
    EXPECT_EQ(tss::make_run_id(cfg), "remote-000000ff");
    cfg.seed = 0;
    EXPECT_EQ(tss::make_run_id(cfg), "remote-00000000");
    cfg.deterministic = false;
    EXPECT_EQ(tss::make_run_id(cfg).rfind("remote-", 0), 0u);
}

TEST(FrameHashKey, UnknownGeometry) {
    EXPECT_EQ(tss::frame_hash_key("remote", {120, 40}, 0), "remote-120x40-seed0");
    EXPECT_EQ(tss::frame_hash_key("remote", {0, 40}, 3), "remote-unknown-seed3");
}

TEST(Recorder, EmitAddsEnvelopeAndDeterministicTimestamps) {
    tss::SessionRecorder rec(deterministic_config(), "run_123", "demo", {80, 24});
    ASSERT_EQ(rec.emit("run_start", Json{{"scenario", "demo"}}).code, StatusCode::Ok);
    ASSERT_EQ(rec.emit("run_end", Json{{"status", "passed"}}).code, StatusCode::Ok);

    ASSERT_EQ(rec.events().size(), 2u);
    const Json& first = rec.events()[0];
    EXPECT_EQ(first["schema_version"], "e2e-jsonl-v1");
    EXPECT_EQ(first["type"], "run_start");
    EXPECT_EQ(first["timestamp"], "T000000");
    EXPECT_EQ(first["run_id"], "run_123");
    EXPECT_EQ(first["seed"], 0);
    EXPECT_EQ(first["scenario"], "demo");
    EXPECT_EQ(rec.events()[1]["timestamp"], "T000100");
}

TEST(Recorder, RecordOutputEmitsFrameAndFoldsChain) {
    tss::SessionRecorder rec(deterministic_config(), "run_123", "demo", {80, 24});
    ASSERT_EQ(rec.record_output(as_view(std::string_view("hello"))).code, StatusCode::Ok);

    ASSERT_EQ(rec.events().size(), 1u);
    const Json& frame = rec.events()[0];
    EXPECT_EQ(frame["type"], "frame");
    EXPECT_EQ(frame["frame_idx"], 1);
    EXPECT_EQ(frame["hash_algo"], "sha256");
    EXPECT_EQ(frame["frame_hash"], "sha256:2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
    EXPECT_EQ(frame["mode"], "remote");
    EXPECT_EQ(frame["hash_key"], "remote-80x24-seed0");
    EXPECT_EQ(frame["patch_bytes"], 5);
    EXPECT_EQ(frame["patch_cells"], 5);
    EXPECT_EQ(frame["patch_runs"], 1);
    EXPECT_EQ(frame["checksum_chain"], "sha256:e3ca85bc58698be7de6c986766d26ce7f0bcbb603cb4a60b500c35ecf4e2df1e");
    EXPECT_EQ(rec.frames(), 1u);
}

TEST(Recorder, OverridesReplaceFieldsAndUpdateGeometry) {
    tss::SessionRecorder rec(deterministic_config(), "run_123", "demo", {80, 24});
    const Json overrides = {{"frame_hash", "sha256:custom"}, {"cols", 100}, {"rows", 30}};
    ASSERT_EQ(rec.record_output(as_view(std::string_view("x")), &overrides).code, StatusCode::Ok);
    EXPECT_EQ(rec.events()[0]["frame_hash"], "sha256:custom");
    EXPECT_EQ(rec.geometry().cols, 100u);
    EXPECT_EQ(rec.geometry().rows, 30u);
    EXPECT_EQ(rec.current_hash_key(), "remote-100x30-seed0");
}

TEST(Recorder, SummaryCountsTraffic) {
    tss::SessionRecorder rec(deterministic_config(), "run_123", "demo", {80, 24});
    rec.record_send(as_view(std::string_view("abc")));
    rec.record_receive();
    rec.record_receive();
    ASSERT_EQ(rec.record_output(as_view(std::string_view("hello"))).code, StatusCode::Ok);
    ASSERT_EQ(rec.record_output(as_view(std::string_view("world"))).code, StatusCode::Ok);

    tss::SessionSummary sum{};
    ASSERT_EQ(rec.summary(&sum).code, StatusCode::Ok);
    EXPECT_EQ(sum.scenario, "demo");
    EXPECT_EQ(sum.ws_in_bytes, 3u);
    EXPECT_EQ(sum.ws_out_bytes, 10u);
    EXPECT_EQ(sum.messages_tx, 1u);
    EXPECT_EQ(sum.messages_rx, 2u);
    EXPECT_EQ(sum.frames, 2u);
    EXPECT_EQ(sum.output_sha256, "sha256:936a185caaa266bb9cbe981e9e05cb78cd732b0b3280eb944412bb6f8f8f07af");
    EXPECT_EQ(sum.checksum_chain, "sha256:f965116a2a42ac631a10bb9beaf3a5cbfebd2444a6297a3dfbae12c037ad192e");
    EXPECT_EQ(sum.frame_gap_ms.count, 1u);

    const Json j = tss::summary_to_json(sum);
    EXPECT_EQ(j["frames"], 2);
    EXPECT_TRUE(j["frame_gap_histogram_ms"].is_object());
}

TEST(Recorder, SinkReceivesOneLinePerEvent) {
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "termoracle_recorder_test.jsonl";
    std::filesystem::remove(path);
    {
        tss::SessionRecorder rec(deterministic_config(), "run_123", "demo", {80, 24});
        ASSERT_EQ(rec.open_sink(path.string()).code, StatusCode::Ok);
        EXPECT_EQ(rec.sink_path(), path.string());
        ASSERT_EQ(rec.emit("run_start", Json::object()).code, StatusCode::Ok);
        ASSERT_EQ(rec.record_output(as_view(std::string_view("hi"))).code, StatusCode::Ok);
        rec.close();
    }
    std::vector<std::string> lines;
    ASSERT_EQ(termoracle::trace::read_lines(path.string(), &lines).code, StatusCode::Ok);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(Json::parse(lines[0])["type"], "run_start");
    EXPECT_EQ(Json::parse(lines[1])["type"], "frame");
    std::filesystem::remove(path);
}
