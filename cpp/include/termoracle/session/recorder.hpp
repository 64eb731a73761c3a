#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "termoracle/core/buffer.hpp"
#include "termoracle/core/errors.hpp"
#include "termoracle/core/json.hpp"
#include "termoracle/core/types.hpp"
#include "termoracle/hash/hashing.hpp"
#include "termoracle/trace/trace_io.hpp"

namespace termoracle::session {
    using u64 = termoracle::core::u64;
    using i64 = termoracle::core::i64;
    using Json = termoracle::core::Json;
    using termoracle::core::Geometry;

    inline constexpr char kTraceSchemaVersion[] = "e2e-jsonl-v1";
    inline constexpr char kRemoteMode[] = "remote";

    struct RecorderConfig {
        std::string schema_version{kTraceSchemaVersion};
        bool deterministic{true};
        i64 time_step_ms{100};
        i64 seed{0};
    };

    struct HistogramSummary {
        u64 count{0};
        double min{0.0};
        double max{0.0};
        double p50{0.0};
        double p95{0.0};
        double p99{0.0};
        double mean{0.0};
    };

    // Quantiles interpolate linearly at rank (n-1)*q over the sorted samples.
    // All values are rounded to 3 decimals; no samples gives all zeros.
    [[nodiscard]] HistogramSummary histogram_summary(std::vector<double> values_ms);
    [[nodiscard]] Json histogram_to_json(const HistogramSummary& h);

    [[nodiscard]] double round3(double v) noexcept;

    struct SessionSummary {
        std::string scenario{};
        u64 ws_in_bytes{0};
        u64 ws_out_bytes{0};
        u64 messages_tx{0};
        u64 messages_rx{0};
        u64 frames{0};
        std::string output_sha256{};
        std::string checksum_chain{};
        HistogramSummary frame_gap_ms{};
    };

    [[nodiscard]] Json summary_to_json(const SessionSummary& s);

    // "{mode}-{cols}x{rows}-seed{seed}", or "{mode}-unknown-seed{seed}" for
    // an unset geometry.
    [[nodiscard]] std::string frame_hash_key(std::string_view mode, Geometry g, i64 seed);

    // remote-<seed as 8 hex digits> when deterministic, otherwise
    // remote-<wall clock ms in hex>.
    [[nodiscard]] std::string make_run_id(const RecorderConfig& cfg);

    // Single-writer event log for one run. Owns the checksum chain, counters,
    // tracked geometry and the optional JSONL sink.
    class SessionRecorder {
    public:
        SessionRecorder(RecorderConfig cfg, std::string run_id, std::string scenario, Geometry initial);
        ~SessionRecorder();

        SessionRecorder(const SessionRecorder&) = delete;
        SessionRecorder& operator=(const SessionRecorder&) = delete;

        // Appends to `path`; every later event is written and flushed.
        termoracle::core::Status open_sink(const std::string& path);

        // {schema_version, type, timestamp, run_id, seed} followed by `fields`.
        // The event is kept in memory even when the sink write fails.
        termoracle::core::Status emit(std::string_view type, const Json& fields);

        // Folds one output chunk into the chain and emits a `frame` event.
        // `overrides` (an object of pre-validated fields) is merged on top.
        termoracle::core::Status record_output(termoracle::core::BufferView data, const Json* overrides = nullptr);

        void record_send(termoracle::core::BufferView data) noexcept;
        void record_receive() noexcept;

        void set_geometry(Geometry g) noexcept { geometry_ = g; }
        [[nodiscard]] Geometry geometry() const noexcept { return geometry_; }

        // Hash key of the current geometry in remote mode.
        [[nodiscard]] std::string current_hash_key() const;

        [[nodiscard]] const std::string& checksum_chain() const noexcept { return chain_.hex(); }
        [[nodiscard]] const std::vector<Json>& events() const noexcept { return events_; }
        [[nodiscard]] const termoracle::core::Bytes& full_output() const noexcept { return output_; }
        [[nodiscard]] u64 frames() const noexcept { return frame_idx_; }
        [[nodiscard]] const std::string& run_id() const noexcept { return run_id_; }
        [[nodiscard]] const std::string& scenario() const noexcept { return scenario_; }
        [[nodiscard]] const std::string& sink_path() const noexcept { return sink_path_; }
        [[nodiscard]] const RecorderConfig& config() const noexcept { return cfg_; }

        termoracle::core::Status summary(SessionSummary* out) const;

        void close() noexcept;

    private:
        using Clock = std::chrono::steady_clock;

        std::string timestamp() const;

        RecorderConfig cfg_;
        std::string run_id_;
        std::string scenario_;
        Geometry geometry_;

        termoracle::trace::TraceSink sink_{};
        std::string sink_path_{};
        std::vector<Json> events_{};
        termoracle::core::Bytes output_{};
        termoracle::hash::ChecksumChain chain_{};

        u64 event_idx_{0};
        u64 frame_idx_{0};
        u64 ws_in_bytes_{0};
        u64 ws_out_bytes_{0};
        u64 messages_tx_{0};
        u64 messages_rx_{0};

        Clock::time_point start_;
        Clock::time_point last_frame_;
        std::vector<double> frame_gap_ms_{};
    };
} // namespace termoracle::session
