#include "termoracle/session/recorder.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <utility>

namespace termoracle::session {
    namespace {
        using termoracle::core::BufferView;
        using termoracle::core::Status;
        using termoracle::core::StatusCode;
        using termoracle::core::StatusDomain;
        using termoracle::core::make_status;

        double percentile(const std::vector<double>& sorted, double q) {
            if (sorted.empty()) {
                return 0.0;
            }
            if (sorted.size() == 1) {
                return sorted.front();
            }
            const double pos = static_cast<double>(sorted.size() - 1) * q;
            const size_t lo = static_cast<size_t>(pos);
            const size_t hi = std::min(lo + 1, sorted.size() - 1);
            const double frac = pos - static_cast<double>(lo);
            return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
        }

        double elapsed_ms(std::chrono::steady_clock::time_point from, std::chrono::steady_clock::time_point to) {
            return std::chrono::duration<double, std::milli>(to - from).count();
        }

        std::string wall_clock_timestamp() {
            const std::time_t now = std::time(nullptr);
            std::tm local{};
            ::localtime_r(&now, &local);
            char buf[64];
            const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S%z", &local);
            return std::string(buf, n);
        }
    } // namespace

    // Rounds through decimal formatting so ties resolve on the exact binary value.
    double round3(double v) noexcept {
        if (!std::isfinite(v)) {
            return v;
        }
        char buf[512];
        std::snprintf(buf, sizeof(buf), "%.3f", v);
        return std::strtod(buf, nullptr);
    }

    HistogramSummary histogram_summary(std::vector<double> values_ms) {
        HistogramSummary h{};
        if (values_ms.empty()) {
            return h;
        }
        std::sort(values_ms.begin(), values_ms.end());
        double total = 0.0;
        for (double v : values_ms) {
            total += v;
        }
        h.count = static_cast<u64>(values_ms.size());
        h.min = round3(values_ms.front());
        h.max = round3(values_ms.back());
        h.p50 = round3(percentile(values_ms, 0.50));
        h.p95 = round3(percentile(values_ms, 0.95));
        h.p99 = round3(percentile(values_ms, 0.99));
        h.mean = round3(total / static_cast<double>(values_ms.size()));
        return h;
    }

    Json histogram_to_json(const HistogramSummary& h) {
        Json out = Json::object();
        out["count"] = h.count;
        out["min"] = h.min;
        out["max"] = h.max;
        out["p50"] = h.p50;
        out["p95"] = h.p95;
        out["p99"] = h.p99;
        out["mean"] = h.mean;
        return out;
    }

    Json summary_to_json(const SessionSummary& s) {
        Json out = Json::object();
        out["scenario"] = s.scenario;
        out["ws_in_bytes"] = s.ws_in_bytes;
        out["ws_out_bytes"] = s.ws_out_bytes;
        out["messages_tx"] = s.messages_tx;
        out["messages_rx"] = s.messages_rx;
        out["frames"] = s.frames;
        out["output_sha256"] = s.output_sha256;
        out["checksum_chain"] = s.checksum_chain;
        out["frame_gap_histogram_ms"] = histogram_to_json(s.frame_gap_ms);
        return out;
    }

    std::string frame_hash_key(std::string_view mode, Geometry g, i64 seed) {
        std::string out(mode);
        if (!termoracle::core::geometry_valid(g)) {
            out += "-unknown";
        } else {
            out += "-" + std::to_string(g.cols) + "x" + std::to_string(g.rows);
        }
        out += "-seed" + std::to_string(seed);
        return out;
    }

    std::string make_run_id(const RecorderConfig& cfg) {
        char buf[48];
        if (cfg.deterministic) {
            if (cfg.seed < 0) {
                std::snprintf(buf, sizeof(buf), "remote--%07llx", static_cast<unsigned long long>(-(cfg.seed + 1)) + 1ULL);
            } else {
                std::snprintf(buf, sizeof(buf), "remote-%08llx", static_cast<unsigned long long>(cfg.seed));
            }
            return buf;
        }
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
        std::snprintf(buf, sizeof(buf), "remote-%llx", static_cast<unsigned long long>(ms));
        return buf;
    }

    SessionRecorder::SessionRecorder(RecorderConfig cfg, std::string run_id, std::string scenario, Geometry initial)
        : cfg_(std::move(cfg)),
          run_id_(std::move(run_id)),
          scenario_(std::move(scenario)),
          geometry_(initial),
          start_(Clock::now()),
          last_frame_(start_) {}

    SessionRecorder::~SessionRecorder() {
        close();
    }

    Status SessionRecorder::open_sink(const std::string& path) {
        const Status s = sink_.open(path);
        if (termoracle::core::is_ok(s)) {
            sink_path_ = path;
        }
        return s;
    }

    std::string SessionRecorder::timestamp() const {
        if (!cfg_.deterministic) {
            return wall_clock_timestamp();
        }
        char buf[32];
        const unsigned long long ts = static_cast<unsigned long long>(event_idx_) * static_cast<unsigned long long>(cfg_.time_step_ms);
        std::snprintf(buf, sizeof(buf), "T%06llu", ts);
        return buf;
    }

    Status SessionRecorder::emit(std::string_view type, const Json& fields) {
        Json event = Json::object();
        event["schema_version"] = cfg_.schema_version;
        event["type"] = std::string(type);
        event["timestamp"] = timestamp();
        event["run_id"] = run_id_;
        event["seed"] = cfg_.seed;
        if (fields.is_object()) {
            for (auto it = fields.begin(); it != fields.end(); ++it) {
                event[it.key()] = it.value();
            }
        }

        Status s = termoracle::core::ok_status();
        if (sink_.is_open()) {
            s = sink_.write_line(termoracle::core::json_dump_compact(event));
            if (!termoracle::core::is_ok(s)) {
                std::fprintf(stderr, "session: trace write failed (%s)\n", sink_path_.c_str());
            }
        }
        events_.push_back(std::move(event));
        ++event_idx_;
        return s;
    }

    Status SessionRecorder::record_output(BufferView data, const Json* overrides) {
        if (!termoracle::core::buffer_ok(data)) {
            return make_status(StatusDomain::Session, StatusCode::Invalid);
        }

        const Clock::time_point now = Clock::now();
        const double gap_ms = elapsed_ms(last_frame_, now);
        last_frame_ = now;
        if (frame_idx_ > 0) {
            frame_gap_ms_.push_back(gap_ms);
        }

        output_.insert(output_.end(), data.data, data.data + data.len);
        ws_out_bytes_ += data.len;

        std::string chunk_hex;
        Status s = termoracle::hash::sha256_hex(data, &chunk_hex);
        if (termoracle::core::is_ok(s)) {
            s = chain_.fold(data);
        }
        if (!termoracle::core::is_ok(s)) {
            return s;
        }
        ++frame_idx_;

        const std::string chunk_hash = termoracle::hash::prefixed(chunk_hex);
        Json frame = Json::object();
        frame["frame_idx"] = frame_idx_;
        frame["hash_algo"] = termoracle::hash::kHashAlgo;
        frame["frame_hash"] = chunk_hash;
        frame["ts_ms"] = static_cast<i64>(elapsed_ms(start_, now));
        frame["mode"] = kRemoteMode;
        frame["hash_key"] = current_hash_key();
        frame["cols"] = geometry_.cols;
        frame["rows"] = geometry_.rows;
        frame["patch_hash"] = chunk_hash;
        frame["patch_bytes"] = data.len;
        // Byte-stream proxies; cell and run counts are not visible here.
        frame["patch_cells"] = data.len;
        frame["patch_runs"] = 1;
        frame["present_ms"] = round3(gap_ms);
        frame["present_bytes"] = data.len;
        frame["checksum_chain"] = termoracle::hash::prefixed(chain_.hex());

        if (overrides && overrides->is_object()) {
            for (auto it = overrides->begin(); it != overrides->end(); ++it) {
                frame[it.key()] = it.value();
            }
            i64 cols = 0;
            i64 rows = 0;
            const Json* c = termoracle::core::json_find(*overrides, "cols");
            const Json* r = termoracle::core::json_find(*overrides, "rows");
            if (c && r && termoracle::core::json_get_i64(*c, &cols) && termoracle::core::json_get_i64(*r, &rows) && cols > 0 && rows > 0 &&
                cols <= 0xffffffffLL && rows <= 0xffffffffLL) {
                geometry_ = Geometry{static_cast<termoracle::core::u32>(cols), static_cast<termoracle::core::u32>(rows)};
            }
        }

        return emit("frame", frame);
    }

    void SessionRecorder::record_send(BufferView data) noexcept {
        ws_in_bytes_ += data.len;
        ++messages_tx_;
    }

    void SessionRecorder::record_receive() noexcept {
        ++messages_rx_;
    }

    std::string SessionRecorder::current_hash_key() const {
        return frame_hash_key(kRemoteMode, geometry_, cfg_.seed);
    }

    Status SessionRecorder::summary(SessionSummary* out) const {
        if (out == nullptr) {
            return make_status(StatusDomain::Session, StatusCode::Invalid);
        }
        std::string output_hex;
        const Status s = termoracle::hash::sha256_hex(termoracle::core::as_view(output_), &output_hex);
        if (!termoracle::core::is_ok(s)) {
            return s;
        }

        SessionSummary sum{};
        sum.scenario = scenario_;
        sum.ws_in_bytes = ws_in_bytes_;
        sum.ws_out_bytes = ws_out_bytes_;
        sum.messages_tx = messages_tx_;
        sum.messages_rx = messages_rx_;
        sum.frames = frame_idx_;
        sum.output_sha256 = termoracle::hash::prefixed(output_hex);
        sum.checksum_chain = termoracle::hash::prefixed(chain_.hex());
        sum.frame_gap_ms = histogram_summary(frame_gap_ms_);
        *out = std::move(sum);
        return termoracle::core::ok_status();
    }

    void SessionRecorder::close() noexcept {
        sink_.close();
    }
} // namespace termoracle::session
