#include "termoracle/schema/examples.hpp"

#include <string>

namespace termoracle::schema {
    namespace {
        using termoracle::core::Json;

        Json base(const std::string& version, const char* type, const char* ts) {
            Json ev = Json::object();
            ev["schema_version"] = version;
            ev["type"] = type;
            ev["timestamp"] = ts;
            ev["run_id"] = "run_123";
            ev["seed"] = 0;
            return ev;
        }

        void merge(Json& ev, const Json& fields) {
            for (auto it = fields.begin(); it != fields.end(); ++it) {
                ev[it.key()] = it.value();
            }
        }

        Json make(const std::string& version, const char* type, const char* ts, const Json& fields) {
            Json ev = base(version, type, ts);
            merge(ev, fields);
            return ev;
        }
    } // namespace

    Json example_events(std::string_view schema_version) {
        const std::string v(schema_version);
        Json out = Json::object();

        out["env"] = make(v, "env", "T000001", {
            {"host", "ci"},
            {"rustc", "rustc 1.x"},
            {"cargo", "cargo 1.x"},
            {"git_commit", "abc123"},
            {"git_dirty", false},
            {"deterministic", true},
            {"term", "xterm-256color"},
            {"colorterm", "truecolor"},
            {"no_color", ""},
        });

        out["browser_env"] = make(v, "browser_env", "T000001", {
            {"browser", "chromium"},
            {"browser_version", "123.0.0.0"},
            {"user_agent", "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36"},
            {"dpr", 2.0},
            {"platform", "Linux x86_64"},
            {"locale", "en-US"},
            {"timezone", "UTC"},
            {"headless", true},
            {"viewport_css_px", {{"width", 1200}, {"height", 800}}},
            {"viewport_px", {{"width", 2400}, {"height", 1600}}},
            {"zoom", 1.0},
        });

        out["gpu_adapter"] = make(v, "gpu_adapter", "T000001", {
            {"api", "webgpu"},
            {"adapter_name", "MockAdapter"},
            {"backend", "wgpu"},
            {"vendor", "0x1234"},
            {"device", "0x5678"},
            {"description", "Mock GPU adapter for tests"},
            {"features", Json::array({"timestamp-query"})},
            {"limits", {{"maxTextureDimension2D", 8192}}},
            {"is_fallback_adapter", false},
        });

        out["ws_metrics"] = make(v, "ws_metrics", "T000001", {
            {"label", "bridge"},
            {"ws_url", "ws://127.0.0.1:12345/ws"},
            {"bytes_tx", 1234},
            {"bytes_rx", 5678},
            {"messages_tx", 12},
            {"messages_rx", 34},
            {"connect_ms", 10},
            {"reconnects", 0},
            {"close_code", nullptr},
            {"close_reason", ""},
            {"dropped_messages", 0},
            {"rtt_histogram_ms", {{"buckets", {1, 2, 5}}, {"counts", {10, 2, 1}}}},
            {"latency_histogram_ms", {{"buckets", {1, 2, 5}}, {"counts", {8, 3, 1}}}},
        });

        out["run_start"] = make(v, "run_start", "T000002", {
            {"command", "termoracle session"},
            {"log_dir", "/tmp/termoracle"},
            {"results_dir", "/tmp/termoracle/results"},
        });

        out["step_start"] = make(v, "step_start", "T000002", {
            {"step", "000:send"},
            {"mode", "remote"},
            {"hash_key", "remote-80x24-seed0"},
            {"cols", 80},
            {"rows", 24},
        });

        out["input"] = make(v, "input", "T000002", {
            {"input_type", "keys"},
            {"encoding", "utf8"},
            {"bytes_b64", "Y2VtZw=="},
            {"input_hash", "deadbeef"},
            {"details", "screen=2 keys=cemg"},
        });

        out["frame"] = make(v, "frame", "T000002", {
            {"frame_idx", 1},
            {"ts_ms", 16},
            {"mode", "alt"},
            {"hash_key", "alt-80x24-seed0"},
            {"cols", 80},
            {"rows", 24},
            {"hash_algo", "sha256"},
            {"frame_hash", "deadbeef"},
            {"patch_hash", "feedface"},
            {"patch_bytes", 2048},
            {"patch_cells", 64},
            {"patch_runs", 7},
            {"render_ms", 3.1},
            {"present_ms", 0.8},
            {"present_bytes", 65536},
            {"checksum_chain", "00ff00ff"},
        });

        out["step_end"] = make(v, "step_end", "T000003", {
            {"step", "inline"},
            {"status", "passed"},
            {"duration_ms", 42},
            {"mode", "inline"},
            {"hash_key", "inline-80x24-seed0"},
            {"cols", 80},
            {"rows", 24},
        });

        out["error"] = make(v, "error", "T000003", {
            {"message", "example failure"},
            {"exit_code", 1},
            {"stack", ""},
            {"details", "case=core_navigation step=dashboard"},
        });

        out["assert"] = make(v, "assert", "T000003", {
            {"assertion", "golden_checksum_chain"},
            {"status", "passed"},
            {"details", "checksum=00ff00ff frames=3"},
        });

        out["case_step_start"] = make(v, "case_step_start", "T000003", {
            {"case", "core_navigation"},
            {"step", "dashboard"},
            {"action", "inject_keys"},
            {"details", "screen=2 keys=cemg"},
            {"mode", "alt"},
            {"hash_key", "alt-80x24-seed0"},
            {"cols", 80},
            {"rows", 24},
        });

        out["case_step_end"] = make(v, "case_step_end", "T000004", {
            {"case", "core_navigation"},
            {"step", "dashboard"},
            {"status", "pass"},
            {"duration_ms", 1200},
            {"action", "inject_keys"},
            {"details", "screen=2 keys=cemg"},
            {"mode", "alt"},
            {"hash_key", "alt-80x24-seed0"},
            {"cols", 80},
            {"rows", 24},
        });

        out["case"] = make(v, "case", "T000005", {
            {"scenario", "bidi"},
            {"mode", "alt"},
            {"cols", 80},
            {"rows", 24},
            {"status", "passed"},
            {"hash", "deadbeef"},
            {"duration_ms", 100},
            {"error", ""},
            {"screen", "31"},
        });

        out["pty_capture"] = make(v, "pty_capture", "T000004", {
            {"output_file", "/tmp/out.pty"},
            {"canonical_file", ""},
            {"output_sha256", "deadbeef"},
            {"canonical_sha256", ""},
            {"output_bytes", 100},
            {"canonical_bytes", 0},
            {"cols", 80},
            {"rows", 24},
            {"exit_code", 0},
        });

        out["artifact"] = make(v, "artifact", "T000004", {
            {"artifact_type", "log_dir"},
            {"path", "/tmp/termoracle"},
            {"status", "present"},
            {"sha256", ""},
            {"bytes", 0},
        });

        out["large_screen_case"] = make(v, "large_screen_case", "T000005", {
            {"case", "large_inline"},
            {"status", "passed"},
            {"screen_mode", "inline"},
            {"cols", 200},
            {"rows", 50},
            {"ui_height", 12},
            {"diff_bayesian", true},
            {"bocpd", true},
            {"conformal", true},
            {"evidence_jsonl", "/tmp/evidence.jsonl"},
            {"pty_output", "/tmp/large.pty"},
            {"caps_file", "/tmp/caps.txt"},
            {"duration_ms", 1234},
        });

        out["span_diff_case"] = make(v, "span_diff_case", "T000006", {
            {"case", "span_sparse"},
            {"status", "passed"},
            {"screen_mode", "alt"},
            {"cols", 80},
            {"rows", 24},
            {"evidence_jsonl", "/tmp/span_diff.jsonl"},
            {"pty_output", "/tmp/span_diff.pty"},
            {"duration_ms", 210},
            {"diff_hash", "3f9a0c1d"},
        });

        out["tile_skip_case"] = make(v, "tile_skip_case", "T000006", {
            {"case", "tile_dense"},
            {"status", "passed"},
            {"screen_mode", "alt"},
            {"cols", 80},
            {"rows", 24},
            {"evidence_jsonl", "/tmp/tile_skip.jsonl"},
            {"pty_output", "/tmp/tile_skip.pty"},
            {"duration_ms", 180},
            {"diff_hash", "77b2e410"},
        });

        out["selector_case"] = make(v, "selector_case", "T000007", {
            {"case", "selector_phase"},
            {"status", "passed"},
            {"screen_mode", "inline"},
            {"cols", 120},
            {"rows", 40},
            {"evidence_jsonl", "/tmp/selector.jsonl"},
            {"pty_output", "/tmp/selector.pty"},
            {"duration_ms", 95},
            {"decision_hash", "a1c4e7f0"},
            {"phase_len", 16},
        });

        out["budgeted_refresh_case"] = make(v, "budgeted_refresh_case", "T000007", {
            {"case", "budget_tight"},
            {"status", "passed"},
            {"screen_mode", "alt"},
            {"cols", 80},
            {"rows", 24},
            {"frame_budget_us", 16000},
            {"render_budget_us", 8000},
            {"evidence_jsonl", "/tmp/budgeted.jsonl"},
            {"pty_output", "/tmp/budgeted.pty"},
            {"duration_ms", 300},
            {"widget_refresh_hash", "c0ffee42"},
        });

        out["run_end"] = make(v, "run_end", "T000008", {
            {"status", "passed"},
            {"duration_ms", 5120},
            {"failed_count", 0},
            {"outcome", "pass"},
            {"ws_in_bytes", 64},
            {"ws_out_bytes", 4096},
            {"frames", 3},
            {"output_sha256", "deadbeef"},
            {"checksum_chain", "00ff00ff"},
        });

        return out;
    }
} // namespace termoracle::schema
