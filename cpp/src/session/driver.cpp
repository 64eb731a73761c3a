#include "termoracle/session/driver.hpp"

#include <cstdio>
#include <filesystem>
#include <system_error>
#include <thread>
#include <utility>

#include "termoracle/core/encoding.hpp"
#include "termoracle/hash/hashing.hpp"
#include "termoracle/net/protocol.hpp"
#include "termoracle/trace/trace_io.hpp"

namespace termoracle::session {
    namespace {
        using termoracle::core::BufferView;
        using termoracle::core::Status;
        using termoracle::core::StatusCode;
        using termoracle::core::StatusDomain;
        using termoracle::core::make_status;

        i64 elapsed_ms(SteadyClock::time_point since) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - since).count();
        }

        std::string step_name(size_t idx, StepType type) {
            char buf[16];
            std::snprintf(buf, sizeof(buf), "%03zu", idx);
            return std::string(buf) + ":" + step_type_name(type);
        }

        std::string status_text(Status s) {
            return std::string(termoracle::core::status_domain_name(s.domain)) + "/" + termoracle::core::status_code_name(s.code);
        }

        std::string describe(Status s, const std::string& detail) {
            return detail.empty() ? status_text(s) : detail;
        }

        std::string resolve_log_dir(const SessionRecorder& recorder, const EnvConfig& env) {
            if (recorder.sink_path().empty()) {
                return env.log_dir;
            }
            std::error_code ec;
            const std::filesystem::path abs = std::filesystem::absolute(recorder.sink_path(), ec);
            if (ec) {
                return std::filesystem::path(recorder.sink_path()).parent_path().string();
            }
            return abs.parent_path().string();
        }

        void note_failure(RunResult* r, SessionRecorder& recorder, const std::string& message) {
            r->outcome = "fail";
            r->errors.push_back(message);
            std::fprintf(stderr, "session: %s\n", message.c_str());
            Json fields = Json::object();
            fields["message"] = message;
            const Status s = recorder.emit("error", fields);
            if (!termoracle::core::is_ok(s)) {
                r->errors.push_back("trace write failed while recording an error");
            }
        }

        // Emits an event whose sink failure counts against the run.
        void emit_checked(RunResult* r, SessionRecorder& recorder, std::string_view type, const Json& fields) {
            const Status s = recorder.emit(type, fields);
            if (!termoracle::core::is_ok(s)) {
                r->outcome = "fail";
                r->errors.push_back("trace write failed for " + std::string(type) + " event");
            }
        }

        void compare_golden(const DriverConfig& cfg, SessionRecorder& recorder, RunResult* r) {
            if (cfg.golden_path.empty() || !termoracle::trace::file_exists(cfg.golden_path)) {
                return;
            }
            GoldenTranscript golden{};
            std::string error;
            const Status s = load_golden_file(cfg.golden_path, &golden, &error);
            if (!termoracle::core::is_ok(s)) {
                note_failure(r, recorder, describe(s, error));
                return;
            }

            const SessionSummary& sum = r->summary;
            Json fields = Json::object();
            fields["assertion"] = "golden_checksum_chain";
            if (!golden.checksum_chain.empty() && golden.checksum_chain != sum.checksum_chain) {
                r->outcome = "fail";
                r->errors.push_back("Golden checksum mismatch: expected " + golden.checksum_chain + ", got " + sum.checksum_chain);
                fields["status"] = "failed";
                fields["details"] = "expected=" + golden.checksum_chain + " actual=" + sum.checksum_chain +
                                    " frames_expected=" + std::to_string(golden.frames) + " frames_actual=" + std::to_string(sum.frames);
            } else {
                fields["status"] = "passed";
                fields["details"] = "checksum=" + sum.checksum_chain + " frames=" + std::to_string(sum.frames);
            }
            emit_checked(r, recorder, "assert", fields);
        }
    } // namespace

    void FrameReader::pump_until(SteadyClock::time_point deadline) {
        while (!finished_ && !token_.cancelled()) {
            const i64 remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now()).count();
            if (remaining <= 0) {
                return;
            }

            net::Message msg{};
            bool got = false;
            const Status s = channel_.receive(remaining, &msg, &got);
            if (s.code == StatusCode::Closed) {
                finished_ = true;
                break;
            }
            if (!termoracle::core::is_ok(s)) {
                finished_ = true;
                failure_ = s;
                failure_message_ = describe(s, channel_.last_error());
                std::fprintf(stderr, "session: reader stopped: %s\n", failure_message_.c_str());
                break;
            }
            if (!got) {
                continue;
            }

            const Status h = handle_message(msg);
            if (!termoracle::core::is_ok(h)) {
                finished_ = true;
                failure_ = h;
                failure_message_ = "cannot record output: " + status_text(h);
                break;
            }
        }

        if (SteadyClock::now() < deadline) {
            std::this_thread::sleep_until(deadline);
        }
    }

    Status FrameReader::handle_message(const net::Message& msg) {
        recorder_.record_receive();
        if (msg.kind == net::MessageKind::Binary) {
            return recorder_.record_output(termoracle::core::as_view(msg.payload));
        }
        net::DecodedFrame frame{};
        if (net::decode_frame_message(msg.payload, &frame)) {
            return recorder_.record_output(termoracle::core::as_view(frame.data), &frame.overrides);
        }
        return recorder_.record_output(termoracle::core::as_view(msg.payload));
    }

    Json run_result_to_json(const RunResult& r) {
        Json out = Json::object();
        out["outcome"] = r.outcome;
        out["errors"] = r.errors;
        const Json sum = summary_to_json(r.summary);
        for (auto it = sum.begin(); it != sum.end(); ++it) {
            out[it.key()] = it.value();
        }
        out["duration_ms"] = r.duration_ms;
        return out;
    }

    SessionDriver::SessionDriver(net::Channel& channel, SessionRecorder& recorder, const DriverConfig& cfg)
        : channel_(channel), recorder_(recorder), cfg_(cfg), reader_(channel, recorder, token_) {}

    void SessionDriver::delay(double ms) {
        if (!(ms > 0.0)) {
            return;
        }
        const auto span = std::chrono::duration_cast<SteadyClock::duration>(std::chrono::duration<double, std::milli>(ms));
        reader_.pump_until(SteadyClock::now() + span);
    }

    Status SessionDriver::emit_step_event(const char* type, const std::string& name, const Json* extra) {
        const Geometry g = recorder_.geometry();
        Json fields = Json::object();
        fields["step"] = name;
        if (extra) {
            for (auto it = extra->begin(); it != extra->end(); ++it) {
                fields[it.key()] = it.value();
            }
        }
        fields["mode"] = kRemoteMode;
        fields["hash_key"] = recorder_.current_hash_key();
        fields["cols"] = g.cols;
        fields["rows"] = g.rows;
        return recorder_.emit(type, fields);
    }

    Status SessionDriver::send_keys(const Step& step, std::string* error) {
        termoracle::core::Bytes data;
        Status s = decode_step_data(step, &data);
        if (!termoracle::core::is_ok(s)) {
            if (error) {
                *error = "cannot decode send payload";
            }
            return s;
        }

        const BufferView view = termoracle::core::as_view(data);
        s = channel_.send(net::MessageKind::Binary, view);
        if (!termoracle::core::is_ok(s)) {
            if (error) {
                *error = describe(s, channel_.last_error());
            }
            return s;
        }
        recorder_.record_send(view);

        std::string digest;
        s = termoracle::hash::sha256_hex(view, &digest);
        if (!termoracle::core::is_ok(s)) {
            return s;
        }

        const Geometry g = recorder_.geometry();
        Json fields = Json::object();
        fields["input_type"] = step.input_type;
        fields["encoding"] = "base64";
        fields["bytes_b64"] = termoracle::core::base64_encode(view);
        fields["input_hash"] = termoracle::hash::prefixed(digest);
        fields["details"] = step.comment;
        fields["mode"] = kRemoteMode;
        fields["hash_key"] = recorder_.current_hash_key();
        fields["cols"] = g.cols;
        fields["rows"] = g.rows;
        return recorder_.emit("input", fields);
    }

    Status SessionDriver::send_resize(const Step& step, std::string* error) {
        const std::string msg = net::encode_resize_message(step.geometry);
        const BufferView view = termoracle::core::as_view(msg);
        Status s = channel_.send(net::MessageKind::Text, view);
        if (!termoracle::core::is_ok(s)) {
            if (error) {
                *error = describe(s, channel_.last_error());
            }
            return s;
        }
        recorder_.record_send(view);
        recorder_.set_geometry(step.geometry);

        std::string digest;
        s = termoracle::hash::sha256_hex(view, &digest);
        if (!termoracle::core::is_ok(s)) {
            return s;
        }

        Json fields = Json::object();
        fields["input_type"] = "resize";
        fields["encoding"] = "json";
        fields["input_hash"] = termoracle::hash::prefixed(digest);
        fields["details"] = step.comment;
        fields["mode"] = kRemoteMode;
        fields["hash_key"] = recorder_.current_hash_key();
        fields["cols"] = step.geometry.cols;
        fields["rows"] = step.geometry.rows;
        return recorder_.emit("input", fields);
    }

    Status SessionDriver::run_step(const Step& step, std::string* error) {
        switch (step.type) {
            case StepType::Send:
                return send_keys(step, error);
            case StepType::Resize:
                return send_resize(step, error);
            case StepType::Wait:
                delay(step.wait_ms);
                return termoracle::core::ok_status();
            case StepType::Drain:
                delay(cfg_.drain_ms);
                return termoracle::core::ok_status();
        }
        return make_status(StatusDomain::Session, StatusCode::Unsupported);
    }

    Status SessionDriver::run_steps(const Scenario& scenario, std::string* error) {
        for (size_t i = 0; i < scenario.steps.size(); ++i) {
            const Step& step = scenario.steps[i];
            const std::string name = step_name(i, step.type);

            Status s = emit_step_event("step_start", name, nullptr);
            if (!termoracle::core::is_ok(s)) {
                if (error) {
                    *error = "trace write failed at step " + name;
                }
                return s;
            }
            const SteadyClock::time_point started = SteadyClock::now();

            delay(step.delay_ms);

            std::string detail;
            s = run_step(step, &detail);
            if (!termoracle::core::is_ok(s)) {
                if (error) {
                    *error = "step " + name + " failed: " + describe(s, detail);
                }
                return s;
            }

            Json extra = Json::object();
            extra["status"] = "passed";
            extra["duration_ms"] = elapsed_ms(started);
            s = emit_step_event("step_end", name, &extra);
            if (!termoracle::core::is_ok(s)) {
                if (error) {
                    *error = "trace write failed at step " + name;
                }
                return s;
            }
        }

        delay(cfg_.settle_ms);
        token_.cancel();

        if (!termoracle::core::is_ok(reader_.failure())) {
            if (error) {
                *error = "reader failed: " + reader_.failure_message();
            }
            return reader_.failure();
        }
        return termoracle::core::ok_status();
    }

    Status run_session(const ChannelFactory& connect,
        const Scenario& scenario,
        SessionRecorder& recorder,
        const DriverConfig& cfg,
        RunResult* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Session, StatusCode::Invalid);
        }

        RunResult result{};
        const SteadyClock::time_point run_started = SteadyClock::now();
        const EnvSnapshot& snap = cfg.snapshot;
        const std::string log_dir = resolve_log_dir(recorder, cfg.env);
        const std::string results_dir = cfg.env.results_dir.empty() ? log_dir : cfg.env.results_dir;

        Json env = Json::object();
        env["host"] = snap.host;
        env["rustc"] = snap.rustc;
        env["cargo"] = snap.cargo;
        env["git_commit"] = snap.git_commit;
        env["git_dirty"] = snap.git_dirty;
        env["deterministic"] = cfg.env.deterministic;
        env["term"] = snap.term;
        env["colorterm"] = snap.colorterm;
        env["no_color"] = snap.no_color;
        env["scenario"] = scenario.name;
        env["initial_cols"] = scenario.initial.cols;
        env["initial_rows"] = scenario.initial.rows;
        emit_checked(&result, recorder, "env", env);

        Json browser = Json::object();
        browser["browser"] = cfg.env.browser;
        browser["browser_version"] = cfg.env.browser_version;
        browser["user_agent"] = cfg.env.user_agent;
        browser["dpr"] = cfg.env.dpr;
        browser["platform"] = snap.platform;
        browser["locale"] = snap.locale;
        browser["timezone"] = snap.timezone;
        browser["headless"] = cfg.env.headless;
        emit_checked(&result, recorder, "browser_env", browser);

        Json start = Json::object();
        start["command"] = cfg.command.empty() ? "termoracle session --url " + cfg.url + " --scenario " + scenario.name : cfg.command;
        start["log_dir"] = log_dir;
        start["results_dir"] = results_dir;
        start["scenario"] = scenario.name;
        start["step_count"] = scenario.steps.size();
        start["timeout_s"] = scenario.timeout_s;
        emit_checked(&result, recorder, "run_start", start);

        std::unique_ptr<net::Channel> channel;
        std::string error;
        Status s = connect(&channel, &error);
        if (termoracle::core::is_ok(s) && !channel) {
            s = make_status(StatusDomain::Session, StatusCode::Unavailable);
        }
        if (!termoracle::core::is_ok(s)) {
            note_failure(&result, recorder, "connect failed: " + describe(s, error));
        } else {
            SessionDriver driver(*channel, recorder, cfg);
            error.clear();
            s = driver.run_steps(scenario, &error);
            if (!termoracle::core::is_ok(s)) {
                note_failure(&result, recorder, describe(s, error));
            }
        }
        if (channel) {
            channel->close();
            channel.reset();
        }

        s = recorder.summary(&result.summary);
        if (!termoracle::core::is_ok(s)) {
            note_failure(&result, recorder, "cannot compute summary: " + status_text(s));
        }

        compare_golden(cfg, recorder, &result);

        const SessionSummary& sum = result.summary;
        Json metrics = Json::object();
        metrics["label"] = scenario.name;
        metrics["ws_url"] = cfg.url;
        metrics["bytes_tx"] = sum.ws_in_bytes;
        metrics["bytes_rx"] = sum.ws_out_bytes;
        metrics["messages_tx"] = sum.messages_tx;
        metrics["messages_rx"] = sum.messages_rx;
        metrics["latency_histogram_ms"] = histogram_to_json(sum.frame_gap_ms);
        emit_checked(&result, recorder, "ws_metrics", metrics);

        result.duration_ms = elapsed_ms(run_started);
        Json end = Json::object();
        end["status"] = result.outcome == "pass" ? "passed" : "failed";
        end["duration_ms"] = result.duration_ms;
        end["failed_count"] = result.errors.size();
        end["outcome"] = result.outcome;
        end["ws_in_bytes"] = sum.ws_in_bytes;
        end["ws_out_bytes"] = sum.ws_out_bytes;
        end["frames"] = sum.frames;
        end["output_sha256"] = sum.output_sha256;
        end["checksum_chain"] = sum.checksum_chain;
        emit_checked(&result, recorder, "run_end", end);

        *out = std::move(result);
        return termoracle::core::ok_status();
    }
} // namespace termoracle::session
