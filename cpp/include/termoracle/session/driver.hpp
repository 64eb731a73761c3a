#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "termoracle/core/errors.hpp"
#include "termoracle/core/json.hpp"
#include "termoracle/core/types.hpp"
#include "termoracle/net/channel.hpp"
#include "termoracle/session/config.hpp"
#include "termoracle/session/env_probe.hpp"
#include "termoracle/session/recorder.hpp"
#include "termoracle/session/scenario.hpp"

namespace termoracle::session {
    using SteadyClock = std::chrono::steady_clock;

    // Cooperative stop signal for the frame reader. Single-threaded: the step
    // task cancels, the reader observes it at its next check.
    class CancelToken {
    public:
        void cancel() noexcept { cancelled_ = true; }
        [[nodiscard]] bool cancelled() const noexcept { return cancelled_; }

    private:
        bool cancelled_{false};
    };

    // Reader task. Runs only inside the step task's delays: pump_until()
    // decodes inbound messages into the recorder until the deadline passes,
    // the token is cancelled or the connection ends.
    class FrameReader {
    public:
        FrameReader(net::Channel& channel, SessionRecorder& recorder, const CancelToken& token)
            : channel_(channel), recorder_(recorder), token_(token) {}

        // Always consumes the full delay; once the reader has finished the
        // remaining time is slept.
        void pump_until(SteadyClock::time_point deadline);

        // Binary messages are raw output; text goes through the structured
        // frame decode and falls back to its raw bytes.
        termoracle::core::Status handle_message(const net::Message& msg);

        [[nodiscard]] bool finished() const noexcept { return finished_; }

        // Non-OK when the reader stopped on anything but a peer close.
        [[nodiscard]] termoracle::core::Status failure() const noexcept { return failure_; }
        [[nodiscard]] const std::string& failure_message() const noexcept { return failure_message_; }

    private:
        net::Channel& channel_;
        SessionRecorder& recorder_;
        const CancelToken& token_;
        bool finished_{false};
        termoracle::core::Status failure_{};
        std::string failure_message_{};
    };

    struct DriverConfig {
        std::string url{};
        std::string command{};
        std::string golden_path{};
        i64 drain_ms{500};
        i64 settle_ms{300};
        EnvConfig env{};
        EnvSnapshot snapshot{};
    };

    struct RunResult {
        std::string outcome{"pass"};
        std::vector<std::string> errors{};
        SessionSummary summary{};
        i64 duration_ms{0};
    };

    [[nodiscard]] Json run_result_to_json(const RunResult& r);

    // Executes scenario steps against an open channel.
    class SessionDriver {
    public:
        SessionDriver(net::Channel& channel, SessionRecorder& recorder, const DriverConfig& cfg);

        // Stops at the first failing step and describes it in *error.
        termoracle::core::Status run_steps(const Scenario& scenario, std::string* error);

        [[nodiscard]] const FrameReader& reader() const noexcept { return reader_; }

    private:
        termoracle::core::Status run_step(const Step& step, std::string* error);
        termoracle::core::Status send_keys(const Step& step, std::string* error);
        termoracle::core::Status send_resize(const Step& step, std::string* error);
        termoracle::core::Status emit_step_event(const char* type, const std::string& name, const Json* extra);
        void delay(double ms);

        net::Channel& channel_;
        SessionRecorder& recorder_;
        const DriverConfig& cfg_;
        CancelToken token_{};
        FrameReader reader_;
    };

    using ChannelFactory = std::function<termoracle::core::Status(std::unique_ptr<net::Channel>*, std::string*)>;

    // Whole run: env/browser_env/run_start, connect, steps, settle, summary,
    // optional golden comparison, ws_metrics and run_end. Session faults are
    // recorded as `error` events and mark the outcome "fail"; only a missing
    // output pointer is reported through the returned status.
    termoracle::core::Status run_session(const ChannelFactory& connect,
        const Scenario& scenario,
        SessionRecorder& recorder,
        const DriverConfig& cfg,
        RunResult* out);
} // namespace termoracle::session
