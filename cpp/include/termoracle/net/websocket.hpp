#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "termoracle/core/errors.hpp"
#include "termoracle/core/types.hpp"
#include "termoracle/net/channel.hpp"
#include "termoracle/net/framing.hpp"

namespace termoracle::net {
    using i64 = termoracle::core::i64;

    struct WsUrl {
        std::string host{};
        u16 port{80};
        std::string path{"/"};
    };

    // ws://host[:port][/path]. Only plain ws:// is supported.
    termoracle::core::Status parse_ws_url(std::string_view url, WsUrl* out);

    // Sec-WebSocket-Accept value for a client key (RFC 6455 section 4.2.2).
    [[nodiscard]] std::string ws_accept_key(std::string_view client_key);

    // Validates a server handshake response up to (not including) the blank
    // line: status 101, Upgrade/Connection headers and the accept key.
    termoracle::core::Status check_handshake_response(std::string_view head, std::string_view expected_accept, std::string* error);

    struct WsClientOptions {
        i64 open_timeout_ms{10000};
        i64 close_timeout_ms{5000};
        u64 max_message_bytes{256 * 1024};
    };

    // One decoded inbound unit: a complete (reassembled) Text/Binary message
    // or a single control frame.
    struct InboundFrame {
        Opcode opcode{Opcode::Binary};
        std::string payload{};
    };

    // Reassembles server-to-client frames from a byte stream.
    class MessageAssembler {
    public:
        explicit MessageAssembler(u64 max_message_bytes) : max_message_bytes_(max_message_bytes) {}

        void feed(const u8* data, size_t len);

        // *got is false when more bytes are needed. Protocol violations
        // (masked server frames, bad fragmentation, oversize messages) return
        // Invalid and describe the problem in *error.
        termoracle::core::Status next(InboundFrame* out, bool* got, std::string* error);

        [[nodiscard]] size_t buffered() const noexcept { return buf_.size() - pos_; }

    private:
        std::string buf_{};
        size_t pos_{0};
        std::string partial_{};
        Opcode partial_op_{Opcode::Binary};
        bool in_fragment_{false};
        u64 max_message_bytes_;
    };

    // RFC 6455 client over a plain TCP socket. All waits use poll(2) with the
    // caller's timeout; client frames are masked with RAND_bytes keys.
    class WebSocketClient final : public Channel {
    public:
        static termoracle::core::Status connect(const std::string& url,
            const WsClientOptions& opts,
            std::unique_ptr<WebSocketClient>* out,
            std::string* error);

        ~WebSocketClient() override;

        WebSocketClient(const WebSocketClient&) = delete;
        WebSocketClient& operator=(const WebSocketClient&) = delete;

        termoracle::core::Status send(MessageKind kind, termoracle::core::BufferView payload) override;
        termoracle::core::Status receive(i64 timeout_ms, Message* out, bool* got) override;
        void close() noexcept override;

        [[nodiscard]] const std::string& last_error() const noexcept override { return last_error_; }

    private:
        WebSocketClient(int fd, const WsClientOptions& opts);

        termoracle::core::Status handshake(const WsUrl& url);
        termoracle::core::Status send_frame(Opcode op, termoracle::core::BufferView payload);
        termoracle::core::Status write_all(const u8* data, size_t len);
        // Reads whatever is available within timeout_ms into the assembler.
        termoracle::core::Status read_some(i64 timeout_ms, bool* got);
        termoracle::core::Status fail(termoracle::core::StatusCode code, std::string message, termoracle::core::u32 aux = 0);

        int fd_{-1};
        WsClientOptions opts_{};
        MessageAssembler assembler_;
        bool close_sent_{false};
        bool peer_closed_{false};
        std::string last_error_{};
    };
} // namespace termoracle::net
