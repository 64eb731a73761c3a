#include "termoracle/net/websocket.hpp"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include "termoracle/core/encoding.hpp"

namespace termoracle::net {
    namespace {
        using termoracle::core::BufferView;
        using termoracle::core::Status;
        using termoracle::core::StatusCode;
        using termoracle::core::StatusDomain;
        using termoracle::core::make_status;

        inline constexpr char kWsGuid[] = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
        inline constexpr size_t kMaxHandshakeBytes = 16 * 1024;
        inline constexpr i64 kWriteTimeoutMs = 5000;
        inline constexpr u16 kCloseNormal = 1000;

        i64 now_ms() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch()).count();
        }

        int poll_timeout(i64 remaining_ms) {
            if (remaining_ms <= 0) {
                return 0;
            }
            if (remaining_ms > 0x7fffffff) {
                return 0x7fffffff;
            }
            return static_cast<int>(remaining_ms);
        }

        std::string lower(std::string_view s) {
            std::string out;
            out.reserve(s.size());
            for (char c : s) {
                out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            }
            return out;
        }

        std::string_view trim(std::string_view s) {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
                s.remove_prefix(1);
            }
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
                s.remove_suffix(1);
            }
            return s;
        }

        Status set_nonblocking(int fd) {
            const int flags = ::fcntl(fd, F_GETFL, 0);
            if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
                return make_status(StatusDomain::Net, StatusCode::Io, static_cast<termoracle::core::u32>(errno));
            }
            return termoracle::core::ok_status();
        }

        // Non-blocking connect bounded by timeout_ms. Returns the socket or -1.
        int connect_addr(const addrinfo* ai, i64 timeout_ms, int* err) {
            const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) {
                *err = errno;
                return -1;
            }
            if (!termoracle::core::is_ok(set_nonblocking(fd))) {
                *err = errno;
                ::close(fd);
                return -1;
            }
            if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
                return fd;
            }
            if (errno != EINPROGRESS) {
                *err = errno;
                ::close(fd);
                return -1;
            }

            pollfd p{fd, POLLOUT, 0};
            const int rc = ::poll(&p, 1, poll_timeout(timeout_ms));
            if (rc <= 0) {
                *err = rc == 0 ? ETIMEDOUT : errno;
                ::close(fd);
                return -1;
            }
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
                *err = so_error != 0 ? so_error : errno;
                ::close(fd);
                return -1;
            }
            return fd;
        }

        bool random_bytes(u8* out, int len) {
            return RAND_bytes(out, len) == 1;
        }
    } // namespace

    Status parse_ws_url(std::string_view url, WsUrl* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        constexpr std::string_view scheme = "ws://";
        if (url.substr(0, scheme.size()) != scheme) {
            return make_status(StatusDomain::Net, StatusCode::Unsupported);
        }
        url.remove_prefix(scheme.size());

        WsUrl parsed{};
        const size_t slash = url.find('/');
        std::string_view authority = url.substr(0, slash);
        if (slash != std::string_view::npos) {
            parsed.path = std::string(url.substr(slash));
        }
        if (authority.empty()) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }

        std::string_view host = authority;
        std::string_view port;
        bool has_port = false;
        if (authority.front() == '[') {
            const size_t close = authority.find(']');
            if (close == std::string_view::npos) {
                return make_status(StatusDomain::Net, StatusCode::Invalid);
            }
            host = authority.substr(1, close - 1);
            std::string_view rest = authority.substr(close + 1);
            if (!rest.empty()) {
                if (rest.front() != ':') {
                    return make_status(StatusDomain::Net, StatusCode::Invalid);
                }
                port = rest.substr(1);
                has_port = true;
            }
        } else {
            const size_t colon = authority.rfind(':');
            if (colon != std::string_view::npos) {
                host = authority.substr(0, colon);
                port = authority.substr(colon + 1);
                has_port = true;
            }
        }
        if (host.empty()) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        parsed.host = std::string(host);

        if (has_port) {
            if (port.empty() || port.size() > 5) {
                return make_status(StatusDomain::Net, StatusCode::Invalid);
            }
            u32 value = 0;
            for (char c : port) {
                if (c < '0' || c > '9') {
                    return make_status(StatusDomain::Net, StatusCode::Invalid);
                }
                value = value * 10u + static_cast<u32>(c - '0');
            }
            if (value == 0 || value > 0xffffu) {
                return make_status(StatusDomain::Net, StatusCode::Invalid);
            }
            parsed.port = static_cast<u16>(value);
        }

        *out = std::move(parsed);
        return termoracle::core::ok_status();
    }

    std::string ws_accept_key(std::string_view client_key) {
        std::string input(client_key);
        input += kWsGuid;

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        if (EVP_Digest(input.data(), input.size(), digest, &len, EVP_sha1(), nullptr) != 1) {
            return {};
        }
        return termoracle::core::base64_encode(BufferView{digest, len});
    }

    Status check_handshake_response(std::string_view head, std::string_view expected_accept, std::string* error) {
        auto fail = [error](std::string message) {
            if (error) {
                *error = std::move(message);
            }
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        };

        const size_t eol = head.find("\r\n");
        const std::string_view status_line = head.substr(0, eol);
        if (status_line.substr(0, 9) != "HTTP/1.1 " || status_line.substr(9, 3) != "101") {
            return fail("unexpected handshake status: " + std::string(status_line));
        }

        bool upgrade = false;
        bool connection = false;
        std::string accept;
        size_t pos = eol == std::string_view::npos ? head.size() : eol + 2;
        while (pos < head.size()) {
            size_t next = head.find("\r\n", pos);
            if (next == std::string_view::npos) {
                next = head.size();
            }
            const std::string_view line = head.substr(pos, next - pos);
            pos = next + 2;

            const size_t colon = line.find(':');
            if (colon == std::string_view::npos) {
                continue;
            }
            const std::string name = lower(trim(line.substr(0, colon)));
            const std::string_view value = trim(line.substr(colon + 1));
            if (name == "upgrade") {
                upgrade = lower(value) == "websocket";
            } else if (name == "connection") {
                connection = lower(value).find("upgrade") != std::string::npos;
            } else if (name == "sec-websocket-accept") {
                accept = std::string(value);
            }
        }

        if (!upgrade || !connection) {
            return fail("handshake response is missing upgrade headers");
        }
        if (accept != expected_accept) {
            return fail("handshake accept key mismatch");
        }
        return termoracle::core::ok_status();
    }

    void MessageAssembler::feed(const u8* data, size_t len) {
        if (data == nullptr || len == 0) {
            return;
        }
        if (pos_ > 0 && pos_ >= buf_.size() / 2) {
            buf_.erase(0, pos_);
            pos_ = 0;
        }
        buf_.append(reinterpret_cast<const char*>(data), len);
    }

    Status MessageAssembler::next(InboundFrame* out, bool* got, std::string* error) {
        if (out == nullptr || got == nullptr) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        *got = false;

        auto violation = [error](const char* message) {
            if (error) {
                *error = message;
            }
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        };

        for (;;) {
            const BufferView in{reinterpret_cast<const u8*>(buf_.data()) + pos_, static_cast<u64>(buf_.size() - pos_)};
            FrameHeader h{};
            u32 header_len = 0;
            const FrameParseResult r = frame_read_header(in, &h, &header_len);
            if (r == FrameParseResult::NeedMore) {
                return termoracle::core::ok_status();
            }
            if (r == FrameParseResult::Invalid) {
                return violation("malformed frame header");
            }
            if (h.masked) {
                return violation("server frame is masked");
            }
            if (h.payload_len > max_message_bytes_) {
                return violation("message exceeds size limit");
            }
            if (in.len - header_len < h.payload_len) {
                return termoracle::core::ok_status();
            }

            std::string payload(buf_.data() + pos_ + header_len, static_cast<size_t>(h.payload_len));
            pos_ += header_len + static_cast<size_t>(h.payload_len);

            if (opcode_is_control(h.opcode)) {
                out->opcode = h.opcode;
                out->payload = std::move(payload);
                *got = true;
                return termoracle::core::ok_status();
            }

            if (h.opcode == Opcode::Continuation) {
                if (!in_fragment_) {
                    return violation("continuation without a started message");
                }
                if (partial_.size() + payload.size() > max_message_bytes_) {
                    return violation("message exceeds size limit");
                }
                partial_ += payload;
                if (!h.fin) {
                    continue;
                }
                out->opcode = partial_op_;
                out->payload = std::move(partial_);
                partial_.clear();
                in_fragment_ = false;
                *got = true;
                return termoracle::core::ok_status();
            }

            if (in_fragment_) {
                return violation("new message inside a fragmented message");
            }
            if (!h.fin) {
                partial_ = std::move(payload);
                partial_op_ = h.opcode;
                in_fragment_ = true;
                continue;
            }
            out->opcode = h.opcode;
            out->payload = std::move(payload);
            *got = true;
            return termoracle::core::ok_status();
        }
    }

    WebSocketClient::WebSocketClient(int fd, const WsClientOptions& opts)
        : fd_(fd), opts_(opts), assembler_(opts.max_message_bytes) {}

    WebSocketClient::~WebSocketClient() {
        close();
    }

    Status WebSocketClient::fail(StatusCode code, std::string message, termoracle::core::u32 aux) {
        last_error_ = std::move(message);
        if (aux != 0) {
            last_error_ += ": ";
            last_error_ += std::strerror(static_cast<int>(aux));
        }
        return make_status(StatusDomain::Net, code, aux);
    }

    Status WebSocketClient::connect(const std::string& url,
        const WsClientOptions& opts,
        std::unique_ptr<WebSocketClient>* out,
        std::string* error) {
        if (out == nullptr) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }

        WsUrl parsed{};
        Status s = parse_ws_url(url, &parsed);
        if (!termoracle::core::is_ok(s)) {
            if (error) {
                *error = "invalid websocket url: " + url;
            }
            return s;
        }

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* res = nullptr;
        const std::string port = std::to_string(parsed.port);
        const int gai = ::getaddrinfo(parsed.host.c_str(), port.c_str(), &hints, &res);
        if (gai != 0) {
            if (error) {
                *error = "cannot resolve " + parsed.host + ": " + ::gai_strerror(gai);
            }
            return make_status(StatusDomain::Net, StatusCode::Network);
        }

        int fd = -1;
        int last_err = 0;
        for (const addrinfo* ai = res; ai != nullptr && fd < 0; ai = ai->ai_next) {
            fd = connect_addr(ai, opts.open_timeout_ms, &last_err);
        }
        ::freeaddrinfo(res);
        if (fd < 0) {
            if (error) {
                *error = "cannot connect to " + parsed.host + ":" + port + ": " + std::strerror(last_err);
            }
            return make_status(StatusDomain::Net, StatusCode::Network, static_cast<termoracle::core::u32>(last_err));
        }

        std::unique_ptr<WebSocketClient> client(new WebSocketClient(fd, opts));
        s = client->handshake(parsed);
        if (!termoracle::core::is_ok(s)) {
            if (error) {
                *error = client->last_error();
            }
            client->peer_closed_ = true;
            client->close();
            return s;
        }

        *out = std::move(client);
        return termoracle::core::ok_status();
    }

    Status WebSocketClient::handshake(const WsUrl& url) {
        u8 nonce[16];
        if (!random_bytes(nonce, sizeof(nonce))) {
            return fail(StatusCode::Unavailable, "random source unavailable");
        }
        const std::string key = termoracle::core::base64_encode(BufferView{nonce, sizeof(nonce)});

        std::string request;
        request += "GET " + url.path + " HTTP/1.1\r\n";
        request += "Host: " + url.host + ":" + std::to_string(url.port) + "\r\n";
        request += "Upgrade: websocket\r\n";
        request += "Connection: Upgrade\r\n";
        request += "Sec-WebSocket-Key: " + key + "\r\n";
        request += "Sec-WebSocket-Version: 13\r\n";
        request += "\r\n";

        Status s = write_all(reinterpret_cast<const u8*>(request.data()), request.size());
        if (!termoracle::core::is_ok(s)) {
            return s;
        }

        const i64 deadline = now_ms() + opts_.open_timeout_ms;
        std::string response;
        size_t header_end = std::string::npos;
        char buf[2048];
        while (header_end == std::string::npos) {
            if (response.size() > kMaxHandshakeBytes) {
                return fail(StatusCode::Invalid, "handshake response too large");
            }
            pollfd p{fd_, POLLIN, 0};
            const int rc = ::poll(&p, 1, poll_timeout(deadline - now_ms()));
            if (rc == 0) {
                return fail(StatusCode::Timeout, "handshake timed out");
            }
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return fail(StatusCode::Network, "poll failed", static_cast<termoracle::core::u32>(errno));
            }
            const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
            if (n == 0) {
                return fail(StatusCode::Closed, "connection closed during handshake");
            }
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    continue;
                }
                return fail(StatusCode::Network, "recv failed", static_cast<termoracle::core::u32>(errno));
            }
            response.append(buf, static_cast<size_t>(n));
            header_end = response.find("\r\n\r\n");
        }

        std::string detail;
        s = check_handshake_response(std::string_view(response).substr(0, header_end), ws_accept_key(key), &detail);
        if (!termoracle::core::is_ok(s)) {
            last_error_ = detail;
            return s;
        }

        const size_t body = header_end + 4;
        if (body < response.size()) {
            assembler_.feed(reinterpret_cast<const u8*>(response.data()) + body, response.size() - body);
        }
        return termoracle::core::ok_status();
    }

    Status WebSocketClient::write_all(const u8* data, size_t len) {
        const i64 deadline = now_ms() + kWriteTimeoutMs;
        size_t off = 0;
        while (off < len) {
            const ssize_t n = ::send(fd_, data + off, len - off, MSG_NOSIGNAL);
            if (n > 0) {
                off += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                pollfd p{fd_, POLLOUT, 0};
                const int rc = ::poll(&p, 1, poll_timeout(deadline - now_ms()));
                if (rc == 0) {
                    return fail(StatusCode::Timeout, "send timed out");
                }
                if (rc < 0 && errno != EINTR) {
                    return fail(StatusCode::Network, "poll failed", static_cast<termoracle::core::u32>(errno));
                }
                continue;
            }
            if (n < 0 && (errno == EPIPE || errno == ECONNRESET)) {
                peer_closed_ = true;
                return fail(StatusCode::Closed, "connection reset by peer", static_cast<termoracle::core::u32>(errno));
            }
            return fail(StatusCode::Network, "send failed", static_cast<termoracle::core::u32>(errno));
        }
        return termoracle::core::ok_status();
    }

    Status WebSocketClient::send_frame(Opcode op, BufferView payload) {
        if (fd_ < 0) {
            return fail(StatusCode::Closed, "connection is closed");
        }
        if (!termoracle::core::buffer_ok(payload)) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }

        FrameHeader h{};
        h.fin = true;
        h.opcode = op;
        h.masked = true;
        h.payload_len = payload.len;
        if (!random_bytes(h.mask.data(), static_cast<int>(h.mask.size()))) {
            return fail(StatusCode::Unavailable, "random source unavailable");
        }

        std::vector<u8> frame(frame_header_size(h) + static_cast<size_t>(payload.len));
        const u32 header_len = frame_write_header(h, termoracle::core::BufferMut{frame.data(), static_cast<u64>(frame.size())});
        if (header_len == 0) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        if (payload.len > 0) {
            std::memcpy(frame.data() + header_len, payload.data, static_cast<size_t>(payload.len));
            frame_apply_mask(h.mask, frame.data() + header_len, payload.len);
        }
        return write_all(frame.data(), frame.size());
    }

    Status WebSocketClient::send(MessageKind kind, BufferView payload) {
        if (close_sent_ || peer_closed_) {
            return fail(StatusCode::Closed, "connection is closed");
        }
        return send_frame(kind == MessageKind::Text ? Opcode::Text : Opcode::Binary, payload);
    }

    Status WebSocketClient::read_some(i64 timeout_ms, bool* got) {
        *got = false;
        pollfd p{fd_, POLLIN, 0};
        const int rc = ::poll(&p, 1, poll_timeout(timeout_ms));
        if (rc == 0) {
            return termoracle::core::ok_status();
        }
        if (rc < 0) {
            if (errno == EINTR) {
                return termoracle::core::ok_status();
            }
            return fail(StatusCode::Network, "poll failed", static_cast<termoracle::core::u32>(errno));
        }

        u8 buf[16 * 1024];
        const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n == 0) {
            peer_closed_ = true;
            return fail(StatusCode::Closed, "connection closed by peer");
        }
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                return termoracle::core::ok_status();
            }
            peer_closed_ = true;
            return fail(StatusCode::Network, "recv failed", static_cast<termoracle::core::u32>(errno));
        }
        assembler_.feed(buf, static_cast<size_t>(n));
        *got = true;
        return termoracle::core::ok_status();
    }

    Status WebSocketClient::receive(i64 timeout_ms, Message* out, bool* got) {
        if (out == nullptr || got == nullptr) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        *got = false;
        if (fd_ < 0) {
            return fail(StatusCode::Closed, "connection is closed");
        }

        const i64 deadline = now_ms() + timeout_ms;
        for (;;) {
            InboundFrame frame{};
            bool have = false;
            std::string detail;
            Status s = assembler_.next(&frame, &have, &detail);
            if (!termoracle::core::is_ok(s)) {
                return fail(StatusCode::Invalid, "protocol error: " + detail);
            }

            if (have) {
                switch (frame.opcode) {
                    case Opcode::Text:
                    case Opcode::Binary:
                        out->kind = frame.opcode == Opcode::Text ? MessageKind::Text : MessageKind::Binary;
                        out->payload = std::move(frame.payload);
                        *got = true;
                        return termoracle::core::ok_status();
                    case Opcode::Ping:
                        if (!close_sent_) {
                            s = send_frame(Opcode::Pong, termoracle::core::as_view(frame.payload));
                            if (!termoracle::core::is_ok(s)) {
                                return s;
                            }
                        }
                        continue;
                    case Opcode::Close:
                        peer_closed_ = true;
                        if (!close_sent_) {
                            close_sent_ = true;
                            const std::string_view code = std::string_view(frame.payload).substr(0, 2);
                            s = send_frame(Opcode::Close, termoracle::core::as_view(code));
                            if (!termoracle::core::is_ok(s)) {
                                return s;
                            }
                        }
                        return fail(StatusCode::Closed, "connection closed by peer");
                    default:
                        continue;
                }
            }

            if (peer_closed_) {
                return fail(StatusCode::Closed, "connection closed by peer");
            }

            bool read = false;
            s = read_some(deadline - now_ms(), &read);
            if (!termoracle::core::is_ok(s)) {
                return s;
            }
            if (!read) {
                return termoracle::core::ok_status();
            }
        }
    }

    void WebSocketClient::close() noexcept {
        if (fd_ < 0) {
            return;
        }
        if (!close_sent_ && !peer_closed_) {
            close_sent_ = true;
            const u8 payload[2] = {static_cast<u8>(kCloseNormal >> 8), static_cast<u8>(kCloseNormal & 0xffu)};
            const Status s = send_frame(Opcode::Close, BufferView{payload, sizeof(payload)});
            if (termoracle::core::is_ok(s)) {
                // Drain until the peer echoes the close or the timeout passes.
                const i64 deadline = now_ms() + opts_.close_timeout_ms;
                while (!peer_closed_ && now_ms() < deadline) {
                    Message ignored{};
                    bool got = false;
                    if (!termoracle::core::is_ok(receive(deadline - now_ms(), &ignored, &got))) {
                        break;
                    }
                }
            }
        }
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        fd_ = -1;
    }
} // namespace termoracle::net
