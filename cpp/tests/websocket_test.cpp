#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "termoracle/core/buffer.hpp"
#include "termoracle/net/websocket.hpp"

namespace tn = termoracle::net;
using termoracle::core::StatusCode;

namespace {
    std::vector<tn::u8> server_frame(tn::u8 b0, const std::string& payload) {
        std::vector<tn::u8> out = {b0, static_cast<tn::u8>(payload.size())};
        out.insert(out.end(), payload.begin(), payload.end());
        return out;
    }

    void append(std::vector<tn::u8>* dst, const std::vector<tn::u8>& src) {
        dst->insert(dst->end(), src.begin(), src.end());
    }

    bool send_all(int fd, const void* data, size_t len) {
        const char* p = static_cast<const char*>(data);
        while (len > 0) {
            const ssize_t n = ::send(fd, p, len, MSG_NOSIGNAL);
            if (n <= 0) {
                return false;
            }
            p += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

    bool recv_exact(int fd, tn::u8* out, size_t len) {
        while (len > 0) {
            const ssize_t n = ::recv(fd, out, len, 0);
            if (n <= 0) {
                return false;
            }
            out += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }
} // namespace

TEST(WsUrl, ParsesHostPortAndPath) {
    tn::WsUrl u;
    ASSERT_EQ(tn::parse_ws_url("ws://127.0.0.1:9231/ws", &u).code, StatusCode::Ok);
    EXPECT_EQ(u.host, "127.0.0.1");
    EXPECT_EQ(u.port, 9231);
    EXPECT_EQ(u.path, "/ws");

    ASSERT_EQ(tn::parse_ws_url("ws://localhost", &u).code, StatusCode::Ok);
    EXPECT_EQ(u.host, "localhost");
    EXPECT_EQ(u.port, 80);
    EXPECT_EQ(u.path, "/");

    ASSERT_EQ(tn::parse_ws_url("ws://[::1]:8080/term?x=1", &u).code, StatusCode::Ok);
    EXPECT_EQ(u.host, "::1");
    EXPECT_EQ(u.port, 8080);
    EXPECT_EQ(u.path, "/term?x=1");
}

TEST(WsUrl, RejectsBadUrls) {
    tn::WsUrl u;
    EXPECT_EQ(tn::parse_ws_url("wss://example.com/", &u).code, StatusCode::Unsupported);
    EXPECT_EQ(tn::parse_ws_url("http://example.com/", &u).code, StatusCode::Unsupported);
    EXPECT_EQ(tn::parse_ws_url("ws:///path", &u).code, StatusCode::Invalid);
    EXPECT_EQ(tn::parse_ws_url("ws://host:", &u).code, StatusCode::Invalid);
    EXPECT_EQ(tn::parse_ws_url("ws://host:0", &u).code, StatusCode::Invalid);
    EXPECT_EQ(tn::parse_ws_url("ws://host:70000", &u).code, StatusCode::Invalid);
    EXPECT_EQ(tn::parse_ws_url("ws://host:8a", &u).code, StatusCode::Invalid);
    EXPECT_EQ(tn::parse_ws_url("ws://[::1", &u).code, StatusCode::Invalid);
}

TEST(WsHandshake, AcceptKeyMatchesRfcExample) {
    EXPECT_EQ(tn::ws_accept_key("dGhlIHNhbXBsZSBub25jZQ=="), "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST(WsHandshake, ChecksResponseHead) {
    const std::string accept = "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=";
    std::string err;
    EXPECT_EQ(tn::check_handshake_response("HTTP/1.1 101 Switching Protocols\r\nUpgrade: WebSocket\r\nConnection: keep-alive, Upgrade\r\n"
                                           "Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=",
                                           accept, &err)
                  .code,
              StatusCode::Ok);

    EXPECT_EQ(tn::check_handshake_response("HTTP/1.1 404 Not Found\r\n", accept, &err).code, StatusCode::Invalid);
    EXPECT_EQ(err, "unexpected handshake status: HTTP/1.1 404 Not Found");

    EXPECT_EQ(tn::check_handshake_response("HTTP/1.1 101 Switching Protocols\r\nSec-WebSocket-Accept: " + accept, accept, &err).code,
              StatusCode::Invalid);
    EXPECT_EQ(err, "handshake response is missing upgrade headers");

    EXPECT_EQ(tn::check_handshake_response("HTTP/1.1 101 OK\r\nUpgrade: websocket\r\nConnection: Upgrade\r\nSec-WebSocket-Accept: wrong",
                                           accept, &err)
                  .code,
              StatusCode::Invalid);
    EXPECT_EQ(err, "handshake accept key mismatch");
}

TEST(WsAssembler, ReassemblesFragmentsAroundControlFrames) {
    std::vector<tn::u8> wire;
    append(&wire, server_frame(0x01, "abc"));
    append(&wire, server_frame(0x89, "p"));
    append(&wire, server_frame(0x80, "de"));

    tn::MessageAssembler a(1024);
    // One byte at a time: message boundaries do not depend on how the
    // transport splits reads.
    std::vector<tn::InboundFrame> frames;
    std::string err;
    for (tn::u8 b : wire) {
        a.feed(&b, 1);
        tn::InboundFrame f;
        bool got = false;
        ASSERT_EQ(a.next(&f, &got, &err).code, StatusCode::Ok) << err;
        if (got) {
            frames.push_back(f);
        }
    }
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].opcode, tn::Opcode::Ping);
    EXPECT_EQ(frames[0].payload, "p");
    EXPECT_EQ(frames[1].opcode, tn::Opcode::Text);
    EXPECT_EQ(frames[1].payload, "abcde");
    EXPECT_EQ(a.buffered(), 0u);
}

TEST(WsAssembler, RejectsProtocolErrors) {
    std::string err;
    tn::InboundFrame f;
    bool got = false;

    {
        tn::MessageAssembler a(1024);
        const std::vector<tn::u8> masked = {0x82, 0x81, 1, 2, 3, 4, 0x00};
        a.feed(masked.data(), masked.size());
        EXPECT_EQ(a.next(&f, &got, &err).code, StatusCode::Invalid);
        EXPECT_EQ(err, "server frame is masked");
    }
    {
        tn::MessageAssembler a(1024);
        const auto cont = server_frame(0x80, "x");
        a.feed(cont.data(), cont.size());
        EXPECT_EQ(a.next(&f, &got, &err).code, StatusCode::Invalid);
        EXPECT_EQ(err, "continuation without a started message");
    }
    {
        tn::MessageAssembler a(4);
        const auto big = server_frame(0x82, "12345");
        a.feed(big.data(), big.size());
        EXPECT_EQ(a.next(&f, &got, &err).code, StatusCode::Invalid);
        EXPECT_EQ(err, "message exceeds size limit");
    }
    {
        tn::MessageAssembler a(1024);
        std::vector<tn::u8> wire = server_frame(0x01, "a");
        append(&wire, server_frame(0x82, "b"));
        a.feed(wire.data(), wire.size());
        EXPECT_EQ(a.next(&f, &got, &err).code, StatusCode::Invalid);
        EXPECT_EQ(err, "new message inside a fragmented message");
    }
}

TEST(WsClient, LoopbackExchange) {
    const int listener = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(listener, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ASSERT_EQ(::bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(::listen(listener, 1), 0);
    socklen_t addr_len = sizeof(addr);
    ASSERT_EQ(::getsockname(listener, reinterpret_cast<sockaddr*>(&addr), &addr_len), 0);
    const unsigned port = ntohs(addr.sin_port);

    std::string received_from_client;
    std::thread server([listener, &received_from_client] {
        const int fd = ::accept(listener, nullptr, nullptr);
        if (fd < 0) {
            return;
        }
        std::string request;
        char buf[1024];
        while (request.find("\r\n\r\n") == std::string::npos) {
            const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) {
                ::close(fd);
                return;
            }
            request.append(buf, static_cast<size_t>(n));
        }
        const std::string marker = "Sec-WebSocket-Key: ";
        const size_t k = request.find(marker);
        const size_t e = request.find("\r\n", k);
        const std::string key = request.substr(k + marker.size(), e - k - marker.size());

        std::string response = "HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n";
        response += "Sec-WebSocket-Accept: " + tn::ws_accept_key(key) + "\r\n\r\n";
        // First frame rides in the same write as the handshake response.
        const auto hello = server_frame(0x82, "hello");
        response.append(hello.begin(), hello.end());
        send_all(fd, response.data(), response.size());

        tn::u8 frame[8];
        if (recv_exact(fd, frame, sizeof(frame)) && frame[0] == 0x82 && frame[1] == (0x80 | 2)) {
            for (int i = 0; i < 2; ++i) {
                received_from_client.push_back(static_cast<char>(frame[6 + i] ^ frame[2 + i]));
            }
        }

        const tn::u8 close_frame[] = {0x88, 0x02, 0x03, 0xe8};
        send_all(fd, close_frame, sizeof(close_frame));
        tn::u8 echo[8];
        (void)recv_exact(fd, echo, 8);
        ::close(fd);
    });

    std::unique_ptr<tn::WebSocketClient> client;
    std::string err;
    const termoracle::core::Status s =
        tn::WebSocketClient::connect("ws://127.0.0.1:" + std::to_string(port) + "/ws", tn::WsClientOptions{}, &client, &err);
    ASSERT_EQ(s.code, StatusCode::Ok) << err;

    tn::Message msg;
    bool got = false;
    ASSERT_EQ(client->receive(2000, &msg, &got).code, StatusCode::Ok) << client->last_error();
    ASSERT_TRUE(got);
    EXPECT_EQ(msg.kind, tn::MessageKind::Binary);
    EXPECT_EQ(msg.payload, "hello");

    ASSERT_EQ(client->send(tn::MessageKind::Binary, termoracle::core::as_view(std::string_view("hi"))).code, StatusCode::Ok);
    EXPECT_EQ(client->receive(2000, &msg, &got).code, StatusCode::Closed);
    EXPECT_FALSE(got);
    client->close();

    server.join();
    ::close(listener);
    EXPECT_EQ(received_from_client, "hi");
}
