#pragma once

#include <string>

#include "termoracle/core/buffer.hpp"
#include "termoracle/core/errors.hpp"
#include "termoracle/core/types.hpp"

namespace termoracle::net {
    enum class MessageKind : termoracle::core::u8 {
        Text = 0,
        Binary = 1,
    };

    struct Message {
        MessageKind kind{MessageKind::Binary};
        std::string payload{};
    };

    // Message-oriented duplex connection to a remote terminal session.
    class Channel {
    public:
        virtual ~Channel() = default;

        virtual termoracle::core::Status send(MessageKind kind, termoracle::core::BufferView payload) = 0;

        // Waits up to timeout_ms for one message. *got is false on timeout.
        // Returns Closed once the peer has closed the connection.
        virtual termoracle::core::Status receive(termoracle::core::i64 timeout_ms, Message* out, bool* got) = 0;

        virtual void close() noexcept = 0;

        // Human-readable detail for the last failure, empty when none.
        [[nodiscard]] virtual const std::string& last_error() const noexcept = 0;
    };
} // namespace termoracle::net
