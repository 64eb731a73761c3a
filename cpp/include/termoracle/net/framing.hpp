#pragma once

#include <array>
#include <cstdint>
#include <type_traits>

#include "termoracle/core/buffer.hpp"
#include "termoracle/core/types.hpp"

namespace termoracle::net {
    using u8 = termoracle::core::u8;
    using u16 = termoracle::core::u16;
    using u32 = termoracle::core::u32;
    using u64 = termoracle::core::u64;
    using termoracle::core::BufferMut;
    using termoracle::core::BufferView;

    // RFC 6455 opcodes.
    enum class Opcode : u8 {
        Continuation = 0x0,
        Text = 0x1,
        Binary = 0x2,
        Close = 0x8,
        Ping = 0x9,
        Pong = 0xA,
    };

    struct FrameHeader {
        bool fin{true};
        Opcode opcode{Opcode::Binary};
        bool masked{false};
        u64 payload_len{0};
        std::array<u8, 4> mask{};
    };

    // Layout (network order):
    // 0 FIN|RSV(3)|opcode(4), 1 MASK|len7,
    // len7 == 126 -> u16 length, len7 == 127 -> u64 length,
    // then a 4-byte masking key when MASK is set.
    inline constexpr u32 kFrameHeaderMinBytes = 2;
    inline constexpr u32 kFrameHeaderMaxBytes = 14;

    // Control frames carry at most 125 payload bytes and are never fragmented.
    inline constexpr u64 kMaxControlPayload = 125;

    enum class FrameParseResult : u8 {
        Ok = 0,
        NeedMore,
        Invalid,
    };

    [[nodiscard]] constexpr bool opcode_is_control(Opcode op) noexcept {
        return (static_cast<u8>(op) & 0x8u) != 0;
    }

    [[nodiscard]] constexpr u32 frame_header_size(const FrameHeader& h) noexcept {
        u32 n = 2;
        if (h.payload_len > 0xffffu) {
            n += 8;
        } else if (h.payload_len >= 126) {
            n += 2;
        }
        if (h.masked) {
            n += 4;
        }
        return n;
    }

    // Returns bytes written (0 on failure).
    [[nodiscard]] u32 frame_write_header(const FrameHeader& h, BufferMut out) noexcept;

    // Parses a header from the first bytes of 'in' (does not consume). On Ok,
    // *header_len holds the encoded header size.
    [[nodiscard]] FrameParseResult frame_read_header(BufferView in, FrameHeader* out, u32* header_len) noexcept;

    // XORs data with the masking key; `offset` is the position of data[0]
    // within the payload. Masking twice restores the input.
    void frame_apply_mask(const std::array<u8, 4>& mask, u8* data, u64 len, u64 offset = 0) noexcept;

    static_assert(std::is_trivially_copyable_v<FrameHeader>);
    static_assert(std::is_standard_layout_v<FrameHeader>);

} // namespace termoracle::net
