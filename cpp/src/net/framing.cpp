#include "termoracle/net/framing.hpp"

namespace termoracle::net {
    static void put_u16_be(u8* p, u16 v) noexcept {
        p[0] = static_cast<u8>((v >> 8) & 0xffu);
        p[1] = static_cast<u8>((v >> 0) & 0xffu);
    }

    static void put_u64_be(u8* p, u64 v) noexcept {
        for (int i = 0; i < 8; ++i) {
            p[i] = static_cast<u8>((v >> (56 - 8 * i)) & 0xffu);
        }
    }

    static u16 get_u16_be(const u8* p) noexcept {
        return static_cast<u16>((static_cast<u16>(p[0]) << 8) | static_cast<u16>(p[1]));
    }

    static u64 get_u64_be(const u8* p) noexcept {
        u64 v = 0;
        for (int i = 0; i < 8; ++i) {
            v = (v << 8) | static_cast<u64>(p[i]);
        }
        return v;
    }

    static bool opcode_valid_u8(u8 v) noexcept {
        switch (static_cast<Opcode>(v)) {
        case Opcode::Continuation:
        case Opcode::Text:
        case Opcode::Binary:
        case Opcode::Close:
        case Opcode::Ping:
        case Opcode::Pong:
            return true;
        default:
            return false;
        }
    }

    u32 frame_write_header(const FrameHeader& h, BufferMut out) noexcept {
        const u32 need = frame_header_size(h);
        if (out.data == nullptr || out.len < need) {
            return 0;
        }
        if (opcode_is_control(h.opcode) && (h.payload_len > kMaxControlPayload || !h.fin)) {
            return 0;
        }

        out.data[0] = static_cast<u8>((h.fin ? 0x80u : 0x00u) | (static_cast<u8>(h.opcode) & 0x0fu));
        const u8 mask_bit = h.masked ? 0x80u : 0x00u;

        u32 pos = 2;
        if (h.payload_len > 0xffffu) {
            out.data[1] = static_cast<u8>(mask_bit | 127u);
            put_u64_be(out.data + 2, h.payload_len);
            pos += 8;
        } else if (h.payload_len >= 126) {
            out.data[1] = static_cast<u8>(mask_bit | 126u);
            put_u16_be(out.data + 2, static_cast<u16>(h.payload_len));
            pos += 2;
        } else {
            out.data[1] = static_cast<u8>(mask_bit | static_cast<u8>(h.payload_len));
        }

        if (h.masked) {
            for (u32 i = 0; i < 4; ++i) {
                out.data[pos + i] = h.mask[i];
            }
            pos += 4;
        }
        return pos;
    }

    FrameParseResult frame_read_header(BufferView in, FrameHeader* out, u32* header_len) noexcept {
        if (out == nullptr || header_len == nullptr) return FrameParseResult::Invalid;
        if (in.data == nullptr) return FrameParseResult::NeedMore;
        if (in.len < kFrameHeaderMinBytes) return FrameParseResult::NeedMore;

        const u8 b0 = in.data[0];
        const u8 b1 = in.data[1];

        if ((b0 & 0x70u) != 0) return FrameParseResult::Invalid; // RSV bits, no extensions negotiated
        const u8 op = static_cast<u8>(b0 & 0x0fu);
        if (!opcode_valid_u8(op)) return FrameParseResult::Invalid;

        FrameHeader h{};
        h.fin = (b0 & 0x80u) != 0;
        h.opcode = static_cast<Opcode>(op);
        h.masked = (b1 & 0x80u) != 0;

        u32 pos = 2;
        const u8 len7 = static_cast<u8>(b1 & 0x7fu);
        if (len7 == 126) {
            if (in.len < pos + 2) return FrameParseResult::NeedMore;
            h.payload_len = get_u16_be(in.data + pos);
            if (h.payload_len < 126) return FrameParseResult::Invalid; // non-minimal length
            pos += 2;
        } else if (len7 == 127) {
            if (in.len < pos + 8) return FrameParseResult::NeedMore;
            h.payload_len = get_u64_be(in.data + pos);
            if ((h.payload_len >> 63) != 0) return FrameParseResult::Invalid;
            if (h.payload_len <= 0xffffu) return FrameParseResult::Invalid;
            pos += 8;
        } else {
            h.payload_len = len7;
        }

        if (opcode_is_control(h.opcode) && (h.payload_len > kMaxControlPayload || !h.fin)) {
            return FrameParseResult::Invalid;
        }

        if (h.masked) {
            if (in.len < pos + 4) return FrameParseResult::NeedMore;
            for (u32 i = 0; i < 4; ++i) {
                h.mask[i] = in.data[pos + i];
            }
            pos += 4;
        }

        *out = h;
        *header_len = pos;
        return FrameParseResult::Ok;
    }

    void frame_apply_mask(const std::array<u8, 4>& mask, u8* data, u64 len, u64 offset) noexcept {
        if (data == nullptr) {
            return;
        }
        for (u64 i = 0; i < len; ++i) {
            data[i] = static_cast<u8>(data[i] ^ mask[(offset + i) & 3u]);
        }
    }
} // namespace termoracle::net
