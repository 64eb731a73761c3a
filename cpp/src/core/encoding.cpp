#include "termoracle/core/encoding.hpp"

#include <utility>

#include <openssl/evp.h>

namespace termoracle::core {
    namespace {
        constexpr u64 kEncodeChunk = 3 * 1024;
        constexpr u64 kDecodeChunk = 4 * 1024;

        [[nodiscard]] bool is_b64_alpha(char c) noexcept {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
        }

        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        [[nodiscard]] bool is_space(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
        }

        // Padding may only occupy the last one or two positions of a
        // length-multiple-of-four string.
        [[nodiscard]] bool b64_well_formed(std::string_view s, u32* padding) noexcept {
            if (s.size() % 4 != 0) {
                return false;
            }
            u32 pad = 0;
            for (size_t i = 0; i < s.size(); ++i) {
                const char c = s[i];
                if (c == '=') {
                    if (i + 2 < s.size()) {
                        return false;
                    }
                    ++pad;
                    continue;
                }
                if (pad != 0 || !is_b64_alpha(c)) {
                    return false;
                }
            }
            *padding = pad;
            return true;
        }
    } // namespace

    std::string hex_encode(BufferView data) {
        static const char hex[] = "0123456789abcdef";
        std::string out;
        if (!buffer_ok(data)) {
            return out;
        }
        out.reserve(static_cast<size_t>(data.len) * 2);
        for (u64 i = 0; i < data.len; ++i) {
            out.push_back(hex[(data.data[i] >> 4) & 0xF]);
            out.push_back(hex[data.data[i] & 0xF]);
        }
        return out;
    }

    Status hex_decode(std::string_view text, Bytes* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        Bytes bytes;
        bytes.reserve(text.size() / 2);
        size_t i = 0;
        while (i < text.size()) {
            if (is_space(text[i])) {
                ++i;
                continue;
            }
            if (i + 1 >= text.size()) {
                return make_status(StatusDomain::Core, StatusCode::Invalid);
            }
            const int hi = hex_value(text[i]);
            const int lo = hex_value(text[i + 1]);
            if (hi < 0 || lo < 0) {
                return make_status(StatusDomain::Core, StatusCode::Invalid);
            }
            bytes.push_back(static_cast<u8>((hi << 4) | lo));
            i += 2;
        }
        *out = std::move(bytes);
        return ok_status();
    }

    std::string base64_encode(BufferView data) {
        std::string out;
        if (!buffer_ok(data) || data.len == 0) {
            return out;
        }
        out.reserve(static_cast<size_t>((data.len + 2) / 3 * 4));
        unsigned char block[kEncodeChunk / 3 * 4 + 1];
        for (u64 off = 0; off < data.len; off += kEncodeChunk) {
            const u64 n = (data.len - off < kEncodeChunk) ? (data.len - off) : kEncodeChunk;
            const int written = EVP_EncodeBlock(block, data.data + off, static_cast<int>(n));
            out.append(reinterpret_cast<const char*>(block), static_cast<size_t>(written));
        }
        return out;
    }

    Status base64_decode(std::string_view text, Base64Mode mode, Bytes* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        std::string filtered;
        if (mode == Base64Mode::Lenient) {
            filtered.reserve(text.size());
            for (char c : text) {
                if (is_b64_alpha(c) || c == '=') {
                    filtered.push_back(c);
                }
            }
            text = filtered;
        }

        u32 padding = 0;
        if (!b64_well_formed(text, &padding)) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        Bytes bytes;
        bytes.reserve(text.size() / 4 * 3);
        unsigned char block[kDecodeChunk / 4 * 3];
        for (size_t off = 0; off < text.size(); off += kDecodeChunk) {
            const size_t n = (text.size() - off < kDecodeChunk) ? (text.size() - off) : kDecodeChunk;
            const int written = EVP_DecodeBlock(block,
                reinterpret_cast<const unsigned char*>(text.data() + off),
                static_cast<int>(n));
            if (written < 0) {
                return make_status(StatusDomain::Core, StatusCode::Invalid);
            }
            bytes.insert(bytes.end(), block, block + written);
        }
        // EVP_DecodeBlock emits a zero byte for every padding character.
        if (bytes.size() < padding) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        bytes.resize(bytes.size() - padding);
        *out = std::move(bytes);
        return ok_status();
    }
} // namespace termoracle::core
