#pragma once

#include <string>
#include <string_view>

#include "termoracle/core/buffer.hpp"
#include "termoracle/core/errors.hpp"
#include "termoracle/core/types.hpp"

namespace termoracle::hash {
    using u8 = termoracle::core::u8;
    using u64 = termoracle::core::u64;

    inline constexpr char kHashAlgo[] = "sha256";
    inline constexpr char kHashPrefix[] = "sha256:";
    inline constexpr size_t kHashHexChars = 64;

    [[nodiscard]] constexpr bool hash_is_zero(const termoracle::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    termoracle::core::Status hash_compute(termoracle::core::BufferView data, termoracle::core::Hash256* out) noexcept;

    [[nodiscard]] std::string hash_to_hex(const termoracle::core::Hash256& h);

    // Lowercase hex SHA-256 of data.
    termoracle::core::Status sha256_hex(termoracle::core::BufferView data, std::string* out);

    // "sha256:<hex>" form used in trace events.
    [[nodiscard]] std::string prefixed(std::string_view hex);

    // Append-only fold over output chunks:
    //   chain' = hex(SHA256(chain || hex(SHA256(chunk))))
    // starting from 64 '0' characters. Any change in chunk content or order
    // changes every later value.
    class ChecksumChain {
    public:
        ChecksumChain();

        termoracle::core::Status fold(termoracle::core::BufferView chunk);
        void reset();

        [[nodiscard]] const std::string& hex() const noexcept { return value_; }
        [[nodiscard]] u64 chunks() const noexcept { return chunks_; }

    private:
        std::string value_;
        u64 chunks_{0};
    };

} // namespace termoracle::hash
