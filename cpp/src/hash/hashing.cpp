#include "termoracle/hash/hashing.hpp"

#include <cstddef>
#include <utility>

#include <openssl/evp.h>

#include "termoracle/core/encoding.hpp"

namespace termoracle::hash {
    namespace {
        using termoracle::core::BufferView;
        using termoracle::core::Hash256;
        using termoracle::core::Status;
        using termoracle::core::StatusCode;
        using termoracle::core::StatusDomain;
        using termoracle::core::make_status;

        // Digest of the concatenation of parts.
        Status digest_parts(const BufferView* parts, size_t count, Hash256* out) noexcept {
            EVP_MD_CTX* ctx = EVP_MD_CTX_new();
            if (!ctx) {
                return make_status(StatusDomain::Hash, StatusCode::Unavailable);
            }

            int ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
            for (size_t i = 0; ok == 1 && i < count; ++i) {
                if (parts[i].len > 0) {
                    ok = EVP_DigestUpdate(ctx, parts[i].data, static_cast<size_t>(parts[i].len));
                }
            }
            unsigned int written = 0;
            if (ok == 1) {
                ok = EVP_DigestFinal_ex(ctx, out->b.data(), &written);
            }
            EVP_MD_CTX_free(ctx);

            if (ok != 1 || written != out->b.size()) {
                return make_status(StatusDomain::Hash, StatusCode::Unavailable);
            }
            return termoracle::core::ok_status();
        }
    } // namespace

    Status hash_compute(BufferView data, Hash256* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Hash, StatusCode::Invalid);
        }
        if (!termoracle::core::buffer_ok(data)) {
            return make_status(StatusDomain::Hash, StatusCode::Invalid);
        }
        return digest_parts(&data, 1, out);
    }

    std::string hash_to_hex(const Hash256& h) {
        return termoracle::core::hex_encode(BufferView{h.b.data(), h.b.size()});
    }

    Status sha256_hex(BufferView data, std::string* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Hash, StatusCode::Invalid);
        }
        Hash256 h{};
        const Status s = hash_compute(data, &h);
        if (!termoracle::core::is_ok(s)) {
            return s;
        }
        *out = hash_to_hex(h);
        return termoracle::core::ok_status();
    }

    std::string prefixed(std::string_view hex) {
        std::string out(kHashPrefix);
        out.append(hex);
        return out;
    }

    ChecksumChain::ChecksumChain() : value_(kHashHexChars, '0') {}

    Status ChecksumChain::fold(BufferView chunk) {
        std::string chunk_hex;
        Status s = sha256_hex(chunk, &chunk_hex);
        if (!termoracle::core::is_ok(s)) {
            return s;
        }

        const BufferView parts[2] = {
            termoracle::core::as_view(value_),
            termoracle::core::as_view(chunk_hex),
        };
        Hash256 next{};
        s = digest_parts(parts, 2, &next);
        if (!termoracle::core::is_ok(s)) {
            return s;
        }
        value_ = hash_to_hex(next);
        ++chunks_;
        return termoracle::core::ok_status();
    }

    void ChecksumChain::reset() {
        value_.assign(kHashHexChars, '0');
        chunks_ = 0;
    }
} // namespace termoracle::hash
