#pragma once

#include <string>
#include <string_view>
#include <type_traits>

#include "termoracle/core/types.hpp"

namespace termoracle::core {

    struct BufferView {
        const u8* data{nullptr};
        u64 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u64 len{0};
    };

    [[nodiscard]] inline BufferView as_view(std::string_view s) noexcept {
        return BufferView{reinterpret_cast<const u8*>(s.data()), static_cast<u64>(s.size())};
    }

    [[nodiscard]] inline BufferView as_view(const Bytes& b) noexcept {
        return BufferView{b.data(), static_cast<u64>(b.size())};
    }

    [[nodiscard]] inline std::string_view as_chars(BufferView v) noexcept {
        return std::string_view(reinterpret_cast<const char*>(v.data), static_cast<size_t>(v.len));
    }

    [[nodiscard]] constexpr bool buffer_ok(BufferView b) noexcept {
        return (b.len == 0) || (b.data != nullptr);
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);
} // namespace termoracle::core
