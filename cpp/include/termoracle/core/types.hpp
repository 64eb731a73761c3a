#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace termoracle::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    using Bytes = std::vector<u8>;

    // SHA-256 digest.
    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    // Terminal geometry in cells.
    struct Geometry {
        u32 cols{0};
        u32 rows{0};
        friend constexpr bool operator==(Geometry, Geometry) noexcept = default;
    };

    [[nodiscard]] constexpr bool geometry_valid(Geometry g) noexcept {
        return g.cols > 0 && g.rows > 0;
    }

    static_assert(std::is_trivially_copyable_v<Hash256>);
    static_assert(std::is_trivially_copyable_v<Geometry>);
    static_assert(std::is_standard_layout_v<Geometry>);

} // namespace termoracle::core
