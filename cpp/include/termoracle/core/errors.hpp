#pragma once
#include <cstdint>
#include <type_traits>

namespace termoracle::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        Conflict,
        Busy,
        Corrupt,
        Io,
        Network,
        Closed,
        Timeout,
        Unsupported,
        Unavailable,
        Cancelled,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Hash,
        Schema,
        Registry,
        Trace,
        Session,
        Net,
        Cli,
        External,
    };

    // aux carries errno for Io/Network failures, 0 otherwise.
    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    [[nodiscard]] const char* status_code_name(StatusCode code) noexcept;
    [[nodiscard]] const char* status_domain_name(StatusDomain domain) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace termoracle::core
