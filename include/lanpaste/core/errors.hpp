#pragma once
#include <cstdint>
#include <type_traits>

namespace lanpaste::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        Unauthorized,
        PermissionDenied,
        Conflict,
        NotFound,
        TooLarge,
        RateLimited,
        Io,
        Internal,
        Unavailable,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Storage,
        Vcs,
        Ledger,
        Security,
        Http,
        Cli,
        External,
    };

    // aux reason codes; Io statuses carry errno in aux instead.
    inline constexpr u32 kConflictAlreadyRunning = 1;
    inline constexpr u32 kConflictIdempotencyMismatch = 2;

    inline constexpr u32 kAuthMissingCredential = 1;
    inline constexpr u32 kAuthBadCredential = 2;

    inline constexpr u32 kDeniedScope = 1;
    inline constexpr u32 kDeniedClientIp = 2;

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

    // snake_case kind used in JSON error bodies ("not_found", "too_large", ...)
    [[nodiscard]] const char* status_kind(StatusCode code) noexcept;

    // Human readable message for a status, including aux reason codes.
    [[nodiscard]] const char* status_message(Status s) noexcept;

    [[nodiscard]] u16 http_status_for(Status s) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace lanpaste::core
