#include "lanpaste/core/errors.hpp"

namespace lanpaste::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::Unauthorized: return "Unauthorized";
            case StatusCode::PermissionDenied: return "PermissionDenied";
            case StatusCode::Conflict: return "Conflict";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::TooLarge: return "TooLarge";
            case StatusCode::RateLimited: return "RateLimited";
            case StatusCode::Io: return "Io";
            case StatusCode::Internal: return "Internal";
            case StatusCode::Unavailable: return "Unavailable";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Storage: return "Storage";
            case StatusDomain::Vcs: return "Vcs";
            case StatusDomain::Ledger: return "Ledger";
            case StatusDomain::Security: return "Security";
            case StatusDomain::Http: return "Http";
            case StatusDomain::Cli: return "Cli";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }

    const char* status_kind(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "ok";
            case StatusCode::Invalid: return "bad_request";
            case StatusCode::Unauthorized: return "unauthorized";
            case StatusCode::PermissionDenied: return "forbidden";
            case StatusCode::Conflict: return "conflict";
            case StatusCode::NotFound: return "not_found";
            case StatusCode::TooLarge: return "too_large";
            case StatusCode::RateLimited: return "too_many_requests";
            case StatusCode::Unavailable: return "service_unavailable";
            case StatusCode::Unknown:
            case StatusCode::Io:
            case StatusCode::Internal:
                return "internal";
        }
        return "internal";
    }

    const char* status_message(Status s) noexcept {
        switch (s.code) {
            case StatusCode::Ok:
                return "ok";
            case StatusCode::Invalid:
                return "invalid request";
            case StatusCode::Unauthorized:
                if (s.aux == kAuthMissingCredential) {
                    return "missing credentials";
                }
                return "missing or invalid credentials";
            case StatusCode::PermissionDenied:
                if (s.aux == kDeniedScope) {
                    return "api key lacks required scope";
                }
                if (s.aux == kDeniedClientIp) {
                    return "client IP not in allowlist";
                }
                return "forbidden";
            case StatusCode::Conflict:
                if (s.aux == kConflictAlreadyRunning) {
                    return "already running";
                }
                if (s.aux == kConflictIdempotencyMismatch) {
                    return "idempotency key reuse with different payload";
                }
                return "conflict";
            case StatusCode::NotFound:
                return "paste not found";
            case StatusCode::TooLarge:
                return "request body exceeds max-bytes";
            case StatusCode::RateLimited:
                return "api key rate limit exceeded";
            case StatusCode::Unavailable:
                return "service unavailable";
            case StatusCode::Io:
                return "filesystem error";
            case StatusCode::Unknown:
            case StatusCode::Internal:
                return "internal error";
        }
        return "internal error";
    }

    u16 http_status_for(Status s) noexcept {
        switch (s.code) {
            case StatusCode::Ok: return 200;
            case StatusCode::Invalid: return 400;
            case StatusCode::Unauthorized: return 401;
            case StatusCode::PermissionDenied: return 403;
            case StatusCode::NotFound: return 404;
            case StatusCode::Conflict: return 409;
            case StatusCode::TooLarge: return 413;
            case StatusCode::RateLimited: return 429;
            case StatusCode::Unavailable: return 503;
            case StatusCode::Unknown:
            case StatusCode::Io:
            case StatusCode::Internal:
                return 500;
        }
        return 500;
    }
} // namespace lanpaste::core
