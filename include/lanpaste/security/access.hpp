#pragma once

#include <array>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "lanpaste/core/errors.hpp"
#include "lanpaste/core/types.hpp"

namespace lanpaste::security {
    using u8 = lanpaste::core::u8;
    using u32 = lanpaste::core::u32;
    using i64 = lanpaste::core::i64;

    inline constexpr const char* kApiKeyHeader = "X-API-Key";
    inline constexpr const char* kTokenHeader = "X-Paste-Token";

    enum class Scope : u8 {
        ApiIndex = 0,
        PasteCreate = 1,
        PasteRead = 2,
        RecentRead = 3,
    };

    [[nodiscard]] constexpr const char* scope_name(Scope s) noexcept {
        switch (s) {
            case Scope::ApiIndex: return "api:index";
            case Scope::PasteCreate: return "paste:create";
            case Scope::PasteRead: return "paste:read";
            case Scope::RecentRead: return "recent:read";
        }
        return "";
    }

    // Constant time for equal lengths; unequal lengths are never equal.
    [[nodiscard]] bool secure_equal(std::string_view a, std::string_view b) noexcept;

    // No expected token means the gate is open. Otherwise Unauthorized unless
    // provided matches.
    lanpaste::core::Status verify_token(std::optional<std::string_view> expected,
        std::optional<std::string_view> provided) noexcept;

    struct CidrBlock {
        std::array<u8, 16> addr{};      // network order; IPv4 uses the first 4 bytes
        u8 prefix{0};
        bool v6{false};
    };

    // "a.b.c.d/n", "x::y/n", or a bare address (full-length prefix).
    lanpaste::core::Status parse_cidr(std::string_view text, CidrBlock* out) noexcept;

    // IPv4-mapped IPv6 clients ("::ffff:a.b.c.d") match IPv4 blocks.
    [[nodiscard]] bool cidr_contains(const CidrBlock& block, std::string_view ip) noexcept;

    // Empty allow list admits everyone. Otherwise PermissionDenied
    // (aux kDeniedClientIp) for unknown or unlisted addresses.
    lanpaste::core::Status check_cidr(const std::vector<CidrBlock>& allow,
        std::optional<std::string_view> client_ip) noexcept;

    struct ApiKeyEntry {
        std::optional<std::string> name;
        std::string key;
        std::vector<std::string> scopes;                // "*" grants every scope
        std::optional<u32> max_requests_per_minute;
    };

    struct RateWindow {
        i64 minute_window{0};           // unix seconds / 60
        u32 count{0};
    };

    static_assert(std::is_trivially_copyable_v<CidrBlock>);
    static_assert(std::is_trivially_copyable_v<RateWindow>);

    // Scoped API keys plus their in-memory per-minute request windows.
    // Windows live for the process lifetime only.
    class ApiKeyStore {
    public:
        ApiKeyStore() = default;
        ApiKeyStore(const ApiKeyStore&) = delete;
        ApiKeyStore& operator=(const ApiKeyStore&) = delete;

        // {"keys":[{"name":?, "key":..., "scopes":[...], "max_requests_per_minute":?}]}
        // Invalid for a blank key, no scopes, a zero limit or a duplicate key.
        lanpaste::core::Status load_file(const std::filesystem::path& path) noexcept;
        lanpaste::core::Status load_json(std::string_view text) noexcept;
        lanpaste::core::Status set_entries(std::vector<ApiKeyEntry> entries) noexcept;

        // No keys configured means every request is admitted.
        [[nodiscard]] bool enabled() const noexcept { return !entries_.empty(); }

        // Unauthorized for a missing or unknown key, PermissionDenied
        // (aux kDeniedScope) when the key lacks scope, RateLimited when the
        // key's window for the current minute is full.
        lanpaste::core::Status authorize(std::optional<std::string_view> provided, Scope scope, i64 now_unix) noexcept;
        lanpaste::core::Status authorize(std::optional<std::string_view> provided, Scope scope) noexcept;

    private:
        [[nodiscard]] const ApiKeyEntry* resolve(std::string_view provided) const noexcept;
        lanpaste::core::Status enforce_rate_limit(const ApiKeyEntry& entry, i64 now_unix) noexcept;

        std::vector<ApiKeyEntry> entries_;
        std::mutex mu_;
        std::unordered_map<std::string, RateWindow> windows_;
    };

    // Rate window identity: the key's name, or "key:" + its first 8 chars.
    std::string rate_identity(const ApiKeyEntry& entry);

} // namespace lanpaste::security
