#include "lanpaste/security/access.hpp"

#include <charconv>
#include <cstring>
#include <unordered_set>

#include <arpa/inet.h>
#include <nlohmann/json.hpp>
#include <sodium.h>

#include "lanpaste/core/clock.hpp"
#include "lanpaste/core/log.hpp"
#include "lanpaste/storage/files.hpp"

namespace lanpaste::security {
    using lanpaste::core::is_ok;
    using lanpaste::core::make_status;
    using lanpaste::core::ok_status;
    using lanpaste::core::Status;
    using lanpaste::core::StatusCode;
    using lanpaste::core::StatusDomain;
    using json = nlohmann::json;

    namespace {
        struct ParsedIp {
            std::array<u8, 16> addr{};
            bool v6{false};
        };

        [[nodiscard]] bool parse_ip(std::string_view text, ParsedIp* out) noexcept {
            char buf[INET6_ADDRSTRLEN + 1];
            if (text.empty() || text.size() >= sizeof(buf)) {
                return false;
            }
            std::memcpy(buf, text.data(), text.size());
            buf[text.size()] = '\0';

            ParsedIp ip{};
            if (::inet_pton(AF_INET, buf, ip.addr.data()) == 1) {
                ip.v6 = false;
                *out = ip;
                return true;
            }
            if (::inet_pton(AF_INET6, buf, ip.addr.data()) == 1) {
                ip.v6 = true;
                *out = ip;
                return true;
            }
            return false;
        }

        [[nodiscard]] bool is_v4_mapped(const ParsedIp& ip) noexcept {
            if (!ip.v6) {
                return false;
            }
            for (size_t i = 0; i < 10; ++i) {
                if (ip.addr[i] != 0) {
                    return false;
                }
            }
            return ip.addr[10] == 0xff && ip.addr[11] == 0xff;
        }

        [[nodiscard]] bool prefix_match(const u8* a, const u8* b, u32 prefix) noexcept {
            const u32 full = prefix / 8;
            if (full > 0 && std::memcmp(a, b, full) != 0) {
                return false;
            }
            const u32 rem = prefix % 8;
            if (rem == 0) {
                return true;
            }
            const u8 mask = static_cast<u8>(0xffu << (8 - rem));
            return (a[full] & mask) == (b[full] & mask);
        }

        [[nodiscard]] bool has_scope(const ApiKeyEntry& entry, Scope scope) noexcept {
            const std::string_view needed = scope_name(scope);
            for (const auto& s : entry.scopes) {
                if (s == "*" || s == needed) {
                    return true;
                }
            }
            return false;
        }

        [[nodiscard]] bool is_blank(std::string_view s) noexcept {
            for (char c : s) {
                if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
                    return false;
                }
            }
            return true;
        }

        Status invalid_keys_file(const char* reason, const std::optional<std::string>& name) {
            LANPASTE_LOG_ERROR("rejected api keys file", {
                lanpaste::core::str_field("reason", reason),
                lanpaste::core::str_field("key_name", name.value_or("unnamed")),
            });
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
    } // namespace

    bool secure_equal(std::string_view a, std::string_view b) noexcept {
        if (a.size() != b.size()) {
            // keep the work proportional to the probe, not the secret
            (void)sodium_memcmp(a.data(), a.data(), a.size());
            return false;
        }
        if (a.empty()) {
            return true;
        }
        return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
    }

    Status verify_token(std::optional<std::string_view> expected, std::optional<std::string_view> provided) noexcept {
        if (!expected.has_value()) {
            return ok_status();
        }
        if (!provided.has_value()) {
            return make_status(StatusDomain::Security, StatusCode::Unauthorized, lanpaste::core::kAuthMissingCredential);
        }
        if (!secure_equal(*expected, *provided)) {
            return make_status(StatusDomain::Security, StatusCode::Unauthorized, lanpaste::core::kAuthBadCredential);
        }
        return ok_status();
    }

    Status parse_cidr(std::string_view text, CidrBlock* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }

        std::string_view addr_part = text;
        std::string_view prefix_part;
        const size_t slash = text.find('/');
        if (slash != std::string_view::npos) {
            addr_part = text.substr(0, slash);
            prefix_part = text.substr(slash + 1);
        }

        ParsedIp ip{};
        if (!parse_ip(addr_part, &ip)) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        const u32 max_prefix = ip.v6 ? 128u : 32u;

        u32 prefix = max_prefix;
        if (slash != std::string_view::npos) {
            const char* first = prefix_part.data();
            const char* last = first + prefix_part.size();
            const auto r = std::from_chars(first, last, prefix, 10);
            if (prefix_part.empty() || r.ec != std::errc() || r.ptr != last || prefix > max_prefix) {
                return make_status(StatusDomain::Security, StatusCode::Invalid);
            }
        }

        CidrBlock block{};
        block.addr = ip.addr;
        block.prefix = static_cast<u8>(prefix);
        block.v6 = ip.v6;
        *out = block;
        return ok_status();
    }

    bool cidr_contains(const CidrBlock& block, std::string_view ip_text) noexcept {
        ParsedIp ip{};
        if (!parse_ip(ip_text, &ip)) {
            return false;
        }
        if (!block.v6 && is_v4_mapped(ip)) {
            return prefix_match(block.addr.data(), ip.addr.data() + 12, block.prefix);
        }
        if (block.v6 != ip.v6) {
            return false;
        }
        return prefix_match(block.addr.data(), ip.addr.data(), block.prefix);
    }

    Status check_cidr(const std::vector<CidrBlock>& allow, std::optional<std::string_view> client_ip) noexcept {
        if (allow.empty()) {
            return ok_status();
        }
        if (client_ip.has_value()) {
            for (const auto& block : allow) {
                if (cidr_contains(block, *client_ip)) {
                    return ok_status();
                }
            }
        }
        return make_status(StatusDomain::Security, StatusCode::PermissionDenied, lanpaste::core::kDeniedClientIp);
    }

    std::string rate_identity(const ApiKeyEntry& entry) {
        if (entry.name.has_value()) {
            return *entry.name;
        }
        return "key:" + entry.key.substr(0, 8);
    }

    Status ApiKeyStore::load_file(const std::filesystem::path& path) noexcept {
        std::string text;
        const Status s = lanpaste::storage::read_file(path, &text);
        if (!is_ok(s)) {
            return s;
        }
        return load_json(text);
    }

    Status ApiKeyStore::load_json(std::string_view text) noexcept {
        const json j = json::parse(text.begin(), text.end(), nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }

        std::vector<ApiKeyEntry> entries;
        try {
            for (const auto& item : j.at("keys")) {
                ApiKeyEntry e;
                if (item.contains("name") && !item.at("name").is_null()) {
                    e.name = item.at("name").get<std::string>();
                }
                e.key = item.at("key").get<std::string>();
                if (item.contains("scopes")) {
                    e.scopes = item.at("scopes").get<std::vector<std::string>>();
                }
                if (item.contains("max_requests_per_minute") && !item.at("max_requests_per_minute").is_null()) {
                    e.max_requests_per_minute = item.at("max_requests_per_minute").get<u32>();
                }
                entries.push_back(std::move(e));
            }
        } catch (const json::exception&) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        return set_entries(std::move(entries));
    }

    Status ApiKeyStore::set_entries(std::vector<ApiKeyEntry> entries) noexcept {
        std::unordered_set<std::string> seen;
        for (const auto& e : entries) {
            if (is_blank(e.key)) {
                return invalid_keys_file("empty key", e.name);
            }
            if (e.scopes.empty()) {
                return invalid_keys_file("no scopes", e.name);
            }
            if (e.max_requests_per_minute.has_value() && *e.max_requests_per_minute == 0) {
                return invalid_keys_file("max_requests_per_minute is 0", e.name);
            }
            if (!seen.insert(e.key).second) {
                return invalid_keys_file("duplicate key", e.name);
            }
        }

        std::lock_guard<std::mutex> lock(mu_);
        entries_ = std::move(entries);
        windows_.clear();
        return ok_status();
    }

    const ApiKeyEntry* ApiKeyStore::resolve(std::string_view provided) const noexcept {
        // every entry is compared so the match position does not leak
        const ApiKeyEntry* match = nullptr;
        for (const auto& e : entries_) {
            if (secure_equal(e.key, provided) && match == nullptr) {
                match = &e;
            }
        }
        return match;
    }

    Status ApiKeyStore::enforce_rate_limit(const ApiKeyEntry& entry, i64 now_unix) noexcept {
        if (!entry.max_requests_per_minute.has_value()) {
            return ok_status();
        }
        const u32 limit = *entry.max_requests_per_minute;
        const i64 minute = now_unix / 60;

        std::lock_guard<std::mutex> lock(mu_);
        RateWindow& w = windows_.try_emplace(rate_identity(entry), RateWindow{minute, 0}).first->second;
        if (w.minute_window != minute) {
            w.minute_window = minute;
            w.count = 0;
        }
        if (w.count >= limit) {
            return make_status(StatusDomain::Security, StatusCode::RateLimited);
        }
        ++w.count;
        return ok_status();
    }

    Status ApiKeyStore::authorize(std::optional<std::string_view> provided, Scope scope, i64 now_unix) noexcept {
        if (!enabled()) {
            return ok_status();
        }
        if (!provided.has_value() || provided->empty()) {
            return make_status(StatusDomain::Security, StatusCode::Unauthorized, lanpaste::core::kAuthMissingCredential);
        }

        const ApiKeyEntry* entry = resolve(*provided);
        if (entry == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Unauthorized, lanpaste::core::kAuthBadCredential);
        }
        if (!has_scope(*entry, scope)) {
            return make_status(StatusDomain::Security, StatusCode::PermissionDenied, lanpaste::core::kDeniedScope);
        }
        return enforce_rate_limit(*entry, now_unix);
    }

    Status ApiKeyStore::authorize(std::optional<std::string_view> provided, Scope scope) noexcept {
        return authorize(provided, scope, lanpaste::core::now_unix_seconds());
    }

} // namespace lanpaste::security
