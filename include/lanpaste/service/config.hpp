#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lanpaste/core/errors.hpp"
#include "lanpaste/core/types.hpp"
#include "lanpaste/security/access.hpp"

namespace lanpaste::service {
    using u16 = lanpaste::core::u16;
    using u64 = lanpaste::core::u64;

    inline constexpr u64 kDefaultMaxBytes = 1024 * 1024;

    struct ServeConfig {
        std::filesystem::path dir;
        std::string bind_host{"0.0.0.0"};
        u16 bind_port{8090};
        std::optional<std::string> token;
        std::optional<std::filesystem::path> api_keys_file;
        u64 max_bytes{kDefaultMaxBytes};
        lanpaste::core::PushMode push{lanpaste::core::PushMode::Off};
        std::string remote{"origin"};
        std::vector<lanpaste::security::CidrBlock> allow_cidr;
        std::string git_author_name{"LAN Paste"};
        std::string git_author_email{"paste@lan"};
        bool trust_forwarded_for{false};
        std::string log_level{"info"};
        std::string git_bin{"git"};
    };

    struct AppPaths {
        std::filesystem::path base;
        std::filesystem::path repo;         // base/repo
        std::filesystem::path run;          // base/run
        std::filesystem::path tmp;          // base/tmp
        std::filesystem::path git_lock;     // run/git.lock
        std::filesystem::path daemon_lock;  // run/daemon.lock
        std::filesystem::path idempotency;  // run/idempotency
    };

    AppPaths app_paths(const std::filesystem::path& base);

    // "off" | "best_effort" | "strict"
    lanpaste::core::Status parse_push_mode(std::string_view text, lanpaste::core::PushMode* out) noexcept;

    // "host:port" or "[v6]:port"; port 0 is allowed (ephemeral).
    lanpaste::core::Status parse_bind(std::string_view text, std::string* host, u16* port) noexcept;

    // Invalid for an empty dir, both token and api keys file, or a push mode
    // other than off without a remote.
    lanpaste::core::Status validate_config(const ServeConfig& cfg) noexcept;

} // namespace lanpaste::service
