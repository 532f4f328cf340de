#include "lanpaste/service/config.hpp"

#include <charconv>

namespace lanpaste::service {
    using lanpaste::core::make_status;
    using lanpaste::core::ok_status;
    using lanpaste::core::PushMode;
    using lanpaste::core::Status;
    using lanpaste::core::StatusCode;
    using lanpaste::core::StatusDomain;

    AppPaths app_paths(const std::filesystem::path& base) {
        AppPaths p;
        p.base = base;
        p.repo = base / "repo";
        p.run = base / "run";
        p.tmp = base / "tmp";
        p.git_lock = p.run / "git.lock";
        p.daemon_lock = p.run / "daemon.lock";
        p.idempotency = p.run / "idempotency";
        return p;
    }

    Status parse_push_mode(std::string_view text, PushMode* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        for (PushMode m : {PushMode::Off, PushMode::BestEffort, PushMode::Strict}) {
            if (text == lanpaste::core::push_mode_label(m)) {
                *out = m;
                return ok_status();
            }
        }
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }

    Status parse_bind(std::string_view text, std::string* host, u16* port) noexcept {
        if (host == nullptr || port == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        const size_t colon = text.rfind(':');
        if (colon == std::string_view::npos || colon == 0 || colon + 1 >= text.size()) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        std::string_view h = text.substr(0, colon);
        if (h.front() == '[') {
            if (h.size() < 3 || h.back() != ']') {
                return make_status(StatusDomain::Core, StatusCode::Invalid);
            }
            h = h.substr(1, h.size() - 2);
        } else if (h.find(':') != std::string_view::npos) {
            // bare IPv6 needs brackets
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        const std::string_view p = text.substr(colon + 1);
        u16 v = 0;
        const auto r = std::from_chars(p.data(), p.data() + p.size(), v, 10);
        if (r.ec != std::errc() || r.ptr != p.data() + p.size()) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        *host = std::string(h);
        *port = v;
        return ok_status();
    }

    Status validate_config(const ServeConfig& cfg) noexcept {
        if (cfg.dir.empty()) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        if (cfg.token.has_value() && cfg.api_keys_file.has_value()) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        if (cfg.push != PushMode::Off && cfg.remote.empty()) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        if (cfg.git_bin.empty()) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        return ok_status();
    }

} // namespace lanpaste::service
