#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lanpaste/core/errors.hpp"
#include "lanpaste/core/types.hpp"
#include "lanpaste/service/app.hpp"

namespace lanpaste::bindings::http {
    using u16 = lanpaste::core::u16;

    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    struct HttpRequest {
        std::string method;
        std::string path;                               // no query string
        std::map<std::string, std::string> query;       // already percent-decoded
        HeaderList headers;
        std::string body;
        std::optional<std::string> client_ip;
    };

    struct HttpResponse {
        u16 status{200};
        std::string content_type;
        HeaderList headers;                             // in addition to Content-Type
        std::string body;
    };

    // Case-insensitive lookup; first match wins.
    [[nodiscard]] std::optional<std::string_view> find_header(const HeaderList& headers, std::string_view name) noexcept;

    std::string html_escape(std::string_view text);

    // Routes one request against the daemon state. *out is always filled,
    // errors included (JSON {"error", "message"}); the return value is the
    // status of the operation behind the route.
    lanpaste::core::Status handle_http_request(lanpaste::service::AppState& state,
        const HttpRequest& req,
        HttpResponse* out) noexcept;

} // namespace lanpaste::bindings::http
