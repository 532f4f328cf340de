#include "lanpaste/bindings/http.hpp"

#include <charconv>

#include <nlohmann/json.hpp>

#include "lanpaste/core/log.hpp"
#include "lanpaste/index/reader.hpp"
#include "lanpaste/storage/codec.hpp"

namespace lanpaste::bindings::http {

using namespace lanpaste::core;
using lanpaste::security::Scope;
using lanpaste::service::AppState;
using json = nlohmann::json;

namespace {

constexpr const char* kJson = "application/json";
constexpr const char* kHtml = "text/html; charset=utf-8";
constexpr const char* kText = "text/plain; charset=utf-8";
constexpr u32 kDashboardRows = 20;

std::string dump(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<std::string> header_string(const HttpRequest& req, std::string_view name) {
    const auto v = find_header(req.headers, name);
    if (!v.has_value()) {
        return std::nullopt;
    }
    return std::string(*v);
}

std::optional<std::string> query_value(const HttpRequest& req, const char* key) {
    const auto it = req.query.find(key);
    if (it == req.query.end()) {
        return std::nullopt;
    }
    return it->second;
}

Status fail(Status s, HttpResponse* out, const char* message = nullptr) {
    json body = json::object();
    body["error"] = status_kind(s.code);
    body["message"] = message != nullptr ? message : status_message(s);
    out->status = http_status_for(s);
    out->content_type = kJson;
    out->headers.clear();
    out->body = dump(body);
    return s;
}

void respond_json(u16 status, const json& body, HttpResponse* out) {
    out->status = status;
    out->content_type = kJson;
    out->body = dump(body);
}

void respond_html(std::string body, HttpResponse* out) {
    out->status = 200;
    out->content_type = kHtml;
    out->body = std::move(body);
}

Status authorize(AppState& state, const HttpRequest& req, Scope scope) {
    const Status s = state.api_keys.authorize(find_header(req.headers, lanpaste::security::kApiKeyHeader), scope);
    if (!is_ok(s)) {
        LANPASTE_LOG_WARN("request rejected", {
            str_field("path", req.path),
            str_field("scope", lanpaste::security::scope_name(scope)),
            status_field(s),
        });
    }
    return s;
}

std::string render_page(std::string_view title, std::string_view body_html) {
    std::string out = "<!doctype html><html><head><meta charset=\"utf-8\"><title>";
    out += html_escape(title);
    out += "</title></head><body>";
    out += body_html;
    out += "</body></html>";
    return out;
}

std::string render_dashboard(const std::vector<PasteMeta>& metas) {
    std::string body = "<h1>LAN Paste</h1><table><thead><tr><th>id</th><th>created</th><th>tag</th>"
                       "<th>size</th><th>type</th><th>commit</th></tr></thead><tbody>";
    for (const auto& m : metas) {
        body += "<tr><td><a href=\"/p/" + html_escape(m.id) + "\">" + html_escape(m.id) + "</a></td>";
        body += "<td>" + html_escape(m.created_at) + "</td>";
        body += "<td>" + html_escape(m.tag.value_or("")) + "</td>";
        body += "<td>" + std::to_string(m.size) + "</td>";
        body += "<td>" + html_escape(m.content_type) + "</td>";
        body += "<td><code>" + html_escape(m.commit) + "</code></td></tr>";
    }
    body += "</tbody></table>";
    return render_page("LAN Paste", body);
}

// Matches "/api/v1/p/{id}" and "/api/v1/p/{id}/raw".
bool split_paste_path(std::string_view path, std::string_view* id, bool* raw) {
    constexpr std::string_view kPrefix = "/api/v1/p/";
    if (path.substr(0, kPrefix.size()) != kPrefix) {
        return false;
    }
    std::string_view rest = path.substr(kPrefix.size());
    *raw = false;
    const size_t slash = rest.find('/');
    if (slash != std::string_view::npos) {
        if (rest.substr(slash) != "/raw") {
            return false;
        }
        *raw = true;
        rest = rest.substr(0, slash);
    }
    if (rest.empty()) {
        return false;
    }
    *id = rest;
    return true;
}

Status handle_dashboard(AppState& state, HttpResponse* out) {
    std::vector<PasteMeta> metas;
    const Status s = lanpaste::index::read_recent(state.git, kDashboardRows, std::nullopt, &metas);
    if (!is_ok(s)) {
        return fail(s, out);
    }
    respond_html(render_dashboard(metas), out);
    return ok_status();
}

Status handle_api_index(AppState& state, const HttpRequest& req, HttpResponse* out) {
    const Status s = authorize(state, req, Scope::ApiIndex);
    if (!is_ok(s)) {
        return fail(s, out);
    }
    json body = json::object();
    body["name"] = "lanpaste";
    body["version"] = "v1";
    body["endpoints"] = json::array({
        "/api/v1/paste (POST)",
        "/api/v1/p/{id} (GET)",
        "/api/v1/p/{id}/raw (GET)",
        "/api/v1/recent?n=50&tag=... (GET)",
    });
    respond_json(200, body, out);
    return ok_status();
}

Status handle_create(AppState& state, const HttpRequest& req, HttpResponse* out) {
    lanpaste::service::CreateRequest create;
    create.input.name = query_value(req, "name");
    create.input.msg = query_value(req, "msg");
    create.input.tag = query_value(req, "tag");
    create.input.content_type = header_string(req, "Content-Type");
    create.input.user_agent = header_string(req, "User-Agent");
    create.input.client_ip = req.client_ip;
    create.input.bytes = req.body;
    create.api_key = header_string(req, lanpaste::security::kApiKeyHeader);
    create.token = header_string(req, lanpaste::security::kTokenHeader);

    if (const auto key = find_header(req.headers, "Idempotency-Key")) {
        std::string_view k = *key;
        while (!k.empty() && (k.front() == ' ' || k.front() == '\t')) k.remove_prefix(1);
        while (!k.empty() && (k.back() == ' ' || k.back() == '\t')) k.remove_suffix(1);
        if (!k.empty()) {
            create.idempotency_key = std::string(k);
        }
    }

    lanpaste::service::CreateOutcome outcome;
    const Status s = lanpaste::service::create_paste(state, create, &outcome);
    if (!is_ok(s)) {
        return fail(s, out);
    }
    respond_json(outcome.replayed ? 200 : 201, lanpaste::storage::response_to_json(outcome.response), out);
    return ok_status();
}

Status handle_paste(AppState& state, const HttpRequest& req, std::string_view id, bool raw, HttpResponse* out) {
    Status s = authorize(state, req, Scope::PasteRead);
    if (!is_ok(s)) {
        return fail(s, out);
    }

    PasteMeta meta;
    s = lanpaste::index::read_meta(state.git, id, &meta);
    if (!is_ok(s)) {
        return fail(s, out);
    }
    if (!raw) {
        respond_json(200, lanpaste::storage::meta_to_json(meta), out);
        return ok_status();
    }

    std::string bytes;
    s = lanpaste::index::read_paste(state.paths.repo, meta, &bytes);
    if (!is_ok(s)) {
        return fail(s, out);
    }
    out->status = 200;
    out->content_type = "application/octet-stream";
    out->headers = {
        {"Content-Disposition", "attachment"},
        {"X-Content-Type-Options", "nosniff"},
    };
    out->body = std::move(bytes);
    return ok_status();
}

Status handle_recent(AppState& state, const HttpRequest& req, HttpResponse* out) {
    Status s = authorize(state, req, Scope::RecentRead);
    if (!is_ok(s)) {
        return fail(s, out);
    }

    u32 n = lanpaste::index::kDefaultRecent;
    if (const auto raw_n = query_value(req, "n")) {
        const char* first = raw_n->data();
        const char* last = first + raw_n->size();
        const auto r = std::from_chars(first, last, n, 10);
        if (raw_n->empty() || r.ec != std::errc() || r.ptr != last) {
            return fail(make_status(StatusDomain::Http, StatusCode::Invalid), out, "n must be a non-negative integer");
        }
    }
    if (n > lanpaste::index::kMaxRecent) {
        n = lanpaste::index::kMaxRecent;
    }

    const std::optional<std::string> tag = query_value(req, "tag");
    std::vector<PasteMeta> metas;
    s = lanpaste::index::read_recent(state.git, n, tag.has_value() ? std::optional<std::string_view>(*tag) : std::nullopt, &metas);
    if (!is_ok(s)) {
        return fail(s, out);
    }

    json body = json::array();
    for (const auto& m : metas) {
        body.push_back(lanpaste::storage::recent_item_to_json(m));
    }
    respond_json(200, body, out);
    return ok_status();
}

Status handle_view(AppState& state, std::string_view id, HttpResponse* out) {
    PasteMeta meta;
    Status s = lanpaste::index::read_meta(state.git, id, &meta);
    if (!is_ok(s)) {
        return fail(s, out);
    }
    std::string bytes;
    s = lanpaste::index::read_paste(state.paths.repo, meta, &bytes);
    if (!is_ok(s)) {
        return fail(s, out);
    }
    respond_html(render_page(meta.id, "<pre>" + html_escape(bytes) + "</pre>"), out);
    return ok_status();
}

Status handle_readyz(AppState& state, HttpResponse* out) {
    const Status s = lanpaste::service::ready(state);
    if (!is_ok(s)) {
        return fail(s, out, "repository not ready");
    }
    out->status = 200;
    out->content_type = kText;
    out->body = "ok";
    return ok_status();
}

} // namespace

std::optional<std::string_view> find_header(const HeaderList& headers, std::string_view name) noexcept {
    for (const auto& [key, value] : headers) {
        if (key.size() != name.size()) {
            continue;
        }
        bool same = true;
        for (size_t i = 0; i < key.size() && same; ++i) {
            const char a = (key[i] >= 'A' && key[i] <= 'Z') ? static_cast<char>(key[i] + 32) : key[i];
            const char b = (name[i] >= 'A' && name[i] <= 'Z') ? static_cast<char>(name[i] + 32) : name[i];
            same = (a == b);
        }
        if (same) {
            return std::string_view(value);
        }
    }
    return std::nullopt;
}

std::string html_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

// Main HTTP request handler
Status handle_http_request(AppState& state, const HttpRequest& req, HttpResponse* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Http, StatusCode::Invalid);
    }
    *out = HttpResponse{};

    try {
        const std::string_view path = req.path;
        const bool get = req.method == "GET" || req.method == "HEAD";

        if (path == "/healthz") {
            if (!get) {
                return fail(make_status(StatusDomain::Http, StatusCode::Invalid), out, "method not allowed");
            }
            out->content_type = kText;
            out->body = "ok";
            return ok_status();
        }
        if (path == "/readyz" && get) {
            return handle_readyz(state, out);
        }
        if ((path == "/" || path == "/dashboard") && get) {
            return handle_dashboard(state, out);
        }
        if (path == "/api" && get) {
            return handle_api_index(state, req, out);
        }
        if (path == "/api/v1/paste") {
            if (req.method != "POST") {
                return fail(make_status(StatusDomain::Http, StatusCode::Invalid), out, "method not allowed");
            }
            return handle_create(state, req, out);
        }
        if (path == "/api/v1/recent" && get) {
            return handle_recent(state, req, out);
        }

        std::string_view id;
        bool raw = false;
        if (get && split_paste_path(path, &id, &raw)) {
            return handle_paste(state, req, id, raw, out);
        }
        if (get && path.substr(0, 3) == "/p/" && path.size() > 3 && path.find('/', 3) == std::string_view::npos) {
            return handle_view(state, path.substr(3), out);
        }

        return fail(make_status(StatusDomain::Http, StatusCode::NotFound), out, "route not found");
    } catch (const std::exception& e) {
        LANPASTE_LOG_ERROR("request handler failed", {str_field("path", req.path), str_field("what", e.what())});
        return fail(make_status(StatusDomain::Http, StatusCode::Internal), out);
    }
}

} // namespace lanpaste::bindings::http
