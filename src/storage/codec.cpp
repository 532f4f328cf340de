#include "lanpaste/storage/codec.hpp"

namespace lanpaste::storage {
    using lanpaste::core::make_status;
    using lanpaste::core::ok_status;
    using lanpaste::core::Status;
    using lanpaste::core::StatusCode;
    using lanpaste::core::StatusDomain;

    namespace {
        void put_optional(json& j, const char* key, const std::optional<std::string>& v) {
            if (v.has_value()) {
                j[key] = *v;
            }
        }

        void get_optional(const json& j, const char* key, std::optional<std::string>* out) {
            const auto it = j.find(key);
            if (it == j.end() || it->is_null()) {
                out->reset();
                return;
            }
            *out = it->get<std::string>();
        }
    } // namespace

    json meta_to_json(const lanpaste::core::PasteMeta& meta) {
        json j = json::object();
        j["id"] = meta.id;
        j["created_at"] = meta.created_at;
        j["path"] = meta.path;
        j["size"] = meta.size;
        j["content_type"] = meta.content_type;
        j["commit"] = meta.commit;
        j["sha256"] = meta.sha256;
        put_optional(j, "tag", meta.tag);
        put_optional(j, "client_ip", meta.client_ip);
        put_optional(j, "user_agent", meta.user_agent);
        return j;
    }

    json recent_item_to_json(const lanpaste::core::PasteMeta& meta) {
        json j = json::object();
        j["id"] = meta.id;
        j["created_at"] = meta.created_at;
        j["path"] = meta.path;
        j["commit"] = meta.commit;
        j["tag"] = meta.tag.has_value() ? json(*meta.tag) : json(nullptr);
        j["size"] = meta.size;
        j["content_type"] = meta.content_type;
        return j;
    }

    json response_to_json(const lanpaste::core::CreatePasteResponse& resp) {
        json j = json::object();
        j["id"] = resp.id;
        j["path"] = resp.path;
        j["commit"] = resp.commit;
        j["raw_url"] = resp.raw_url;
        j["view_url"] = resp.view_url;
        j["meta_url"] = resp.meta_url;
        return j;
    }

    Status meta_from_json(const json& j, lanpaste::core::PasteMeta* out) noexcept {
        if (out == nullptr || !j.is_object()) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        try {
            lanpaste::core::PasteMeta m;
            m.id = j.at("id").get<std::string>();
            m.created_at = j.at("created_at").get<std::string>();
            m.path = j.at("path").get<std::string>();
            m.size = j.at("size").get<lanpaste::core::u64>();
            m.content_type = j.at("content_type").get<std::string>();
            m.commit = j.value("commit", std::string());
            m.sha256 = j.at("sha256").get<std::string>();
            get_optional(j, "tag", &m.tag);
            get_optional(j, "client_ip", &m.client_ip);
            get_optional(j, "user_agent", &m.user_agent);
            *out = std::move(m);
        } catch (const json::exception&) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        return ok_status();
    }

    Status response_from_json(const json& j, lanpaste::core::CreatePasteResponse* out) noexcept {
        if (out == nullptr || !j.is_object()) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        try {
            lanpaste::core::CreatePasteResponse r;
            r.id = j.at("id").get<std::string>();
            r.path = j.at("path").get<std::string>();
            r.commit = j.at("commit").get<std::string>();
            r.raw_url = j.at("raw_url").get<std::string>();
            r.view_url = j.at("view_url").get<std::string>();
            r.meta_url = j.at("meta_url").get<std::string>();
            *out = std::move(r);
        } catch (const json::exception&) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        return ok_status();
    }

    Status encode_meta(const lanpaste::core::PasteMeta& meta, std::string* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        // user supplied strings may carry invalid UTF-8
        *out = meta_to_json(meta).dump(2, ' ', false, json::error_handler_t::replace);
        out->push_back('\n');
        return ok_status();
    }

    Status decode_meta(std::string_view text, lanpaste::core::PasteMeta* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        const json j = json::parse(text.begin(), text.end(), nullptr, false);
        if (j.is_discarded()) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        return meta_from_json(j, out);
    }

} // namespace lanpaste::storage
