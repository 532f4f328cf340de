#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "lanpaste/core/types.hpp"

namespace lanpaste::core {

    // Persisted as meta/<id>.json. Field names are the public wire contract.
    struct PasteMeta {
        std::string id;
        std::string created_at;     // RFC 3339, UTC, millisecond precision
        std::string path;           // repository-relative content path
        u64 size{0};
        std::string content_type;
        std::string commit;         // empty until hydrated
        std::string sha256;
        std::optional<std::string> tag;
        std::optional<std::string> client_ip;
        std::optional<std::string> user_agent;
    };

    struct CreatePasteInput {
        std::optional<std::string> name;
        std::optional<std::string> msg;
        std::optional<std::string> tag;
        std::optional<std::string> content_type;
        std::string bytes;
        std::optional<std::string> client_ip;
        std::optional<std::string> user_agent;
    };

    struct PasteDraft {
        std::string id;
        std::string rel_path;
        std::filesystem::path abs_path;
        std::string meta_rel_path;
        std::filesystem::path meta_path;
        std::string content_type;
        u64 size{0};
        std::string sha256;
        std::string subject;
        PasteMeta meta;
    };

    struct CommitResult {
        std::string commit;
        bool pushed{false};
        std::optional<std::string> push_error;
    };

    struct CreatePasteResponse {
        std::string id;
        std::string path;
        std::string commit;
        std::string raw_url;
        std::string view_url;
        std::string meta_url;
    };

    struct IdempotencyRecord {
        std::string request_fingerprint;
        CreatePasteResponse response;
    };

} // namespace lanpaste::core
