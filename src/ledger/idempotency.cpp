#include "lanpaste/ledger/idempotency.hpp"

#include <atomic>
#include <cerrno>

#include <unistd.h>

#include "lanpaste/storage/codec.hpp"
#include "lanpaste/storage/files.hpp"
#include "lanpaste/storage/hashing.hpp"

namespace lanpaste::ledger {
    using lanpaste::core::is_ok;
    using lanpaste::core::make_status;
    using lanpaste::core::ok_status;
    using lanpaste::core::Status;
    using lanpaste::core::StatusCode;
    using lanpaste::core::StatusDomain;
    using lanpaste::storage::json;

    namespace {
        std::atomic<lanpaste::core::u32> g_tmp_counter{0};
    } // namespace

    std::filesystem::path idempotency_record_path(const std::filesystem::path& dir, std::string_view key) {
        lanpaste::core::Hash256 h{};
        (void)lanpaste::storage::hash_compute(lanpaste::storage::as_buffer(key), &h);
        return dir / (lanpaste::storage::hash_hex(h) + ".json");
    }

    Status idempotency_read(const std::filesystem::path& dir,
        std::string_view key,
        lanpaste::core::IdempotencyRecord* out,
        bool* found) noexcept {
        if (out == nullptr || found == nullptr || key.empty()) {
            return make_status(StatusDomain::Ledger, StatusCode::Invalid);
        }
        *found = false;

        std::string text;
        const Status s = lanpaste::storage::read_file(idempotency_record_path(dir, key), &text);
        if (s.code == StatusCode::NotFound) {
            return ok_status();
        }
        if (!is_ok(s)) {
            return s;
        }

        const json j = json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            return make_status(StatusDomain::Ledger, StatusCode::Internal);
        }
        const auto fp = j.find("request_fingerprint");
        const auto resp = j.find("response");
        if (fp == j.end() || !fp->is_string() || resp == j.end()) {
            return make_status(StatusDomain::Ledger, StatusCode::Internal);
        }

        lanpaste::core::IdempotencyRecord rec;
        rec.request_fingerprint = fp->get<std::string>();
        if (!is_ok(lanpaste::storage::response_from_json(*resp, &rec.response))) {
            return make_status(StatusDomain::Ledger, StatusCode::Internal);
        }
        *out = std::move(rec);
        *found = true;
        return ok_status();
    }

    Status idempotency_write(const std::filesystem::path& dir,
        std::string_view key,
        const lanpaste::core::IdempotencyRecord& record) noexcept {
        if (key.empty()) {
            return make_status(StatusDomain::Ledger, StatusCode::Invalid);
        }

        Status s = lanpaste::storage::create_dirs(dir);
        if (!is_ok(s)) {
            return s;
        }

        json j = json::object();
        j["key"] = std::string(key);
        j["request_fingerprint"] = record.request_fingerprint;
        j["response"] = lanpaste::storage::response_to_json(record.response);
        const std::string text = j.dump(2, ' ', false, json::error_handler_t::replace);

        const std::filesystem::path final_path = idempotency_record_path(dir, key);
        std::filesystem::path tmp = final_path;
        tmp += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(g_tmp_counter.fetch_add(1));

        s = lanpaste::storage::write_file(tmp, lanpaste::storage::as_buffer(text));
        if (!is_ok(s)) {
            return s;
        }

        // link() refuses an existing target, so a record is never replaced.
        const int rc = ::link(tmp.c_str(), final_path.c_str());
        const int err = errno;
        (void)lanpaste::storage::remove_file(tmp);
        if (rc != 0) {
            if (err == EEXIST) {
                return make_status(StatusDomain::Ledger, StatusCode::Conflict, lanpaste::core::kConflictIdempotencyMismatch);
            }
            return make_status(StatusDomain::Ledger, StatusCode::Io, static_cast<lanpaste::core::u32>(err));
        }
        return ok_status();
    }

} // namespace lanpaste::ledger
