#include "lanpaste/index/reader.hpp"

#include <algorithm>
#include <system_error>

#include "lanpaste/core/log.hpp"
#include "lanpaste/core/ulid.hpp"
#include "lanpaste/storage/codec.hpp"
#include "lanpaste/storage/files.hpp"
#include "lanpaste/storage/naming.hpp"

namespace lanpaste::index {
    using lanpaste::core::is_ok;
    using lanpaste::core::make_status;
    using lanpaste::core::ok_status;
    using lanpaste::core::PasteMeta;
    using lanpaste::core::Status;
    using lanpaste::core::StatusCode;
    using lanpaste::core::StatusDomain;

    namespace {
        Status hydrate_commit(const lanpaste::vcs::GitContext& ctx, PasteMeta* meta) noexcept {
            if (!meta->commit.empty()) {
                return ok_status();
            }
            return lanpaste::vcs::git_log_commit_for(ctx, meta->path, &meta->commit);
        }

        [[nodiscard]] bool newer_first(const PasteMeta& a, const PasteMeta& b) noexcept {
            if (a.created_at != b.created_at) {
                return a.created_at > b.created_at;
            }
            return a.id > b.id;
        }

        [[nodiscard]] bool safe_content_path(std::string_view p) noexcept {
            return p.rfind("pastes/", 0) == 0 && p.find("..") == std::string_view::npos &&
                p.find('\\') == std::string_view::npos;
        }
    } // namespace

    Status read_meta(const lanpaste::vcs::GitContext& ctx, std::string_view id, PasteMeta* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        if (!lanpaste::core::ulid_is_valid(id)) {
            return make_status(StatusDomain::Storage, StatusCode::NotFound);
        }

        std::string text;
        Status s = lanpaste::storage::read_file(ctx.repo / lanpaste::storage::meta_rel_path(id), &text);
        if (!is_ok(s)) {
            return s;
        }

        PasteMeta meta;
        s = lanpaste::storage::decode_meta(text, &meta);
        if (!is_ok(s)) {
            return make_status(StatusDomain::Storage, StatusCode::Internal);
        }
        s = hydrate_commit(ctx, &meta);
        if (!is_ok(s)) {
            return s;
        }
        *out = std::move(meta);
        return ok_status();
    }

    Status read_recent(const lanpaste::vcs::GitContext& ctx,
        lanpaste::core::u32 limit,
        std::optional<std::string_view> tag,
        std::vector<PasteMeta>* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        out->clear();

        const std::filesystem::path meta_dir = ctx.repo / "meta";
        std::error_code ec;
        if (!std::filesystem::exists(meta_dir, ec)) {
            return ok_status();
        }

        std::vector<PasteMeta> metas;
        std::filesystem::directory_iterator it(meta_dir, ec);
        if (ec) {
            return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<lanpaste::core::u32>(ec.value()));
        }
        for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
            const std::filesystem::path& p = it->path();
            if (p.extension() != ".json") {
                continue;
            }

            std::string text;
            Status s = lanpaste::storage::read_file(p, &text);
            if (s.code == StatusCode::NotFound) {
                continue;
            }
            if (!is_ok(s)) {
                return s;
            }

            PasteMeta meta;
            if (!is_ok(lanpaste::storage::decode_meta(text, &meta))) {
                LANPASTE_LOG_WARN("skipping unparsable metadata record", {lanpaste::core::str_field("file", p.filename().string())});
                continue;
            }
            if (tag.has_value() && (!meta.tag.has_value() || *meta.tag != *tag)) {
                continue;
            }
            metas.push_back(std::move(meta));
        }
        if (ec) {
            return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<lanpaste::core::u32>(ec.value()));
        }

        std::sort(metas.begin(), metas.end(), newer_first);
        if (metas.size() > limit) {
            metas.resize(limit);
        }

        // hydration does not affect ordering
        for (auto& meta : metas) {
            const Status s = hydrate_commit(ctx, &meta);
            if (!is_ok(s)) {
                return s;
            }
        }
        *out = std::move(metas);
        return ok_status();
    }

    Status read_paste(const std::filesystem::path& repo, const PasteMeta& meta, std::string* out) noexcept {
        if (out == nullptr || !safe_content_path(meta.path)) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        return lanpaste::storage::read_file(repo / meta.path, out);
    }

} // namespace lanpaste::index
