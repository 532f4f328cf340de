#include "lanpaste/storage/draft.hpp"

#include <string>

#include "lanpaste/core/clock.hpp"
#include "lanpaste/core/ulid.hpp"
#include "lanpaste/storage/codec.hpp"
#include "lanpaste/storage/files.hpp"
#include "lanpaste/storage/hashing.hpp"
#include "lanpaste/storage/naming.hpp"

namespace lanpaste::storage {
    using lanpaste::core::is_ok;
    using lanpaste::core::make_status;
    using lanpaste::core::ok_status;
    using lanpaste::core::Status;
    using lanpaste::core::StatusCode;
    using lanpaste::core::StatusDomain;

    namespace {
        std::string commit_subject(const lanpaste::core::CreatePasteInput& input, const std::string& id, const std::string& slug) {
            if (input.msg.has_value()) {
                return *input.msg;
            }
            std::string subject = "paste: " + id + " " + slug;
            if (input.tag.has_value()) {
                subject += " [tag:" + *input.tag + "]";
            }
            return subject;
        }

        std::optional<std::string_view> view_of(const std::optional<std::string>& v) noexcept {
            if (!v.has_value()) {
                return std::nullopt;
            }
            return std::string_view(*v);
        }
    } // namespace

    Status build_paste_draft(const std::filesystem::path& repo,
        const lanpaste::core::CreatePasteInput& input,
        lanpaste::core::TimestampMs now,
        lanpaste::core::PasteDraft* out) noexcept {
        if (out == nullptr || repo.empty()) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        std::string slug;
        Status s = sanitize_name(input.name.value_or(kDefaultSlug), &slug);
        if (!is_ok(s)) {
            return s;
        }

        lanpaste::core::PasteDraft d;
        s = lanpaste::core::ulid_new(now, &d.id);
        if (!is_ok(s)) {
            return s;
        }

        const char* ext = choose_extension(view_of(input.name), view_of(input.content_type));
        d.rel_path = paste_rel_path(lanpaste::core::utc_date_path(now), d.id, slug, ext);
        d.abs_path = repo / d.rel_path;
        d.meta_rel_path = meta_rel_path(d.id);
        d.meta_path = repo / d.meta_rel_path;
        d.size = static_cast<lanpaste::core::u64>(input.bytes.size());

        s = sha256_hex(as_buffer(input.bytes), &d.sha256);
        if (!is_ok(s)) {
            return s;
        }

        if (std::string_view(ext) == "md") {
            d.content_type = kMarkdownContentType;
        } else {
            d.content_type = input.content_type.value_or(kPlainContentType);
        }
        d.subject = commit_subject(input, d.id, slug);

        d.meta.id = d.id;
        d.meta.created_at = lanpaste::core::format_rfc3339_ms(now);
        d.meta.path = d.rel_path;
        d.meta.size = d.size;
        d.meta.content_type = d.content_type;
        d.meta.sha256 = d.sha256;
        d.meta.tag = input.tag;
        d.meta.client_ip = input.client_ip;
        d.meta.user_agent = input.user_agent;

        std::string meta_text;
        s = encode_meta(d.meta, &meta_text);
        if (!is_ok(s)) {
            return s;
        }

        s = create_dirs(d.abs_path.parent_path());
        if (!is_ok(s)) {
            return s;
        }
        s = create_dirs(d.meta_path.parent_path());
        if (!is_ok(s)) {
            return s;
        }
        s = write_file(d.abs_path, as_buffer(input.bytes));
        if (!is_ok(s)) {
            return s;
        }
        s = write_file(d.meta_path, as_buffer(meta_text));
        if (!is_ok(s)) {
            return s;
        }

        *out = std::move(d);
        return ok_status();
    }

    Status build_paste_draft(const std::filesystem::path& repo,
        const lanpaste::core::CreatePasteInput& input,
        lanpaste::core::PasteDraft* out) noexcept {
        return build_paste_draft(repo, input, lanpaste::core::now_ms(), out);
    }

    void remove_draft_files(const lanpaste::core::PasteDraft& draft) noexcept {
        (void)remove_file(draft.abs_path);
        (void)remove_file(draft.meta_path);
    }

} // namespace lanpaste::storage
