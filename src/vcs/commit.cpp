#include "lanpaste/vcs/commit.hpp"

#include "lanpaste/core/log.hpp"
#include "lanpaste/storage/draft.hpp"

namespace lanpaste::vcs {
    using lanpaste::core::is_ok;
    using lanpaste::core::make_status;
    using lanpaste::core::ok_status;
    using lanpaste::core::PushMode;
    using lanpaste::core::Status;
    using lanpaste::core::StatusCode;
    using lanpaste::core::StatusDomain;

    namespace {
        std::string push_error_text(Status s, const GitOutput& detail) {
            std::string text = "git push failed";
            if (s.code == StatusCode::Internal && detail.exit_code > 0) {
                text += " (exit " + std::to_string(detail.exit_code) + ")";
            }
            if (!detail.err.empty()) {
                text += ": ";
                text += detail.err;
                while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
                    text.pop_back();
                }
            }
            return text;
        }

        // Leaves the draft files untracked so a later commit cannot pick them up.
        void unstage_draft(const GitContext& ctx, const lanpaste::core::PasteDraft& draft) noexcept {
            GitOutput detail;
            const Status s = git_run(ctx, {"reset", "--", draft.rel_path, draft.meta_rel_path}, &detail);
            if (!is_ok(s)) {
                LANPASTE_LOG_ERROR("cannot unstage draft after failed commit", {
                    lanpaste::core::str_field("id", draft.id),
                    lanpaste::core::str_field("stderr", detail.err),
                });
            }
        }

        void rollback_commit(const GitContext& ctx, const lanpaste::core::PasteDraft& draft) noexcept {
            GitOutput detail;
            Status s = git_run(ctx, {"reset", "--soft", "HEAD~1"}, &detail);
            if (!is_ok(s)) {
                LANPASTE_LOG_ERROR("rollback: cannot drop commit", {
                    lanpaste::core::str_field("id", draft.id),
                    lanpaste::core::str_field("stderr", detail.err),
                });
            }
            lanpaste::storage::remove_draft_files(draft);
            s = git_run(ctx, {"reset"}, &detail);
            if (!is_ok(s)) {
                LANPASTE_LOG_ERROR("rollback: cannot unstage draft", {
                    lanpaste::core::str_field("id", draft.id),
                    lanpaste::core::str_field("stderr", detail.err),
                });
            }
        }
    } // namespace

    Status commit_paste(const GitContext& ctx,
        const lanpaste::core::PasteDraft& draft,
        PushMode push_mode,
        std::string_view remote,
        lanpaste::core::CommitResult* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Vcs, StatusCode::Invalid);
        }

        lanpaste::core::CommitResult result;
        GitOutput detail;
        Status s = git_commit(ctx, {draft.rel_path, draft.meta_rel_path}, draft.subject, &result.commit, &detail);
        if (!is_ok(s)) {
            LANPASTE_LOG_ERROR("commit failed", {
                lanpaste::core::str_field("id", draft.id),
                lanpaste::core::status_field(s),
                lanpaste::core::str_field("stderr", detail.err),
            });
            unstage_draft(ctx, draft);
            return make_status(StatusDomain::Vcs, StatusCode::Internal, s.aux);
        }

        switch (push_mode) {
            case PushMode::Off:
                break;
            case PushMode::BestEffort:
                s = git_push(ctx, remote, &detail);
                if (is_ok(s)) {
                    result.pushed = true;
                } else {
                    result.push_error = push_error_text(s, detail);
                }
                break;
            case PushMode::Strict:
                s = git_push(ctx, remote, &detail);
                if (!is_ok(s)) {
                    LANPASTE_LOG_ERROR("push failed in strict mode, rolling back", {
                        lanpaste::core::str_field("id", draft.id),
                        lanpaste::core::str_field("commit", result.commit),
                        lanpaste::core::str_field("error", push_error_text(s, detail)),
                    });
                    rollback_commit(ctx, draft);
                    return make_status(StatusDomain::Vcs, StatusCode::Internal, s.aux);
                }
                result.pushed = true;
                break;
        }

        *out = std::move(result);
        return ok_status();
    }

} // namespace lanpaste::vcs
