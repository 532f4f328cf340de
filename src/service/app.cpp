#include "lanpaste/service/app.hpp"

#include "lanpaste/core/log.hpp"
#include "lanpaste/ledger/idempotency.hpp"
#include "lanpaste/storage/draft.hpp"
#include "lanpaste/storage/files.hpp"
#include "lanpaste/storage/hashing.hpp"
#include "lanpaste/vcs/commit.hpp"

namespace lanpaste::service {
    using lanpaste::core::is_ok;
    using lanpaste::core::make_status;
    using lanpaste::core::ok_status;
    using lanpaste::core::Status;
    using lanpaste::core::StatusCode;
    using lanpaste::core::StatusDomain;
    using lanpaste::core::str_field;

    namespace {
        std::optional<std::string_view> view_of(const std::optional<std::string>& v) noexcept {
            if (!v.has_value()) {
                return std::nullopt;
            }
            return std::string_view(*v);
        }

        Status log_rejected(const char* gate, Status s) {
            LANPASTE_LOG_WARN("create rejected", {str_field("gate", gate), lanpaste::core::status_field(s)});
            return s;
        }

        Status admit(AppState& state, const CreateRequest& req) noexcept {
            if (state.api_keys.enabled()) {
                const Status s = state.api_keys.authorize(view_of(req.api_key), lanpaste::security::Scope::PasteCreate);
                if (!is_ok(s)) {
                    return log_rejected("api_key", s);
                }
            } else {
                const Status s = lanpaste::security::verify_token(view_of(state.cfg.token), view_of(req.token));
                if (!is_ok(s)) {
                    return log_rejected("token", s);
                }
            }

            Status s = lanpaste::security::check_cidr(state.cfg.allow_cidr, view_of(req.input.client_ip));
            if (!is_ok(s)) {
                return log_rejected("cidr", s);
            }

            if (static_cast<u64>(req.input.bytes.size()) > state.cfg.max_bytes) {
                return log_rejected("size", make_status(StatusDomain::Core, StatusCode::TooLarge));
            }
            return ok_status();
        }

        Status fingerprint_of(const lanpaste::core::CreatePasteInput& input, std::string* out) noexcept {
            std::string sha;
            const Status s = lanpaste::storage::sha256_hex(lanpaste::storage::as_buffer(input.bytes), &sha);
            if (!is_ok(s)) {
                return s;
            }
            lanpaste::storage::FingerprintFields f;
            f.name = view_of(input.name);
            f.tag = view_of(input.tag);
            f.content_type = view_of(input.content_type);
            f.content_sha256 = sha;
            return lanpaste::storage::request_fingerprint(f, out);
        }
    } // namespace

    lanpaste::vcs::GitContext git_context(const ServeConfig& cfg, const AppPaths& paths) {
        lanpaste::vcs::GitContext ctx;
        ctx.repo = paths.repo;
        ctx.git_bin = cfg.git_bin;
        ctx.author_name = cfg.git_author_name;
        ctx.author_email = cfg.git_author_email;
        return ctx;
    }

    Status run_preflight(const ServeConfig& cfg) noexcept {
        Status s = validate_config(cfg);
        if (!is_ok(s)) {
            return s;
        }

        const AppPaths paths = app_paths(cfg.dir);
        const lanpaste::vcs::GitContext git = git_context(cfg, paths);

        s = lanpaste::vcs::git_check_installed(git);
        if (!is_ok(s)) {
            LANPASTE_LOG_ERROR("git is required but could not be executed", {str_field("git", cfg.git_bin)});
            return s;
        }

        for (const auto* dir : {&paths.run, &paths.idempotency, &paths.tmp, &paths.repo}) {
            s = lanpaste::storage::create_dirs(*dir);
            if (!is_ok(s)) {
                LANPASTE_LOG_ERROR("cannot create directory", {str_field("dir", dir->string()), lanpaste::core::status_field(s)});
                return s;
            }
        }

        const std::filesystem::path probe = paths.run / ".write_test";
        s = lanpaste::storage::write_file(probe, lanpaste::storage::as_buffer("ok"));
        if (!is_ok(s)) {
            LANPASTE_LOG_ERROR("run directory is not writable", {str_field("dir", paths.run.string())});
            return s;
        }
        s = lanpaste::storage::remove_file(probe);
        if (!is_ok(s)) {
            return s;
        }

        s = lanpaste::vcs::git_bootstrap_repo(git);
        if (!is_ok(s)) {
            LANPASTE_LOG_ERROR("repository bootstrap failed", {lanpaste::core::status_field(s)});
            return s;
        }
        LANPASTE_LOG_INFO("preflight complete", {
            str_field("repo", paths.repo.string()),
            str_field("push", lanpaste::core::push_mode_label(cfg.push)),
        });
        return ok_status();
    }

    Status build_state(const ServeConfig& cfg, std::unique_ptr<AppState>* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        Status s = validate_config(cfg);
        if (!is_ok(s)) {
            return s;
        }

        auto state = std::make_unique<AppState>();
        state->cfg = cfg;
        state->paths = app_paths(cfg.dir);
        state->git = git_context(cfg, state->paths);

        if (cfg.api_keys_file.has_value()) {
            s = state->api_keys.load_file(*cfg.api_keys_file);
            if (!is_ok(s)) {
                LANPASTE_LOG_ERROR("cannot load api keys", {str_field("file", cfg.api_keys_file->string())});
                return s;
            }
        }

        s = lanpaste::storage::FileLock::acquire(state->paths.daemon_lock, &state->daemon_lock);
        if (!is_ok(s)) {
            if (s.code == StatusCode::Conflict) {
                LANPASTE_LOG_ERROR("another instance is already running", {str_field("dir", cfg.dir.string())});
            }
            return s;
        }

        *out = std::move(state);
        return ok_status();
    }

    Status ready(AppState& state) noexcept {
        if (!lanpaste::vcs::git_is_repository(state.git)) {
            return make_status(StatusDomain::Vcs, StatusCode::Unavailable);
        }
        std::unique_lock<std::mutex> writer(state.write_mu, std::try_to_lock);
        if (!writer.owns_lock()) {
            return make_status(StatusDomain::Storage, StatusCode::Unavailable);
        }
        lanpaste::storage::FileLock probe;
        const Status s = lanpaste::storage::FileLock::acquire(state.paths.git_lock, &probe);
        if (!is_ok(s)) {
            return make_status(StatusDomain::Storage, StatusCode::Unavailable, s.aux);
        }
        return ok_status();
    }

    Status create_paste(AppState& state, const CreateRequest& req, CreateOutcome* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        Status s = admit(state, req);
        if (!is_ok(s)) {
            return s;
        }

        const bool keyed = req.idempotency_key.has_value() && !req.idempotency_key->empty();
        std::string fingerprint;
        if (keyed) {
            s = fingerprint_of(req.input, &fingerprint);
            if (!is_ok(s)) {
                return s;
            }
        }

        std::lock_guard<std::mutex> writer(state.write_mu);
        lanpaste::storage::FileLock git_lock;
        s = lanpaste::storage::FileLock::acquire(state.paths.git_lock, &git_lock);
        if (!is_ok(s)) {
            return s;
        }

        if (keyed) {
            lanpaste::core::IdempotencyRecord record;
            bool found = false;
            s = lanpaste::ledger::idempotency_read(state.paths.idempotency, *req.idempotency_key, &record, &found);
            if (!is_ok(s)) {
                return s;
            }
            if (found) {
                if (record.request_fingerprint != fingerprint) {
                    LANPASTE_LOG_WARN("idempotency key reused with a different payload", {str_field("id", record.response.id)});
                    return make_status(StatusDomain::Ledger, StatusCode::Conflict, lanpaste::core::kConflictIdempotencyMismatch);
                }
                LANPASTE_LOG_INFO("idempotent replay", {str_field("id", record.response.id)});
                out->response = std::move(record.response);
                out->replayed = true;
                return ok_status();
            }
        }

        lanpaste::core::PasteDraft draft;
        s = lanpaste::storage::build_paste_draft(state.paths.repo, req.input, &draft);
        if (!is_ok(s)) {
            return s;
        }

        lanpaste::core::CommitResult commit;
        s = lanpaste::vcs::commit_paste(state.git, draft, state.cfg.push, state.cfg.remote, &commit);
        if (!is_ok(s)) {
            return s;
        }
        if (commit.push_error.has_value()) {
            LANPASTE_LOG_WARN("best-effort push failed", {str_field("id", draft.id), str_field("error", *commit.push_error)});
        }

        lanpaste::core::CreatePasteResponse resp;
        resp.id = draft.id;
        resp.path = draft.rel_path;
        resp.commit = commit.commit;
        resp.raw_url = "/api/v1/p/" + draft.id + "/raw";
        resp.view_url = "/p/" + draft.id;
        resp.meta_url = "/api/v1/p/" + draft.id;

        if (keyed) {
            s = lanpaste::ledger::idempotency_write(state.paths.idempotency, *req.idempotency_key,
                lanpaste::core::IdempotencyRecord{fingerprint, resp});
            if (!is_ok(s)) {
                return s;
            }
        }

        LANPASTE_LOG_INFO("paste created", {
            str_field("id", resp.id),
            str_field("path", resp.path),
            str_field("commit", resp.commit),
            lanpaste::core::bool_field("pushed", commit.pushed),
        });
        out->response = std::move(resp);
        out->replayed = false;
        return ok_status();
    }

} // namespace lanpaste::service
