#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "lanpaste/core/errors.hpp"
#include "lanpaste/core/models.hpp"
#include "lanpaste/security/access.hpp"
#include "lanpaste/service/config.hpp"
#include "lanpaste/storage/file_lock.hpp"
#include "lanpaste/vcs/git.hpp"

namespace lanpaste::service {

    // Process-wide daemon state. Holds the daemon lock until destroyed.
    struct AppState {
        ServeConfig cfg;
        AppPaths paths;
        lanpaste::vcs::GitContext git;
        lanpaste::security::ApiKeyStore api_keys;
        lanpaste::storage::FileLock daemon_lock;
        // Queues writers of this process in front of the git lock, which only
        // ever fails fast.
        std::mutex write_mu;
    };

    lanpaste::vcs::GitContext git_context(const ServeConfig& cfg, const AppPaths& paths);

    // git binary check (Unavailable), run/, run/idempotency/, tmp/ and repo/
    // creation, a scratch write probe, then repository bootstrap.
    lanpaste::core::Status run_preflight(const ServeConfig& cfg) noexcept;

    // Loads API keys and takes the daemon lock; a second instance on the same
    // dir gets Conflict (aux kConflictAlreadyRunning).
    lanpaste::core::Status build_state(const ServeConfig& cfg, std::unique_ptr<AppState>* out) noexcept;

    // Unavailable unless the repo is a work tree and the git lock is free.
    lanpaste::core::Status ready(AppState& state) noexcept;

    struct CreateRequest {
        lanpaste::core::CreatePasteInput input;
        std::optional<std::string> api_key;
        std::optional<std::string> token;
        std::optional<std::string> idempotency_key;     // trimmed by the caller; empty means none
    };

    struct CreateOutcome {
        lanpaste::core::CreatePasteResponse response;
        bool replayed{false};
    };

    // Admission, CIDR gate, size ceiling, then under the git lock: idempotency
    // lookup, draft, commit and push policy, ledger record. A replay returns
    // the stored response with replayed = true and commits nothing.
    lanpaste::core::Status create_paste(AppState& state, const CreateRequest& req, CreateOutcome* out) noexcept;

} // namespace lanpaste::service
