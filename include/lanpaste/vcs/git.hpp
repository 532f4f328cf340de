#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "lanpaste/core/errors.hpp"

namespace lanpaste::vcs {

    struct GitContext {
        std::filesystem::path repo;     // working directory of every invocation; empty keeps the caller's cwd
        std::string git_bin{"git"};     // resolved through PATH
        std::string author_name{"LAN Paste"};
        std::string author_email{"paste@lan"};
    };

    struct GitOutput {
        std::string out;                // stdout, surrounding whitespace trimmed
        std::string err;                // stderr as produced
        int exit_code{0};
    };

    // Runs `git <args...>` with GIT_AUTHOR_* and GIT_COMMITTER_* taken from ctx.
    // Non-zero exit is Internal (aux = exit code, stderr in out->err); a spawn
    // failure is Internal with aux = errno.
    lanpaste::core::Status git_run(const GitContext& ctx,
        const std::vector<std::string>& args,
        GitOutput* out) noexcept;

    // Unavailable when `git --version` cannot run.
    lanpaste::core::Status git_check_installed(const GitContext& ctx) noexcept;

    // `rev-parse --is-inside-work-tree` succeeds and prints "true".
    [[nodiscard]] bool git_is_repository(const GitContext& ctx) noexcept;

    // Stages exactly paths, commits with subject, returns the 12-char short id.
    // Caller holds the repository lock.
    lanpaste::core::Status git_commit(const GitContext& ctx,
        const std::vector<std::string>& paths,
        std::string_view subject,
        std::string* commit_id,
        GitOutput* detail) noexcept;

    // `push <remote> HEAD`. Caller holds the repository lock.
    lanpaste::core::Status git_push(const GitContext& ctx, std::string_view remote, GitOutput* detail) noexcept;

    // First 12 chars of the newest commit touching path; empty when none.
    lanpaste::core::Status git_log_commit_for(const GitContext& ctx, std::string_view path, std::string* commit_id) noexcept;

    // Creates repo, runs `git init` when needed, lays out pastes/ and meta/,
    // writes README.md, merges the required .gitignore lines and makes the
    // initial commit when HEAD does not verify.
    lanpaste::core::Status git_bootstrap_repo(const GitContext& ctx) noexcept;

} // namespace lanpaste::vcs
