#pragma once

#include <string_view>

#include "lanpaste/core/errors.hpp"
#include "lanpaste/core/models.hpp"
#include "lanpaste/core/types.hpp"
#include "lanpaste/vcs/git.hpp"

namespace lanpaste::vcs {

    // Commits the draft's content and meta files, then applies the push policy:
    //   Off         no push, pushed = false.
    //   BestEffort  push failure lands in out->push_error, the call still succeeds.
    //   Strict      push failure soft-resets HEAD~1, deletes both draft files,
    //               resets the index (each step best effort) and returns Internal.
    // A failed stage/commit is Internal and leaves the draft files untracked.
    // Caller holds the repository lock for the whole call.
    lanpaste::core::Status commit_paste(const GitContext& ctx,
        const lanpaste::core::PasteDraft& draft,
        lanpaste::core::PushMode push_mode,
        std::string_view remote,
        lanpaste::core::CommitResult* out) noexcept;

} // namespace lanpaste::vcs
