#pragma once

#include <filesystem>

#include "lanpaste/core/errors.hpp"
#include "lanpaste/core/models.hpp"
#include "lanpaste/core/types.hpp"

namespace lanpaste::storage {

    // Writes the content file and meta/<id>.json (commit left empty) under
    // repo and describes both in *out. Invalid for an unacceptable name;
    // any filesystem failure fails the whole draft. Files already written
    // are not removed on failure.
    lanpaste::core::Status build_paste_draft(const std::filesystem::path& repo,
        const lanpaste::core::CreatePasteInput& input,
        lanpaste::core::TimestampMs now,
        lanpaste::core::PasteDraft* out) noexcept;

    lanpaste::core::Status build_paste_draft(const std::filesystem::path& repo,
        const lanpaste::core::CreatePasteInput& input,
        lanpaste::core::PasteDraft* out) noexcept;

    // Best effort; used on the strict-push rollback path.
    void remove_draft_files(const lanpaste::core::PasteDraft& draft) noexcept;

} // namespace lanpaste::storage
