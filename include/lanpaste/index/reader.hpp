#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lanpaste/core/errors.hpp"
#include "lanpaste/core/models.hpp"
#include "lanpaste/core/types.hpp"
#include "lanpaste/vcs/git.hpp"

namespace lanpaste::index {

    inline constexpr lanpaste::core::u32 kDefaultRecent = 50;
    inline constexpr lanpaste::core::u32 kMaxRecent = 500;

    // Reads meta/<id>.json from ctx.repo. Ids outside the ULID alphabet and
    // missing records are NotFound. An empty commit id is filled from
    // `git log` on every read; nothing is cached or written back.
    lanpaste::core::Status read_meta(const lanpaste::vcs::GitContext& ctx,
        std::string_view id,
        lanpaste::core::PasteMeta* out) noexcept;

    // Newest first (created_at, then id), at most limit records, optionally only
    // those whose tag equals tag exactly. Unparsable records are skipped.
    lanpaste::core::Status read_recent(const lanpaste::vcs::GitContext& ctx,
        lanpaste::core::u32 limit,
        std::optional<std::string_view> tag,
        std::vector<lanpaste::core::PasteMeta>* out) noexcept;

    // Raw bytes at meta.path. Paths outside pastes/ are Invalid.
    lanpaste::core::Status read_paste(const std::filesystem::path& repo,
        const lanpaste::core::PasteMeta& meta,
        std::string* out) noexcept;

} // namespace lanpaste::index
