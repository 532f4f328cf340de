#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "lanpaste/core/errors.hpp"
#include "lanpaste/core/types.hpp"

namespace lanpaste::storage {

    inline constexpr lanpaste::core::u32 kMaxSlugLen = 80;
    inline constexpr const char* kDefaultSlug = "paste";

    inline constexpr const char* kMarkdownContentType = "text/markdown; charset=utf-8";
    inline constexpr const char* kPlainContentType = "text/plain; charset=utf-8";

    // Invalid for names containing '/', '\\', ".." or a leading '.'.
    // Result only holds [A-Za-z0-9._-], never "--", never a leading or
    // trailing '-', at most kMaxSlugLen chars.
    lanpaste::core::Status sanitize_name(std::string_view name, std::string* out) noexcept;

    // "md" when the content type mentions text/markdown or the name ends in .md
    // (both case-insensitive), "txt" otherwise.
    [[nodiscard]] const char* choose_extension(std::optional<std::string_view> name,
        std::optional<std::string_view> content_type) noexcept;

    // pastes/<yyyy>/<mm>/<dd>/<id>__<slug>.<ext>
    std::string paste_rel_path(std::string_view date_path, std::string_view id, std::string_view slug, std::string_view ext);

    // meta/<id>.json
    std::string meta_rel_path(std::string_view id);

} // namespace lanpaste::storage
