#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "lanpaste/core/errors.hpp"
#include "lanpaste/core/models.hpp"

namespace lanpaste::storage {
    using json = nlohmann::json;

    // Absent optionals are omitted from the object.
    json meta_to_json(const lanpaste::core::PasteMeta& meta);

    // Listing shape: no client_ip / user_agent / sha256, tag is null when absent.
    json recent_item_to_json(const lanpaste::core::PasteMeta& meta);

    json response_to_json(const lanpaste::core::CreatePasteResponse& resp);

    lanpaste::core::Status meta_from_json(const json& j, lanpaste::core::PasteMeta* out) noexcept;
    lanpaste::core::Status response_from_json(const json& j, lanpaste::core::CreatePasteResponse* out) noexcept;

    // Pretty printed, two-space indent, trailing newline.
    lanpaste::core::Status encode_meta(const lanpaste::core::PasteMeta& meta, std::string* out) noexcept;

    // Invalid on malformed JSON or missing required fields.
    lanpaste::core::Status decode_meta(std::string_view text, lanpaste::core::PasteMeta* out) noexcept;

} // namespace lanpaste::storage
