#pragma once

#include <string>

#include "lanpaste/core/types.hpp"

namespace lanpaste::core {

    [[nodiscard]] TimestampMs now_ms() noexcept;

    // Whole seconds since the Unix epoch.
    [[nodiscard]] i64 now_unix_seconds() noexcept;

    // "2025-01-31T08:15:02.417Z"
    std::string format_rfc3339_ms(TimestampMs ts);

    // "2025/01/31", the UTC day bucket under pastes/.
    std::string utc_date_path(TimestampMs ts);

} // namespace lanpaste::core
