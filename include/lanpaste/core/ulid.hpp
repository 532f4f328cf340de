#pragma once

#include <array>
#include <mutex>
#include <string>
#include <string_view>

#include "lanpaste/core/errors.hpp"
#include "lanpaste/core/types.hpp"

namespace lanpaste::core {

    inline constexpr u32 kUlidLength = 26;

    // Crockford base32, 48-bit millisecond timestamp followed by 80 random bits.
    // Within one generator, ids are strictly increasing: a repeated (or
    // backwards) millisecond reuses the last timestamp and increments the
    // random part.
    class UlidGenerator {
    public:
        Status next(TimestampMs ts, std::string* out) noexcept;

    private:
        std::mutex mu_;
        TimestampMs last_ts_{-1};
        std::array<u8, 10> last_rand_{};
    };

    // Process-wide generator.
    Status ulid_new(TimestampMs ts, std::string* out) noexcept;

    // 26 characters from the Crockford alphabet (upper case), first char <= '7'.
    [[nodiscard]] bool ulid_is_valid(std::string_view s) noexcept;

} // namespace lanpaste::core
