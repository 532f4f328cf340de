#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace lanpaste::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Milliseconds since the Unix epoch, UTC.
    using TimestampMs = i64;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    enum class PushMode : u8 {
        Off = 0,
        BestEffort = 1,
        Strict = 2,
    };

    [[nodiscard]] constexpr const char* push_mode_label(PushMode m) noexcept {
        switch (m) {
            case PushMode::Off: return "off";
            case PushMode::BestEffort: return "best_effort";
            case PushMode::Strict: return "strict";
        }
        return "off";
    }

    static_assert(std::is_trivially_copyable_v<Hash256>);
    static_assert(std::is_standard_layout_v<Hash256>);

} // namespace lanpaste::core
