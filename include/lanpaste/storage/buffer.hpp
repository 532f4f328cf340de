#pragma once

#include <string_view>
#include <type_traits>

#include "lanpaste/core/types.hpp"

namespace lanpaste::storage {
    using u8 = lanpaste::core::u8;
    using u32 = lanpaste::core::u32;
    using u64 = lanpaste::core::u64;

    struct BufferView {
        const u8* data{nullptr};
        u64 len{0};
    };

    [[nodiscard]] inline BufferView as_buffer(std::string_view s) noexcept {
        return BufferView{reinterpret_cast<const u8*>(s.data()), static_cast<u64>(s.size())};
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
} // namespace lanpaste::storage
