#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "lanpaste/core/errors.hpp"
#include "lanpaste/core/types.hpp"
#include "lanpaste/storage/buffer.hpp"

namespace lanpaste::storage {
    [[nodiscard]] constexpr bool hash_is_zero(const lanpaste::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    // BLAKE3, 32-byte output.
    lanpaste::core::Status hash_compute(BufferView data, lanpaste::core::Hash256* out) noexcept;

    // Lower-case hex, 64 chars.
    std::string hash_hex(const lanpaste::core::Hash256& h);

    // SHA-256 of the raw bytes, lower-case hex.
    lanpaste::core::Status sha256_hex(BufferView data, std::string* out) noexcept;

    struct FingerprintFields {
        std::optional<std::string_view> name;
        std::optional<std::string_view> tag;
        std::optional<std::string_view> content_type;
        std::string_view content_sha256;
    };

    // Stable digest over name, tag, content type and the content hash only.
    // Absent and empty optional fields produce different fingerprints.
    lanpaste::core::Status request_fingerprint(const FingerprintFields& f, std::string* out) noexcept;

} // namespace lanpaste::storage
