#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "lanpaste/core/errors.hpp"
#include "lanpaste/core/models.hpp"

namespace lanpaste::ledger {

    // One JSON file per key under dir, named by the BLAKE3 hex digest of the
    // key so arbitrary caller strings never reach the filesystem.
    std::filesystem::path idempotency_record_path(const std::filesystem::path& dir, std::string_view key);

    // *found is false (and Ok returned) when no record exists for key.
    lanpaste::core::Status idempotency_read(const std::filesystem::path& dir,
        std::string_view key,
        lanpaste::core::IdempotencyRecord* out,
        bool* found) noexcept;

    // Records are write-once: a second write for the same key is Conflict
    // (aux kConflictIdempotencyMismatch) and leaves the first record intact.
    lanpaste::core::Status idempotency_write(const std::filesystem::path& dir,
        std::string_view key,
        const lanpaste::core::IdempotencyRecord& record) noexcept;

} // namespace lanpaste::ledger
