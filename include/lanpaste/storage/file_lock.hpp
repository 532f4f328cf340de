#pragma once

#include <filesystem>

#include "lanpaste/core/errors.hpp"

namespace lanpaste::storage {

    // Exclusive advisory lock (flock) held for the lifetime of the handle.
    // Acquisition never blocks: a lock held elsewhere is Conflict with
    // aux kConflictAlreadyRunning. The lock file itself is left on disk.
    class FileLock {
    public:
        FileLock() noexcept = default;
        ~FileLock();

        FileLock(const FileLock&) = delete;
        FileLock& operator=(const FileLock&) = delete;
        FileLock(FileLock&& other) noexcept;
        FileLock& operator=(FileLock&& other) noexcept;

        // Creates the parent directory and the lock file when missing.
        static lanpaste::core::Status acquire(const std::filesystem::path& path, FileLock* out) noexcept;

        [[nodiscard]] bool held() const noexcept { return fd_ >= 0; }

        void release() noexcept;

    private:
        int fd_{-1};
    };

} // namespace lanpaste::storage
