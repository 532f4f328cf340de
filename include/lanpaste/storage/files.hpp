#pragma once

#include <filesystem>
#include <string>

#include "lanpaste/core/errors.hpp"
#include "lanpaste/storage/buffer.hpp"

namespace lanpaste::storage {

    // Io statuses carry errno in aux.
    lanpaste::core::Status create_dirs(const std::filesystem::path& dir) noexcept;

    // Truncates or creates, then fsyncs. A partially written file is unlinked.
    lanpaste::core::Status write_file(const std::filesystem::path& path, BufferView data) noexcept;

    // NotFound when the file does not exist.
    lanpaste::core::Status read_file(const std::filesystem::path& path, std::string* out) noexcept;

    // Missing files are not an error.
    lanpaste::core::Status remove_file(const std::filesystem::path& path) noexcept;

} // namespace lanpaste::storage
