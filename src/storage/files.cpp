#include "lanpaste/storage/files.hpp"

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace lanpaste::storage {
    using lanpaste::core::make_status;
    using lanpaste::core::ok_status;
    using lanpaste::core::Status;
    using lanpaste::core::StatusCode;
    using lanpaste::core::StatusDomain;

    namespace {
        Status io_error(int err) noexcept {
            return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(err));
        }
    } // namespace

    Status create_dirs(const std::filesystem::path& dir) noexcept {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return io_error(ec.value());
        }
        return ok_status();
    }

    Status write_file(const std::filesystem::path& path, BufferView data) noexcept {
        if (data.len > 0 && data.data == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) {
            return io_error(errno);
        }

        u64 written = 0;
        while (written < data.len) {
            const ssize_t n = ::write(fd, data.data + written, static_cast<size_t>(data.len - written));
            if (n < 0) {
                if (errno == EINTR) continue;
                const int err = errno;
                ::close(fd);
                ::unlink(path.c_str()); // Cleanup partial write
                return io_error(err);
            }
            written += static_cast<u64>(n);
        }

        if (::fsync(fd) != 0) {
            const int err = errno;
            ::close(fd);
            ::unlink(path.c_str());
            return io_error(err);
        }

        if (::close(fd) != 0) {
            return io_error(errno);
        }
        return ok_status();
    }

    Status read_file(const std::filesystem::path& path, std::string* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            if (errno == ENOENT) {
                return make_status(StatusDomain::Storage, StatusCode::NotFound);
            }
            return io_error(errno);
        }

        out->clear();
        char buf[64 * 1024];
        for (;;) {
            const ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR) continue;
                const int err = errno;
                ::close(fd);
                return io_error(err);
            }
            if (n == 0) {
                break;
            }
            out->append(buf, static_cast<size_t>(n));
        }
        ::close(fd);
        return ok_status();
    }

    Status remove_file(const std::filesystem::path& path) noexcept {
        if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
            return io_error(errno);
        }
        return ok_status();
    }

} // namespace lanpaste::storage
