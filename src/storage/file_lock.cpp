#include "lanpaste/storage/file_lock.hpp"

#include <cerrno>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "lanpaste/storage/files.hpp"

namespace lanpaste::storage {
    using lanpaste::core::make_status;
    using lanpaste::core::Status;
    using lanpaste::core::StatusCode;
    using lanpaste::core::StatusDomain;

    FileLock::~FileLock() {
        release();
    }

    FileLock::FileLock(FileLock&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    FileLock& FileLock::operator=(FileLock&& other) noexcept {
        if (this != &other) {
            release();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    void FileLock::release() noexcept {
        if (fd_ < 0) {
            return;
        }
        (void)::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }

    Status FileLock::acquire(const std::filesystem::path& path, FileLock* out) noexcept {
        if (out == nullptr || path.empty()) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        if (path.has_parent_path()) {
            const Status s = create_dirs(path.parent_path());
            if (!lanpaste::core::is_ok(s)) {
                return s;
            }
        }

        const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0) {
            return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<lanpaste::core::u32>(errno));
        }

        int rc = 0;
        do {
            rc = ::flock(fd, LOCK_EX | LOCK_NB);
        } while (rc != 0 && errno == EINTR);

        if (rc != 0) {
            const int err = errno;
            ::close(fd);
            if (err == EWOULDBLOCK) {
                return make_status(StatusDomain::Storage, StatusCode::Conflict, lanpaste::core::kConflictAlreadyRunning);
            }
            return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<lanpaste::core::u32>(err));
        }

        *out = FileLock{};
        out->fd_ = fd;
        return lanpaste::core::ok_status();
    }

} // namespace lanpaste::storage
