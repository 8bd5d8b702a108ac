#include "session/file_lock.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/file.h>
#include <unistd.h>
#include <utility>

namespace hookguard::session {

using core::errors::ErrorCategory;
using core::errors::HookError;

FileLock::~FileLock() {
    if (fd_ >= 0) {
        static_cast<void>(flock(fd_, LOCK_UN));
        static_cast<void>(close(fd_));
    }
}

core::errors::Result<std::unique_ptr<FileLock>> FileLock::acquire(
    const std::filesystem::path& path, const int operation) {
    const int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return HookError{ErrorCategory::State,
                         "Unable to open lock file " + path.string() + ": " +
                             std::strerror(errno),
                         "state_lock_failed"};
    }

    int rc = 0;
    do {
        rc = flock(fd, operation);
    } while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        const std::string reason = std::strerror(errno);
        static_cast<void>(close(fd));
        return HookError{ErrorCategory::State,
                         "Unable to lock " + path.string() + ": " + reason,
                         "state_lock_failed"};
    }

    auto lock = std::make_unique<FileLock>();
    lock->fd_ = fd;
    return std::move(lock);
}

}  // namespace hookguard::session
