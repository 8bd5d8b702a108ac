#pragma once

#include <filesystem>
#include <memory>
#include "core/errors/hook_errors.hpp"

namespace hookguard::session {

// Advisory flock held for the lifetime of the object. Each acquire opens its
// own descriptor, so two threads of one process also exclude each other.
class FileLock {
public:
    FileLock() = default;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    ~FileLock();

    // `operation` is LOCK_SH or LOCK_EX. Blocks until granted.
    static core::errors::Result<std::unique_ptr<FileLock>> acquire(
        const std::filesystem::path& path, int operation);

private:
    int fd_ = -1;
};

}  // namespace hookguard::session
