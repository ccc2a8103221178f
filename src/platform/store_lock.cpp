#include "store_lock.hpp"
#include <core/errors.hpp>
#include <filesystem>
#include <system_error>
#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>

StoreLock::StoreLock(const std::string& store_path)
    : store_path_(store_path), lock_path_(store_path + ".lock") {
    // Ensure parent directory exists
    std::error_code ec;
    std::filesystem::create_directories(
        std::filesystem::path(lock_path_).parent_path(), ec);

    fd_ = open(lock_path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0) return;
    if (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        close(fd_);
        fd_ = -1;
    }
}

StoreLock::~StoreLock() {
    if (fd_ < 0) return;
    close(fd_);
    // flock is released automatically when fd is closed
}

void StoreLock::require() const {
    if (!held()) {
        throw PipelineError(ErrorKind::IO,
            "Another shutterbox process is using " + store_path_);
    }
}
