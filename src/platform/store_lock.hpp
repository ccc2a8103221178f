#pragma once
#include <string>

// RAII exclusive lock guarding a store's mutation window.
// Uses flock() on <store>.lock; released when the holder closes the file or
// the process exits (even on crash).
class StoreLock {
public:
    // Attempts to acquire the lock without blocking. Check held() after construction.
    explicit StoreLock(const std::string& store_path);
    ~StoreLock();

    StoreLock(const StoreLock&) = delete;
    StoreLock& operator=(const StoreLock&) = delete;

    // Returns true if this instance holds the lock.
    bool held() const { return fd_ >= 0; }

    const std::string& lock_path() const { return lock_path_; }

    // Throw PipelineError(IO) naming the contended store unless held.
    void require() const;

private:
    int fd_ = -1;
    std::string store_path_;
    std::string lock_path_;
};
