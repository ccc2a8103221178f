#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Block until the child exits. Returns its exit code, 128+N if it was
    // killed by signal N, -1 if the handle is invalid.
    int wait();

private:
    int pid_ = -1;
    bool reaped_ = false;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& stderr_log,
                               int stdout_fd);
};

// Spawn a child process (argv-style, no shell).
// stderr_log: if non-empty, redirect child's stderr to this file (append mode).
// stdout_fd: if >= 0, the child's stdout is dup'ed onto this descriptor.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stderr_log = "",
                    int stdout_fd = -1);

// Spawn and wait. Output goes to the terminal. Returns the exit code
// (127 if the program could not be executed).
int run(const std::string& program, const std::vector<std::string>& args);

// Spawn, capture stdout, and wait.
ProcessResult capture(const std::string& program, const std::vector<std::string>& args);

} // namespace platform
