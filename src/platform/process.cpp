#include "process.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <cerrno>

namespace platform {

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    // Reap a child nobody waited for so it does not linger as a zombie.
    if (pid_ > 0 && !reaped_) {
        int status;
        waitpid(pid_, &status, WNOHANG);
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), reaped_(other.reaped_) {
    other.pid_ = -1;
    other.reaped_ = false;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        other.pid_ = -1;
        other.reaped_ = false;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

int ProcessHandle::wait() {
    if (pid_ <= 0 || reaped_) return -1;
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    reaped_ = true;
    return ret == pid_ ? decode_status(status) : -1;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stderr_log,
                    int stdout_fd) {
    ProcessHandle handle;

    // Build argv before forking; only async-signal-safe calls in the child
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        if (stdout_fd >= 0) {
            dup2(stdout_fd, STDOUT_FILENO);
            close(stdout_fd);
        }

        if (!stderr_log.empty()) {
            int fd = open(stderr_log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd >= 0) {
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    handle.pid_ = pid;
    return handle;
}

int run(const std::string& program, const std::vector<std::string>& args) {
    auto handle = spawn(program, args);
    if (!handle.valid()) return 127;
    return handle.wait();
}

ProcessResult capture(const std::string& program, const std::vector<std::string>& args) {
    ProcessResult result;

    int fds[2];
    if (pipe(fds) != 0) return result;

    // Read end must not leak into the child
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);

    auto handle = spawn(program, args, "/dev/null", fds[1]);
    close(fds[1]);
    if (!handle.valid()) {
        close(fds[0]);
        return result;
    }

    char buf[CAPTURE_READ_BUF_SIZE];
    for (;;) {
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            result.stdout_data.append(buf, static_cast<size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close(fds[0]);

    result.exit_code = handle.wait();
    return result;
}

} // namespace platform
