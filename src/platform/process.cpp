#include "process.hpp"
#include "platform.hpp"
#include <sys/socket.h>
#include <sys/wait.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    if (running()) terminate(0);
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        if (running()) terminate(0);
        pid_ = other.pid_;
        other.pid_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::running() const {
    if (pid_ <= 0) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    return ret == 0;  // 0 means still running
}

void ProcessHandle::terminate(int grace_ms) {
    if (pid_ <= 0) return;
    kill(pid_, SIGTERM);
    for (int waited = 0; waited < grace_ms; waited += 50) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            pid_ = -1;
            return;
        }
        sleep_ms(50);
    }
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    pid_ = -1;
}

// ── spawn_relay ──────────────────────────────────────────────

Result<ProcessHandle> spawn_relay(const std::string& command, socket_t& local_end) {
    int sv[2];
    if (socketpair(AF_UNIX, SOCK_STREAM, 0, sv) < 0) {
        return Result<ProcessHandle>::Err(ErrorKind::Connection,
                                          "Failed to create proxy socketpair",
                                          errno_text(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(sv[0]);
        close(sv[1]);
        return Result<ProcessHandle>::Err(ErrorKind::Connection,
                                          "Failed to fork proxy command", errno_text(err));
    }

    if (pid == 0) {
        // Child: the relay talks to us through sv[1] on stdin/stdout
        close(sv[0]);
        dup2(sv[1], STDIN_FILENO);
        dup2(sv[1], STDOUT_FILENO);
        if (sv[1] > STDERR_FILENO) close(sv[1]);
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);  // exec failed
    }

    // Parent
    close(sv[1]);
    local_end = sv[0];

    ProcessHandle handle;
    handle.pid_ = pid;
    return Result<ProcessHandle>::Ok(std::move(handle));
}

// ── replace_process ──────────────────────────────────────────

Result<void> replace_process(const std::string& command) {
    execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
    return Result<void>::Err(ErrorKind::Command,
                             "Could not launch '" + command + "'", errno_text(errno));
}

} // namespace platform
