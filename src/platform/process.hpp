#pragma once

#include <string>
#include <core/types.hpp>
#include "socket_util.hpp"

namespace platform {

// Owns a spawned child process. Terminates it on destruction if still running.
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

    // True if the process is still running.
    bool running() const;

    // SIGTERM, then SIGKILL if the process outlives the grace period.
    void terminate(int grace_ms);

private:
    int pid_ = -1;

    friend Result<ProcessHandle> spawn_relay(const std::string& command, socket_t& local_end);
};

// Run `command` through /bin/sh with its stdin and stdout bound to one end of
// a socketpair. The other end is returned in local_end (caller closes it).
// Used for ProxyCommand-style tunnels: bytes written to local_end reach the
// relay's stdin, and its stdout comes back on local_end.
Result<ProcessHandle> spawn_relay(const std::string& command, socket_t& local_end);

// Replace the current process image with `/bin/sh -c command`.
// Does not return on success; returns an error only if the exec itself failed.
Result<void> replace_process(const std::string& command);

} // namespace platform
