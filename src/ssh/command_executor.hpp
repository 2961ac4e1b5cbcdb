#pragma once

#include <string>
#include <core/types.hpp>
#include "connection_manager.hpp"

// Tracks which stream the log is currently showing so a banner is written
// only when output switches streams, not once per chunk.
class StreamHeaderTracker {
public:
    enum class State { NONE, STDOUT_ACTIVE, STDERR_ACTIVE };

    // Returns true when `stream` differs from the active one (a banner is due).
    bool enter(StreamKind stream);

    State state() const { return state_; }
    int transitions() const { return transitions_; }

private:
    State state_ = State::NONE;
    int transitions_ = 0;
};

// Runs commands over exec channels of the manager's session.
//
// Each attempt opens a fresh channel and an empty output buffer; attempts
// that hit a transient end-of-stream drop the session and are retried (up to
// SSH_MAX_ATTEMPTS in total), reconnecting on the way.
class CommandExecutor {
public:
    explicit CommandExecutor(ConnectionManager& connections);

    Result<ExecResult> exec(const std::string& command, const ExecOptions& options = {});

private:
    ConnectionManager& connections_;

    Result<ExecResult> exec_once(const std::string& command, const ExecOptions& options);
    void banner(const std::string& tag) const;
};
