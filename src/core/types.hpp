#pragma once

#include <string>
#include <functional>
#include <utility>

// What went wrong, coarse enough for callers (and the retry loop) to branch on
enum class ErrorKind {
    None,
    Config,       // invalid configuration, raised before any network I/O
    Connection,   // auth rejected, timeout, unreachable host
    Command,      // remote end refused the exec request
    Transfer,     // upload/download failed
    TransientIO,  // unexpected end-of-stream mid-operation (retryable)
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    std::string cause;            // underlying library/errno text, for logs

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None, ""};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err,
                         const std::string& cause = "") {
        return {false, T{}, err, kind, cause};
    }

    // Re-wrap the error of another result type
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.kind, other.cause};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    std::string cause;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None, ""};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err,
                            const std::string& cause = "") {
        return {false, err, kind, cause};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.kind, other.cause};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Which half of a channel a chunk of output came from
enum class StreamKind {
    Stdout,
    Stderr,
};

// Remote command execution result
struct ExecResult {
    std::string output;       // stdout + stderr bytes in arrival order
    int exit_status = -1;     // remote exit code, -1 if the server sent none

    bool success() const { return exit_status == 0; }
};

struct ExecOptions {
    bool silence = false;     // keep output off the caller's sinks
};

// Receives raw bytes from one half of a channel
using StreamHandler = std::function<void(const std::string&)>;
