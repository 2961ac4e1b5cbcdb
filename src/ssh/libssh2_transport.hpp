#pragma once

#include <string>
#include <core/types.hpp>
#include <platform/process.hpp>
#include <platform/socket_util.hpp>
#include "session.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// One authenticated libssh2 session over a TCP socket or a local proxy relay.
//
// establish() runs in blocking mode bounded by the connect timeout:
// socket (or relay) -> method preferences -> handshake -> host key check ->
// authentication. Afterwards the caller picks blocking or non-blocking I/O.
class Libssh2Transport {
public:
    explicit Libssh2Transport(const SessionOptions& options);
    ~Libssh2Transport();

    Libssh2Transport(const Libssh2Transport&) = delete;
    Libssh2Transport& operator=(const Libssh2Transport&) = delete;

    Result<void> establish();
    void close();
    bool is_active() const { return active_; }

    void set_blocking(bool blocking);

    // Wait (up to timeout_ms, -1 for ever) for the socket to become ready in
    // whichever direction libssh2 is currently blocked on.
    void wait_socket(int timeout_ms);

    // Send a keepalive if one is due.
    void keepalive();

    // Turn a libssh2 return code into an error result of kind `fallback`,
    // or TransientIO when the code means the stream ended underneath us.
    template <typename T>
    Result<T> fail(int rc, ErrorKind fallback, const std::string& message) {
        return Result<T>::Err(classify(rc, fallback), message, last_error());
    }

    ErrorKind classify(int rc, ErrorKind fallback) const;
    std::string last_error() const;

    LIBSSH2_SESSION* raw_session() { return session_; }
    const SessionOptions& options() const { return options_; }
    std::string target() const;

private:
    SessionOptions options_;
    LIBSSH2_SESSION* session_ = nullptr;
    socket_t sock_ = HOPSSH_INVALID_SOCKET;
    platform::ProcessHandle proxy_;
    bool active_ = false;

    Result<void> open_socket();
    Result<void> apply_preferences();
    Result<void> verify_host_key();
    Result<void> authenticate();

    bool auth_agent();
    bool auth_publickey();
    bool auth_password();
    bool auth_keyboard_interactive();
};

// True for libssh2 codes that mean the transport went away mid-operation.
bool is_transient_libssh2_error(int rc);
