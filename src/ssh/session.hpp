#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "transfer_event.hpp"

// Provider-level options for opening one SSH session. Built from a
// ConnectionConfig by ConnectionManager; only explicitly set options are
// filled in; everything else falls back to the client library's defaults.
struct SessionOptions {
    std::string host;
    std::string user;
    std::optional<int> port;
    std::optional<std::string> password;
    std::vector<std::string> identity_files;
    std::optional<int> timeout;                   // seconds
    std::optional<bool> compression;
    std::optional<int> compression_level;
    std::optional<bool> forward_agent;
    std::vector<std::string> encryption;
    std::vector<std::string> hmac;
    std::vector<std::string> host_key;
    std::vector<std::string> auth_methods;
    std::optional<bool> keys_only;
    std::vector<std::string> known_hosts_files;   // empty: host key not verified
    std::optional<std::string> proxy_command;     // %h/%p still unexpanded
};

// One exec sub-stream of a session. Lives for a single command.
class Channel {
public:
    virtual ~Channel() = default;

    // Ask the remote end to run `command`. Fails with ErrorKind::Command if
    // the request is refused.
    virtual Result<void> exec(const std::string& command) = 0;

    // Block until the remote end closes the channel. Handlers run
    // synchronously on the calling thread, once per chunk, in the order the
    // transport can observe (see Libssh2Channel for its limits).
    // Returns the remote exit status (-1 if none was reported).
    virtual Result<int> wait(const StreamHandler& on_stdout,
                             const StreamHandler& on_stderr) = 0;
};

// An established, authenticated SSH session. Not safe for concurrent use.
class Session {
public:
    virtual ~Session() = default;

    virtual Result<std::unique_ptr<Channel>> open_channel() = 0;
    virtual bool is_open() const = 0;
    virtual void close() = 0;
};

// SFTP sub-session used for file transfer. Emits TransferEvents to the
// observer as the transfer progresses.
class SftpSession {
public:
    virtual ~SftpSession() = default;

    virtual Result<void> upload(const std::string& local, const std::string& remote,
                                const TransferObserver& observer) = 0;
    virtual Result<void> download(const std::string& remote, const std::string& local,
                                  const TransferObserver& observer) = 0;
    virtual bool is_open() const = 0;
    virtual void close() = 0;
};

// Opens sessions. The production factory talks libssh2; tests swap in doubles.
class SessionFactory {
public:
    virtual ~SessionFactory() = default;

    virtual Result<std::unique_ptr<Session>> open_session(const SessionOptions& options) = 0;
    virtual Result<std::unique_ptr<SftpSession>> open_sftp(const SessionOptions& options) = 0;
};

std::shared_ptr<SessionFactory> make_libssh2_factory();
