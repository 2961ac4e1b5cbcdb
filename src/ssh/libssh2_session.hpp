#pragma once

#include <functional>
#include <memory>
#include <string>
#include <sys/types.h>
#include "session.hpp"
#include "libssh2_transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

// Reads up to `len` bytes from one half of a channel. Returns the byte count,
// 0 or LIBSSH2_ERROR_EAGAIN when nothing is buffered, or a libssh2 error.
using ChannelReader = std::function<ssize_t(char* buf, size_t len)>;

// One read round: try the preferred half, then the other, and stop at the
// first chunk delivered. After a delivery the other half is preferred next
// round. Returns bytes delivered, 0 if neither half had data, or a negative
// libssh2 error.
//
// libssh2 keeps no ordering between the two halves. Within the data buffered
// at one wakeup a later stdout chunk can be delivered ahead of an earlier
// stderr chunk (or the reverse); order is kept only across socket waits.
long read_one_chunk(const ChannelReader& read_stdout, const ChannelReader& read_stderr,
                    const StreamHandler& on_stdout, const StreamHandler& on_stderr,
                    bool& prefer_stderr);

// Exec channel over a non-blocking libssh2 session. Reads one chunk per round,
// alternating between stdout and stderr.
class Libssh2Channel : public Channel {
public:
    Libssh2Channel(Libssh2Transport& transport, LIBSSH2_CHANNEL* channel);
    ~Libssh2Channel() override;

    Result<void> exec(const std::string& command) override;
    Result<int> wait(const StreamHandler& on_stdout,
                     const StreamHandler& on_stderr) override;

private:
    Libssh2Transport& transport_;
    LIBSSH2_CHANNEL* channel_;
    bool prefer_stderr_ = false;

    long read_chunk(const StreamHandler& on_stdout, const StreamHandler& on_stderr);
    void release();
};

class Libssh2Session : public Session {
public:
    explicit Libssh2Session(std::unique_ptr<Libssh2Transport> transport);
    ~Libssh2Session() override;

    Result<std::unique_ptr<Channel>> open_channel() override;
    bool is_open() const override;
    void close() override;

private:
    std::unique_ptr<Libssh2Transport> transport_;
};

// Error kind for a failed SFTP status code: a lost or missing connection is
// TransientIO, anything else is a Transfer error.
ErrorKind sftp_status_kind(unsigned long status);

// SFTP subsystem on its own blocking libssh2 session.
class Libssh2SftpSession : public SftpSession {
public:
    Libssh2SftpSession(std::unique_ptr<Libssh2Transport> transport, LIBSSH2_SFTP* sftp);
    ~Libssh2SftpSession() override;

    Result<void> upload(const std::string& local, const std::string& remote,
                        const TransferObserver& observer) override;
    Result<void> download(const std::string& remote, const std::string& local,
                          const TransferObserver& observer) override;
    bool is_open() const override;
    void close() override;

private:
    std::unique_ptr<Libssh2Transport> transport_;
    LIBSSH2_SFTP* sftp_;

    // Create missing parents of `remote`, one Mkdir event per directory made
    Result<void> ensure_remote_parents(const std::string& remote,
                                       const TransferObserver& observer);
    Result<void> sftp_error(const std::string& message) const;
};

class Libssh2SessionFactory : public SessionFactory {
public:
    Libssh2SessionFactory();

    Result<std::unique_ptr<Session>> open_session(const SessionOptions& options) override;
    Result<std::unique_ptr<SftpSession>> open_sftp(const SessionOptions& options) override;
};
