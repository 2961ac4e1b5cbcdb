#include "libssh2_session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <mutex>

// ── Libssh2Channel ─────────────────────────────────────────────

Libssh2Channel::Libssh2Channel(Libssh2Transport& transport, LIBSSH2_CHANNEL* channel)
    : transport_(transport), channel_(channel) {}

Libssh2Channel::~Libssh2Channel() {
    release();
}

void Libssh2Channel::release() {
    if (!channel_) return;
    int rc;
    while ((rc = libssh2_channel_close(channel_)) == LIBSSH2_ERROR_EAGAIN) {
        transport_.wait_socket(SSH_KEEPALIVE_INTERVAL_SECS * 1000);
    }
    libssh2_channel_free(channel_);
    channel_ = nullptr;
}

Result<void> Libssh2Channel::exec(const std::string& command) {
    if (transport_.options().forward_agent.value_or(false)) {
        int rc;
        while ((rc = libssh2_channel_request_auth_agent(channel_)) == LIBSSH2_ERROR_EAGAIN) {
            transport_.wait_socket(-1);
        }
        if (rc != 0) {
            hopssh_log(LogLevel::Debug, "Agent forwarding refused: " + transport_.last_error());
        }
    }

    int rc;
    while ((rc = libssh2_channel_exec(channel_, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        transport_.wait_socket(-1);
    }
    if (rc != 0) {
        return transport_.fail<void>(rc, ErrorKind::Command,
                                     "Exec request rejected by " + transport_.target());
    }
    return Result<void>::Ok();
}

long read_one_chunk(const ChannelReader& read_stdout, const ChannelReader& read_stderr,
                    const StreamHandler& on_stdout, const StreamHandler& on_stderr,
                    bool& prefer_stderr) {
    char buf[SSH_READ_BUF_SIZE];

    for (int i = 0; i < 2; ++i) {
        bool from_stderr = ((i == 0) == prefer_stderr);
        ssize_t n = from_stderr ? read_stderr(buf, sizeof(buf)) : read_stdout(buf, sizeof(buf));
        if (n > 0) {
            std::string chunk(buf, static_cast<size_t>(n));
            if (from_stderr) on_stderr(chunk);
            else on_stdout(chunk);
            prefer_stderr = !from_stderr;
            return static_cast<long>(n);
        }
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) return static_cast<long>(n);
    }
    return 0;
}

long Libssh2Channel::read_chunk(const StreamHandler& on_stdout, const StreamHandler& on_stderr) {
    return read_one_chunk(
        [this](char* buf, size_t len) { return libssh2_channel_read(channel_, buf, len); },
        [this](char* buf, size_t len) { return libssh2_channel_read_stderr(channel_, buf, len); },
        on_stdout, on_stderr, prefer_stderr_);
}

Result<int> Libssh2Channel::wait(const StreamHandler& on_stdout,
                                 const StreamHandler& on_stderr) {
    for (;;) {
        long rc = read_chunk(on_stdout, on_stderr);
        if (rc < 0) {
            return transport_.fail<int>(static_cast<int>(rc), ErrorKind::Connection,
                                        "Channel read failed on " + transport_.target());
        }
        if (rc > 0) continue;
        if (libssh2_channel_eof(channel_)) break;
        transport_.wait_socket(SSH_KEEPALIVE_INTERVAL_SECS * 1000);
        transport_.keepalive();
    }

    int close_rc;
    while ((close_rc = libssh2_channel_close(channel_)) == LIBSSH2_ERROR_EAGAIN) {
        transport_.wait_socket(-1);
    }
    if (close_rc == 0) {
        while ((close_rc = libssh2_channel_wait_closed(channel_)) == LIBSSH2_ERROR_EAGAIN) {
            transport_.wait_socket(-1);
        }
    }

    int exit_status = -1;
    if (close_rc == 0) {
        exit_status = libssh2_channel_get_exit_status(channel_);
    }

    libssh2_channel_free(channel_);
    channel_ = nullptr;
    return Result<int>::Ok(exit_status);
}

// ── Libssh2Session ─────────────────────────────────────────────

Libssh2Session::Libssh2Session(std::unique_ptr<Libssh2Transport> transport)
    : transport_(std::move(transport)) {
    transport_->set_blocking(false);
}

Libssh2Session::~Libssh2Session() {
    close();
}

Result<std::unique_ptr<Channel>> Libssh2Session::open_channel() {
    if (!is_open()) {
        return Result<std::unique_ptr<Channel>>::Err(ErrorKind::TransientIO,
                                                     "Session is closed");
    }

    LIBSSH2_CHANNEL* channel = nullptr;
    while ((channel = libssh2_channel_open_session(transport_->raw_session())) == nullptr) {
        int rc = libssh2_session_last_errno(transport_->raw_session());
        if (rc != LIBSSH2_ERROR_EAGAIN) {
            return transport_->fail<std::unique_ptr<Channel>>(
                rc, ErrorKind::Connection, "Failed to open SSH channel on " + transport_->target());
        }
        transport_->wait_socket(-1);
    }

    return Result<std::unique_ptr<Channel>>::Ok(
        std::make_unique<Libssh2Channel>(*transport_, channel));
}

bool Libssh2Session::is_open() const {
    return transport_ && transport_->is_active();
}

void Libssh2Session::close() {
    if (transport_) transport_->close();
}

// ── Libssh2SessionFactory ──────────────────────────────────────

Libssh2SessionFactory::Libssh2SessionFactory() {
    static std::once_flag init_once;
    std::call_once(init_once, [] {
        int rc = libssh2_init(0);
        if (rc != 0) {
            hopssh_log(LogLevel::Fatal, fmt::format("libssh2_init failed ({})", rc));
        }
    });
}

Result<std::unique_ptr<Session>> Libssh2SessionFactory::open_session(const SessionOptions& options) {
    auto transport = std::make_unique<Libssh2Transport>(options);
    auto established = transport->establish();
    if (established.is_err()) {
        return Result<std::unique_ptr<Session>>::Err(established);
    }
    return Result<std::unique_ptr<Session>>::Ok(
        std::make_unique<Libssh2Session>(std::move(transport)));
}

Result<std::unique_ptr<SftpSession>> Libssh2SessionFactory::open_sftp(const SessionOptions& options) {
    auto transport = std::make_unique<Libssh2Transport>(options);
    auto established = transport->establish();
    if (established.is_err()) {
        return Result<std::unique_ptr<SftpSession>>::Err(established);
    }

    LIBSSH2_SFTP* sftp = libssh2_sftp_init(transport->raw_session());
    if (!sftp) {
        int rc = libssh2_session_last_errno(transport->raw_session());
        return transport->fail<std::unique_ptr<SftpSession>>(
            rc, ErrorKind::Connection, "Failed to start SFTP subsystem on " + transport->target());
    }

    return Result<std::unique_ptr<SftpSession>>::Ok(
        std::make_unique<Libssh2SftpSession>(std::move(transport), sftp));
}

std::shared_ptr<SessionFactory> make_libssh2_factory() {
    return std::make_shared<Libssh2SessionFactory>();
}
