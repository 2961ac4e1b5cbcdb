#pragma once

#include <memory>
#include <core/config.hpp>
#include <core/types.hpp>
#include "session.hpp"

// ConnectionManager: owns the sessions for one ConnectionConfig.
//
// The exec session and the SFTP session are opened lazily on first use and
// cached until close(). A session that died mid-operation is dropped with
// discard_session()/discard_sftp() so the next call reconnects.
//
// One operation at a time: callers that need parallel remote work use
// separate ConnectionManager instances.
class ConnectionManager {
public:
    explicit ConnectionManager(ConnectionConfig config,
                               std::shared_ptr<SessionFactory> factory = nullptr);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Cached session, connecting on first use. The pointer stays owned here.
    Result<Session*> session();
    Result<SftpSession*> sftp();

    // Drop a cached session without a graceful shutdown
    void discard_session();
    void discard_sftp();

    // Close both sessions. Safe to call any number of times.
    void close();

    bool connected() const;
    const ConnectionConfig& config() const { return config_; }
    std::string describe() const;

    // Provider options for this config (validates it first)
    Result<SessionOptions> session_options() const;

private:
    ConnectionConfig config_;
    std::shared_ptr<SessionFactory> factory_;
    std::unique_ptr<Session> session_;
    std::unique_ptr<SftpSession> sftp_;
};
