#pragma once

#include <memory>
#include <string>
#include <core/config.hpp>
#include <core/types.hpp>
#include "connection_manager.hpp"
#include "command_executor.hpp"
#include "file_transfer.hpp"

// One remote host: the connection plus the operations run over it.
//
// Sessions are opened on first use and reused until close(). Not safe for
// concurrent use; run parallel work on separate RemoteHost instances.
class RemoteHost {
public:
    explicit RemoteHost(ConnectionConfig config,
                        std::shared_ptr<SessionFactory> factory = nullptr);

    Result<ExecResult> exec(const std::string& command, const ExecOptions& options = {});
    Result<bool> upload(const std::string& local, const std::string& remote);
    Result<bool> download(const std::string& remote, const std::string& local);

    // Interactive ssh command line for this host (see build_console_command)
    Result<std::string> console_command() const;

    void close();
    bool connected() const { return connections_.connected(); }
    std::string describe() const { return connections_.describe(); }
    const ConnectionConfig& config() const { return connections_.config(); }

private:
    ConnectionManager connections_;
    CommandExecutor executor_;
    FileTransferService transfers_;
};
