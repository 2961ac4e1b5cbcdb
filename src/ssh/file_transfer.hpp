#pragma once

#include <string>
#include <core/types.hpp>
#include "connection_manager.hpp"
#include "transfer_event.hpp"

// Moves single files over the manager's SFTP session.
//
// Both directions are retried on transient end-of-stream like exec. Lifecycle
// events from the SFTP layer are written to the log and otherwise ignored.
class FileTransferService {
public:
    explicit FileTransferService(ConnectionManager& connections);

    // Returns true on success; any failure is an error result.
    Result<bool> upload(const std::string& local, const std::string& remote);
    Result<bool> download(const std::string& remote, const std::string& local);

private:
    ConnectionManager& connections_;

    enum class Direction { Upload, Download };

    Result<bool> transfer(Direction direction, const std::string& from, const std::string& to);
    static void log_event(const TransferEvent& event);
};
