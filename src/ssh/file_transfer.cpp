#include "file_transfer.hpp"
#include "retry.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

FileTransferService::FileTransferService(ConnectionManager& connections)
    : connections_(connections) {}

void FileTransferService::log_event(const TransferEvent& event) {
    hopssh_log(LogLevel::Debug, describe_transfer_event(event));
}

Result<bool> FileTransferService::upload(const std::string& local, const std::string& remote) {
    hopssh_log(LogLevel::Info, fmt::format("upload(\"{}\", \"{}\")", local, remote));
    return transfer(Direction::Upload, local, remote);
}

Result<bool> FileTransferService::download(const std::string& remote, const std::string& local) {
    hopssh_log(LogLevel::Info, fmt::format("download(\"{}\", \"{}\")", remote, local));
    return transfer(Direction::Download, remote, local);
}

Result<bool> FileTransferService::transfer(Direction direction,
                                           const std::string& from,
                                           const std::string& to) {
    const char* verb = (direction == Direction::Upload) ? "upload" : "download";

    return retry(SSH_MAX_ATTEMPTS, ErrorKind::TransientIO, [&](int attempt) {
        if (attempt > 1) {
            hopssh_log(LogLevel::Info,
                       fmt::format("{}(\"{}\", \"{}\") attempt {}", verb, from, to, attempt));
        }

        auto sftp = connections_.sftp();
        if (sftp.is_err()) return Result<bool>::Err(sftp);

        auto moved = (direction == Direction::Upload)
            ? sftp.value->upload(from, to, log_event)
            : sftp.value->download(from, to, log_event);

        if (moved.is_err()) {
            if (moved.kind == ErrorKind::TransientIO) {
                connections_.discard_sftp();
                return Result<bool>::Err(moved);
            }
            std::string message = fmt::format("{} failed ({} -> {}): {}", verb, from, to, moved.error);
            hopssh_log(LogLevel::Error, message);
            ErrorKind kind = (moved.kind == ErrorKind::Connection || moved.kind == ErrorKind::Config)
                ? moved.kind : ErrorKind::Transfer;
            return Result<bool>::Err(kind, message, moved.cause);
        }
        return Result<bool>::Ok(true);
    });
}
