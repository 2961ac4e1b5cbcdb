#include "libssh2_session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

Libssh2SftpSession::Libssh2SftpSession(std::unique_ptr<Libssh2Transport> transport,
                                       LIBSSH2_SFTP* sftp)
    : transport_(std::move(transport)), sftp_(sftp) {
    transport_->set_blocking(true);
}

Libssh2SftpSession::~Libssh2SftpSession() {
    close();
}

bool Libssh2SftpSession::is_open() const {
    return sftp_ && transport_ && transport_->is_active();
}

void Libssh2SftpSession::close() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (transport_) transport_->close();
}

static void emit(const TransferObserver& observer, TransferEvent event) {
    if (observer) observer(event);
}

ErrorKind sftp_status_kind(unsigned long status) {
    switch (status) {
    case LIBSSH2_FX_CONNECTION_LOST:
    case LIBSSH2_FX_NO_CONNECTION:
        return ErrorKind::TransientIO;
    default:
        return ErrorKind::Transfer;
    }
}

// Error result for the last failed SFTP call
Result<void> Libssh2SftpSession::sftp_error(const std::string& message) const {
    int rc = libssh2_session_last_errno(transport_->raw_session());
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        unsigned long status = libssh2_sftp_last_error(sftp_);
        return Result<void>::Err(sftp_status_kind(status), message,
                                 fmt::format("sftp status {}", status));
    }
    return transport_->fail<void>(rc, ErrorKind::Transfer, message);
}

Result<void> Libssh2SftpSession::ensure_remote_parents(const std::string& remote,
                                                       const TransferObserver& observer) {
    fs::path parent = fs::path(remote).parent_path();
    if (parent.empty() || parent == parent.root_path()) return Result<void>::Ok();

    fs::path prefix;
    for (const auto& part : parent) {
        prefix /= part;
        if (prefix == prefix.root_path()) continue;

        std::string dir = prefix.string();
        LIBSSH2_SFTP_ATTRIBUTES attrs;
        if (libssh2_sftp_stat(sftp_, dir.c_str(), &attrs) == 0) continue;

        if (libssh2_sftp_mkdir(sftp_, dir.c_str(), 0755) != 0) {
            return sftp_error("Cannot create remote directory " + dir);
        }
        TransferEvent event{TransferEvent::Kind::Mkdir};
        event.path = dir;
        emit(observer, event);
    }
    return Result<void>::Ok();
}

Result<void> Libssh2SftpSession::upload(const std::string& local, const std::string& remote,
                                        const TransferObserver& observer) {
    std::ifstream in(local, std::ios::binary);
    if (!in) {
        return Result<void>::Err(ErrorKind::Transfer, "Cannot read local file " + local);
    }

    auto dirs = ensure_remote_parents(remote, observer);
    if (dirs.is_err()) return dirs;

    LIBSSH2_SFTP_HANDLE* handle = libssh2_sftp_open(
        sftp_, remote.c_str(),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
        LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH);
    if (!handle) return sftp_error("Cannot open remote file " + remote);

    TransferEvent opened{TransferEvent::Kind::Open};
    opened.local = local;
    opened.remote = remote;
    emit(observer, opened);

    std::vector<char> buf(SFTP_CHUNK_SIZE);
    uint64_t offset = 0;
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = in.gcount();
        if (got <= 0) break;

        const char* p = buf.data();
        size_t remain = static_cast<size_t>(got);
        while (remain > 0) {
            ssize_t w = libssh2_sftp_write(handle, p, remain);
            if (w < 0) {
                auto err = sftp_error(fmt::format("Write to {} failed at offset {}", remote, offset));
                libssh2_sftp_close(handle);
                return err;
            }
            TransferEvent put{TransferEvent::Kind::Put};
            put.local = local;
            put.remote = remote;
            put.offset = offset;
            put.size = static_cast<uint64_t>(w);
            emit(observer, put);

            p += w;
            remain -= static_cast<size_t>(w);
            offset += static_cast<uint64_t>(w);
        }
    }

    if (in.bad()) {
        libssh2_sftp_close(handle);
        return Result<void>::Err(ErrorKind::Transfer, "Read from local file " + local + " failed");
    }

    if (libssh2_sftp_close(handle) != 0) {
        return sftp_error("Closing remote file " + remote + " failed");
    }
    TransferEvent closed{TransferEvent::Kind::Close};
    closed.path = remote;
    emit(observer, closed);
    emit(observer, TransferEvent{TransferEvent::Kind::Finish});
    return Result<void>::Ok();
}

Result<void> Libssh2SftpSession::download(const std::string& remote, const std::string& local,
                                          const TransferObserver& observer) {
    LIBSSH2_SFTP_HANDLE* handle = libssh2_sftp_open(sftp_, remote.c_str(), LIBSSH2_FXF_READ, 0);
    if (!handle) return sftp_error("Cannot open remote file " + remote);

    // Local parents, one Mkdir per directory created
    fs::path parent = fs::path(local).parent_path();
    if (!parent.empty() && !fs::exists(parent)) {
        std::vector<fs::path> missing;
        for (fs::path p = parent; !p.empty() && !fs::exists(p); p = p.parent_path()) {
            missing.push_back(p);
            if (p == p.parent_path()) break;
        }
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            libssh2_sftp_close(handle);
            return Result<void>::Err(ErrorKind::Transfer,
                                     "Cannot create local directory " + parent.string(), ec.message());
        }
        for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
            TransferEvent event{TransferEvent::Kind::Mkdir};
            event.path = it->string();
            emit(observer, event);
        }
    }

    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out) {
        libssh2_sftp_close(handle);
        return Result<void>::Err(ErrorKind::Transfer, "Cannot write local file " + local);
    }
    // A failed download leaves no truncated file behind
    platform::PartialFile partial(local);

    TransferEvent opened{TransferEvent::Kind::Open};
    opened.local = local;
    opened.remote = remote;
    emit(observer, opened);

    std::vector<char> buf(SFTP_CHUNK_SIZE);
    uint64_t offset = 0;
    for (;;) {
        ssize_t n = libssh2_sftp_read(handle, buf.data(), buf.size());
        if (n == 0) break;  // EOF
        if (n < 0) {
            auto err = sftp_error(fmt::format("Read from {} failed at offset {}", remote, offset));
            libssh2_sftp_close(handle);
            return err;
        }

        out.write(buf.data(), n);
        if (!out) {
            libssh2_sftp_close(handle);
            return Result<void>::Err(ErrorKind::Transfer, "Write to local file " + local + " failed");
        }

        TransferEvent got{TransferEvent::Kind::Get};
        got.local = local;
        got.remote = remote;
        got.offset = offset;
        got.size = static_cast<uint64_t>(n);
        emit(observer, got);
        offset += static_cast<uint64_t>(n);
    }

    libssh2_sftp_close(handle);
    out.close();
    if (!out) {
        return Result<void>::Err(ErrorKind::Transfer, "Closing local file " + local + " failed");
    }
    partial.commit();

    TransferEvent closed{TransferEvent::Kind::Close};
    closed.path = local;
    emit(observer, closed);
    emit(observer, TransferEvent{TransferEvent::Kind::Finish});
    return Result<void>::Ok();
}
