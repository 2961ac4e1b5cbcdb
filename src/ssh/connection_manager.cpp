#include "connection_manager.hpp"
#include "proxy_command.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

// ── Lifecycle ──────────────────────────────────────────────────

ConnectionManager::ConnectionManager(ConnectionConfig config,
                                     std::shared_ptr<SessionFactory> factory)
    : config_(std::move(config)),
      factory_(factory ? std::move(factory) : make_libssh2_factory()) {}

ConnectionManager::~ConnectionManager() {
    close();
}

std::string ConnectionManager::describe() const {
    return ::describe(config_);
}

bool ConnectionManager::connected() const {
    return session_ && session_->is_open();
}

// ── Options ────────────────────────────────────────────────────

static std::string redact(const SessionOptions& o) {
    std::vector<std::string> parts;
    parts.push_back("host=" + o.host);
    if (!o.user.empty()) parts.push_back("user=" + o.user);
    if (o.port) parts.push_back(fmt::format("port={}", *o.port));
    if (o.password) parts.push_back("password=<redacted>");
    if (!o.identity_files.empty()) {
        parts.push_back(fmt::format("keys=[{}]", fmt::join(o.identity_files, ", ")));
    }
    if (o.timeout) parts.push_back(fmt::format("timeout={}", *o.timeout));
    if (o.compression) parts.push_back(fmt::format("compression={}", *o.compression));
    if (o.compression_level) {
        parts.push_back(fmt::format("compression_level={}", *o.compression_level));
    }
    if (o.forward_agent) parts.push_back(fmt::format("forward_agent={}", *o.forward_agent));
    if (!o.encryption.empty()) {
        parts.push_back(fmt::format("encryption=[{}]", fmt::join(o.encryption, ",")));
    }
    if (!o.hmac.empty()) parts.push_back(fmt::format("hmac=[{}]", fmt::join(o.hmac, ",")));
    if (!o.host_key.empty()) {
        parts.push_back(fmt::format("host_key=[{}]", fmt::join(o.host_key, ",")));
    }
    if (!o.auth_methods.empty()) {
        parts.push_back(fmt::format("auth_methods=[{}]", fmt::join(o.auth_methods, ",")));
    }
    if (o.keys_only) parts.push_back(fmt::format("keys_only={}", *o.keys_only));
    if (!o.known_hosts_files.empty()) {
        parts.push_back(fmt::format("known_hosts=[{}]", fmt::join(o.known_hosts_files, ", ")));
    }
    if (o.proxy_command) parts.push_back("proxy=\"" + *o.proxy_command + "\"");
    return fmt::format("{}", fmt::join(parts, " "));
}

Result<SessionOptions> ConnectionManager::session_options() const {
    auto valid = validate(config_);
    if (valid.is_err()) {
        hopssh_log(LogLevel::Fatal, valid.error);
        return Result<SessionOptions>::Err(valid);
    }

    SessionOptions o;
    o.host = config_.host;
    o.user = config_.user;
    o.port = config_.port;
    o.password = config_.password;
    o.identity_files = config_.identity_files;
    o.encryption = config_.encryption;
    o.hmac = config_.hmac;
    o.host_key = config_.host_key;
    o.auth_methods = config_.auth_methods;

    // Flags pass through only when they differ from the documented default
    if (config_.timeout > 0) o.timeout = config_.timeout;
    if (config_.compression) o.compression = true;
    if (config_.compression_level) o.compression_level = config_.compression_level;
    if (config_.forward_agent) o.forward_agent = true;
    if (config_.keys_only) o.keys_only = true;

    if (config_.host_key_verify) {
        o.known_hosts_files.push_back(
            config_.known_hosts_file.value_or(expand_home(DEFAULT_KNOWN_HOSTS)));
        if (config_.global_known_hosts_file) {
            o.known_hosts_files.push_back(*config_.global_known_hosts_file);
        }
    }

    if (config_.proxy) {
        auto proxy = build_proxy_command(*config_.proxy, config_.forward_agent,
                                         config_.host_key_verify);
        if (proxy.is_err()) return Result<SessionOptions>::Err(proxy);
        o.proxy_command = proxy.value;
    }

    hopssh_log(LogLevel::Debug, "session_options(" + redact(o) + ")");
    return Result<SessionOptions>::Ok(std::move(o));
}

// ── Session grants ─────────────────────────────────────────────

Result<Session*> ConnectionManager::session() {
    if (session_ && session_->is_open()) {
        return Result<Session*>::Ok(session_.get());
    }
    session_.reset();

    auto options = session_options();
    if (options.is_err()) return Result<Session*>::Err(options);

    hopssh_log(LogLevel::Info, "connect(" + describe() + ")");
    auto opened = factory_->open_session(options.value);
    if (opened.is_err()) {
        hopssh_log(LogLevel::Error,
                   fmt::format("connect({}) failed: {}{}", describe(), opened.error,
                               opened.cause.empty() ? "" : " [" + opened.cause + "]"));
        return Result<Session*>::Err(opened);
    }

    session_ = std::move(opened.value);
    return Result<Session*>::Ok(session_.get());
}

Result<SftpSession*> ConnectionManager::sftp() {
    if (sftp_ && sftp_->is_open()) {
        return Result<SftpSession*>::Ok(sftp_.get());
    }
    sftp_.reset();

    auto options = session_options();
    if (options.is_err()) return Result<SftpSession*>::Err(options);

    hopssh_log(LogLevel::Info, "sftp(" + describe() + ")");
    auto opened = factory_->open_sftp(options.value);
    if (opened.is_err()) {
        hopssh_log(LogLevel::Error,
                   fmt::format("sftp({}) failed: {}{}", describe(), opened.error,
                               opened.cause.empty() ? "" : " [" + opened.cause + "]"));
        return Result<SftpSession*>::Err(opened);
    }

    sftp_ = std::move(opened.value);
    return Result<SftpSession*>::Ok(sftp_.get());
}

void ConnectionManager::discard_session() {
    if (!session_) return;
    hopssh_log(LogLevel::Debug, "discard session (" + describe() + ")");
    session_->close();
    session_.reset();
}

void ConnectionManager::discard_sftp() {
    if (!sftp_) return;
    hopssh_log(LogLevel::Debug, "discard sftp (" + describe() + ")");
    sftp_->close();
    sftp_.reset();
}

void ConnectionManager::close() {
    if (!session_ && !sftp_) return;
    hopssh_log(LogLevel::Debug, "close(" + describe() + ")");
    if (sftp_) {
        sftp_->close();
        sftp_.reset();
    }
    if (session_) {
        session_->close();
        session_.reset();
    }
}
