#include "remote_host.hpp"
#include "proxy_command.hpp"
#include <core/log.hpp>

RemoteHost::RemoteHost(ConnectionConfig config, std::shared_ptr<SessionFactory> factory)
    : connections_(std::move(config), std::move(factory)),
      executor_(connections_),
      transfers_(connections_) {}

Result<ExecResult> RemoteHost::exec(const std::string& command, const ExecOptions& options) {
    return executor_.exec(command, options);
}

Result<bool> RemoteHost::upload(const std::string& local, const std::string& remote) {
    return transfers_.upload(local, remote);
}

Result<bool> RemoteHost::download(const std::string& remote, const std::string& local) {
    return transfers_.download(remote, local);
}

Result<std::string> RemoteHost::console_command() const {
    auto valid = validate(connections_.config());
    if (valid.is_err()) return Result<std::string>::Err(valid);
    return build_console_command(connections_.config());
}

void RemoteHost::close() {
    hopssh_log(LogLevel::Info, "close(" + describe() + ")");
    connections_.close();
}
