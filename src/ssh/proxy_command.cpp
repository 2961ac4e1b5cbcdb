#include "proxy_command.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <vector>

// Flags common to the console and relay invocations
static std::vector<std::string> base_ssh_words(bool forward_agent, bool host_key_verify) {
    std::vector<std::string> words{SSH_CLIENT_BINARY, "-q"};
    if (forward_agent) words.push_back("-A");
    if (!host_key_verify) words.push_back(SSH_NO_KNOWN_HOSTS);
    words.push_back(SSH_NO_STRICT_KEYS);
    words.push_back(SSH_KEEPALIVE_OPTS);
    return words;
}

static void append_identity_and_port(std::vector<std::string>& words,
                                     const std::vector<std::string>& identity_files,
                                     const std::optional<int>& port) {
    for (const auto& key : identity_files) {
        words.push_back("-i " + key);
    }
    if (port) words.push_back(fmt::format("-p {}", *port));
}

Result<std::string> build_proxy_command(const ProxyConfig& proxy,
                                        bool forward_agent,
                                        bool host_key_verify) {
    if (!proxy.user || proxy.user->empty()) {
        std::string message = "You must specify a proxy user in order to SSH proxy.";
        hopssh_log(LogLevel::Fatal, message);
        return Result<std::string>::Err(ErrorKind::Config, message);
    }
    if (!proxy.host || proxy.host->empty()) {
        std::string message = "You must specify a proxy host in order to SSH proxy.";
        hopssh_log(LogLevel::Fatal, message);
        return Result<std::string>::Err(ErrorKind::Config, message);
    }

    auto words = base_ssh_words(forward_agent, host_key_verify);
    append_identity_and_port(words, proxy.identity_files, proxy.port);
    words.push_back(*proxy.user + "@" + *proxy.host);
    words.push_back(PROXY_RELAY_COMMAND);

    std::string command = join_words(words);
    hopssh_log(LogLevel::Debug, fmt::format("proxy_command(\"{}\")", command));
    return Result<std::string>::Ok(command);
}

Result<std::string> build_console_command(const ConnectionConfig& config) {
    auto words = base_ssh_words(config.forward_agent, config.host_key_verify);
    append_identity_and_port(words, config.identity_files, config.port);

    if (config.proxy && config.proxy->host) {
        auto proxy = build_proxy_command(*config.proxy, config.forward_agent,
                                         config.host_key_verify);
        if (proxy.is_err()) return proxy;
        words.push_back("-o ProxyCommand=\"" + proxy.value + "\"");
    }

    words.push_back(config.user.empty() ? config.host : config.user + "@" + config.host);

    std::string command = join_words(words);
    hopssh_log(LogLevel::Debug, fmt::format("console_command(\"{}\")", command));
    return Result<std::string>::Ok(command);
}

std::string expand_proxy_command(const std::string& command,
                                 const std::string& host, int port) {
    std::string out;
    out.reserve(command.size() + host.size());
    for (size_t i = 0; i < command.size(); ++i) {
        if (command[i] == '%' && i + 1 < command.size()) {
            char next = command[i + 1];
            if (next == 'h') { out += host; ++i; continue; }
            if (next == 'p') { out += std::to_string(port); ++i; continue; }
            if (next == '%') { out += '%'; ++i; continue; }
        }
        out += command[i];
    }
    return out;
}
