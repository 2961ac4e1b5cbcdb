#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <iostream>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

ConnectionConfig::ConnectionConfig()
    : stdout_sink(&std::cout), stderr_sink(&std::cerr) {}

Result<void> validate(const ConnectionConfig& config) {
    if (config.host.empty()) {
        return Result<void>::Err(ErrorKind::Config,
                                 "You must specify a host in order to connect.");
    }
    if (config.proxy) {
        if (!config.proxy->user || config.proxy->user->empty()) {
            return Result<void>::Err(ErrorKind::Config,
                                     "You must specify a proxy user in order to SSH proxy.");
        }
        if (!config.proxy->host || config.proxy->host->empty()) {
            return Result<void>::Err(ErrorKind::Config,
                                     "You must specify a proxy host in order to SSH proxy.");
        }
    }
    return Result<void>::Ok();
}

std::string describe(const ConnectionConfig& config) {
    std::string out = config.user.empty() ? config.host : config.user + "@" + config.host;
    if (config.port) out += fmt::format(":{}", *config.port);
    return out;
}

// ── YAML parsing ──────────────────────────────────────────────

// A key may hold a single scalar or a sequence of scalars.
static std::vector<std::string> parse_path_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (!node) return out;
    if (node.IsSequence()) {
        for (const auto& item : node) {
            out.push_back(expand_home(item.as<std::string>()));
        }
    } else if (node.IsScalar()) {
        out.push_back(expand_home(node.as<std::string>()));
    }
    return out;
}

// Algorithm lists accept "a,b,c" or a YAML sequence.
static std::vector<std::string> parse_name_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (!node) return out;
    if (node.IsSequence()) {
        for (const auto& item : node) out.push_back(item.as<std::string>());
    } else if (node.IsScalar()) {
        out = split_list(node.as<std::string>());
    }
    return out;
}

static std::optional<ProxyConfig> parse_proxy_config(const YAML::Node& node) {
    bool present = node["proxy_host"] || node["proxy_user"] ||
                   node["proxy_port"] || node["proxy_identity_file"];
    if (!present) return std::nullopt;

    ProxyConfig proxy;
    if (node["proxy_host"]) proxy.host = node["proxy_host"].as<std::string>();
    if (node["proxy_user"]) proxy.user = node["proxy_user"].as<std::string>();
    if (node["proxy_port"]) proxy.port = node["proxy_port"].as<int>();
    proxy.identity_files = parse_path_list(node["proxy_identity_file"]);
    return proxy;
}

static ConnectionConfig parse_connection_node(const YAML::Node& node) {
    ConnectionConfig config;
    config.host = node["host"].as<std::string>("");
    config.user = node["user"].as<std::string>("");
    if (node["port"]) config.port = node["port"].as<int>();
    if (node["password"]) config.password = node["password"].as<std::string>();
    config.identity_files = parse_path_list(node["identity_file"]);

    config.timeout = node["timeout"].as<int>(DEFAULT_CONNECT_TIMEOUT_SECS);
    config.compression = node["compression"].as<bool>(false);
    if (node["compression_level"]) {
        config.compression_level = node["compression_level"].as<int>();
    }
    config.forward_agent = node["forward_agent"].as<bool>(true);
    config.host_key_verify = node["host_key_verify"].as<bool>(false);

    config.encryption = parse_name_list(node["encryption"]);
    config.hmac = parse_name_list(node["hmac"]);
    config.host_key = parse_name_list(node["host_key"]);
    config.auth_methods = parse_name_list(node["auth_methods"]);
    config.keys_only = node["keys_only"].as<bool>(false);
    if (node["known_hosts_file"]) {
        config.known_hosts_file = expand_home(node["known_hosts_file"].as<std::string>());
    }
    if (node["global_known_hosts_file"]) {
        config.global_known_hosts_file =
            expand_home(node["global_known_hosts_file"].as<std::string>());
    }

    config.proxy = parse_proxy_config(node);
    return config;
}

Result<ConnectionConfig> parse_connection_config(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root.IsMap()) {
            return Result<ConnectionConfig>::Err(ErrorKind::Config,
                                                 "Config must be a YAML mapping");
        }
        return Result<ConnectionConfig>::Ok(parse_connection_node(root));
    } catch (const YAML::Exception& e) {
        return Result<ConnectionConfig>::Err(ErrorKind::Config,
                                             "Failed to parse config", e.what());
    }
}

Result<ConnectionConfig> load_connection_config(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<ConnectionConfig>::Err(ErrorKind::Config,
                                             "Cannot read config file: " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();

    auto result = parse_connection_config(buf.str());
    if (result.is_err()) {
        result.error += " (" + path.string() + ")";
    }
    return result;
}

fs::path get_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_default_config_path() {
    return get_config_dir() / CONFIG_FILE_NAME;
}

bool default_config_exists() {
    return fs::exists(get_default_config_path());
}
