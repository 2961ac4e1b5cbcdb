#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>
#include "constants.hpp"
#include "types.hpp"

namespace fs = std::filesystem;

// Intermediate host the connection is tunneled through.
struct ProxyConfig {
    std::optional<std::string> host;
    std::optional<std::string> user;
    std::optional<int> port;
    std::vector<std::string> identity_files;
};

// Everything needed to reach one remote host. Fields wrapped in optional are
// passed to the SSH client only when set; the rest carry documented defaults.
// Treated as immutable once a connection has been opened with it.
struct ConnectionConfig {
    std::string host;                                  // required
    std::optional<int> port;
    std::string user;
    std::optional<std::string> password;
    std::vector<std::string> identity_files;

    int timeout = DEFAULT_CONNECT_TIMEOUT_SECS;        // seconds
    bool compression = false;
    std::optional<int> compression_level;
    bool forward_agent = true;
    bool host_key_verify = false;

    std::vector<std::string> encryption;               // cipher preference
    std::vector<std::string> hmac;                     // MAC preference
    std::vector<std::string> host_key;                 // host key algorithm preference
    std::vector<std::string> auth_methods;             // publickey, password, keyboard-interactive, agent
    bool keys_only = false;
    std::optional<std::string> known_hosts_file;
    std::optional<std::string> global_known_hosts_file;

    std::optional<ProxyConfig> proxy;

    // Output sinks for exec. Not owned.
    std::ostream* stdout_sink;
    std::ostream* stderr_sink;

    ConnectionConfig();
};

// Check required fields. Runs before any network activity.
Result<void> validate(const ConnectionConfig& config);

// user@host, plus :port when a port is configured
std::string describe(const ConnectionConfig& config);

// Load a connection config from a YAML mapping.
Result<ConnectionConfig> load_connection_config(const fs::path& path);
Result<ConnectionConfig> parse_connection_config(const std::string& yaml_text);

// ~/.hopssh/config.yaml
fs::path get_config_dir();
fs::path get_default_config_path();
bool default_config_exists();
