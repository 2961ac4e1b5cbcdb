#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>

// Parsed command line:
//   hopssh [--config PATH] [--host H] [--user U] [--port P] [--identity F]...
//          [--verbose] <command> [args...]
struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> host;
    std::optional<std::string> user;
    std::optional<int> port;
    std::vector<std::string> identity_files;
    bool verbose = false;
    bool silence = false;           // exec --silence

    std::string command;            // exec, upload, download, console, --help, --version
    std::vector<std::string> args;  // command operands
};

// Parse argv. Usage errors come back as ErrorKind::Config.
Result<CliArgs> parse_cli_args(int argc, char** argv);
Result<CliArgs> parse_cli_args(const std::vector<std::string>& argv);

// Command line flags override whatever the config file set.
void apply_cli_overrides(const CliArgs& args, ConnectionConfig& config);
