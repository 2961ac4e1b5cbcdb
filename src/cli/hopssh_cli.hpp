#pragma once

#include <memory>
#include <string>
#include <core/config.hpp>
#include <ssh/session.hpp>
#include "cli_args.hpp"

// Exit codes
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_FAILURE_OP = 1;

// Runs one parsed hopssh command against the configured host.
class HopsshCLI {
public:
    explicit HopsshCLI(std::shared_ptr<SessionFactory> factory = nullptr);

    int run(const CliArgs& args);

    static void print_usage();
    static void print_version();

private:
    std::shared_ptr<SessionFactory> factory_;

    // Config file (explicit, else the default one when present) + flags
    Result<ConnectionConfig> resolve_config(const CliArgs& args) const;

    int run_exec(const ConnectionConfig& config, const CliArgs& args);
    int run_upload(const ConnectionConfig& config, const CliArgs& args);
    int run_download(const ConnectionConfig& config, const CliArgs& args);
    int run_console(const ConnectionConfig& config);

    static int report(const std::string& what, const std::string& error,
                      const std::string& cause);
};
