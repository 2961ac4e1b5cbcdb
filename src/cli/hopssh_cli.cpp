#include "hopssh_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <platform/process.hpp>
#include <ssh/remote_host.hpp>
#include <iostream>
#include <fmt/format.h>

HopsshCLI::HopsshCLI(std::shared_ptr<SessionFactory> factory)
    : factory_(std::move(factory)) {}

void HopsshCLI::print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::usage_row("hopssh", "[options] <command>", "");
    std::cout << theme::section("Commands");
    std::cout << theme::usage_row("exec", "[--silence] <command...>", "Run a command on the host");
    std::cout << theme::usage_row("upload", "<local> <remote>", "Copy a file to the host");
    std::cout << theme::usage_row("download", "<remote> <local>", "Copy a file from the host");
    std::cout << theme::usage_row("console", "", "Open an interactive ssh session");
    std::cout << theme::section("Options");
    std::cout << theme::usage_row("--config", "<path>", "Connection config (default ~/.hopssh/config.yaml)");
    std::cout << theme::usage_row("--host", "<host>", "Target host");
    std::cout << theme::usage_row("--user", "<user>", "Login user");
    std::cout << theme::usage_row("--port", "<port>", "Target port");
    std::cout << theme::usage_row("--identity", "<file>", "Private key (repeatable)");
    std::cout << theme::usage_row("--verbose", "", "Debug logging to " + hopssh_log_path());
    std::cout << "\n";
    std::cout << theme::dim("    hopssh --version        Show version\n"
                            "    hopssh --help           Show this help") << "\n\n";
}

void HopsshCLI::print_version() {
    std::cout << theme::color::BROWN << theme::color::BOLD << "hopssh"
              << theme::color::RESET << theme::color::DIM
              << " version 0.1.0" << theme::color::RESET << "\n";
}

int HopsshCLI::report(const std::string& what, const std::string& error,
                      const std::string& cause) {
    std::cerr << theme::fail(what + ": " + error);
    if (!cause.empty()) std::cerr << theme::step(cause);
    return EXIT_FAILURE_OP;
}

Result<ConnectionConfig> HopsshCLI::resolve_config(const CliArgs& args) const {
    ConnectionConfig config;

    if (args.config_path) {
        auto loaded = load_connection_config(*args.config_path);
        if (loaded.is_err()) return loaded;
        config = loaded.value;
    } else if (default_config_exists()) {
        auto loaded = load_connection_config(get_default_config_path());
        if (loaded.is_err()) return loaded;
        config = loaded.value;
    }

    apply_cli_overrides(args, config);
    return Result<ConnectionConfig>::Ok(config);
}

int HopsshCLI::run(const CliArgs& args) {
    if (args.command == "--help") {
        print_usage();
        return 0;
    }
    if (args.command == "--version") {
        print_version();
        return 0;
    }

    if (args.verbose) set_log_level(LogLevel::Debug);

    auto config = resolve_config(args);
    if (config.is_err()) return report("Configuration", config.error, config.cause);

    auto valid = validate(config.value);
    if (valid.is_err()) {
        std::cerr << theme::fail(valid.error);
        return EXIT_USAGE;
    }

    if (args.command == "exec") return run_exec(config.value, args);
    if (args.command == "upload") return run_upload(config.value, args);
    if (args.command == "download") return run_download(config.value, args);
    if (args.command == "console") return run_console(config.value);

    std::cerr << theme::fail("Unknown command: " + args.command);
    return EXIT_USAGE;
}

int HopsshCLI::run_exec(const ConnectionConfig& config, const CliArgs& args) {
    RemoteHost host(config, factory_);
    ExecOptions options;
    options.silence = args.silence;

    auto result = host.exec(args.args[0], options);
    host.close();
    if (result.is_err()) return report("exec", result.error, result.cause);

    // No status from the server counts as a failure
    return result.value.exit_status >= 0 ? result.value.exit_status : EXIT_FAILURE_OP;
}

int HopsshCLI::run_upload(const ConnectionConfig& config, const CliArgs& args) {
    RemoteHost host(config, factory_);
    auto result = host.upload(args.args[0], args.args[1]);
    host.close();
    if (result.is_err()) return report("upload", result.error, result.cause);

    std::cout << theme::ok(fmt::format("{} -> {}:{}", args.args[0], host.describe(), args.args[1]));
    return 0;
}

int HopsshCLI::run_download(const ConnectionConfig& config, const CliArgs& args) {
    RemoteHost host(config, factory_);
    auto result = host.download(args.args[0], args.args[1]);
    host.close();
    if (result.is_err()) return report("download", result.error, result.cause);

    std::cout << theme::ok(fmt::format("{}:{} -> {}", host.describe(), args.args[0], args.args[1]));
    return 0;
}

int HopsshCLI::run_console(const ConnectionConfig& config) {
    RemoteHost host(config, factory_);
    auto command = host.console_command();
    if (command.is_err()) return report("console", command.error, command.cause);

    hopssh_log(LogLevel::Info, "console(" + describe(config) + ")");
    std::cout.flush();
    std::cerr.flush();

    // Only returns if the exec failed
    auto replaced = platform::replace_process(command.value);
    return report("console", replaced.error, replaced.cause);
}
