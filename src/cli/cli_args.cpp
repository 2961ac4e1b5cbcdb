#include "cli_args.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

static Result<CliArgs> usage_error(const std::string& msg) {
    return Result<CliArgs>::Err(ErrorKind::Config, msg);
}

Result<CliArgs> parse_cli_args(int argc, char** argv) {
    std::vector<std::string> words;
    for (int i = 1; i < argc; ++i) words.emplace_back(argv[i]);
    return parse_cli_args(words);
}

Result<CliArgs> parse_cli_args(const std::vector<std::string>& argv) {
    CliArgs out;
    size_t i = 0;

    auto take_value = [&](std::string& value) -> bool {
        if (i + 1 >= argv.size()) return false;
        value = argv[++i];
        return true;
    };

    // Global options come before the command
    for (; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        std::string value;

        if (arg == "--help" || arg == "-h") {
            out.command = "--help";
            return Result<CliArgs>::Ok(out);
        } else if (arg == "--version") {
            out.command = "--version";
            return Result<CliArgs>::Ok(out);
        } else if (arg == "--verbose" || arg == "-v") {
            out.verbose = true;
        } else if (arg == "--config" || arg == "--host" || arg == "--user" ||
                   arg == "--port" || arg == "--identity" || arg == "-i" || arg == "-p") {
            if (!take_value(value)) return usage_error("Missing value for " + arg);
            if (arg == "--config") {
                out.config_path = expand_home(value);
            } else if (arg == "--host") {
                out.host = value;
            } else if (arg == "--user") {
                out.user = value;
            } else if (arg == "--port" || arg == "-p") {
                try {
                    size_t used = 0;
                    int port = std::stoi(value, &used);
                    if (used != value.size() || port <= 0 || port > 65535) {
                        return usage_error("Invalid port: " + value);
                    }
                    out.port = port;
                } catch (const std::exception&) {
                    return usage_error("Invalid port: " + value);
                }
            } else {
                out.identity_files.push_back(expand_home(value));
            }
        } else if (arg.rfind("-", 0) == 0) {
            return usage_error("Unknown option: " + arg);
        } else {
            break;
        }
    }

    if (i >= argv.size()) return usage_error("Missing command.");
    out.command = argv[i++];

    if (out.command == "exec") {
        if (i < argv.size() && argv[i] == "--silence") {
            out.silence = true;
            ++i;
        }
        std::vector<std::string> words(argv.begin() + static_cast<long>(i), argv.end());
        std::string command = join_words(words);
        if (command.empty()) return usage_error("Usage: hopssh exec [--silence] <command...>");
        out.args.push_back(command);
    } else if (out.command == "upload" || out.command == "download") {
        if (argv.size() - i != 2) {
            return usage_error(out.command == "upload"
                ? "Usage: hopssh upload <local> <remote>"
                : "Usage: hopssh download <remote> <local>");
        }
        out.args.assign(argv.begin() + static_cast<long>(i), argv.end());
    } else if (out.command == "console") {
        if (i != argv.size()) return usage_error("Usage: hopssh console");
    } else {
        return usage_error("Unknown command: " + out.command);
    }

    return Result<CliArgs>::Ok(out);
}

void apply_cli_overrides(const CliArgs& args, ConnectionConfig& config) {
    if (args.host) config.host = *args.host;
    if (args.user) config.user = *args.user;
    if (args.port) config.port = args.port;
    if (!args.identity_files.empty()) config.identity_files = args.identity_files;
}
