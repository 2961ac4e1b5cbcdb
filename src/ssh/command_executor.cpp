#include "command_executor.hpp"
#include "retry.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <ostream>

// ── StreamHeaderTracker ────────────────────────────────────────

bool StreamHeaderTracker::enter(StreamKind stream) {
    State next = (stream == StreamKind::Stdout) ? State::STDOUT_ACTIVE
                                                : State::STDERR_ACTIVE;
    if (next == state_) return false;
    state_ = next;
    transitions_++;
    return true;
}

// ── CommandExecutor ────────────────────────────────────────────

CommandExecutor::CommandExecutor(ConnectionManager& connections)
    : connections_(connections) {}

void CommandExecutor::banner(const std::string& tag) const {
    hopssh_log_raw(LogLevel::Debug,
                   fmt::format("===[{0}]===[{0}]===[{1}]===[{0}]===[{0}]===\n",
                               tag, connections_.describe()));
}

static void write_sink(std::ostream* sink, const std::string& data) {
    if (!sink) return;
    sink->write(data.data(), static_cast<std::streamsize>(data.size()));
    sink->flush();
}

Result<ExecResult> CommandExecutor::exec(const std::string& command,
                                         const ExecOptions& options) {
    hopssh_log(LogLevel::Info, fmt::format("exec(\"{}\", silence={})", command, options.silence));

    return retry(SSH_MAX_ATTEMPTS, ErrorKind::TransientIO, [&](int attempt) {
        if (attempt > 1) {
            hopssh_log(LogLevel::Info, fmt::format("exec(\"{}\") attempt {}", command, attempt));
        }
        auto result = exec_once(command, options);
        if (result.is_err() && result.kind == ErrorKind::TransientIO) {
            // The transport is gone; the next attempt reconnects
            connections_.discard_session();
        }
        return result;
    });
}

Result<ExecResult> CommandExecutor::exec_once(const std::string& command,
                                              const ExecOptions& options) {
    auto session = connections_.session();
    if (session.is_err()) return Result<ExecResult>::Err(session);

    auto channel = session.value->open_channel();
    if (channel.is_err()) return Result<ExecResult>::Err(channel);

    hopssh_log(LogLevel::Debug, "Channel opened.");
    banner("OPENED");

    auto started = channel.value->exec(command);
    if (started.is_err()) {
        if (started.kind != ErrorKind::Command) return Result<ExecResult>::Err(started);
        std::string message = fmt::format("Could not execute '{}'.", command);
        hopssh_log(LogLevel::Fatal, message + " " + started.error);
        return Result<ExecResult>::Err(ErrorKind::Command, message,
                                       started.cause.empty() ? started.error : started.cause);
    }

    const ConnectionConfig& config = connections_.config();
    std::string output;
    StreamHeaderTracker headers;

    auto on_stdout = [&](const std::string& data) {
        if (headers.enter(StreamKind::Stdout)) banner("STDOUT");
        hopssh_log_raw(LogLevel::Debug, data);
        if (!options.silence) write_sink(config.stdout_sink, data);
        output += data;
    };
    auto on_stderr = [&](const std::string& data) {
        if (headers.enter(StreamKind::Stderr)) banner("STDERR");
        hopssh_log_raw(LogLevel::Debug, data);
        if (!options.silence) write_sink(config.stderr_sink, data);
        output += data;
    };

    auto status = channel.value->wait(on_stdout, on_stderr);
    if (status.is_err()) {
        hopssh_log(LogLevel::Error,
                   fmt::format("exec(\"{}\") interrupted: {}", command, status.error));
        return Result<ExecResult>::Err(status);
    }

    banner("CLOSED");
    hopssh_log(LogLevel::Debug,
               fmt::format("Channel closed. exit={} output={} bytes", status.value, output.size()));

    ExecResult result;
    result.output = std::move(output);
    result.exit_status = status.value;
    return Result<ExecResult>::Ok(std::move(result));
}
