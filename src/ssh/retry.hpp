#pragma once

#include <core/log.hpp>
#include <core/types.hpp>
#include <fmt/format.h>

// Run op(attempt) until it succeeds, fails with an error other than
// `retryable`, or max_attempts attempts have been made. No delay between
// attempts. The last result is returned unchanged.
//
// op must start from scratch on every call: any state it accumulates
// (output buffers, sessions it had to re-establish) belongs to one attempt.
template <typename Op>
auto retry(int max_attempts, ErrorKind retryable, Op&& op) -> decltype(op(1)) {
    auto result = op(1);
    for (int attempt = 2; attempt <= max_attempts; ++attempt) {
        if (result.is_ok() || result.kind != retryable) return result;
        hopssh_log(LogLevel::Warn,
                   fmt::format("attempt {}/{} failed ({}: {}), retrying",
                               attempt - 1, max_attempts,
                               error_kind_name(result.kind), result.error));
        result = op(attempt);
    }
    if (result.is_err() && result.kind == retryable && max_attempts > 1) {
        hopssh_log(LogLevel::Error,
                   fmt::format("giving up after {} attempts: {}", max_attempts, result.error));
    }
    return result;
}
