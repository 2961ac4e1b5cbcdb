#pragma once

// ── SSH client options ──────────────────────────────────────
// Flags shared by the console command and the proxy relay command.
constexpr const char* SSH_CLIENT_BINARY     = "ssh";
constexpr const char* SSH_NO_KNOWN_HOSTS    = "-o UserKnownHostsFile=/dev/null";
constexpr const char* SSH_NO_STRICT_KEYS    = "-o StrictHostKeyChecking=no";
constexpr const char* SSH_KEEPALIVE_OPTS    = "-o KeepAlive=yes -o ServerAliveInterval=60";
constexpr const char* PROXY_RELAY_COMMAND   = "nc %h %p";

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_CONNECT_TIMEOUT_SECS = 60;    // TCP connect + handshake + auth
constexpr int SSH_KEEPALIVE_INTERVAL_SECS  = 60;    // Keepalive on established sessions
constexpr int PROXY_TERMINATE_WAIT_MS      = 2000;  // Grace period for the relay to exit

// ── Retry counts ────────────────────────────────────────────
constexpr int SSH_MAX_ATTEMPTS             = 3;     // Total attempts on transient end-of-stream

// ── Ports ───────────────────────────────────────────────────
constexpr int DEFAULT_SSH_PORT             = 22;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE            = 4096;
constexpr int SFTP_CHUNK_SIZE              = 32 * 1024;

// ── Local paths ─────────────────────────────────────────────
constexpr const char* DEFAULT_KNOWN_HOSTS  = "~/.ssh/known_hosts";
constexpr const char* LOG_FILE_NAME        = "hopssh_debug.log";
constexpr const char* CONFIG_DIR_NAME      = ".hopssh";
constexpr const char* CONFIG_FILE_NAME     = "config.yaml";
