#include "libssh2_transport.hpp"
#include "proxy_command.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <cstring>

bool is_transient_libssh2_error(int rc) {
    switch (rc) {
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    case LIBSSH2_ERROR_SOCKET_RECV:
    case LIBSSH2_ERROR_SOCKET_SEND:
    case LIBSSH2_ERROR_CHANNEL_CLOSED:
        return true;
    default:
        return false;
    }
}

// Password for keyboard-interactive prompts, passed via the session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

// ── Lifecycle ──────────────────────────────────────────────────

Libssh2Transport::Libssh2Transport(const SessionOptions& options)
    : options_(options) {}

Libssh2Transport::~Libssh2Transport() {
    close();
}

std::string Libssh2Transport::target() const {
    std::string out = options_.user.empty() ? options_.host : options_.user + "@" + options_.host;
    if (options_.port) out += fmt::format(":{}", *options_.port);
    return out;
}

Result<void> Libssh2Transport::establish() {
    auto sock = open_socket();
    if (sock.is_err()) return sock;

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        close();
        return Result<void>::Err(ErrorKind::Connection, "Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, static_cast<long>(
        options_.timeout.value_or(DEFAULT_CONNECT_TIMEOUT_SECS)) * 1000L);

    auto prefs = apply_preferences();
    if (prefs.is_err()) {
        close();
        return prefs;
    }

    // SSH handshake (key exchange)
    int rc = libssh2_session_handshake(session_, sock_);
    if (rc != 0) {
        auto err = fail<void>(rc, ErrorKind::Connection,
                              "SSH handshake failed with " + target());
        close();
        return err;
    }

    auto host_ok = verify_host_key();
    if (host_ok.is_err()) {
        close();
        return host_ok;
    }

    auto auth = authenticate();
    if (auth.is_err()) {
        close();
        return auth;
    }

    // No per-command timeout once the session is up
    libssh2_session_set_timeout(session_, 0);
    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_INTERVAL_SECS);
    active_ = true;

    hopssh_log(LogLevel::Debug, "Connected to " + target());
    return Result<void>::Ok();
}

Result<void> Libssh2Transport::open_socket() {
    int port = options_.port.value_or(DEFAULT_SSH_PORT);

    if (options_.proxy_command) {
        std::string command = expand_proxy_command(*options_.proxy_command, options_.host, port);
        hopssh_log(LogLevel::Debug, fmt::format("proxy relay: {}", command));

        auto relay = platform::spawn_relay(command, sock_);
        if (relay.is_err()) return Result<void>::Err(relay);
        proxy_ = std::move(relay.value);
        return Result<void>::Ok();
    }

    auto sock = platform::connect_tcp(options_.host, port,
                                      options_.timeout.value_or(DEFAULT_CONNECT_TIMEOUT_SECS));
    if (sock.is_err()) return Result<void>::Err(sock);
    sock_ = sock.value;
    platform::enable_tcp_keepalive(sock_);
    return Result<void>::Ok();
}

Result<void> Libssh2Transport::apply_preferences() {
    struct Pref {
        int method;
        const std::vector<std::string>* names;
        const char* label;
    };
    const Pref prefs[] = {
        {LIBSSH2_METHOD_CRYPT_CS, &options_.encryption, "encryption"},
        {LIBSSH2_METHOD_CRYPT_SC, &options_.encryption, "encryption"},
        {LIBSSH2_METHOD_MAC_CS,   &options_.hmac,       "hmac"},
        {LIBSSH2_METHOD_MAC_SC,   &options_.hmac,       "hmac"},
        {LIBSSH2_METHOD_HOSTKEY,  &options_.host_key,   "host_key"},
    };

    for (const auto& pref : prefs) {
        if (pref.names->empty()) continue;
        std::string list = fmt::format("{}", fmt::join(*pref.names, ","));
        int rc = libssh2_session_method_pref(session_, pref.method, list.c_str());
        if (rc != 0) {
            return Result<void>::Err(ErrorKind::Config,
                                     fmt::format("Unsupported {} preference: {}", pref.label, list),
                                     last_error());
        }
    }

    if (options_.compression.value_or(false)) {
        libssh2_session_flag(session_, LIBSSH2_FLAG_COMPRESS, 1);
        if (options_.compression_level) {
            hopssh_log(LogLevel::Debug, fmt::format(
                "compression_level={} ignored: libssh2 uses the zlib default",
                *options_.compression_level));
        }
    }
    return Result<void>::Ok();
}

Result<void> Libssh2Transport::verify_host_key() {
    if (options_.known_hosts_files.empty()) return Result<void>::Ok();

    size_t key_len = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(session_, &key_len, &key_type);
    if (!key) {
        return Result<void>::Err(ErrorKind::Connection,
                                 "Server did not present a host key", last_error());
    }

    LIBSSH2_KNOWNHOSTS* known = libssh2_knownhost_init(session_);
    if (!known) {
        return Result<void>::Err(ErrorKind::Connection, "Failed to initialise known hosts");
    }

    for (const auto& file : options_.known_hosts_files) {
        int n = libssh2_knownhost_readfile(known, file.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH);
        if (n < 0) {
            hopssh_log(LogLevel::Warn, fmt::format("known hosts file unreadable: {}", file));
        }
    }

    struct libssh2_knownhost* match = nullptr;
    int check = libssh2_knownhost_checkp(known, options_.host.c_str(),
                                         options_.port.value_or(DEFAULT_SSH_PORT),
                                         key, key_len,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW,
                                         &match);
    libssh2_knownhost_free(known);

    switch (check) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:
        return Result<void>::Ok();
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
        return Result<void>::Err(ErrorKind::Connection,
                                 "Host key for " + options_.host + " does not match known hosts");
    case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
        return Result<void>::Err(ErrorKind::Connection,
                                 "Host key for " + options_.host + " not found in known hosts");
    default:
        return Result<void>::Err(ErrorKind::Connection,
                                 "Host key check failed for " + options_.host, last_error());
    }
}

// ── Authentication ─────────────────────────────────────────────

Result<void> Libssh2Transport::authenticate() {
    // Ask what the server supports ("none" may already succeed)
    const char* auth_list = libssh2_userauth_list(session_, options_.user.c_str(),
                                                  static_cast<unsigned int>(options_.user.length()));
    if (!auth_list) {
        if (libssh2_userauth_authenticated(session_)) return Result<void>::Ok();
        int rc = libssh2_session_last_errno(session_);
        if (is_transient_libssh2_error(rc)) {
            return fail<void>(rc, ErrorKind::Connection, "Connection lost during authentication");
        }
    }
    std::string methods = auth_list ? auth_list : "";
    hopssh_log(LogLevel::Debug, "Auth methods: " + methods);

    auto offered = [&](const std::string& m) {
        return methods.empty() || methods.find(m) != std::string::npos;
    };

    std::vector<std::string> order = options_.auth_methods;
    if (order.empty()) {
        order = {"agent", "publickey", "password", "keyboard-interactive"};
    }

    for (const auto& method : order) {
        bool ok = false;
        if (method == "agent") {
            if (options_.keys_only.value_or(false) || !offered("publickey")) continue;
            ok = auth_agent();
        } else if (method == "publickey") {
            if (!offered("publickey")) continue;
            ok = auth_publickey();
        } else if (method == "password") {
            if (!options_.password || !offered("password")) continue;
            ok = auth_password();
        } else if (method == "keyboard-interactive") {
            if (!options_.password || !offered("keyboard-interactive")) continue;
            ok = auth_keyboard_interactive();
        } else {
            hopssh_log(LogLevel::Warn, "Unknown auth method ignored: " + method);
            continue;
        }
        if (ok) {
            hopssh_log(LogLevel::Debug, "Authenticated via " + method);
            return Result<void>::Ok();
        }
    }

    return Result<void>::Err(ErrorKind::Connection,
                             "Authentication failed for " + target(), last_error());
}

bool Libssh2Transport::auth_agent() {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (!agent) return false;

    bool ok = false;
    if (libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        while (libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            if (libssh2_agent_userauth(agent, options_.user.c_str(), identity) == 0) {
                ok = true;
                break;
            }
            prev = identity;
        }
        libssh2_agent_disconnect(agent);
    }
    libssh2_agent_free(agent);
    return ok;
}

bool Libssh2Transport::auth_publickey() {
    for (const auto& key : options_.identity_files) {
        int rc = libssh2_userauth_publickey_fromfile_ex(
            session_, options_.user.c_str(), static_cast<unsigned int>(options_.user.length()),
            nullptr, key.c_str(), nullptr);
        if (rc == 0) return true;
        hopssh_log(LogLevel::Debug, fmt::format("publickey {} rejected: {}", key, last_error()));
    }
    return false;
}

bool Libssh2Transport::auth_password() {
    return libssh2_userauth_password(session_, options_.user.c_str(),
                                     options_.password->c_str()) == 0;
}

bool Libssh2Transport::auth_keyboard_interactive() {
    KbdAuthData kbd_data{*options_.password, 0};
    *libssh2_session_abstract(session_) = &kbd_data;
    int rc = libssh2_userauth_keyboard_interactive(session_, options_.user.c_str(), kbd_callback);
    *libssh2_session_abstract(session_) = nullptr;
    return rc == 0;
}

// ── I/O helpers ────────────────────────────────────────────────

void Libssh2Transport::set_blocking(bool blocking) {
    if (session_) libssh2_session_set_blocking(session_, blocking ? 1 : 0);
}

void Libssh2Transport::wait_socket(int timeout_ms) {
    if (!session_ || sock_ < 0) return;
    int dir = libssh2_session_block_directions(session_);
    short events = 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;
    platform::poll_socket(sock_, events, timeout_ms);
}

void Libssh2Transport::keepalive() {
    if (!session_ || !active_) return;
    int seconds_to_next = 0;
    libssh2_keepalive_send(session_, &seconds_to_next);
}

ErrorKind Libssh2Transport::classify(int rc, ErrorKind fallback) const {
    return is_transient_libssh2_error(rc) ? ErrorKind::TransientIO : fallback;
}

std::string Libssh2Transport::last_error() const {
    if (!session_) return "";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : "";
}

void Libssh2Transport::close() {
    active_ = false;

    if (session_) {
        libssh2_session_set_blocking(session_, 1);
        libssh2_session_set_timeout(session_, PROXY_TERMINATE_WAIT_MS);
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = HOPSSH_INVALID_SOCKET;
    }

    if (proxy_.valid()) {
        proxy_.terminate(PROXY_TERMINATE_WAIT_MS);
    }
}
