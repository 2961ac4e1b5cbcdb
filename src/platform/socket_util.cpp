#include "socket_util.hpp"
#include "platform.hpp"
#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <fmt/format.h>

namespace platform {

// Try one resolved address with a non-blocking connect bounded by timeout_ms.
static Result<socket_t> connect_addr(const struct addrinfo* ai, int timeout_ms) {
    socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock < 0) {
        return Result<socket_t>::Err(ErrorKind::Connection, "Failed to create socket",
                                     errno_text(errno));
    }

    set_nonblocking(sock);

    int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (ret < 0 && errno != EINPROGRESS) {
        int err = errno;
        close_socket(sock);
        return Result<socket_t>::Err(ErrorKind::Connection, "Failed to connect",
                                     errno_text(err));
    }

    // Wait for non-blocking connect to complete
    if (ret < 0) {
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            close_socket(sock);
            return Result<socket_t>::Err(ErrorKind::Connection, "Connection timed out");
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
        if (sock_err != 0) {
            close_socket(sock);
            return Result<socket_t>::Err(ErrorKind::Connection, "Connection failed",
                                         errno_text(sock_err));
        }
    }

    return Result<socket_t>::Ok(sock);
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_secs) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        return Result<socket_t>::Err(ErrorKind::Connection,
                                     "Failed to resolve host: " + host, gai_strerror(rc));
    }

    Result<socket_t> last = Result<socket_t>::Err(ErrorKind::Connection,
                                                  "No usable address for " + host);
    for (const struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        last = connect_addr(ai, timeout_secs * 1000);
        if (last.is_ok()) break;
    }
    freeaddrinfo(res);

    if (last.is_err()) {
        last.error = fmt::format("{} ({}:{})", last.error, host, port);
    }
    return last;
}

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

void enable_tcp_keepalive(socket_t sock) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
#ifdef TCP_KEEPIDLE
    int keepidle = 60;
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    int keepintvl = 15;
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, &keepintvl, sizeof(keepintvl));
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(socket_t sock) {
    if (sock >= 0) close(sock);
}

} // namespace platform
