#include "process/network_checker.hpp"

#include "log/log.hpp"

#include <cstring>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
using socket_t = SOCKET;
#define LSPACK_INVALID_SOCKET INVALID_SOCKET
#define LSPACK_CLOSE_SOCKET closesocket
#else
#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
using socket_t = int;
#define LSPACK_INVALID_SOCKET (-1)
#define LSPACK_CLOSE_SOCKET close
#endif

namespace lspack::proc {

bool split_url_host(const std::string& url, std::string& host, int& port) {
    std::string rest = url;
    port = 443;

    size_t scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        std::string scheme = rest.substr(0, scheme_end);
        if (scheme == "http") {
            port = 80;
        }
        rest = rest.substr(scheme_end + 3);
    }

    size_t path_start = rest.find('/');
    if (path_start != std::string::npos) {
        rest = rest.substr(0, path_start);
    }

    // user:pass@host
    size_t at = rest.rfind('@');
    if (at != std::string::npos) {
        rest = rest.substr(at + 1);
    }

    size_t colon = rest.rfind(':');
    if (colon != std::string::npos && rest.find(']') == std::string::npos) {
        std::string port_str = rest.substr(colon + 1);
        rest = rest.substr(0, colon);
        if (!port_str.empty()) {
            int parsed = 0;
            for (char c : port_str) {
                if (c < '0' || c > '9')
                    return false;
                parsed = parsed * 10 + (c - '0');
            }
            port = parsed;
        }
    }

    host = rest;
    return !host.empty();
}

#ifdef _WIN32
static bool ensure_winsock() {
    static bool initialized = [] {
        WSADATA data;
        return WSAStartup(MAKEWORD(2, 2), &data) == 0;
    }();
    return initialized;
}
#endif

static bool connect_with_timeout(const addrinfo* addr, int timeout_ms) {
    socket_t sock = socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
    if (sock == LSPACK_INVALID_SOCKET) {
        return false;
    }

#ifdef _WIN32
    u_long nonblocking = 1;
    ioctlsocket(sock, FIONBIO, &nonblocking);
    int rc = connect(sock, addr->ai_addr, static_cast<int>(addr->ai_addrlen));
    bool connected = rc == 0;
    if (!connected && WSAGetLastError() == WSAEWOULDBLOCK) {
        WSAPOLLFD pfd{};
        pfd.fd = sock;
        pfd.events = POLLWRNORM;
        if (WSAPoll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLWRNORM)) {
            int err = 0;
            int len = sizeof(err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&err), &len);
            connected = err == 0;
        }
    }
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
    int rc = connect(sock, addr->ai_addr, addr->ai_addrlen);
    bool connected = rc == 0;
    if (!connected && errno == EINPROGRESS) {
        struct pollfd pfd {};
        pfd.fd = sock;
        pfd.events = POLLOUT;
        if (poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLOUT)) {
            int err = 0;
            socklen_t len = sizeof(err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, &err, &len);
            connected = err == 0;
        }
    }
#endif

    LSPACK_CLOSE_SOCKET(sock);
    return connected;
}

bool SocketNetworkChecker::reachable(const std::string& url) {
    std::string host;
    int port = 0;
    if (!split_url_host(url, host, port)) {
        LSPACK_LOG_WARN("process", "Cannot extract a host from '" << url << "'");
        return false;
    }

    std::string key = host + ":" + std::to_string(port);
    if (key == last_key_) {
        return last_result_;
    }

#ifdef _WIN32
    if (!ensure_winsock()) {
        return false;
    }
#endif

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &results);
    bool ok = false;
    if (rc != 0) {
        LSPACK_LOG_DEBUG("process", "Cannot resolve " << host << ": " << gai_strerror(rc));
    } else {
        for (const addrinfo* addr = results; addr != nullptr && !ok; addr = addr->ai_next) {
            ok = connect_with_timeout(addr, timeout_ms_);
        }
        freeaddrinfo(results);
    }

    LSPACK_LOG_DEBUG("process",
                     "Reachability " << key << ": " << (ok ? "reachable" : "unreachable"));
    last_key_ = key;
    last_result_ = ok;
    return ok;
}

} // namespace lspack::proc
