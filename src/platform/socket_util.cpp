#include "socket_util.hpp"

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif
#include <cerrno>
#include <cstring>

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

socket_t connect_tcp(const std::string& host, int port, int timeout_ms,
                     std::string* error) {
    init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        if (error) *error = "Failed to resolve host: " + host;
        return TANDEM_INVALID_SOCKET;
    }

    socket_t result = TANDEM_INVALID_SOCKET;
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == TANDEM_INVALID_SOCKET) continue;

        set_nonblocking(sock);
        int ret = connect(sock, ai->ai_addr, static_cast<int>(ai->ai_addrlen));
        if (ret == 0) {
            result = sock;
            break;
        }
#ifdef _WIN32
        bool pending = WSAGetLastError() == WSAEWOULDBLOCK;
#else
        bool pending = errno == EINPROGRESS;
#endif
        if (!pending) {
            if (error) *error = "Failed to connect: " + std::string(std::strerror(errno));
            close_socket(sock);
            continue;
        }

        // Wait for non-blocking connect to complete
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            if (error) *error = "Connection timed out: " + host;
            close_socket(sock);
            continue;
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
        if (sock_err != 0) {
            if (error) *error = "Connection failed: " + std::string(std::strerror(sock_err));
            close_socket(sock);
            continue;
        }
        result = sock;
        break;
    }

    freeaddrinfo(res);
    return result;
}

bool tcp_reachable(const std::string& host, int port, int timeout_ms) {
    socket_t sock = connect_tcp(host, port, timeout_ms);
    if (sock == TANDEM_INVALID_SOCKET) return false;
    close_socket(sock);
    return true;
}

} // namespace platform
