#include "socket.h"
#include "logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/tcp.h>
#include <poll.h>

// Socket module logging macros
#define LOG_SOCKET_DEBUG(message) LOG_DEBUG("socket", message)
#define LOG_SOCKET_INFO(message)  LOG_INFO("socket", message)
#define LOG_SOCKET_WARN(message)  LOG_WARN("socket", message)
#define LOG_SOCKET_ERROR(message) LOG_ERROR("socket", message)

namespace peerwire {

namespace {

bool resolve_ipv4(const std::string& host, in_addr& out) {
    if (inet_pton(AF_INET, host.c_str(), &out) == 1) {
        return true;
    }

    addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || !result) {
        return false;
    }

    out = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return true;
}

bool connect_with_timeout(socket_t socket, const sockaddr_in& addr, int timeout_ms) {
    if (timeout_ms <= 0) {
        return connect(socket, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0;
    }

    if (!set_socket_nonblocking(socket, true)) {
        return false;
    }

    int rc = connect(socket, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    if (rc != 0 && errno != EINPROGRESS) {
        return false;
    }

    if (rc != 0) {
        pollfd pfd;
        pfd.fd = socket;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, timeout_ms);
        if (ready <= 0) {
            if (ready == 0) {
                errno = ETIMEDOUT;
            }
            return false;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(socket, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
            errno = so_error;
            return false;
        }
    }

    return set_socket_nonblocking(socket, false);
}

} // namespace

// TCP Socket Functions
socket_t create_tcp_client_v4(const std::string& host, int port, int timeout_ms) {
    LOG_SOCKET_DEBUG("Creating TCP client socket for " << host << ":" << port);

    if (port <= 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 1-65535)");
        return INVALID_SOCKET_VALUE;
    }

    sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(static_cast<uint16_t>(port));

    if (!resolve_ipv4(host, server_addr.sin_addr)) {
        LOG_SOCKET_ERROR("Failed to resolve hostname: " << host);
        return INVALID_SOCKET_VALUE;
    }

    socket_t client_socket = socket(AF_INET, SOCK_STREAM, 0);
    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create client socket: " << strerror(errno));
        return INVALID_SOCKET_VALUE;
    }

    if (!connect_with_timeout(client_socket, server_addr, timeout_ms)) {
        LOG_SOCKET_WARN("Connection to " << host << ":" << port << " failed: " << strerror(errno));
        close_socket(client_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_DEBUG("Connected to " << host << ":" << port);
    return client_socket;
}

socket_t create_tcp_server_v4(const std::string& bind_address, int port, int backlog) {
    LOG_SOCKET_DEBUG("Creating TCP server socket on " << bind_address << ":" << port);

    if (port < 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 0-65535)");
        return INVALID_SOCKET_VALUE;
    }

    sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(static_cast<uint16_t>(port));

    if (bind_address.empty()) {
        server_addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, bind_address.c_str(), &server_addr.sin_addr) != 1) {
        LOG_SOCKET_ERROR("Invalid bind address: " << bind_address);
        return INVALID_SOCKET_VALUE;
    }

    socket_t server_socket = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create server socket: " << strerror(errno));
        return INVALID_SOCKET_VALUE;
    }

    int opt = 1;
    if (setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set socket options");
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    if (bind(server_socket, reinterpret_cast<sockaddr*>(&server_addr), sizeof(server_addr)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to bind server socket to port " << port << ": " << strerror(errno));
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    if (listen(server_socket, backlog) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to listen on server socket: " << strerror(errno));
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_INFO("Server listening on " << (bind_address.empty() ? "0.0.0.0" : bind_address)
                    << ":" << get_bound_port(server_socket) << " (backlog: " << backlog << ")");
    return server_socket;
}

socket_t accept_client(socket_t server_socket) {
    sockaddr_storage client_addr;
    socklen_t client_addr_len = sizeof(client_addr);

    socket_t client_socket = accept(server_socket, reinterpret_cast<sockaddr*>(&client_addr), &client_addr_len);
    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to accept client connection: " << strerror(errno));
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_INFO("Client connected from " << get_peer_address(client_socket));
    return client_socket;
}

SocketWait wait_readable(socket_t socket, int timeout_ms) {
    pollfd pfd;
    pfd.fd = socket;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ready = poll(&pfd, 1, timeout_ms);
    if (ready == 0) {
        return SocketWait::Timeout;
    }
    if (ready < 0) {
        return errno == EINTR ? SocketWait::Timeout : SocketWait::Error;
    }
    if (pfd.revents & POLLNVAL) {
        return SocketWait::Error;
    }
    // POLLHUP and POLLERR still report Ready so the caller's recv() sees EOF or the error
    return SocketWait::Ready;
}

SocketWait wait_readable(socket_t socket, int wake_fd, int timeout_ms) {
    pollfd pfds[2];
    pfds[0].fd = socket;
    pfds[0].events = POLLIN;
    pfds[0].revents = 0;
    pfds[1].fd = wake_fd;
    pfds[1].events = POLLIN;
    pfds[1].revents = 0;

    int ready = poll(pfds, 2, timeout_ms);
    if (ready == 0) {
        return SocketWait::Timeout;
    }
    if (ready < 0) {
        return errno == EINTR ? SocketWait::Timeout : SocketWait::Error;
    }

    bool woken = (pfds[1].revents & POLLIN) != 0;
    if (woken) {
        uint8_t scratch[64];
        while (::read(wake_fd, scratch, sizeof(scratch)) > 0) {
        }
    }

    if (pfds[0].revents & POLLNVAL) {
        return SocketWait::Error;
    }
    if (pfds[0].revents != 0) {
        return SocketWait::Ready;
    }
    return woken ? SocketWait::Woken : SocketWait::Timeout;
}

bool create_wake_pipe(int fds[2]) {
    fds[0] = -1;
    fds[1] = -1;

    int created[2];
    if (pipe(created) != 0) {
        LOG_SOCKET_ERROR("Failed to create wake pipe: " << strerror(errno));
        return false;
    }
    for (int fd : created) {
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1 ||
            fcntl(fd, F_SETFD, FD_CLOEXEC) == -1) {
            LOG_SOCKET_ERROR("Failed to configure wake pipe: " << strerror(errno));
            ::close(created[0]);
            ::close(created[1]);
            return false;
        }
    }

    fds[0] = created[0];
    fds[1] = created[1];
    return true;
}

void signal_wake_pipe(int write_fd) {
    if (write_fd < 0) {
        return;
    }
    // A full pipe already holds a pending wake
    uint8_t byte = 1;
    while (::write(write_fd, &byte, 1) < 0 && errno == EINTR) {
    }
}

void close_wake_pipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            ::close(fds[i]);
            fds[i] = -1;
        }
    }
}

std::string get_peer_address(socket_t socket) {
    sockaddr_in peer_addr;
    socklen_t peer_addr_len = sizeof(peer_addr);

    if (getpeername(socket, reinterpret_cast<sockaddr*>(&peer_addr), &peer_addr_len) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to get peer address for socket " << socket);
        return "";
    }
    if (peer_addr.sin_family != AF_INET) {
        return "";
    }

    char ip_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &peer_addr.sin_addr, ip_str, INET_ADDRSTRLEN);
    return std::string(ip_str) + ":" + std::to_string(ntohs(peer_addr.sin_port));
}

int get_bound_port(socket_t socket) {
    sockaddr_in addr;
    socklen_t len = sizeof(addr);
    if (getsockname(socket, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return -1;
    }
    return ntohs(addr.sin_port);
}

bool set_send_timeout(socket_t socket, int timeout_ms) {
    timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    if (setsockopt(socket, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        LOG_SOCKET_WARN("Failed to set send timeout on socket " << socket);
        return false;
    }
    return true;
}

bool set_tcp_nodelay(socket_t socket) {
    int opt = 1;
    return setsockopt(socket, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) == 0;
}

// Common Socket Functions
void close_socket(socket_t socket) {
    if (is_valid_socket(socket)) {
        LOG_SOCKET_DEBUG("Closing socket " << socket);
        close(socket);
    }
}

bool is_valid_socket(socket_t socket) {
    return socket != INVALID_SOCKET_VALUE;
}

bool set_socket_nonblocking(socket_t socket, bool nonblocking) {
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags == -1) {
        LOG_SOCKET_ERROR("Failed to get socket flags");
        return false;
    }

    flags = nonblocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (fcntl(socket, F_SETFL, flags) == -1) {
        LOG_SOCKET_ERROR("Failed to change socket blocking mode");
        return false;
    }
    return true;
}

} // namespace peerwire
