#pragma once

#include <string>
#include <cstdint>

#include <sys/socket.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <unistd.h>

typedef int socket_t;
#define INVALID_SOCKET_VALUE -1
#define SOCKET_ERROR_VALUE -1

namespace peerwire {

/**
 * Outcome of waiting on a socket
 */
enum class SocketWait {
    Ready,
    Timeout,
    Woken,      ///< Only the wake pipe fired
    Error
};

// TCP Socket Functions
/**
 * Connect to an IPv4 host, giving up after timeout_ms
 * @param host Hostname or dotted address
 * @param port Port number
 * @param timeout_ms Connect timeout in milliseconds (0 = system default)
 * @return Connected blocking socket, or INVALID_SOCKET_VALUE on failure
 */
socket_t create_tcp_client_v4(const std::string& host, int port, int timeout_ms = 0);

/**
 * Create a listening IPv4 socket
 * @param bind_address Local address to bind ("0.0.0.0" or empty for any)
 * @param port Port number (0 lets the system pick one)
 * @param backlog Listen backlog
 * @return Listening socket, or INVALID_SOCKET_VALUE on failure
 */
socket_t create_tcp_server_v4(const std::string& bind_address, int port, int backlog = 16);

/**
 * Accept a pending connection
 * @return Client socket, or INVALID_SOCKET_VALUE on failure
 */
socket_t accept_client(socket_t server_socket);

/**
 * Wait until the socket is readable (or accepting)
 */
SocketWait wait_readable(socket_t socket, int timeout_ms);

/**
 * Wait until the socket is readable or the wake pipe is signalled
 * A signalled wake pipe is drained. A negative wake_fd is ignored.
 */
SocketWait wait_readable(socket_t socket, int wake_fd, int timeout_ms);

// Wake Pipe Functions
/**
 * Create a non-blocking pipe used to interrupt wait_readable from another thread
 * @param fds Receives the read end in fds[0] and the write end in fds[1]
 * @return false if the pipe could not be created
 */
bool create_wake_pipe(int fds[2]);
void signal_wake_pipe(int write_fd);
void close_wake_pipe(int fds[2]);

/**
 * Remote "ip:port" of a connected socket, empty on failure
 */
std::string get_peer_address(socket_t socket);

/**
 * Local port a socket is bound to, -1 on failure
 */
int get_bound_port(socket_t socket);

/**
 * Bound the time a blocking send may stall
 */
bool set_send_timeout(socket_t socket, int timeout_ms);

bool set_tcp_nodelay(socket_t socket);

// Common Socket Functions
void close_socket(socket_t socket);
bool is_valid_socket(socket_t socket);
bool set_socket_nonblocking(socket_t socket, bool nonblocking = true);

} // namespace peerwire
