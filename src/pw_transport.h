#pragma once

/**
 * @file pw_transport.h
 * @brief Byte streams the connection actors read from and write to
 *
 * Two implementations are provided: TCP over POSIX sockets, and an
 * in-memory pipe pair that lets tests run whole swarms inside one process.
 */

#include "socket.h"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace peerwire {

//=============================================================================
// Peer Address
//=============================================================================

struct PeerAddress {
    std::string ip;
    uint16_t port;

    PeerAddress() : port(0) {}
    PeerAddress(const std::string& i, uint16_t p) : ip(i), port(p) {}

    std::string to_string() const { return ip + ":" + std::to_string(port); }

    /**
     * @brief Parse "host:port"
     * @return std::nullopt if there is no port or it is out of range
     */
    static std::optional<PeerAddress> parse(const std::string& text);

    bool operator==(const PeerAddress& other) const {
        return ip == other.ip && port == other.port;
    }
    bool operator!=(const PeerAddress& other) const { return !(*this == other); }
    bool operator<(const PeerAddress& other) const {
        if (ip != other.ip) return ip < other.ip;
        return port < other.port;
    }
};

//=============================================================================
// Stream
//=============================================================================

enum class ReadStatus : uint8_t {
    Data,       ///< bytes > 0 were read
    Timeout,    ///< Nothing arrived within the timeout
    Eof,        ///< Remote side closed the stream
    Error       ///< Transport failure, see error
};

const char* read_status_to_string(ReadStatus status);

struct ReadResult {
    ReadStatus status;
    size_t bytes;
    std::string error;

    ReadResult() : status(ReadStatus::Timeout), bytes(0) {}
    ReadResult(ReadStatus s, size_t n, std::string e = std::string())
        : status(s), bytes(n), error(std::move(e)) {}
};

/**
 * @brief A connected, ordered byte stream
 *
 * A stream is used by one thread at a time, except wake() which any
 * thread may call.
 */
class Stream {
public:
    virtual ~Stream() = default;

    /**
     * @brief Read up to length bytes, waiting at most timeout_ms
     */
    virtual ReadResult read(uint8_t* buffer, size_t length, int timeout_ms) = 0;

    /**
     * @brief Write all bytes
     * @return false on transport failure
     */
    virtual bool write(const uint8_t* data, size_t length) = 0;

    virtual void close() = 0;

    /**
     * @brief Make a pending or the next read() return Timeout without waiting
     *
     * Lets the reading thread service other work queued for it.
     */
    virtual void wake() = 0;

    /// "ip:port" of the remote side, for logging
    virtual std::string remote_address() const = 0;
};

//=============================================================================
// Listener and Transport
//=============================================================================

class Listener {
public:
    virtual ~Listener() = default;

    /**
     * @brief Wait up to timeout_ms for an incoming stream
     * @return nullptr on timeout or when the listener is closed
     */
    virtual std::unique_ptr<Stream> accept(int timeout_ms) = 0;

    virtual void close() = 0;

    /// Port actually bound
    virtual uint16_t port() const = 0;
};

/**
 * @brief Factory for outgoing and listening streams
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Open a stream to address
     * @return nullptr if the connection could not be established
     */
    virtual std::unique_ptr<Stream> connect(const PeerAddress& address, int timeout_ms) = 0;

    /**
     * @brief Start listening on bind_ip:port (port 0 picks a free one)
     * @return nullptr if the listener could not be created
     */
    virtual std::unique_ptr<Listener> listen(const std::string& bind_ip, uint16_t port) = 0;
};

//=============================================================================
// TCP
//=============================================================================

class TcpStream : public Stream {
public:
    /**
     * @brief Take ownership of a connected socket
     */
    explicit TcpStream(socket_t socket);
    ~TcpStream() override;

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    ReadResult read(uint8_t* buffer, size_t length, int timeout_ms) override;
    bool write(const uint8_t* data, size_t length) override;
    void close() override;
    void wake() override;
    std::string remote_address() const override { return remote_address_; }

private:
    socket_t socket_;
    std::string remote_address_;
    int wake_fds_[2];       ///< Self-pipe polled beside the socket
};

class TcpListener : public Listener {
public:
    explicit TcpListener(socket_t socket);
    ~TcpListener() override;

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    std::unique_ptr<Stream> accept(int timeout_ms) override;
    void close() override;
    uint16_t port() const override { return port_; }

private:
    socket_t socket_;
    uint16_t port_;
};

class TcpTransport : public Transport {
public:
    std::unique_ptr<Stream> connect(const PeerAddress& address, int timeout_ms) override;
    std::unique_ptr<Listener> listen(const std::string& bind_ip, uint16_t port) override;
};

//=============================================================================
// In-memory
//=============================================================================

/**
 * @brief One direction of an in-memory stream pair
 */
struct MemoryPipe {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<uint8_t> bytes;
    bool closed = false;
    bool woken = false;     ///< Set by wake() on the reading end
};

/**
 * @brief In-process stream, created in connected pairs
 *
 * Closing either end ends both directions: the other end reads the bytes
 * still queued and then Eof, and writes on either end fail.
 */
class MemoryStream : public Stream {
public:
    MemoryStream(std::shared_ptr<MemoryPipe> in,
                 std::shared_ptr<MemoryPipe> out,
                 std::string remote_address);
    ~MemoryStream() override;

    /**
     * @brief Create two connected streams
     */
    static std::pair<std::unique_ptr<MemoryStream>, std::unique_ptr<MemoryStream>>
    create_pair(const std::string& first_address = "mem:a",
                const std::string& second_address = "mem:b");

    ReadResult read(uint8_t* buffer, size_t length, int timeout_ms) override;
    bool write(const uint8_t* data, size_t length) override;
    void close() override;
    void wake() override;
    std::string remote_address() const override { return remote_address_; }

private:
    std::shared_ptr<MemoryPipe> in_;
    std::shared_ptr<MemoryPipe> out_;
    std::string remote_address_;
};

class MemoryTransport;

/**
 * @brief Accept side of a MemoryTransport address
 */
class MemoryListener : public Listener {
public:
    MemoryListener(MemoryTransport* transport, uint16_t port);
    ~MemoryListener() override;

    std::unique_ptr<Stream> accept(int timeout_ms) override;
    void close() override;
    uint16_t port() const override { return port_; }

    /// Called by the transport to hand over the accepting end of a pair
    bool deliver(std::unique_ptr<Stream> stream);

private:
    MemoryTransport* transport_;
    uint16_t port_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::unique_ptr<Stream>> incoming_;
    bool closed_;
};

/**
 * @brief Routes connect() calls to listeners registered in the same process
 *
 * Addresses are matched on ip and port. Connecting to an address nobody
 * listens on fails like a refused TCP connect.
 */
class MemoryTransport : public Transport {
public:
    std::unique_ptr<Stream> connect(const PeerAddress& address, int timeout_ms) override;
    std::unique_ptr<Listener> listen(const std::string& bind_ip, uint16_t port) override;

    /// Number of successful connect() calls, across all addresses
    size_t connect_count() const;

private:
    friend class MemoryListener;
    void unregister(MemoryListener* listener);

    mutable std::mutex mutex_;
    std::map<PeerAddress, MemoryListener*> listeners_;
    uint16_t next_port_ = 40000;
    size_t connect_count_ = 0;
};

} // namespace peerwire
