#include "pw_transport.h"
#include "logger.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

#define LOG_TRANSPORT_DEBUG(message) LOG_DEBUG("transport", message)
#define LOG_TRANSPORT_WARN(message)  LOG_WARN("transport", message)

namespace peerwire {

namespace {

// A send that stalls this long is treated as a dead connection
constexpr int kSendTimeoutMs = 30000;

} // namespace

std::optional<PeerAddress> PeerAddress::parse(const std::string& text) {
    size_t colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        return std::nullopt;
    }

    std::string port_text = text.substr(colon + 1);
    if (port_text.size() > 5 ||
        !std::all_of(port_text.begin(), port_text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }

    int port = std::stoi(port_text);
    if (port <= 0 || port > 65535) {
        return std::nullopt;
    }
    return PeerAddress(text.substr(0, colon), static_cast<uint16_t>(port));
}

const char* read_status_to_string(ReadStatus status) {
    switch (status) {
        case ReadStatus::Data: return "Data";
        case ReadStatus::Timeout: return "Timeout";
        case ReadStatus::Eof: return "Eof";
        case ReadStatus::Error: return "Error";
        default: return "Unknown";
    }
}

//=============================================================================
// TcpStream
//=============================================================================

TcpStream::TcpStream(socket_t socket)
    : socket_(socket),
      remote_address_(get_peer_address(socket)) {
    set_tcp_nodelay(socket_);
    set_send_timeout(socket_, kSendTimeoutMs);
    if (!create_wake_pipe(wake_fds_)) {
        LOG_TRANSPORT_WARN("Stream to " << remote_address_ << " falls back to read timeouts");
    }
}

TcpStream::~TcpStream() {
    close();
    close_wake_pipe(wake_fds_);
}

ReadResult TcpStream::read(uint8_t* buffer, size_t length, int timeout_ms) {
    if (!is_valid_socket(socket_)) {
        return ReadResult(ReadStatus::Error, 0, "stream closed");
    }

    SocketWait wait = wait_readable(socket_, wake_fds_[0], timeout_ms);
    if (wait == SocketWait::Timeout || wait == SocketWait::Woken) {
        return ReadResult(ReadStatus::Timeout, 0);
    }
    if (wait == SocketWait::Error) {
        return ReadResult(ReadStatus::Error, 0, "poll failed");
    }

    ssize_t n = recv(socket_, buffer, length, 0);
    if (n > 0) {
        return ReadResult(ReadStatus::Data, static_cast<size_t>(n));
    }
    if (n == 0) {
        return ReadResult(ReadStatus::Eof, 0);
    }
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        return ReadResult(ReadStatus::Timeout, 0);
    }
    return ReadResult(ReadStatus::Error, 0, strerror(errno));
}

bool TcpStream::write(const uint8_t* data, size_t length) {
    if (!is_valid_socket(socket_)) {
        return false;
    }

    size_t sent = 0;
    while (sent < length) {
        ssize_t n = send(socket_, data + sent, length - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_TRANSPORT_WARN("send to " << remote_address_ << " failed: " << strerror(errno));
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void TcpStream::close() {
    if (is_valid_socket(socket_)) {
        shutdown(socket_, SHUT_RDWR);
        close_socket(socket_);
        socket_ = INVALID_SOCKET_VALUE;
    }
}

void TcpStream::wake() {
    signal_wake_pipe(wake_fds_[1]);
}

//=============================================================================
// TcpListener
//=============================================================================

TcpListener::TcpListener(socket_t socket)
    : socket_(socket) {
    int bound = get_bound_port(socket_);
    port_ = bound > 0 ? static_cast<uint16_t>(bound) : 0;
}

TcpListener::~TcpListener() {
    close();
}

std::unique_ptr<Stream> TcpListener::accept(int timeout_ms) {
    if (!is_valid_socket(socket_)) {
        return nullptr;
    }
    if (wait_readable(socket_, timeout_ms) != SocketWait::Ready) {
        return nullptr;
    }

    socket_t client = accept_client(socket_);
    if (!is_valid_socket(client)) {
        return nullptr;
    }
    return std::make_unique<TcpStream>(client);
}

void TcpListener::close() {
    if (is_valid_socket(socket_)) {
        close_socket(socket_);
        socket_ = INVALID_SOCKET_VALUE;
    }
}

//=============================================================================
// TcpTransport
//=============================================================================

std::unique_ptr<Stream> TcpTransport::connect(const PeerAddress& address, int timeout_ms) {
    socket_t socket = create_tcp_client_v4(address.ip, address.port, timeout_ms);
    if (!is_valid_socket(socket)) {
        return nullptr;
    }
    return std::make_unique<TcpStream>(socket);
}

std::unique_ptr<Listener> TcpTransport::listen(const std::string& bind_ip, uint16_t port) {
    socket_t socket = create_tcp_server_v4(bind_ip, port);
    if (!is_valid_socket(socket)) {
        return nullptr;
    }
    return std::make_unique<TcpListener>(socket);
}

//=============================================================================
// MemoryStream
//=============================================================================

MemoryStream::MemoryStream(std::shared_ptr<MemoryPipe> in,
                           std::shared_ptr<MemoryPipe> out,
                           std::string remote_address)
    : in_(std::move(in)),
      out_(std::move(out)),
      remote_address_(std::move(remote_address)) {}

MemoryStream::~MemoryStream() {
    close();
}

std::pair<std::unique_ptr<MemoryStream>, std::unique_ptr<MemoryStream>>
MemoryStream::create_pair(const std::string& first_address, const std::string& second_address) {
    auto a_to_b = std::make_shared<MemoryPipe>();
    auto b_to_a = std::make_shared<MemoryPipe>();

    // Each end reports the other end's address as its remote address
    auto first = std::make_unique<MemoryStream>(b_to_a, a_to_b, second_address);
    auto second = std::make_unique<MemoryStream>(a_to_b, b_to_a, first_address);
    return std::make_pair(std::move(first), std::move(second));
}

ReadResult MemoryStream::read(uint8_t* buffer, size_t length, int timeout_ms) {
    std::unique_lock<std::mutex> lock(in_->mutex);
    in_->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                     [this] { return !in_->bytes.empty() || in_->closed || in_->woken; });
    in_->woken = false;

    if (!in_->bytes.empty()) {
        size_t n = std::min(length, in_->bytes.size());
        std::copy(in_->bytes.begin(), in_->bytes.begin() + n, buffer);
        in_->bytes.erase(in_->bytes.begin(), in_->bytes.begin() + n);
        return ReadResult(ReadStatus::Data, n);
    }
    if (in_->closed) {
        return ReadResult(ReadStatus::Eof, 0);
    }
    return ReadResult(ReadStatus::Timeout, 0);
}

bool MemoryStream::write(const uint8_t* data, size_t length) {
    {
        std::lock_guard<std::mutex> lock(out_->mutex);
        if (out_->closed) {
            return false;
        }
        out_->bytes.insert(out_->bytes.end(), data, data + length);
    }
    out_->cv.notify_all();
    return true;
}

void MemoryStream::close() {
    for (auto* pipe : {in_.get(), out_.get()}) {
        {
            std::lock_guard<std::mutex> lock(pipe->mutex);
            pipe->closed = true;
        }
        pipe->cv.notify_all();
    }
}

void MemoryStream::wake() {
    {
        std::lock_guard<std::mutex> lock(in_->mutex);
        in_->woken = true;
    }
    in_->cv.notify_all();
}

//=============================================================================
// MemoryListener
//=============================================================================

MemoryListener::MemoryListener(MemoryTransport* transport, uint16_t port)
    : transport_(transport),
      port_(port),
      closed_(false) {}

MemoryListener::~MemoryListener() {
    close();
}

std::unique_ptr<Stream> MemoryListener::accept(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                 [this] { return !incoming_.empty() || closed_; });
    if (incoming_.empty()) {
        return nullptr;
    }
    std::unique_ptr<Stream> stream = std::move(incoming_.front());
    incoming_.pop_front();
    return stream;
}

void MemoryListener::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        incoming_.clear();
    }
    cv_.notify_all();
    transport_->unregister(this);
}

bool MemoryListener::deliver(std::unique_ptr<Stream> stream) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        incoming_.push_back(std::move(stream));
    }
    cv_.notify_all();
    return true;
}

//=============================================================================
// MemoryTransport
//=============================================================================

std::unique_ptr<Stream> MemoryTransport::connect(const PeerAddress& address, int timeout_ms) {
    (void)timeout_ms;
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = listeners_.find(address);
    if (it == listeners_.end()) {
        LOG_TRANSPORT_DEBUG("No in-memory listener at " << address.to_string());
        return nullptr;
    }

    std::string dialer_address = "mem:" + std::to_string(++connect_count_);
    auto pair = MemoryStream::create_pair(dialer_address, address.to_string());
    if (!it->second->deliver(std::move(pair.second))) {
        --connect_count_;
        return nullptr;
    }
    return std::move(pair.first);
}

std::unique_ptr<Listener> MemoryTransport::listen(const std::string& bind_ip, uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (port == 0) {
        while (listeners_.count(PeerAddress(bind_ip, next_port_)) > 0) {
            ++next_port_;
        }
        port = next_port_++;
    }

    PeerAddress address(bind_ip, port);
    if (listeners_.count(address) > 0) {
        return nullptr;
    }

    auto listener = std::make_unique<MemoryListener>(this, port);
    listeners_[address] = listener.get();
    return listener;
}

size_t MemoryTransport::connect_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connect_count_;
}

void MemoryTransport::unregister(MemoryListener* listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
        if (it->second == listener) {
            listeners_.erase(it);
            return;
        }
    }
}

} // namespace peerwire
