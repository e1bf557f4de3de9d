#include "connection_actor.h"
#include "logger.h"

#include <vector>

#define LOG_CONN_DEBUG(message) LOG_DEBUG("conn", message)
#define LOG_CONN_INFO(message)  LOG_INFO("conn", message)
#define LOG_CONN_WARN(message)  LOG_WARN("conn", message)

namespace peerwire {

namespace {

constexpr size_t kReadChunkSize = 64 * 1024;

} // namespace

ConnectionActor::ConnectionActor(const ConnectionParams& params,
                                 std::unique_ptr<Stream> stream,
                                 EventSink sink)
    : params_(params),
      stream_(std::move(stream)),
      transport_(nullptr),
      sink_(std::move(sink)),
      engine_(params.info_hash, params.local_peer_id, params.role, params.num_pieces),
      finished_(false),
      bytes_read_(0),
      bytes_written_(0) {
    if (stream_) {
        remote_address_ = stream_->remote_address();
    }
    if (params_.expected_peer_id) {
        engine_.set_expected_peer_id(*params_.expected_peer_id);
    }
}

ConnectionActor::ConnectionActor(const ConnectionParams& params,
                                 Transport* transport,
                                 const PeerAddress& address,
                                 EventSink sink)
    : params_(params),
      transport_(transport),
      dial_address_(address),
      remote_address_(address.to_string()),
      sink_(std::move(sink)),
      engine_(params.info_hash, params.local_peer_id, params.role, params.num_pieces),
      finished_(false),
      bytes_read_(0),
      bytes_written_(0) {
    if (params_.expected_peer_id) {
        engine_.set_expected_peer_id(*params_.expected_peer_id);
    }
}

ConnectionActor::~ConnectionActor() {
    close("shutdown");
    join();
}

void ConnectionActor::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::thread(&ConnectionActor::run, this);
}

bool ConnectionActor::send(Message message) {
    if (!commands_.push(SendCommand{std::move(message)})) {
        return false;
    }
    wake_stream();
    return true;
}

void ConnectionActor::close(const std::string& reason) {
    if (commands_.push(CloseCommand{reason})) {
        wake_stream();
    }
}

void ConnectionActor::wake_stream() {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    if (stream_) {
        stream_->wake();
    }
}

void ConnectionActor::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

//=============================================================================
// Actor Thread
//=============================================================================

void ConnectionActor::run() {
    std::string reason = drive();

    commands_.close();
    engine_.close();
    if (stream_) {
        stream_->close();
    }

    LOG_CONN_DEBUG("Connection " << params_.id << " (" << remote_address_ << ") ended: " << reason);
    finished_ = true;
    emit(Disconnected{reason});
}

std::string ConnectionActor::drive() {
    if (!stream_) {
        if (!transport_ || !dial_address_) {
            return "no stream";
        }
        LOG_CONN_DEBUG("Dialing " << remote_address_);
        auto connected = transport_->connect(*dial_address_, params_.connect_timeout_ms);
        if (!connected) {
            LOG_CONN_WARN("Failed to connect to " << remote_address_);
            return "connect failed";
        }
        std::lock_guard<std::mutex> lock(stream_mutex_);
        stream_ = std::move(connected);
    }

    auto started = std::chrono::steady_clock::now();
    std::vector<uint8_t> buffer(kReadChunkSize);

    while (true) {
        for (auto& command : commands_.drain()) {
            if (auto* request = std::get_if<CloseCommand>(&command)) {
                return request->reason.empty() ? std::string("closed locally") : request->reason;
            }

            const Message& message = std::get<SendCommand>(command).message;
            SendStatus status = engine_.send(message);
            if (status != SendStatus::Queued) {
                LOG_CONN_DEBUG("Dropped " << message_name(message) << " to " << remote_address_
                               << ": " << send_status_to_string(status));
            }
        }

        if (!flush_outbound()) {
            return "write failed";
        }

        if (!engine_.is_established()) {
            auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count();
            if (waited >= params_.handshake_timeout_ms) {
                LOG_CONN_INFO("Handshake with " << remote_address_ << " timed out");
                return "handshake timeout";
            }
        }

        ReadResult result = stream_->read(buffer.data(), buffer.size(), params_.read_timeout_ms);
        switch (result.status) {
            case ReadStatus::Timeout:
                continue;
            case ReadStatus::Eof:
                return "connection closed by peer";
            case ReadStatus::Error:
                return "read error: " + result.error;
            case ReadStatus::Data:
                break;
        }

        bytes_read_ += result.bytes;
        for (auto& event : engine_.receive(buffer.data(), result.bytes)) {
            if (auto* violation = std::get_if<ProtocolViolation>(&event)) {
                std::string reason = std::string("protocol violation: ") + violation->reason;
                LOG_CONN_WARN("Peer " << remote_address_ << " " << reason);
                emit(std::move(*violation));
                return reason;
            }
            if (auto* completed = std::get_if<HandshakeCompleted>(&event)) {
                emit(*completed);
            } else {
                emit(std::move(std::get<MessageReceived>(event)));
            }
        }

        // Answer a responder handshake before blocking in read again
        if (!flush_outbound()) {
            return "write failed";
        }
    }
}

bool ConnectionActor::flush_outbound() {
    ChainedSendBuffer& out = engine_.outbound();
    while (!out.empty()) {
        size_t chunk = out.front_size();
        if (!stream_->write(out.front_data(), chunk)) {
            return false;
        }
        bytes_written_ += chunk;
        out.pop_front(chunk);
    }
    return true;
}

void ConnectionActor::emit(ConnectionEvent event) {
    if (sink_) {
        sink_(PeerEvent{params_.id, std::move(event)});
    }
}

} // namespace peerwire
