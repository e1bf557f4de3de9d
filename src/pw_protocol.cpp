#include "pw_protocol.h"

namespace peerwire {

//=============================================================================
// Helpers
//=============================================================================

const char* engine_state_to_string(EngineState state) {
    switch (state) {
        case EngineState::AwaitingHandshake: return "AwaitingHandshake";
        case EngineState::Established: return "Established";
        case EngineState::Closed: return "Closed";
    }
    return "Unknown";
}

const char* role_to_string(Role role) {
    return role == Role::Initiator ? "initiator" : "responder";
}

const char* violation_kind_to_string(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::MalformedHandshake: return "malformed handshake";
        case ViolationKind::InfoHashMismatch: return "info hash mismatch";
        case ViolationKind::UnexpectedPeerId: return "unexpected peer id";
        case ViolationKind::InvalidMessageType: return "invalid message type";
        case ViolationKind::MalformedPayload: return "malformed payload";
    }
    return "unknown";
}

const char* send_status_to_string(SendStatus status) {
    switch (status) {
        case SendStatus::Queued: return "queued";
        case SendStatus::NotEstablished: return "not established";
        case SendStatus::HandshakeAlreadySent: return "handshake already sent";
        case SendStatus::Closed: return "closed";
    }
    return "unknown";
}

//=============================================================================
// Construction
//=============================================================================

ProtocolEngine::ProtocolEngine(const InfoHash& info_hash,
                               const PeerID& local_peer_id,
                               Role role,
                               uint32_t num_pieces)
    : info_hash_(info_hash),
      local_peer_id_(local_peer_id),
      role_(role),
      num_pieces_(num_pieces),
      state_(EngineState::AwaitingHandshake),
      handshake_sent_(false),
      bytes_received_(0),
      bytes_queued_(0),
      messages_received_(0) {
    if (role_ == Role::Initiator) {
        queue_handshake();
    }
}

//=============================================================================
// Input
//=============================================================================

std::vector<ProtocolEvent> ProtocolEngine::receive(const uint8_t* data, size_t length) {
    std::vector<ProtocolEvent> events;

    if (state_ == EngineState::Closed || length == 0) {
        return events;
    }

    inbound_.append(data, length);
    bytes_received_ += length;

    if (state_ == EngineState::AwaitingHandshake) {
        process_handshake(events);
    }

    if (state_ == EngineState::Established) {
        process_frames(events);
    }

    return events;
}

std::vector<ProtocolEvent> ProtocolEngine::receive(const std::vector<uint8_t>& data) {
    return receive(data.data(), data.size());
}

void ProtocolEngine::process_handshake(std::vector<ProtocolEvent>& events) {
    HandshakeResult hs = decode_handshake(inbound_.data(), inbound_.size());

    if (hs.status == HandshakeStatus::NeedMoreBytes) {
        return;
    }

    if (hs.status == HandshakeStatus::MalformedHandshake) {
        violation(events, ViolationKind::MalformedHandshake, "bad protocol header");
        return;
    }

    if (hs.handshake.info_hash != info_hash_) {
        violation(events, ViolationKind::InfoHashMismatch,
                  "remote info hash " + info_hash_to_hex(hs.handshake.info_hash));
        return;
    }

    if (expected_peer_id_ && *expected_peer_id_ != hs.handshake.peer_id) {
        violation(events, ViolationKind::UnexpectedPeerId,
                  "remote peer id " + peer_id_to_string(hs.handshake.peer_id));
        return;
    }

    inbound_.consume(PW_HANDSHAKE_SIZE);
    remote_peer_id_ = hs.handshake.peer_id;
    state_ = EngineState::Established;

    if (role_ == Role::Responder && !handshake_sent_) {
        queue_handshake();
    }

    events.emplace_back(HandshakeCompleted{hs.handshake.peer_id});
}

void ProtocolEngine::process_frames(std::vector<ProtocolEvent>& events) {
    while (!inbound_.empty()) {
        DecodeResult result = decode_message(inbound_.data(), inbound_.size(), num_pieces_);

        if (result.status == CodecStatus::NeedMoreBytes) {
            break;
        }

        if (!result.ok()) {
            violation(events,
                      result.status == CodecStatus::InvalidMessageType
                          ? ViolationKind::InvalidMessageType
                          : ViolationKind::MalformedPayload,
                      result.error);
            return;
        }

        if (std::holds_alternative<msg::Handshake>(result.message)) {
            violation(events, ViolationKind::MalformedPayload, "handshake after handshake");
            return;
        }

        inbound_.consume(result.consumed);
        ++messages_received_;
        events.emplace_back(MessageReceived{std::move(result.message)});
    }
}

void ProtocolEngine::violation(std::vector<ProtocolEvent>& events,
                               ViolationKind kind, std::string reason) {
    close();
    events.emplace_back(ProtocolViolation{kind, std::move(reason)});
}

//=============================================================================
// Output
//=============================================================================

void ProtocolEngine::queue_handshake() {
    auto bytes = encode_handshake(info_hash_, local_peer_id_);
    bytes_queued_ += bytes.size();
    outbound_.append(std::move(bytes));
    handshake_sent_ = true;
}

SendStatus ProtocolEngine::send(const Message& message) {
    if (state_ == EngineState::Closed) {
        return SendStatus::Closed;
    }

    if (std::holds_alternative<msg::Handshake>(message)) {
        if (handshake_sent_) {
            return SendStatus::HandshakeAlreadySent;
        }
        queue_handshake();
        return SendStatus::Queued;
    }

    if (state_ != EngineState::Established) {
        return SendStatus::NotEstablished;
    }

    auto bytes = encode_message(message);
    bytes_queued_ += bytes.size();
    outbound_.append(std::move(bytes));
    return SendStatus::Queued;
}

void ProtocolEngine::close() {
    state_ = EngineState::Closed;
    inbound_.clear();
    outbound_.clear();
}

} // namespace peerwire
