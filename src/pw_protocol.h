#pragma once

/**
 * @file pw_protocol.h
 * @brief Sans-io protocol engine for one peer connection
 *
 * The engine is a pure state machine: bytes from the wire go in through
 * receive(), decoded events come out, and messages submitted with send()
 * accumulate in an outbound buffer for the owner to write. It never
 * touches a socket, a file or a thread.
 *
 *   AwaitingHandshake --valid handshake--> Established
 *          |                                   |
 *          +------ violation / close() ------> Closed
 */

#include "pw_types.h"
#include "pw_messages.h"
#include "receive_buffer.h"
#include "chained_send_buffer.h"

#include <vector>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace peerwire {

//=============================================================================
// Engine State
//=============================================================================

enum class EngineState : uint8_t {
    AwaitingHandshake,  ///< Waiting for the remote handshake
    Established,        ///< Handshake accepted, exchanging frames
    Closed              ///< Terminal, all input ignored
};

const char* engine_state_to_string(EngineState state);

/**
 * @brief Which side opened the connection
 *
 * The initiator sends its handshake first; the responder only answers
 * once it has seen a valid handshake from the remote side.
 */
enum class Role : uint8_t {
    Initiator,
    Responder
};

const char* role_to_string(Role role);

//=============================================================================
// Events
//=============================================================================

enum class ViolationKind : uint8_t {
    MalformedHandshake,
    InfoHashMismatch,
    UnexpectedPeerId,
    InvalidMessageType,
    MalformedPayload
};

const char* violation_kind_to_string(ViolationKind kind);

struct HandshakeCompleted {
    PeerID peer_id;
};

struct MessageReceived {
    Message message;
};

struct ProtocolViolation {
    ViolationKind kind;
    std::string reason;
};

using ProtocolEvent = std::variant<HandshakeCompleted, MessageReceived, ProtocolViolation>;

//=============================================================================
// Send Result
//=============================================================================

enum class SendStatus : uint8_t {
    Queued,                 ///< Encoded into the outbound buffer
    NotEstablished,         ///< Handshake not completed yet
    HandshakeAlreadySent,   ///< Our handshake is already on its way
    Closed                  ///< Engine is closed
};

const char* send_status_to_string(SendStatus status);

//=============================================================================
// Protocol Engine
//=============================================================================

class ProtocolEngine {
public:
    /**
     * @brief Create an engine for one connection
     *
     * An Initiator queues its handshake immediately, so the outbound buffer
     * is non-empty before any input arrives.
     *
     * @param info_hash Info hash the remote side must present
     * @param local_peer_id Our peer ID, sent in our handshake
     * @param role Initiator or Responder
     * @param num_pieces Piece count used to validate frames (0 disables it)
     */
    ProtocolEngine(const InfoHash& info_hash,
                   const PeerID& local_peer_id,
                   Role role,
                   uint32_t num_pieces = 0);

    /**
     * @brief Require the remote handshake to carry this peer ID
     *
     * Used when dialing a peer whose identity is already known.
     */
    void set_expected_peer_id(const PeerID& peer_id) { expected_peer_id_ = peer_id; }

    //=========================================================================
    // Input
    //=========================================================================

    /**
     * @brief Feed bytes read from the wire
     *
     * Decodes as many complete units as the buffered bytes allow. Bytes
     * may be split anywhere: the concatenation of the events of several
     * calls equals the events of one call with all bytes.
     *
     * @return Events in wire order; empty when more bytes are needed
     *         or the engine is Closed
     */
    std::vector<ProtocolEvent> receive(const uint8_t* data, size_t length);
    std::vector<ProtocolEvent> receive(const std::vector<uint8_t>& data);

    //=========================================================================
    // Output
    //=========================================================================

    /**
     * @brief Submit a message for sending
     *
     * Only a Handshake may be sent before the remote handshake arrives.
     * A Handshake always carries the engine's own info hash and peer ID,
     * whatever the submitted value holds.
     */
    SendStatus send(const Message& message);

    /**
     * @brief Close locally, dropping unsent output
     */
    void close();

    bool has_outbound() const { return !outbound_.empty(); }
    size_t outbound_size() const { return outbound_.size(); }

    /**
     * @brief Outbound chain for partial writes by the owner
     */
    ChainedSendBuffer& outbound() { return outbound_; }

    /**
     * @brief Take all pending outbound bytes
     */
    std::vector<uint8_t> take_outbound() { return outbound_.take_all(); }

    //=========================================================================
    // State
    //=========================================================================

    EngineState state() const { return state_; }
    Role role() const { return role_; }
    bool is_established() const { return state_ == EngineState::Established; }
    bool is_closed() const { return state_ == EngineState::Closed; }
    bool handshake_sent() const { return handshake_sent_; }

    const std::optional<PeerID>& remote_peer_id() const { return remote_peer_id_; }
    const InfoHash& info_hash() const { return info_hash_; }

    /// Bytes received but not yet forming a complete unit
    size_t pending_inbound() const { return inbound_.size(); }

    uint64_t bytes_received() const { return bytes_received_; }
    uint64_t bytes_queued() const { return bytes_queued_; }
    uint64_t messages_received() const { return messages_received_; }

private:
    void queue_handshake();
    void process_handshake(std::vector<ProtocolEvent>& events);
    void process_frames(std::vector<ProtocolEvent>& events);
    void violation(std::vector<ProtocolEvent>& events, ViolationKind kind, std::string reason);

    InfoHash info_hash_;
    PeerID local_peer_id_;
    Role role_;
    uint32_t num_pieces_;
    std::optional<PeerID> expected_peer_id_;
    std::optional<PeerID> remote_peer_id_;

    EngineState state_;
    bool handshake_sent_;

    ReceiveBuffer inbound_;
    ChainedSendBuffer outbound_;

    uint64_t bytes_received_;
    uint64_t bytes_queued_;
    uint64_t messages_received_;
};

} // namespace peerwire
