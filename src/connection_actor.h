#pragma once

/**
 * @file connection_actor.h
 * @brief Thread that drives one peer connection
 *
 * A connection actor owns a Stream and a ProtocolEngine. It applies
 * commands from the torrent actor, flushes the engine's output to the
 * stream, reads from the stream with a short timeout and forwards every
 * engine event upward tagged with its ConnectionId. Whatever ends the
 * connection, the last event it emits is exactly one Disconnected.
 */

#include "pw_types.h"
#include "pw_messages.h"
#include "pw_protocol.h"
#include "pw_transport.h"
#include "mailbox.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>

namespace peerwire {

//=============================================================================
// Events and Commands
//=============================================================================

/**
 * @brief Terminal event of a connection actor
 */
struct Disconnected {
    std::string reason;
};

using ConnectionEvent = std::variant<HandshakeCompleted, MessageReceived, ProtocolViolation, Disconnected>;

/**
 * @brief An event from one connection, as seen by the torrent actor
 */
struct PeerEvent {
    ConnectionId connection;
    ConnectionEvent event;
};

struct SendCommand {
    Message message;
};

struct CloseCommand {
    std::string reason;
};

using PeerCommand = std::variant<SendCommand, CloseCommand>;

//=============================================================================
// Connection Actor
//=============================================================================

/**
 * @brief Settings a connection actor is created with
 */
struct ConnectionParams {
    ConnectionId id;
    InfoHash info_hash;
    PeerID local_peer_id;
    Role role;
    uint32_t num_pieces;
    int read_timeout_ms;
    int handshake_timeout_ms;
    int connect_timeout_ms;
    std::optional<PeerID> expected_peer_id;     ///< Set when redialing a known peer

    ConnectionParams()
        : id(0), info_hash{}, local_peer_id{}, role(Role::Initiator), num_pieces(0)
        , read_timeout_ms(20), handshake_timeout_ms(10000), connect_timeout_ms(5000) {}
};

class ConnectionActor {
public:
    using EventSink = std::function<void(PeerEvent)>;

    /**
     * @brief Drive an already connected stream
     */
    ConnectionActor(const ConnectionParams& params,
                    std::unique_ptr<Stream> stream,
                    EventSink sink);

    /**
     * @brief Dial address from the actor's own thread, then drive the stream
     *
     * transport must outlive the actor.
     */
    ConnectionActor(const ConnectionParams& params,
                    Transport* transport,
                    const PeerAddress& address,
                    EventSink sink);

    /**
     * @brief Closes the connection and joins the thread
     */
    ~ConnectionActor();

    ConnectionActor(const ConnectionActor&) = delete;
    ConnectionActor& operator=(const ConnectionActor&) = delete;

    void start();

    /**
     * @brief Queue a message; ignored once the actor has stopped
     */
    bool send(Message message);

    /**
     * @brief Ask the actor to close the connection, dropping unsent output
     */
    void close(const std::string& reason);

    /**
     * @brief Wait for the thread to exit
     */
    void join();

    ConnectionId id() const { return params_.id; }
    Role role() const { return params_.role; }
    const std::string& remote_address() const { return remote_address_; }
    bool is_finished() const { return finished_.load(); }

    uint64_t bytes_read() const { return bytes_read_.load(); }
    uint64_t bytes_written() const { return bytes_written_.load(); }

private:
    void run();

    /**
     * @brief Main loop
     * @return Reason the connection ended
     */
    std::string drive();

    bool flush_outbound();
    void emit(ConnectionEvent event);

    /// Interrupt a read in progress so queued commands go out at once
    void wake_stream();

    ConnectionParams params_;
    std::mutex stream_mutex_;       ///< Guards stream_ against wake_stream() while dialing
    std::unique_ptr<Stream> stream_;
    Transport* transport_;
    std::optional<PeerAddress> dial_address_;
    std::string remote_address_;
    EventSink sink_;

    ProtocolEngine engine_;
    Mailbox<PeerCommand> commands_;

    std::thread thread_;
    std::atomic<bool> finished_;
    std::atomic<uint64_t> bytes_read_;
    std::atomic<uint64_t> bytes_written_;
};

} // namespace peerwire
