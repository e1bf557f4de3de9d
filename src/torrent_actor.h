#pragma once

/**
 * @file torrent_actor.h
 * @brief Owner of the swarm, the piece table and the scheduling policy
 *
 * The torrent actor processes one input at a time from its mailbox:
 * events from connection actors, requests from the Torrent handle, and a
 * periodic tick. Every piece of swarm state lives here and is touched by
 * no other thread.
 */

#include "pw_types.h"
#include "pw_bitfield.h"
#include "pw_config.h"
#include "pw_messages.h"
#include "pw_transport.h"
#include "connection_actor.h"
#include "piece_table.h"
#include "piece_store.h"
#include "torrent_meta.h"
#include "mailbox.h"

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace peerwire {

//=============================================================================
// Snapshot
//=============================================================================

/**
 * @brief Copy of one swarm member's state
 */
struct PeerSnapshot {
    PeerID peer_id;
    ConnectionId connection;
    std::string address;
    Role direction;
    Bitfield have;
    bool am_choking;
    bool am_interested;
    bool peer_choking;
    bool peer_interested;
    size_t in_flight;
    uint64_t blocks_received;
    uint64_t blocks_sent;
    uint64_t bytes_downloaded;
    uint64_t bytes_uploaded;
};

/**
 * @brief Copy of a torrent's state, taken inside the actor
 */
struct TorrentSnapshot {
    InfoHash info_hash;
    uint32_t num_pieces;
    std::vector<PieceState> pieces;
    Bitfield verified;
    std::vector<PeerSnapshot> peers;
    size_t pending_connections;     ///< Connections still handshaking
    size_t requested_blocks;        ///< Blocks assigned to some peer
    uint32_t hash_failures;
    bool complete;

    const PeerSnapshot* find_peer(const PeerID& peer_id) const;
};

//=============================================================================
// Inputs
//=============================================================================

struct AddConnection {
    std::unique_ptr<Stream> stream;
    Role role;
};

struct DialPeer {
    PeerAddress address;
};

struct SnapshotRequest {
    std::shared_ptr<std::promise<TorrentSnapshot>> reply;
};

struct ShutdownRequest {};

using TorrentInput = std::variant<PeerEvent, AddConnection, DialPeer, SnapshotRequest, ShutdownRequest>;

//=============================================================================
// Torrent Actor
//=============================================================================

class TorrentActor {
public:
    using CompletionCallback = std::function<void()>;

    /**
     * @brief Create the actor state
     *
     * Pieces the store already holds are marked verified. A null store
     * keeps verified pieces nowhere and leaves every request unanswered.
     *
     * @param inbox Mailbox the actor consumes; connection actors push their events to it
     */
    TorrentActor(const TorrentMeta& meta,
                 const TorrentConfig& config,
                 const PeerID& local_peer_id,
                 std::shared_ptr<PieceStore> store,
                 std::shared_ptr<Transport> transport,
                 Mailbox<TorrentInput>& inbox);

    ~TorrentActor();

    TorrentActor(const TorrentActor&) = delete;
    TorrentActor& operator=(const TorrentActor&) = delete;

    /**
     * @brief Invoked from the actor thread once every piece is verified
     */
    void set_completion_callback(CompletionCallback callback) { on_complete_ = std::move(callback); }

    /**
     * @brief Process inputs until ShutdownRequest or until the inbox is closed
     */
    void run();

    /**
     * @brief Process one input
     */
    void handle(TorrentInput input);

    /**
     * @brief Periodic work: keep-alives, due redials, scheduling
     */
    void on_tick();

    bool is_complete() const { return complete_; }
    bool is_running() const { return running_; }

private:
    struct PeerState {
        PeerID peer_id;
        ConnectionId connection;
        std::string address;
        Role direction;
        Bitfield have;
        bool am_choking;
        bool am_interested;
        bool peer_choking;
        bool peer_interested;
        std::set<BlockInfo> in_flight;
        uint64_t blocks_received;
        uint64_t blocks_sent;
        uint64_t bytes_downloaded;
        uint64_t bytes_uploaded;
        std::chrono::steady_clock::time_point last_send;
    };

    struct ConnectionRecord {
        std::unique_ptr<ConnectionActor> actor;
        std::optional<PeerAddress> dial_address;
        std::optional<PeerID> peer_id;      ///< Set once the connection joined the swarm
        int redials_done;
        bool closing;                       ///< Closed by us, never redialed
    };

    struct Redial {
        PeerAddress address;
        std::optional<PeerID> peer_id;
        int attempt;
        std::chrono::steady_clock::time_point due;
    };

    // Input handlers
    void on_add_connection(AddConnection input);
    void on_dial(const PeerAddress& address, std::optional<PeerID> expected, int redials_done);
    void on_snapshot(SnapshotRequest& request);
    void on_shutdown();
    void on_peer_event(PeerEvent event);

    // Peer events
    void on_handshake(ConnectionId id, const PeerID& peer_id);
    void on_message(ConnectionId id, const Message& message);
    void on_disconnected(ConnectionId id, const std::string& reason);

    // Messages from an established peer
    void handle_bitfield(PeerState& peer, const msg::Bitfield& message);
    void handle_have(PeerState& peer, const msg::Have& message);
    void handle_choke(PeerState& peer);
    void handle_unchoke(PeerState& peer);
    void handle_interested(PeerState& peer);
    void handle_not_interested(PeerState& peer);
    void handle_request(PeerState& peer, const msg::Request& message);
    void handle_piece(PeerState& peer, const msg::Piece& message);
    void handle_cancel(PeerState& peer, const msg::Cancel& message);

    // Policy
    void on_piece_verified(uint32_t piece_index, const std::vector<uint8_t>& data);
    void update_interest(PeerState& peer);
    void fill_upload_slots();
    void schedule();
    void schedule_peer(PeerState& peer);
    void release_requests(PeerState& peer);
    void check_completion();

    void start_connection(ConnectionRecord record);
    ConnectionParams make_params(ConnectionId id, Role role) const;
    ConnectionActor::EventSink make_sink();
    bool has_capacity() const;
    void send_to(PeerState& peer, Message message);
    void close_connection(ConnectionId id, const std::string& reason);
    PeerState* find_peer(ConnectionId id);
    size_t unchoked_count() const;
    TorrentSnapshot make_snapshot() const;

    TorrentMeta meta_;
    TorrentConfig config_;
    PeerID local_peer_id_;
    std::shared_ptr<PieceStore> store_;
    std::shared_ptr<Transport> transport_;
    Mailbox<TorrentInput>& inbox_;

    PieceTable table_;
    std::map<ConnectionId, ConnectionRecord> connections_;
    std::map<PeerID, PeerState> swarm_;
    std::vector<Redial> redials_;

    ConnectionId next_connection_id_;
    uint32_t hash_failures_;
    bool complete_;
    bool running_;
    CompletionCallback on_complete_;
};

} // namespace peerwire
