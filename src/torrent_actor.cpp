#include "torrent_actor.h"
#include "logger.h"

#include <algorithm>

#define LOG_TORRENT_DEBUG(message) LOG_DEBUG("torrent", message)
#define LOG_TORRENT_INFO(message)  LOG_INFO("torrent", message)
#define LOG_TORRENT_WARN(message)  LOG_WARN("torrent", message)
#define LOG_TORRENT_ERROR(message) LOG_ERROR("torrent", message)

namespace peerwire {

using Clock = std::chrono::steady_clock;

const PeerSnapshot* TorrentSnapshot::find_peer(const PeerID& peer_id) const {
    for (const auto& peer : peers) {
        if (peer.peer_id == peer_id) {
            return &peer;
        }
    }
    return nullptr;
}

//=============================================================================
// Construction
//=============================================================================

TorrentActor::TorrentActor(const TorrentMeta& meta,
                           const TorrentConfig& config,
                           const PeerID& local_peer_id,
                           std::shared_ptr<PieceStore> store,
                           std::shared_ptr<Transport> transport,
                           Mailbox<TorrentInput>& inbox)
    : meta_(meta),
      config_(config),
      local_peer_id_(local_peer_id),
      store_(std::move(store)),
      transport_(std::move(transport)),
      inbox_(inbox),
      table_(meta_, config.block_size),
      next_connection_id_(1),
      hash_failures_(0),
      complete_(false),
      running_(true) {
    for (uint32_t i = 0; i < meta_.num_pieces(); ++i) {
        if (store_ && store_->has_piece(i)) {
            table_.mark_verified(i);
        }
    }
    complete_ = table_.is_complete();

    LOG_TORRENT_INFO("Torrent " << info_hash_to_hex(meta_.info_hash()) << ": "
                     << table_.num_verified() << "/" << meta_.num_pieces() << " pieces present");
}

TorrentActor::~TorrentActor() {
    on_shutdown();
}

//=============================================================================
// Main Loop
//=============================================================================

void TorrentActor::run() {
    const auto tick = std::chrono::milliseconds(std::max(1, config_.tick_interval_ms));
    auto next_tick = Clock::now() + tick;

    while (running_) {
        auto now = Clock::now();
        auto wait = next_tick > now
            ? std::chrono::duration_cast<std::chrono::milliseconds>(next_tick - now)
            : std::chrono::milliseconds(0);

        auto input = inbox_.pop_for(wait);
        if (input) {
            handle(std::move(*input));
        } else if (inbox_.is_closed()) {
            break;
        }

        if (running_ && Clock::now() >= next_tick) {
            on_tick();
            next_tick = Clock::now() + tick;
        }
    }

    on_shutdown();
}

void TorrentActor::handle(TorrentInput input) {
    if (auto* event = std::get_if<PeerEvent>(&input)) {
        on_peer_event(std::move(*event));
    } else if (auto* add = std::get_if<AddConnection>(&input)) {
        on_add_connection(std::move(*add));
    } else if (auto* dial = std::get_if<DialPeer>(&input)) {
        on_dial(dial->address, std::nullopt, 0);
    } else if (auto* request = std::get_if<SnapshotRequest>(&input)) {
        on_snapshot(*request);
    } else {
        on_shutdown();
    }

    if (running_) {
        schedule();
    }
}

void TorrentActor::on_tick() {
    if (!running_) {
        return;
    }

    auto now = Clock::now();
    auto keepalive = std::chrono::milliseconds(config_.keepalive_interval_ms);
    for (auto& entry : swarm_) {
        if (now - entry.second.last_send >= keepalive) {
            send_to(entry.second, msg::KeepAlive{});
        }
    }

    std::vector<Redial> due;
    auto it = redials_.begin();
    while (it != redials_.end()) {
        if (it->due <= now) {
            due.push_back(*it);
            it = redials_.erase(it);
        } else {
            ++it;
        }
    }
    for (const auto& redial : due) {
        LOG_TORRENT_INFO("Redialing " << redial.address.to_string() << " (attempt "
                         << redial.attempt << "/" << config_.redial_attempts << ")");
        on_dial(redial.address, redial.peer_id, redial.attempt);
    }

    schedule();
}

//=============================================================================
// Input Handlers
//=============================================================================

void TorrentActor::on_add_connection(AddConnection input) {
    if (!input.stream) {
        return;
    }
    if (!running_ || !has_capacity()) {
        LOG_TORRENT_WARN("Refusing connection from " << input.stream->remote_address()
                         << " (" << connections_.size() << " connections)");
        input.stream->close();
        return;
    }

    ConnectionId id = next_connection_id_++;
    ConnectionRecord record;
    record.actor = std::make_unique<ConnectionActor>(make_params(id, input.role),
                                                     std::move(input.stream), make_sink());
    record.redials_done = 0;
    record.closing = false;

    LOG_TORRENT_INFO("Connection " << id << " with " << record.actor->remote_address()
                     << " (" << role_to_string(input.role) << ")");
    start_connection(std::move(record));
}

void TorrentActor::on_dial(const PeerAddress& address, std::optional<PeerID> expected, int redials_done) {
    if (!running_ || !transport_) {
        LOG_TORRENT_ERROR("Cannot dial " << address.to_string() << ": no transport");
        return;
    }
    if (!has_capacity()) {
        LOG_TORRENT_WARN("Not dialing " << address.to_string() << ": connection limit reached");
        return;
    }

    ConnectionId id = next_connection_id_++;
    ConnectionParams params = make_params(id, Role::Initiator);
    params.expected_peer_id = expected;

    ConnectionRecord record;
    record.actor = std::make_unique<ConnectionActor>(params, transport_.get(), address, make_sink());
    record.dial_address = address;
    record.redials_done = redials_done;
    record.closing = false;

    LOG_TORRENT_INFO("Connection " << id << " dialing " << address.to_string());
    start_connection(std::move(record));
}

void TorrentActor::on_snapshot(SnapshotRequest& request) {
    if (request.reply) {
        request.reply->set_value(make_snapshot());
    }
}

void TorrentActor::on_shutdown() {
    if (!running_ && connections_.empty()) {
        return;
    }
    running_ = false;

    for (auto& entry : connections_) {
        entry.second.closing = true;
        entry.second.actor->close("shutdown");
    }
    for (auto& entry : connections_) {
        entry.second.actor->join();
    }

    connections_.clear();
    swarm_.clear();
    redials_.clear();

    if (store_) {
        store_->flush();
    }
    LOG_TORRENT_INFO("Torrent " << info_hash_to_hex(meta_.info_hash()) << " stopped with "
                     << table_.num_verified() << "/" << meta_.num_pieces() << " pieces");
}

void TorrentActor::on_peer_event(PeerEvent event) {
    ConnectionId id = event.connection;

    if (auto* completed = std::get_if<HandshakeCompleted>(&event.event)) {
        on_handshake(id, completed->peer_id);
    } else if (auto* received = std::get_if<MessageReceived>(&event.event)) {
        on_message(id, received->message);
    } else if (auto* violation = std::get_if<ProtocolViolation>(&event.event)) {
        LOG_TORRENT_WARN("Connection " << id << ": " << violation_kind_to_string(violation->kind)
                         << " (" << violation->reason << ")");
    } else {
        on_disconnected(id, std::get<Disconnected>(event.event).reason);
    }
}

//=============================================================================
// Peer Events
//=============================================================================

void TorrentActor::on_handshake(ConnectionId id, const PeerID& peer_id) {
    auto it = connections_.find(id);
    if (it == connections_.end() || it->second.closing) {
        return;
    }

    if (peer_id == local_peer_id_) {
        close_connection(id, "connected to self");
        return;
    }
    if (swarm_.count(peer_id) > 0) {
        close_connection(id, "duplicate peer " + peer_id_to_string(peer_id));
        return;
    }

    ConnectionRecord& record = it->second;
    record.peer_id = peer_id;

    PeerState peer;
    peer.peer_id = peer_id;
    peer.connection = id;
    peer.address = record.actor->remote_address();
    peer.direction = record.actor->role();
    peer.have = Bitfield(meta_.num_pieces());
    peer.am_choking = true;
    peer.am_interested = false;
    peer.peer_choking = true;
    peer.peer_interested = false;
    peer.blocks_received = 0;
    peer.blocks_sent = 0;
    peer.bytes_downloaded = 0;
    peer.bytes_uploaded = 0;
    peer.last_send = Clock::now();

    PeerState& state = swarm_.emplace(peer_id, std::move(peer)).first->second;
    LOG_TORRENT_INFO("Peer " << peer_id_to_string(peer_id) << " joined from " << state.address
                     << " (" << swarm_.size() << " peers)");

    send_to(state, msg::Bitfield(table_.verified_pieces()));
}

void TorrentActor::on_message(ConnectionId id, const Message& message) {
    PeerState* peer = find_peer(id);
    if (!peer) {
        LOG_TORRENT_DEBUG("Ignoring " << message_name(message) << " from connection " << id
                          << " outside the swarm");
        return;
    }

    if (auto* bitfield = std::get_if<msg::Bitfield>(&message)) {
        handle_bitfield(*peer, *bitfield);
    } else if (auto* have = std::get_if<msg::Have>(&message)) {
        handle_have(*peer, *have);
    } else if (std::holds_alternative<msg::Choke>(message)) {
        handle_choke(*peer);
    } else if (std::holds_alternative<msg::Unchoke>(message)) {
        handle_unchoke(*peer);
    } else if (std::holds_alternative<msg::Interested>(message)) {
        handle_interested(*peer);
    } else if (std::holds_alternative<msg::NotInterested>(message)) {
        handle_not_interested(*peer);
    } else if (auto* request = std::get_if<msg::Request>(&message)) {
        handle_request(*peer, *request);
    } else if (auto* piece = std::get_if<msg::Piece>(&message)) {
        handle_piece(*peer, *piece);
    } else if (auto* cancel = std::get_if<msg::Cancel>(&message)) {
        handle_cancel(*peer, *cancel);
    }
    // KeepAlive needs no reaction
}

void TorrentActor::on_disconnected(ConnectionId id, const std::string& reason) {
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return;
    }

    ConnectionRecord record = std::move(it->second);
    connections_.erase(it);
    record.actor->join();

    if (record.peer_id) {
        auto peer = swarm_.find(*record.peer_id);
        if (peer != swarm_.end() && peer->second.connection == id) {
            size_t released = peer->second.in_flight.size();
            release_requests(peer->second);
            swarm_.erase(peer);

            LOG_TORRENT_INFO("Peer " << peer_id_to_string(*record.peer_id) << " left: " << reason
                             << " (released " << released << " requests, "
                             << swarm_.size() << " peers)");
            fill_upload_slots();
        }
    } else {
        LOG_TORRENT_INFO("Connection " << id << " with " << record.actor->remote_address()
                         << " closed before joining: " << reason);
    }

    if (record.dial_address && !record.closing && running_ && !complete_ &&
        record.redials_done < config_.redial_attempts) {
        Redial redial;
        redial.address = *record.dial_address;
        redial.peer_id = record.peer_id;
        redial.attempt = record.redials_done + 1;
        redial.due = Clock::now() + std::chrono::milliseconds(config_.redial_backoff_ms);
        redials_.push_back(redial);
    }
}

//=============================================================================
// Messages
//=============================================================================

void TorrentActor::handle_bitfield(PeerState& peer, const msg::Bitfield& message) {
    peer.have = message.to_bitfield(meta_.num_pieces());
    LOG_TORRENT_DEBUG("Peer " << peer_id_to_string(peer.peer_id) << " has "
                      << peer.have.count() << "/" << meta_.num_pieces() << " pieces");
    update_interest(peer);
}

void TorrentActor::handle_have(PeerState& peer, const msg::Have& message) {
    if (message.piece_index >= meta_.num_pieces()) {
        return;
    }
    peer.have.set_bit(message.piece_index);
    update_interest(peer);
}

void TorrentActor::handle_choke(PeerState& peer) {
    peer.peer_choking = true;
    release_requests(peer);
}

void TorrentActor::handle_unchoke(PeerState& peer) {
    peer.peer_choking = false;
}

void TorrentActor::handle_interested(PeerState& peer) {
    peer.peer_interested = true;
    if (peer.am_choking && unchoked_count() < config_.max_unchoked_peers) {
        peer.am_choking = false;
        send_to(peer, msg::Unchoke{});
        LOG_TORRENT_DEBUG("Unchoked " << peer_id_to_string(peer.peer_id));
    }
}

void TorrentActor::handle_not_interested(PeerState& peer) {
    peer.peer_interested = false;
    if (!peer.am_choking) {
        peer.am_choking = true;
        send_to(peer, msg::Choke{});
        LOG_TORRENT_DEBUG("Choked " << peer_id_to_string(peer.peer_id));
        fill_upload_slots();
    }
}

void TorrentActor::handle_request(PeerState& peer, const msg::Request& message) {
    if (peer.am_choking) {
        LOG_TORRENT_DEBUG("Ignoring request from choked peer " << peer_id_to_string(peer.peer_id));
        return;
    }
    if (message.piece_index >= meta_.num_pieces() || !table_.is_verified(message.piece_index)) {
        LOG_TORRENT_DEBUG("Ignoring request for unavailable piece " << message.piece_index);
        return;
    }
    if (message.length == 0 || message.length > PW_MAX_BLOCK_SIZE ||
        static_cast<uint64_t>(message.begin) + message.length > meta_.piece_size(message.piece_index)) {
        LOG_TORRENT_DEBUG("Ignoring request outside piece " << message.piece_index
                          << " (begin " << message.begin << ", length " << message.length << ")");
        return;
    }

    if (!store_) {
        LOG_TORRENT_DEBUG("Ignoring request for piece " << message.piece_index << ", no piece store");
        return;
    }

    auto data = store_->read_block(message.piece_index, message.begin, message.length);
    if (!data) {
        LOG_TORRENT_WARN("Piece store could not read piece " << message.piece_index
                         << " at " << message.begin);
        return;
    }

    peer.blocks_sent++;
    peer.bytes_uploaded += data->size();
    send_to(peer, msg::Piece(message.piece_index, message.begin, std::move(*data)));
}

void TorrentActor::handle_piece(PeerState& peer, const msg::Piece& message) {
    BlockInfo block(message.piece_index, message.begin, static_cast<uint32_t>(message.data.size()));
    auto it = peer.in_flight.find(block);
    if (it == peer.in_flight.end()) {
        LOG_TORRENT_DEBUG("Ignoring unrequested block " << block.piece_index << ":" << block.offset
                          << " from " << peer_id_to_string(peer.peer_id));
        return;
    }
    peer.in_flight.erase(it);
    peer.blocks_received++;
    peer.bytes_downloaded += message.data.size();

    BlockWriteResult result = table_.write_block(message.piece_index, message.begin, message.data);
    switch (result.outcome) {
        case BlockOutcome::Stored:
            break;
        case BlockOutcome::PieceVerified:
            on_piece_verified(message.piece_index, result.piece_data);
            break;
        case BlockOutcome::HashMismatch:
            hash_failures_++;
            LOG_TORRENT_WARN("Piece " << message.piece_index << " from " << peer_id_to_string(peer.peer_id)
                             << " failed hash check, rescheduling");
            break;
        case BlockOutcome::Duplicate:
        case BlockOutcome::Rejected:
            LOG_TORRENT_DEBUG("Block " << block.piece_index << ":" << block.offset << " "
                              << block_outcome_to_string(result.outcome));
            break;
    }
}

void TorrentActor::handle_cancel(PeerState& peer, const msg::Cancel& message) {
    // Requests are answered as they arrive, so nothing is queued to cancel
    LOG_TORRENT_DEBUG("Cancel " << message.piece_index << ":" << message.begin
                      << " from " << peer_id_to_string(peer.peer_id) << " (already served)");
}

//=============================================================================
// Policy
//=============================================================================

void TorrentActor::on_piece_verified(uint32_t piece_index, const std::vector<uint8_t>& data) {
    if (store_ && !store_->put_piece(piece_index, data)) {
        LOG_TORRENT_ERROR("Piece store refused verified piece " << piece_index);
    }

    LOG_TORRENT_INFO("Piece " << piece_index << " verified (" << table_.num_verified()
                     << "/" << meta_.num_pieces() << ")");

    for (auto& entry : swarm_) {
        PeerState& peer = entry.second;
        // Requests for the same piece still out to other peers are stale now
        for (auto it = peer.in_flight.begin(); it != peer.in_flight.end();) {
            if (it->piece_index == piece_index) {
                table_.release_block(*it);
                it = peer.in_flight.erase(it);
            } else {
                ++it;
            }
        }
        send_to(peer, msg::Have{piece_index});
        update_interest(peer);
    }

    check_completion();
}

void TorrentActor::update_interest(PeerState& peer) {
    bool wants = table_.wants_any(peer.have);
    if (wants && !peer.am_interested) {
        peer.am_interested = true;
        send_to(peer, msg::Interested{});
    } else if (!wants && peer.am_interested) {
        peer.am_interested = false;
        send_to(peer, msg::NotInterested{});
    }
}

void TorrentActor::fill_upload_slots() {
    for (auto& entry : swarm_) {
        if (unchoked_count() >= config_.max_unchoked_peers) {
            return;
        }
        PeerState& peer = entry.second;
        if (peer.peer_interested && peer.am_choking) {
            peer.am_choking = false;
            send_to(peer, msg::Unchoke{});
        }
    }
}

void TorrentActor::schedule() {
    if (complete_) {
        return;
    }
    for (auto& entry : swarm_) {
        schedule_peer(entry.second);
    }
}

void TorrentActor::schedule_peer(PeerState& peer) {
    if (peer.peer_choking || !peer.am_interested) {
        return;
    }

    while (peer.in_flight.size() < config_.pipeline_depth) {
        std::optional<BlockInfo> block = table_.pick_block(peer.have);
        if (!block) {
            break;
        }
        peer.in_flight.insert(*block);
        send_to(peer, msg::Request(block->piece_index, block->offset, block->length));
    }
}

void TorrentActor::release_requests(PeerState& peer) {
    for (const auto& block : peer.in_flight) {
        table_.release_block(block);
    }
    peer.in_flight.clear();
}

void TorrentActor::check_completion() {
    if (complete_ || !table_.is_complete()) {
        return;
    }
    complete_ = true;
    redials_.clear();

    if (store_) {
        store_->flush();
    }
    LOG_TORRENT_INFO("Download complete: " << meta_.num_pieces() << " pieces, "
                     << meta_.total_length() << " bytes");

    if (on_complete_) {
        on_complete_();
    }
}

//=============================================================================
// Helpers
//=============================================================================

void TorrentActor::start_connection(ConnectionRecord record) {
    ConnectionId id = record.actor->id();
    auto it = connections_.emplace(id, std::move(record)).first;
    it->second.actor->start();
}

ConnectionParams TorrentActor::make_params(ConnectionId id, Role role) const {
    ConnectionParams params;
    params.id = id;
    params.info_hash = meta_.info_hash();
    params.local_peer_id = local_peer_id_;
    params.role = role;
    params.num_pieces = meta_.num_pieces();
    params.read_timeout_ms = config_.read_timeout_ms;
    params.handshake_timeout_ms = config_.handshake_timeout_ms;
    params.connect_timeout_ms = config_.connect_timeout_ms;
    return params;
}

ConnectionActor::EventSink TorrentActor::make_sink() {
    Mailbox<TorrentInput>* inbox = &inbox_;
    return [inbox](PeerEvent event) {
        // Refused once the torrent has shut down
        inbox->push(TorrentInput(std::move(event)));
    };
}

bool TorrentActor::has_capacity() const {
    return connections_.size() < config_.max_peers;
}

void TorrentActor::send_to(PeerState& peer, Message message) {
    auto it = connections_.find(peer.connection);
    if (it == connections_.end()) {
        return;
    }
    it->second.actor->send(std::move(message));
    peer.last_send = Clock::now();
}

void TorrentActor::close_connection(ConnectionId id, const std::string& reason) {
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return;
    }
    LOG_TORRENT_INFO("Closing connection " << id << " with " << it->second.actor->remote_address()
                     << ": " << reason);
    it->second.closing = true;
    it->second.actor->close(reason);
}

TorrentActor::PeerState* TorrentActor::find_peer(ConnectionId id) {
    auto it = connections_.find(id);
    if (it == connections_.end() || !it->second.peer_id || it->second.closing) {
        return nullptr;
    }
    auto peer = swarm_.find(*it->second.peer_id);
    if (peer == swarm_.end() || peer->second.connection != id) {
        return nullptr;
    }
    return &peer->second;
}

size_t TorrentActor::unchoked_count() const {
    size_t count = 0;
    for (const auto& entry : swarm_) {
        if (!entry.second.am_choking) {
            count++;
        }
    }
    return count;
}

TorrentSnapshot TorrentActor::make_snapshot() const {
    TorrentSnapshot snapshot;
    snapshot.info_hash = meta_.info_hash();
    snapshot.num_pieces = meta_.num_pieces();
    snapshot.verified = table_.verified_pieces();
    snapshot.requested_blocks = table_.requested_count();
    snapshot.hash_failures = hash_failures_;
    snapshot.complete = complete_;

    snapshot.pieces.reserve(meta_.num_pieces());
    for (uint32_t i = 0; i < meta_.num_pieces(); ++i) {
        snapshot.pieces.push_back(table_.state(i));
    }

    snapshot.pending_connections = 0;
    for (const auto& entry : connections_) {
        if (!entry.second.peer_id) {
            snapshot.pending_connections++;
        }
    }

    for (const auto& entry : swarm_) {
        const PeerState& peer = entry.second;
        PeerSnapshot ps;
        ps.peer_id = peer.peer_id;
        ps.connection = peer.connection;
        ps.address = peer.address;
        ps.direction = peer.direction;
        ps.have = peer.have;
        ps.am_choking = peer.am_choking;
        ps.am_interested = peer.am_interested;
        ps.peer_choking = peer.peer_choking;
        ps.peer_interested = peer.peer_interested;
        ps.in_flight = peer.in_flight.size();
        ps.blocks_received = peer.blocks_received;
        ps.blocks_sent = peer.blocks_sent;
        ps.bytes_downloaded = peer.bytes_downloaded;
        ps.bytes_uploaded = peer.bytes_uploaded;
        snapshot.peers.push_back(std::move(ps));
    }

    return snapshot;
}

} // namespace peerwire
