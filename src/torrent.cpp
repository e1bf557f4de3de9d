#include "torrent.h"
#include "logger.h"

#include <future>

#define LOG_TORRENT_DEBUG(message) LOG_DEBUG("torrent", message)
#define LOG_TORRENT_INFO(message)  LOG_INFO("torrent", message)
#define LOG_TORRENT_ERROR(message) LOG_ERROR("torrent", message)

namespace peerwire {

namespace {

constexpr int kAcceptPollMs = 100;

} // namespace

Torrent::Torrent(const TorrentMeta& meta,
                 const TorrentConfig& config,
                 const PeerID& local_peer_id,
                 std::shared_ptr<PieceStore> store,
                 std::shared_ptr<Transport> transport)
    : meta_(meta),
      local_peer_id_(local_peer_id),
      transport_(transport),
      accepting_(false),
      listen_port_(0),
      complete_(false),
      stopped_(false) {
    actor_ = std::make_unique<TorrentActor>(meta, config, local_peer_id,
                                            std::move(store), std::move(transport), inbox_);
    complete_ = actor_->is_complete();
    actor_->set_completion_callback([this]() { mark_complete(); });

    LOG_TORRENT_INFO("Starting torrent " << info_hash_to_hex(meta_.info_hash())
                     << " as " << peer_id_to_string(local_peer_id_));
    actor_thread_ = std::thread([this]() { actor_->run(); });
}

Torrent::~Torrent() {
    shutdown();
}

//=============================================================================
// Connections
//=============================================================================

bool Torrent::add_connection(std::unique_ptr<Stream> stream, Role role) {
    if (!stream) {
        return false;
    }
    return inbox_.push(AddConnection{std::move(stream), role});
}

bool Torrent::dial(const PeerAddress& address) {
    return inbox_.push(DialPeer{address});
}

uint16_t Torrent::listen(const std::string& bind_ip, uint16_t port) {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);

    if (!transport_ || listener_ || inbox_.is_closed()) {
        return 0;
    }

    listener_ = transport_->listen(bind_ip, port);
    if (!listener_) {
        LOG_TORRENT_ERROR("Failed to listen on " << bind_ip << ":" << port);
        return 0;
    }

    listen_port_ = listener_->port();
    accepting_ = true;
    accept_thread_ = std::thread(&Torrent::accept_loop, this);

    LOG_TORRENT_INFO("Accepting peers on " << bind_ip << ":" << listen_port_.load());
    return listen_port_.load();
}

void Torrent::accept_loop() {
    while (accepting_.load()) {
        std::unique_ptr<Stream> stream = listener_->accept(kAcceptPollMs);
        if (!stream) {
            continue;
        }
        LOG_TORRENT_DEBUG("Accepted " << stream->remote_address());
        if (!add_connection(std::move(stream), Role::Responder)) {
            break;
        }
    }
}

//=============================================================================
// State
//=============================================================================

std::optional<TorrentSnapshot> Torrent::snapshot() {
    auto promise = std::make_shared<std::promise<TorrentSnapshot>>();
    std::future<TorrentSnapshot> future = promise->get_future();

    // The request holds the only reference, so a request dropped unanswered breaks the promise
    if (!inbox_.push(SnapshotRequest{std::move(promise)})) {
        return std::nullopt;
    }

    try {
        return future.get();
    } catch (const std::future_error& e) {
        LOG_TORRENT_DEBUG("Snapshot not taken: " << e.what());
        return std::nullopt;
    }
}

bool Torrent::wait_for_completion(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait_for(lock, timeout, [this]() { return complete_ || stopped_; });
    return complete_;
}

bool Torrent::wait_for_completion() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait(lock, [this]() { return complete_ || stopped_; });
    return complete_;
}

bool Torrent::is_complete() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return complete_;
}

void Torrent::mark_complete() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        complete_ = true;
    }
    state_cv_.notify_all();
}

void Torrent::shutdown() {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);

    if (accept_thread_.joinable()) {
        accepting_ = false;
        accept_thread_.join();
    }
    if (listener_) {
        listener_->close();
        listener_.reset();
    }

    if (actor_thread_.joinable()) {
        inbox_.push(ShutdownRequest{});
        actor_thread_.join();
        LOG_TORRENT_INFO("Torrent " << info_hash_to_hex(meta_.info_hash()) << " shut down");
    }

    // Unanswered requests are dropped here, which releases their waiters
    inbox_.close();
    inbox_.drain();

    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        stopped_ = true;
    }
    state_cv_.notify_all();
}

} // namespace peerwire
