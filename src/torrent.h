#pragma once

/**
 * @file torrent.h
 * @brief Process-facing handle of one torrent
 *
 * A Torrent owns the torrent actor thread and its mailbox, and optionally
 * an accept thread that feeds incoming streams to the actor. Every public
 * method is safe to call from any thread.
 */

#include "pw_types.h"
#include "pw_config.h"
#include "pw_transport.h"
#include "piece_store.h"
#include "torrent_actor.h"
#include "torrent_meta.h"
#include "mailbox.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace peerwire {

class Torrent {
public:
    /**
     * @brief Create the torrent and start its actor thread
     *
     * @param meta Torrent metadata
     * @param config Tunables, validated by the caller
     * @param local_peer_id Our peer ID
     * @param store Sink for verified pieces; pieces it already holds count as verified (may be null)
     * @param transport Used to dial peers and to listen (may be null if neither is needed)
     */
    Torrent(const TorrentMeta& meta,
            const TorrentConfig& config,
            const PeerID& local_peer_id,
            std::shared_ptr<PieceStore> store,
            std::shared_ptr<Transport> transport);

    /**
     * @brief Shuts down
     */
    ~Torrent();

    Torrent(const Torrent&) = delete;
    Torrent& operator=(const Torrent&) = delete;

    //=========================================================================
    // Connections
    //=========================================================================

    /**
     * @brief Hand over a connected stream
     * @return false if the torrent is shut down
     */
    bool add_connection(std::unique_ptr<Stream> stream, Role role);

    /**
     * @brief Connect to a peer from a connection actor
     * @return false if the torrent is shut down
     */
    bool dial(const PeerAddress& address);

    /**
     * @brief Accept incoming connections on bind_ip:port
     * @return Bound port, or 0 if listening failed
     */
    uint16_t listen(const std::string& bind_ip, uint16_t port);

    //=========================================================================
    // State
    //=========================================================================

    /**
     * @brief Copy of the swarm and piece state, taken inside the actor
     * @return std::nullopt if the torrent is shut down
     */
    std::optional<TorrentSnapshot> snapshot();

    /**
     * @brief Block until every piece is verified or the timeout expires
     * @return true if complete
     */
    bool wait_for_completion(std::chrono::milliseconds timeout);

    /**
     * @brief Block until every piece is verified or the torrent shuts down
     */
    bool wait_for_completion();

    bool is_complete() const;

    /**
     * @brief Close every connection and join every thread
     */
    void shutdown();

    const TorrentMeta& meta() const { return meta_; }
    const PeerID& peer_id() const { return local_peer_id_; }
    uint16_t listen_port() const { return listen_port_.load(); }

private:
    void accept_loop();
    void mark_complete();

    TorrentMeta meta_;
    PeerID local_peer_id_;
    std::shared_ptr<Transport> transport_;

    Mailbox<TorrentInput> inbox_;
    std::unique_ptr<TorrentActor> actor_;
    std::thread actor_thread_;

    std::unique_ptr<Listener> listener_;
    std::thread accept_thread_;
    std::atomic<bool> accepting_;
    std::atomic<uint16_t> listen_port_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    bool complete_;
    bool stopped_;
    std::mutex shutdown_mutex_;
};

} // namespace peerwire
