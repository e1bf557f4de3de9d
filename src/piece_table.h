#pragma once

/**
 * @file piece_table.h
 * @brief Per-piece download state and block bookkeeping
 *
 * Each piece is Missing, InProgress (some blocks received) or Verified.
 * A piece only becomes Verified once every block is present and the
 * SHA-1 of the assembled bytes matches the expected digest; after that
 * it never changes again.
 *
 * Not thread-safe: owned by the torrent actor.
 */

#include "pw_types.h"
#include "pw_bitfield.h"
#include "torrent_meta.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace peerwire {

enum class PieceState : uint8_t {
    Missing,
    InProgress,
    Verified
};

const char* piece_state_to_string(PieceState state);

/**
 * @brief What happened to a block handed to write_block()
 */
enum class BlockOutcome : uint8_t {
    Stored,         ///< Block kept, piece still incomplete
    PieceVerified,  ///< Block completed the piece and the hash matched
    HashMismatch,   ///< Block completed the piece but the hash did not match
    Duplicate,      ///< Block was already received
    Rejected        ///< Bad index, offset or length, or piece already verified
};

const char* block_outcome_to_string(BlockOutcome outcome);

struct BlockWriteResult {
    BlockOutcome outcome;
    std::vector<uint8_t> piece_data;    ///< Assembled piece, only on PieceVerified
};

class PieceTable {
public:
    /**
     * @param meta Torrent metadata, copied
     * @param block_size Size of blocks requested from peers
     */
    PieceTable(const TorrentMeta& meta, uint32_t block_size);

    //=========================================================================
    // Scheduling
    //=========================================================================

    /**
     * @brief Choose the next block to request from a peer
     *
     * Sequential policy: the lowest-index piece that is not Verified and
     * that the peer has, then its first block that is neither received
     * nor already requested. The chosen block is marked requested.
     *
     * @param peer_has Pieces the peer announced
     * @return Block to request, or std::nullopt if nothing is assignable
     */
    std::optional<BlockInfo> pick_block(const Bitfield& peer_has);

    /**
     * @brief Return a requested block to the unassigned pool
     *
     * No effect if the block was already received or never requested.
     */
    void release_block(const BlockInfo& block);

    //=========================================================================
    // Data
    //=========================================================================

    /**
     * @brief Store a received block
     *
     * Completing a piece triggers verification: on success the piece is
     * Verified and its bytes are returned; on mismatch every block is
     * discarded and the piece is Missing again.
     */
    BlockWriteResult write_block(uint32_t piece_index, uint32_t begin,
                                 const std::vector<uint8_t>& data);

    /**
     * @brief Mark a piece Verified without downloading it
     *
     * Used when the data is already held locally.
     */
    void mark_verified(uint32_t piece_index);

    //=========================================================================
    // Queries
    //=========================================================================

    PieceState state(uint32_t piece_index) const;
    bool is_verified(uint32_t piece_index) const { return state(piece_index) == PieceState::Verified; }

    /// Received blocks of a piece, empty bitfield for an invalid index
    Bitfield received_blocks(uint32_t piece_index) const;
    size_t blocks_received(uint32_t piece_index) const;

    bool is_requested(const BlockInfo& block) const;
    size_t requested_count() const { return requested_total_; }

    /// Bitfield of Verified pieces, as announced to peers
    const Bitfield& verified_pieces() const { return verified_; }
    uint32_t num_verified() const { return static_cast<uint32_t>(verified_.count()); }
    bool is_complete() const { return verified_.all_set(); }

    /// True if peer_has contains a piece we do not have yet
    bool wants_any(const Bitfield& peer_has) const;

    uint32_t num_pieces() const { return meta_.num_pieces(); }
    uint32_t block_size() const { return block_size_; }
    const TorrentMeta& meta() const { return meta_; }

private:
    struct PieceEntry {
        PieceState state = PieceState::Missing;
        Bitfield received;
        Bitfield requested;
        std::vector<uint8_t> data;
    };

    /// Block number for (piece, begin, length), or -1 if it is not a valid block
    int64_t block_number(uint32_t piece_index, uint32_t begin, uint32_t length) const;
    void reset_piece(PieceEntry& entry);

    TorrentMeta meta_;
    uint32_t block_size_;
    std::vector<PieceEntry> pieces_;
    Bitfield verified_;
    size_t requested_total_;
};

} // namespace peerwire
