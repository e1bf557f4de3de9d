#include "piece_table.h"
#include "sha1.h"
#include "logger.h"

#include <algorithm>

#define LOG_PIECES_DEBUG(message) LOG_DEBUG("pieces", message)
#define LOG_PIECES_WARN(message)  LOG_WARN("pieces", message)

namespace peerwire {

const char* piece_state_to_string(PieceState state) {
    switch (state) {
        case PieceState::Missing: return "Missing";
        case PieceState::InProgress: return "InProgress";
        case PieceState::Verified: return "Verified";
    }
    return "Unknown";
}

const char* block_outcome_to_string(BlockOutcome outcome) {
    switch (outcome) {
        case BlockOutcome::Stored: return "stored";
        case BlockOutcome::PieceVerified: return "piece verified";
        case BlockOutcome::HashMismatch: return "hash mismatch";
        case BlockOutcome::Duplicate: return "duplicate";
        case BlockOutcome::Rejected: return "rejected";
    }
    return "unknown";
}

PieceTable::PieceTable(const TorrentMeta& meta, uint32_t block_size)
    : meta_(meta),
      block_size_(block_size == 0 ? PW_BLOCK_SIZE : block_size),
      pieces_(meta.num_pieces()),
      verified_(meta.num_pieces()),
      requested_total_(0) {
    for (uint32_t i = 0; i < meta_.num_pieces(); ++i) {
        uint32_t blocks = meta_.num_blocks(i, block_size_);
        pieces_[i].received = Bitfield(blocks);
        pieces_[i].requested = Bitfield(blocks);
    }
}

//=============================================================================
// Scheduling
//=============================================================================

std::optional<BlockInfo> PieceTable::pick_block(const Bitfield& peer_has) {
    for (size_t index = peer_has.find_next_set(0);
         index < peer_has.size() && index < pieces_.size();
         index = peer_has.find_next_set(index + 1)) {
        PieceEntry& entry = pieces_[index];
        if (entry.state == PieceState::Verified) {
            continue;
        }

        for (size_t block = 0; block < entry.received.size(); ++block) {
            if (entry.received.get_bit(block) || entry.requested.get_bit(block)) {
                continue;
            }

            entry.requested.set_bit(block);
            ++requested_total_;

            uint32_t piece = static_cast<uint32_t>(index);
            uint32_t number = static_cast<uint32_t>(block);
            return BlockInfo(piece, number * block_size_,
                             meta_.block_length(piece, number, block_size_));
        }
    }

    return std::nullopt;
}

void PieceTable::release_block(const BlockInfo& block) {
    int64_t number = block_number(block.piece_index, block.offset, block.length);
    if (number < 0) {
        return;
    }

    PieceEntry& entry = pieces_[block.piece_index];
    if (entry.requested.get_bit(static_cast<size_t>(number))) {
        entry.requested.clear_bit(static_cast<size_t>(number));
        --requested_total_;
    }
}

//=============================================================================
// Data
//=============================================================================

BlockWriteResult PieceTable::write_block(uint32_t piece_index, uint32_t begin,
                                         const std::vector<uint8_t>& data) {
    BlockWriteResult result{BlockOutcome::Rejected, {}};

    int64_t number = block_number(piece_index, begin, static_cast<uint32_t>(data.size()));
    if (number < 0) {
        return result;
    }

    PieceEntry& entry = pieces_[piece_index];
    if (entry.state == PieceState::Verified) {
        return result;
    }

    size_t block = static_cast<size_t>(number);
    if (entry.received.get_bit(block)) {
        result.outcome = BlockOutcome::Duplicate;
        return result;
    }

    if (entry.state == PieceState::Missing) {
        entry.data.assign(meta_.piece_size(piece_index), 0);
        entry.state = PieceState::InProgress;
    }

    std::copy(data.begin(), data.end(), entry.data.begin() + begin);
    entry.received.set_bit(block);
    if (entry.requested.get_bit(block)) {
        entry.requested.clear_bit(block);
        --requested_total_;
    }

    if (!entry.received.all_set()) {
        result.outcome = BlockOutcome::Stored;
        return result;
    }

    if (SHA1::hash_bytes(entry.data) != meta_.piece_hash(piece_index)) {
        LOG_PIECES_WARN("Piece " << piece_index << " failed hash check, discarding "
                        << entry.received.count() << " blocks");
        reset_piece(entry);
        result.outcome = BlockOutcome::HashMismatch;
        return result;
    }

    LOG_PIECES_DEBUG("Piece " << piece_index << " verified");
    result.piece_data = std::move(entry.data);
    entry.data = std::vector<uint8_t>();
    entry.state = PieceState::Verified;
    verified_.set_bit(piece_index);
    result.outcome = BlockOutcome::PieceVerified;
    return result;
}

void PieceTable::mark_verified(uint32_t piece_index) {
    if (piece_index >= pieces_.size()) {
        return;
    }

    PieceEntry& entry = pieces_[piece_index];
    requested_total_ -= entry.requested.count();
    entry.requested.clear_all();
    entry.received.set_all();
    entry.data = std::vector<uint8_t>();
    entry.state = PieceState::Verified;
    verified_.set_bit(piece_index);
}

void PieceTable::reset_piece(PieceEntry& entry) {
    requested_total_ -= entry.requested.count();
    entry.requested.clear_all();
    entry.received.clear_all();
    entry.data = std::vector<uint8_t>();
    entry.state = PieceState::Missing;
}

//=============================================================================
// Queries
//=============================================================================

PieceState PieceTable::state(uint32_t piece_index) const {
    if (piece_index >= pieces_.size()) {
        return PieceState::Missing;
    }
    return pieces_[piece_index].state;
}

Bitfield PieceTable::received_blocks(uint32_t piece_index) const {
    if (piece_index >= pieces_.size()) {
        return Bitfield();
    }
    return pieces_[piece_index].received;
}

size_t PieceTable::blocks_received(uint32_t piece_index) const {
    if (piece_index >= pieces_.size()) {
        return 0;
    }
    return pieces_[piece_index].received.count();
}

bool PieceTable::is_requested(const BlockInfo& block) const {
    int64_t number = block_number(block.piece_index, block.offset, block.length);
    if (number < 0) {
        return false;
    }
    return pieces_[block.piece_index].requested.get_bit(static_cast<size_t>(number));
}

bool PieceTable::wants_any(const Bitfield& peer_has) const {
    return peer_has.has_bits_not_in(verified_);
}

int64_t PieceTable::block_number(uint32_t piece_index, uint32_t begin, uint32_t length) const {
    if (piece_index >= pieces_.size() || begin % block_size_ != 0) {
        return -1;
    }

    uint32_t number = begin / block_size_;
    uint32_t expected = meta_.block_length(piece_index, number, block_size_);
    if (expected == 0 || expected != length) {
        return -1;
    }
    return number;
}

} // namespace peerwire
