#pragma once

/**
 * @file piece_store.h
 * @brief Persistence sink for verified pieces
 *
 * The torrent actor only hands a piece to the store after its hash was
 * checked, and reads blocks back from it to serve peers.
 */

#include "pw_types.h"
#include "pw_bitfield.h"
#include "torrent_meta.h"
#include "mailbox.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace peerwire {

/**
 * @brief Where verified pieces go
 */
class PieceStore {
public:
    virtual ~PieceStore() = default;

    /**
     * @brief Persist a verified piece
     * @return false if the store refused the piece
     */
    virtual bool put_piece(uint32_t index, const std::vector<uint8_t>& data) = 0;

    virtual bool has_piece(uint32_t index) const = 0;

    /**
     * @brief Read part of a stored piece
     * @return std::nullopt if the piece is not stored or the range is outside it
     */
    virtual std::optional<std::vector<uint8_t>> read_block(uint32_t index,
                                                           uint32_t begin,
                                                           uint32_t length) const = 0;

    /**
     * @brief Block until every accepted piece is durable
     */
    virtual void flush() {}
};

//=============================================================================
// MemoryPieceStore
//=============================================================================

/**
 * @brief Keeps pieces in memory, used by tests and for small seeds
 */
class MemoryPieceStore : public PieceStore {
public:
    MemoryPieceStore() = default;

    /**
     * @brief Pre-load every piece of content as laid out by meta
     */
    MemoryPieceStore(const TorrentMeta& meta, const std::vector<uint8_t>& content);

    bool put_piece(uint32_t index, const std::vector<uint8_t>& data) override;
    bool has_piece(uint32_t index) const override;
    std::optional<std::vector<uint8_t>> read_block(uint32_t index,
                                                   uint32_t begin,
                                                   uint32_t length) const override;

    std::optional<std::vector<uint8_t>> get_piece(uint32_t index) const;
    size_t piece_count() const;

private:
    mutable std::mutex mutex_;
    std::map<uint32_t, std::vector<uint8_t>> pieces_;
};

//=============================================================================
// FilePieceStore
//=============================================================================

/**
 * @brief Writes pieces into one flat file at offset index * piece_length
 *
 * Writes are queued to a background writer thread so put_piece() returns
 * without touching the disk. A piece counts as stored as soon as it is
 * queued; reads of a piece still in the queue are served from memory.
 */
class FilePieceStore : public PieceStore {
public:
    /**
     * @brief Open or create the backing file
     *
     * An existing file of the right size is hash-checked piece by piece
     * and the matching pieces are reported by has_piece(). Otherwise the
     * file is created (or truncated) and sized to the content length.
     */
    FilePieceStore(const std::string& path, const TorrentMeta& meta);
    ~FilePieceStore() override;

    /// False if the backing file could not be opened or created
    bool is_open() const { return open_; }

    bool put_piece(uint32_t index, const std::vector<uint8_t>& data) override;
    bool has_piece(uint32_t index) const override;
    std::optional<std::vector<uint8_t>> read_block(uint32_t index,
                                                   uint32_t begin,
                                                   uint32_t length) const override;
    void flush() override;

    /// Pieces found intact when the file was opened
    uint32_t existing_pieces() const { return existing_pieces_; }

    uint64_t bytes_written() const { return bytes_written_.load(); }
    bool write_failed() const { return write_failed_.load(); }

private:
    struct WriteJob {
        uint32_t index;
        std::vector<uint8_t> data;
    };

    void check_existing();
    void writer_loop();

    std::string path_;
    TorrentMeta meta_;
    bool open_;
    uint32_t existing_pieces_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    Bitfield stored_;
    std::map<uint32_t, std::vector<uint8_t>> pending_;

    Mailbox<WriteJob> jobs_;
    std::thread writer_;
    std::atomic<uint64_t> bytes_written_;
    std::atomic<bool> write_failed_;
};

} // namespace peerwire
