#include "piece_store.h"
#include "fs.h"
#include "logger.h"
#include "sha1.h"

#include <algorithm>

#define LOG_STORE_DEBUG(message) LOG_DEBUG("store", message)
#define LOG_STORE_INFO(message)  LOG_INFO("store", message)
#define LOG_STORE_ERROR(message) LOG_ERROR("store", message)

namespace peerwire {

namespace {

bool range_inside(uint32_t piece_size, uint32_t begin, uint32_t length) {
    return length > 0 && static_cast<uint64_t>(begin) + length <= piece_size;
}

} // namespace

//=============================================================================
// MemoryPieceStore
//=============================================================================

MemoryPieceStore::MemoryPieceStore(const TorrentMeta& meta, const std::vector<uint8_t>& content) {
    for (uint32_t i = 0; i < meta.num_pieces(); ++i) {
        uint64_t offset = meta.piece_offset(i);
        if (offset >= content.size()) {
            break;
        }
        size_t len = std::min<size_t>(meta.piece_size(i), content.size() - offset);
        pieces_[i] = std::vector<uint8_t>(content.begin() + offset, content.begin() + offset + len);
    }
}

bool MemoryPieceStore::put_piece(uint32_t index, const std::vector<uint8_t>& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    pieces_[index] = data;
    return true;
}

bool MemoryPieceStore::has_piece(uint32_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pieces_.count(index) > 0;
}

std::optional<std::vector<uint8_t>> MemoryPieceStore::read_block(uint32_t index,
                                                                 uint32_t begin,
                                                                 uint32_t length) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pieces_.find(index);
    if (it == pieces_.end() || !range_inside(static_cast<uint32_t>(it->second.size()), begin, length)) {
        return std::nullopt;
    }
    return std::vector<uint8_t>(it->second.begin() + begin, it->second.begin() + begin + length);
}

std::optional<std::vector<uint8_t>> MemoryPieceStore::get_piece(uint32_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pieces_.find(index);
    if (it == pieces_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t MemoryPieceStore::piece_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pieces_.size();
}

//=============================================================================
// FilePieceStore
//=============================================================================

FilePieceStore::FilePieceStore(const std::string& path, const TorrentMeta& meta)
    : path_(path),
      meta_(meta),
      open_(false),
      existing_pieces_(0),
      stored_(meta.num_pieces()),
      bytes_written_(0),
      write_failed_(false) {
    int64_t size = get_file_size(path_);

    if (size >= 0 && static_cast<uint64_t>(size) == meta_.total_length()) {
        open_ = true;
        check_existing();
    } else {
        open_ = create_file_with_size(path_, meta_.total_length());
        if (open_) {
            LOG_STORE_INFO("Created " << path_ << " (" << meta_.total_length() << " bytes)");
        }
    }

    if (open_) {
        writer_ = std::thread(&FilePieceStore::writer_loop, this);
    } else {
        LOG_STORE_ERROR("Cannot open piece file " << path_);
    }
}

FilePieceStore::~FilePieceStore() {
    jobs_.close();
    if (writer_.joinable()) {
        writer_.join();
    }
}

void FilePieceStore::check_existing() {
    std::vector<uint8_t> buffer;

    for (uint32_t i = 0; i < meta_.num_pieces(); ++i) {
        buffer.resize(meta_.piece_size(i));
        if (!read_file_chunk(path_, meta_.piece_offset(i), buffer.data(), buffer.size())) {
            continue;
        }
        if (SHA1::hash_bytes(buffer) == meta_.piece_hash(i)) {
            stored_.set_bit(i);
            ++existing_pieces_;
        }
    }

    LOG_STORE_INFO("Checked " << path_ << ": " << existing_pieces_ << "/"
                   << meta_.num_pieces() << " pieces intact");
}

bool FilePieceStore::put_piece(uint32_t index, const std::vector<uint8_t>& data) {
    if (!open_ || index >= meta_.num_pieces() || data.size() != meta_.piece_size(index)) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stored_.get_bit(index)) {
            return true;
        }
        stored_.set_bit(index);
        pending_[index] = data;
    }

    if (!jobs_.push(WriteJob{index, data})) {
        std::lock_guard<std::mutex> lock(mutex_);
        stored_.clear_bit(index);
        pending_.erase(index);
        idle_cv_.notify_all();
        return false;
    }
    return true;
}

bool FilePieceStore::has_piece(uint32_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stored_.get_bit(index);
}

std::optional<std::vector<uint8_t>> FilePieceStore::read_block(uint32_t index,
                                                               uint32_t begin,
                                                               uint32_t length) const {
    if (!range_inside(meta_.piece_size(index), begin, length)) {
        return std::nullopt;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stored_.get_bit(index)) {
            return std::nullopt;
        }
        auto it = pending_.find(index);
        if (it != pending_.end()) {
            return std::vector<uint8_t>(it->second.begin() + begin,
                                        it->second.begin() + begin + length);
        }
    }

    std::vector<uint8_t> block(length);
    if (!read_file_chunk(path_, meta_.piece_offset(index) + begin, block.data(), length)) {
        return std::nullopt;
    }
    return block;
}

void FilePieceStore::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return pending_.empty(); });
}

void FilePieceStore::writer_loop() {
    while (auto job = jobs_.pop()) {
        bool ok = write_file_chunk(path_, meta_.piece_offset(job->index),
                                   job->data.data(), job->data.size());

        std::lock_guard<std::mutex> lock(mutex_);
        if (ok) {
            bytes_written_ += job->data.size();
            LOG_STORE_DEBUG("Wrote piece " << job->index << " to " << path_);
        } else {
            write_failed_ = true;
            stored_.clear_bit(job->index);
            LOG_STORE_ERROR("Failed to write piece " << job->index << " to " << path_);
        }
        pending_.erase(job->index);
        if (pending_.empty()) {
            idle_cv_.notify_all();
        }
    }
}

} // namespace peerwire
