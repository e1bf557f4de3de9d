#pragma once

/**
 * @file chained_send_buffer.h
 * @brief Outbound chain of encoded messages awaiting a write
 */

#include <vector>
#include <deque>
#include <cstdint>
#include <cstddef>

namespace peerwire {

/**
 * @brief A chunk of data in the send chain
 */
struct SendChunk {
    std::vector<uint8_t> data;  ///< Owned data
    size_t offset = 0;          ///< Bytes of data already written out

    SendChunk() = default;
    explicit SendChunk(std::vector<uint8_t> d) : data(std::move(d)), offset(0) {}

    size_t remaining() const { return data.size() - offset; }
    const uint8_t* current() const { return data.data() + offset; }
};

/**
 * @brief FIFO of byte chunks with partial-write support
 *
 * Usage:
 *   1. append(bytes) - queue an encoded message
 *   2. n = stream.write(front_data(), front_size())
 *   3. pop_front(n) - drop what the stream accepted
 */
class ChainedSendBuffer {
public:
    ChainedSendBuffer() = default;

    /**
     * @brief Append data by moving (no copy)
     */
    void append(std::vector<uint8_t> data);

    /**
     * @brief Append data by copying
     */
    void append(const uint8_t* data, size_t length);

    /**
     * @brief Front chunk data, nullptr if empty
     */
    const uint8_t* front_data() const;

    /**
     * @brief Front chunk size, 0 if empty
     */
    size_t front_size() const;

    /**
     * @brief Remove bytes from the front after a successful write
     */
    void pop_front(size_t bytes);

    /**
     * @brief Remove everything and return it as one contiguous buffer
     */
    std::vector<uint8_t> take_all();

    size_t size() const { return total_bytes_; }
    bool empty() const { return total_bytes_ == 0; }
    size_t chunk_count() const { return chunks_.size(); }
    void clear();

private:
    std::deque<SendChunk> chunks_;
    size_t total_bytes_ = 0;
};

} // namespace peerwire
