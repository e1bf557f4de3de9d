#pragma once

/**
 * @file receive_buffer.h
 * @brief Inbound byte buffer holding the partial frame of a connection
 */

#include <vector>
#include <cstdint>
#include <cstddef>

namespace peerwire {

/**
 * @brief Append-at-back, consume-at-front byte buffer
 *
 * consume() only advances a start offset. The unused front is reclaimed
 * lazily when an append would otherwise have to grow the storage.
 */
class ReceiveBuffer {
public:
    explicit ReceiveBuffer(size_t initial_capacity = 4096);

    /**
     * @brief Copy bytes to the back of the buffer
     */
    void append(const uint8_t* data, size_t length);

    /**
     * @brief Get pointer to unprocessed data
     */
    const uint8_t* data() const { return buffer_.data() + start_; }

    /**
     * @brief Get size of unprocessed data
     */
    size_t size() const { return end_ - start_; }

    bool empty() const { return start_ == end_; }

    /**
     * @brief Drop bytes from the front after they were decoded
     */
    void consume(size_t bytes);

    /**
     * @brief Move unprocessed data to the beginning of storage
     */
    void normalize();

    void clear();

    size_t capacity() const { return buffer_.size(); }

    /**
     * @brief Bytes already consumed but not yet reclaimed
     */
    size_t front_waste() const { return start_; }

private:
    std::vector<uint8_t> buffer_;
    size_t start_ = 0;  ///< Start of unprocessed data
    size_t end_ = 0;    ///< End of received data
};

} // namespace peerwire
