#include "receive_buffer.h"
#include <cstring>

namespace peerwire {

ReceiveBuffer::ReceiveBuffer(size_t initial_capacity)
    : buffer_(initial_capacity) {
}

void ReceiveBuffer::append(const uint8_t* data, size_t length) {
    if (length == 0) {
        return;
    }

    if (buffer_.size() - end_ < length && start_ > 0) {
        normalize();
    }

    size_t needed = end_ + length;
    if (needed > buffer_.size()) {
        size_t new_size = buffer_.size() < 256 ? 256 : buffer_.size();
        while (new_size < needed) {
            new_size = new_size * 3 / 2;
        }
        buffer_.resize(new_size);
    }

    std::memcpy(buffer_.data() + end_, data, length);
    end_ += length;
}

void ReceiveBuffer::consume(size_t bytes) {
    start_ += bytes;
    if (start_ >= end_) {
        start_ = 0;
        end_ = 0;
    }
}

void ReceiveBuffer::normalize() {
    if (start_ == 0) {
        return;
    }

    size_t data_size = end_ - start_;
    if (data_size > 0) {
        std::memmove(buffer_.data(), buffer_.data() + start_, data_size);
    }
    end_ = data_size;
    start_ = 0;
}

void ReceiveBuffer::clear() {
    start_ = 0;
    end_ = 0;
}

} // namespace peerwire
