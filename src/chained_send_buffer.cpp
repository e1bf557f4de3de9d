#include "chained_send_buffer.h"

namespace peerwire {

void ChainedSendBuffer::append(std::vector<uint8_t> data) {
    if (data.empty()) return;

    total_bytes_ += data.size();
    chunks_.emplace_back(std::move(data));
}

void ChainedSendBuffer::append(const uint8_t* data, size_t length) {
    if (length == 0) return;
    append(std::vector<uint8_t>(data, data + length));
}

const uint8_t* ChainedSendBuffer::front_data() const {
    return chunks_.empty() ? nullptr : chunks_.front().current();
}

size_t ChainedSendBuffer::front_size() const {
    return chunks_.empty() ? 0 : chunks_.front().remaining();
}

void ChainedSendBuffer::pop_front(size_t bytes) {
    while (bytes > 0 && !chunks_.empty()) {
        SendChunk& front = chunks_.front();
        size_t remaining = front.remaining();

        if (bytes >= remaining) {
            bytes -= remaining;
            total_bytes_ -= remaining;
            chunks_.pop_front();
        } else {
            front.offset += bytes;
            total_bytes_ -= bytes;
            bytes = 0;
        }
    }
}

std::vector<uint8_t> ChainedSendBuffer::take_all() {
    std::vector<uint8_t> out;

    // Single untouched chunk can be handed over as is
    if (chunks_.size() == 1 && chunks_.front().offset == 0) {
        out = std::move(chunks_.front().data);
        clear();
        return out;
    }

    out.reserve(total_bytes_);
    for (const auto& chunk : chunks_) {
        out.insert(out.end(), chunk.current(), chunk.current() + chunk.remaining());
    }
    clear();
    return out;
}

void ChainedSendBuffer::clear() {
    chunks_.clear();
    total_bytes_ = 0;
}

} // namespace peerwire
