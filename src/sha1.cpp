#include "sha1.h"
#include <iomanip>
#include <sstream>
#include <cstring>
#include <algorithm>

namespace peerwire {

// SHA1 constants
static const uint32_t K[] = {
    0x5A827999, 0x6ED9EBA1, 0x8F1BBCDC, 0xCA62C1D6
};

static uint32_t left_rotate(uint32_t value, int amount) {
    return (value << amount) | (value >> (32 - amount));
}

SHA1::SHA1() {
    reset();
}

void SHA1::reset() {
    h_[0] = 0x67452301;
    h_[1] = 0xEFCDAB89;
    h_[2] = 0x98BADCFE;
    h_[3] = 0x10325476;
    h_[4] = 0xC3D2E1F0;

    buffer_length_ = 0;
    total_length_ = 0;
    finalized_ = false;
}

void SHA1::update(const uint8_t* data, size_t length) {
    if (finalized_ || length == 0) {
        return;
    }

    total_length_ += length;

    // Top up a partially filled block first
    if (buffer_length_ > 0) {
        size_t take = std::min(length, sizeof(buffer_) - buffer_length_);
        std::memcpy(buffer_ + buffer_length_, data, take);
        buffer_length_ += take;
        data += take;
        length -= take;

        if (buffer_length_ < sizeof(buffer_)) {
            return;
        }
        process_block(buffer_);
        buffer_length_ = 0;
    }

    while (length >= sizeof(buffer_)) {
        process_block(data);
        data += sizeof(buffer_);
        length -= sizeof(buffer_);
    }

    if (length > 0) {
        std::memcpy(buffer_, data, length);
        buffer_length_ = length;
    }
}

void SHA1::update(const std::vector<uint8_t>& data) {
    update(data.data(), data.size());
}

void SHA1::update(const std::string& str) {
    update(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

void SHA1::process_block(const uint8_t* block) {
    uint32_t w[80];

    // Break chunk into sixteen 32-bit big-endian words
    for (int i = 0; i < 16; i++) {
        w[i] = (static_cast<uint32_t>(block[i * 4]) << 24) |
               (static_cast<uint32_t>(block[i * 4 + 1]) << 16) |
               (static_cast<uint32_t>(block[i * 4 + 2]) << 8) |
               (static_cast<uint32_t>(block[i * 4 + 3]));
    }

    for (int i = 16; i < 80; i++) {
        w[i] = left_rotate(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
    }

    uint32_t a = h_[0];
    uint32_t b = h_[1];
    uint32_t c = h_[2];
    uint32_t d = h_[3];
    uint32_t e = h_[4];

    for (int i = 0; i < 80; i++) {
        uint32_t f, k;

        if (i < 20) {
            f = (b & c) | (~b & d);
            k = K[0];
        } else if (i < 40) {
            f = b ^ c ^ d;
            k = K[1];
        } else if (i < 60) {
            f = (b & c) | (b & d) | (c & d);
            k = K[2];
        } else {
            f = b ^ c ^ d;
            k = K[3];
        }

        uint32_t temp = left_rotate(a, 5) + f + e + k + w[i];
        e = d;
        d = c;
        c = left_rotate(b, 30);
        b = a;
        a = temp;
    }

    h_[0] += a;
    h_[1] += b;
    h_[2] += c;
    h_[3] += d;
    h_[4] += e;
}

void SHA1::finish() {
    if (finalized_) {
        return;
    }

    uint64_t bit_length = total_length_ * 8;

    // Padding: a single 1 bit, zeros up to 56 mod 64, then the 64-bit length
    buffer_[buffer_length_++] = 0x80;
    if (buffer_length_ > 56) {
        std::memset(buffer_ + buffer_length_, 0, sizeof(buffer_) - buffer_length_);
        process_block(buffer_);
        buffer_length_ = 0;
    }
    std::memset(buffer_ + buffer_length_, 0, 56 - buffer_length_);

    for (int i = 0; i < 8; i++) {
        buffer_[56 + i] = static_cast<uint8_t>(bit_length >> ((7 - i) * 8));
    }
    process_block(buffer_);
    buffer_length_ = 0;

    finalized_ = true;
}

Sha1Digest SHA1::digest() {
    finish();

    Sha1Digest out{};
    for (int i = 0; i < 5; i++) {
        out[i * 4]     = static_cast<uint8_t>(h_[i] >> 24);
        out[i * 4 + 1] = static_cast<uint8_t>(h_[i] >> 16);
        out[i * 4 + 2] = static_cast<uint8_t>(h_[i] >> 8);
        out[i * 4 + 3] = static_cast<uint8_t>(h_[i]);
    }
    return out;
}

std::string SHA1::finalize() {
    finish();

    std::ostringstream result;
    result << std::hex << std::setfill('0');
    for (int i = 0; i < 5; i++) {
        result << std::setw(8) << h_[i];
    }
    return result.str();
}

Sha1Digest SHA1::hash_bytes(const uint8_t* data, size_t length) {
    SHA1 hasher;
    hasher.update(data, length);
    return hasher.digest();
}

Sha1Digest SHA1::hash_bytes(const std::vector<uint8_t>& data) {
    return hash_bytes(data.data(), data.size());
}

std::string SHA1::hash(const std::string& input) {
    SHA1 hasher;
    hasher.update(input);
    return hasher.finalize();
}

} // namespace peerwire
