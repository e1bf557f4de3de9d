#include "pw_bitfield.h"
#include <algorithm>

namespace peerwire {

namespace {

inline uint8_t bit_mask(size_t index) {
    return static_cast<uint8_t>(0x80u >> (index % 8));
}

inline size_t popcount8(uint8_t x) {
#if defined(__GNUC__) || defined(__clang__)
    return static_cast<size_t>(__builtin_popcount(x));
#else
    size_t n = 0;
    while (x) {
        x &= static_cast<uint8_t>(x - 1);
        ++n;
    }
    return n;
#endif
}

} // namespace

//=============================================================================
// Constructors
//=============================================================================

Bitfield::Bitfield() noexcept
    : num_bits_(0) {
}

Bitfield::Bitfield(size_t num_bits, bool initial_value)
    : bytes_((num_bits + 7) / 8, initial_value ? 0xFF : 0x00),
      num_bits_(num_bits) {
    if (initial_value) {
        clear_trailing_bits();
    }
}

//=============================================================================
// Bit Operations
//=============================================================================

void Bitfield::set_bit(size_t index) {
    if (index >= num_bits_) {
        return;
    }
    bytes_[index / 8] |= bit_mask(index);
}

void Bitfield::clear_bit(size_t index) {
    if (index >= num_bits_) {
        return;
    }
    bytes_[index / 8] &= static_cast<uint8_t>(~bit_mask(index));
}

bool Bitfield::get_bit(size_t index) const {
    if (index >= num_bits_) {
        return false;
    }
    return (bytes_[index / 8] & bit_mask(index)) != 0;
}

void Bitfield::set_all() {
    std::fill(bytes_.begin(), bytes_.end(), 0xFF);
    clear_trailing_bits();
}

void Bitfield::clear_all() {
    std::fill(bytes_.begin(), bytes_.end(), 0x00);
}

void Bitfield::clear_trailing_bits() {
    size_t spare = bytes_.size() * 8 - num_bits_;
    if (spare > 0 && !bytes_.empty()) {
        bytes_.back() &= static_cast<uint8_t>(0xFF << spare);
    }
}

//=============================================================================
// Query Operations
//=============================================================================

bool Bitfield::all_set() const {
    return count() == num_bits_;
}

bool Bitfield::none_set() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

size_t Bitfield::count() const {
    size_t total = 0;
    for (uint8_t byte : bytes_) {
        total += popcount8(byte);
    }
    return total;
}

bool Bitfield::has_bits_not_in(const Bitfield& other) const {
    for (size_t i = 0; i < bytes_.size(); ++i) {
        uint8_t theirs = i < other.bytes_.size() ? other.bytes_[i] : 0;
        if ((bytes_[i] & static_cast<uint8_t>(~theirs)) != 0) {
            return true;
        }
    }
    return false;
}

//=============================================================================
// Iteration Helpers
//=============================================================================

size_t Bitfield::find_next_set(size_t start) const {
    for (size_t i = start; i < num_bits_; ++i) {
        // Skip whole empty bytes
        if ((i % 8) == 0 && bytes_[i / 8] == 0) {
            i += 7;
            continue;
        }
        if (get_bit(i)) {
            return i;
        }
    }
    return num_bits_;
}

size_t Bitfield::find_next_clear(size_t start) const {
    for (size_t i = start; i < num_bits_; ++i) {
        if ((i % 8) == 0 && bytes_[i / 8] == 0xFF && i + 8 <= num_bits_) {
            i += 7;
            continue;
        }
        if (!get_bit(i)) {
            return i;
        }
    }
    return num_bits_;
}

//=============================================================================
// Serialization
//=============================================================================

Bitfield Bitfield::from_bytes(const uint8_t* data, size_t data_len, size_t num_bits) {
    Bitfield result(num_bits);
    size_t copy_len = std::min(data_len, result.bytes_.size());
    if (data && copy_len > 0) {
        std::copy(data, data + copy_len, result.bytes_.begin());
    }
    result.clear_trailing_bits();
    return result;
}

Bitfield Bitfield::from_bytes(const std::vector<uint8_t>& data, size_t num_bits) {
    return from_bytes(data.data(), data.size(), num_bits);
}

std::optional<Bitfield> Bitfield::from_wire(const std::vector<uint8_t>& data, size_t num_bits) {
    if (data.size() != (num_bits + 7) / 8) {
        return std::nullopt;
    }

    size_t spare = data.size() * 8 - num_bits;
    if (spare > 0) {
        uint8_t spare_mask = static_cast<uint8_t>((1u << spare) - 1);
        if ((data.back() & spare_mask) != 0) {
            return std::nullopt;
        }
    }

    return from_bytes(data, num_bits);
}

bool Bitfield::operator==(const Bitfield& other) const {
    return num_bits_ == other.num_bits_ && bytes_ == other.bytes_;
}

std::string Bitfield::to_string() const {
    std::string result;
    result.reserve(num_bits_);
    for (size_t i = 0; i < num_bits_; ++i) {
        result.push_back(get_bit(i) ? '1' : '0');
    }
    return result;
}

} // namespace peerwire
