#pragma once

/**
 * @file pw_bitfield.h
 * @brief Bitfield used for piece availability and block bookkeeping
 *
 * Bits are stored directly in wire order (high bit of byte 0 is index 0),
 * so a local bitfield serializes without conversion.
 */

#include <vector>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>

namespace peerwire {

/**
 * @brief Fixed-size bit array in wire layout
 */
class Bitfield {
public:
    Bitfield() noexcept;

    /**
     * @brief Create bitfield with specified number of bits
     * @param num_bits Number of bits in the bitfield
     * @param initial_value Initial value for all bits (default: false)
     */
    explicit Bitfield(size_t num_bits, bool initial_value = false);

    //=========================================================================
    // Bit Operations
    //=========================================================================

    /// Out-of-range indices are ignored
    void set_bit(size_t index);
    void clear_bit(size_t index);

    /// Out-of-range indices read as false
    bool get_bit(size_t index) const;
    bool operator[](size_t index) const { return get_bit(index); }

    void set_all();
    void clear_all();

    //=========================================================================
    // Query Operations
    //=========================================================================

    bool all_set() const;
    bool none_set() const;
    size_t count() const;

    size_t size() const noexcept { return num_bits_; }
    bool empty() const noexcept { return num_bits_ == 0; }
    size_t num_bytes() const noexcept { return (num_bits_ + 7) / 8; }

    /**
     * @brief Check if this bitfield has any bit set that other lacks
     *
     * Bits beyond other's size count as missing from other.
     */
    bool has_bits_not_in(const Bitfield& other) const;

    //=========================================================================
    // Iteration Helpers
    //=========================================================================

    /// @return Index of the first set bit at or after start, or size() if none
    size_t find_next_set(size_t start = 0) const;

    /// @return Index of the first clear bit at or after start, or size() if none
    size_t find_next_clear(size_t start = 0) const;

    //=========================================================================
    // Serialization (Wire Format)
    //=========================================================================

    /**
     * @brief Bytes for the wire, spare bits of the last byte are zero
     */
    const std::vector<uint8_t>& to_bytes() const noexcept { return bytes_; }

    /**
     * @brief Build a bitfield from wire bytes without validation
     *
     * Missing bytes read as zero, spare bits beyond num_bits are dropped.
     */
    static Bitfield from_bytes(const uint8_t* data, size_t data_len, size_t num_bits);
    static Bitfield from_bytes(const std::vector<uint8_t>& data, size_t num_bits);

    /**
     * @brief Build a bitfield from wire bytes with strict validation
     *
     * @return std::nullopt if the byte count is not exactly ceil(num_bits / 8)
     *         or any spare bit in the last byte is set
     */
    static std::optional<Bitfield> from_wire(const std::vector<uint8_t>& data, size_t num_bits);

    bool operator==(const Bitfield& other) const;
    bool operator!=(const Bitfield& other) const { return !(*this == other); }

    /// String of '0' and '1' characters for debugging
    std::string to_string() const;

private:
    void clear_trailing_bits();

    std::vector<uint8_t> bytes_;
    size_t num_bits_;
};

} // namespace peerwire
