#pragma once

#include <array>
#include <string>
#include <vector>
#include <cstdint>

namespace peerwire {

/// Raw 20-byte SHA-1 digest
using Sha1Digest = std::array<uint8_t, 20>;

/**
 * @brief Incremental SHA-1 used to verify pieces
 */
class SHA1 {
public:
    SHA1();

    // Process a buffer
    void update(const uint8_t* data, size_t length);

    // Process a byte vector
    void update(const std::vector<uint8_t>& data);

    // Process a string
    void update(const std::string& str);

    /**
     * @brief Finish hashing and return the raw digest
     *
     * Further updates are ignored; calling this again returns the same digest.
     */
    Sha1Digest digest();

    // Get the final hash as a 40-character lowercase hex string
    std::string finalize();

    // Convenience functions to hash a buffer directly
    static Sha1Digest hash_bytes(const uint8_t* data, size_t length);
    static Sha1Digest hash_bytes(const std::vector<uint8_t>& data);
    static std::string hash(const std::string& input);

private:
    void process_block(const uint8_t* block);
    void finish();
    void reset();

    uint32_t h_[5];
    uint8_t buffer_[64];
    size_t buffer_length_;
    uint64_t total_length_;
    bool finalized_;
};

} // namespace peerwire
