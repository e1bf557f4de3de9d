#pragma once

/**
 * @file pw_types.h
 * @brief Core peer wire types and constants for peerwire
 *
 * This file contains fundamental types used throughout the peer wire
 * implementation including PeerID, InfoHash, constants, and utility functions.
 */

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <random>
#include <sstream>
#include <iomanip>

namespace peerwire {

//=============================================================================
// Constants
//=============================================================================

/// Size of peer ID in bytes
constexpr size_t PW_PEER_ID_SIZE = 20;

/// Size of info hash in bytes (SHA-1)
constexpr size_t PW_INFO_HASH_SIZE = 20;

/// Standard block size in bytes (16 KB)
constexpr uint32_t PW_BLOCK_SIZE = 16384;

/// Largest block a peer may request from us
constexpr uint32_t PW_MAX_BLOCK_SIZE = 32768;

/// Default piece length when hashing a local file for seeding (256 KB)
constexpr uint32_t PW_DEFAULT_PIECE_LENGTH = 262144;

/// Protocol string for the handshake
constexpr char PW_PROTOCOL_STRING[] = "BitTorrent protocol";

/// Length of protocol string
constexpr size_t PW_PROTOCOL_STRING_LEN = 19;

/// Total handshake size: 1 + 19 + 8 + 20 + 20 = 68 bytes
constexpr size_t PW_HANDSHAKE_SIZE = 68;

/// Reserved bytes in handshake (8 bytes)
constexpr size_t PW_RESERVED_SIZE = 8;

/// Size of the big-endian length prefix of every frame
constexpr size_t PW_LENGTH_PREFIX_SIZE = 4;

/// Largest frame body accepted from the wire (one max block plus header)
constexpr uint32_t PW_MAX_FRAME_SIZE = 1024 * 1024 + 16;

/// Default number of outstanding block requests to a single peer
constexpr size_t PW_DEFAULT_PIPELINE_DEPTH = 5;

/// Client prefix used in generated peer IDs
constexpr char PW_CLIENT_PREFIX[] = "-PW0100-";

//=============================================================================
// Type Definitions
//=============================================================================

/// 20-byte peer identifier
using PeerID = std::array<uint8_t, PW_PEER_ID_SIZE>;

/// 20-byte info hash identifying a torrent
using InfoHash = std::array<uint8_t, PW_INFO_HASH_SIZE>;

/// Identity of one connection actor, unique for the process lifetime
using ConnectionId = uint64_t;

/**
 * @brief Hash function for 20-byte identifiers in unordered containers
 */
struct Id20Hash {
    size_t operator()(const std::array<uint8_t, 20>& id) const {
        size_t result = 0;
        for (size_t i = 0; i < id.size(); ++i) {
            result = result * 31 + id[i];
        }
        return result;
    }
};

//=============================================================================
// Peer ID Generation
//=============================================================================

/**
 * @brief Generate a local peer ID
 *
 * Format: -PW0100-xxxxxxxxxxxx where x is drawn from the base58 alphabet,
 * so the whole identifier stays printable.
 *
 * @param client_id Client identifier prefix (up to 8 characters)
 * @return Generated peer ID
 */
inline PeerID generate_peer_id(const std::string& client_id = PW_CLIENT_PREFIX) {
    static const char alphabet[] =
        "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

    PeerID peer_id{};

    size_t prefix_len = (std::min)(client_id.size(), static_cast<size_t>(8));
    for (size_t i = 0; i < prefix_len; ++i) {
        peer_id[i] = static_cast<uint8_t>(client_id[i]);
    }

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<size_t> dis(0, sizeof(alphabet) - 2);

    for (size_t i = prefix_len; i < PW_PEER_ID_SIZE; ++i) {
        peer_id[i] = static_cast<uint8_t>(alphabet[dis(gen)]);
    }

    return peer_id;
}

//=============================================================================
// Conversion Utilities
//=============================================================================

/**
 * @brief Convert peer ID to printable string
 *
 * Non-printable characters are shown as hex escapes
 */
inline std::string peer_id_to_string(const PeerID& id) {
    std::ostringstream oss;
    for (uint8_t byte : id) {
        if (byte >= 32 && byte < 127) {
            oss << static_cast<char>(byte);
        } else {
            oss << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(byte);
        }
    }
    return oss.str();
}

/**
 * @brief Convert a 20-byte identifier to a 40-character hex string
 */
inline std::string to_hex(const std::array<uint8_t, 20>& id) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : id) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

inline std::string info_hash_to_hex(const InfoHash& hash) {
    return to_hex(hash);
}

/**
 * @brief Parse a 40-character hex string into a 20-byte identifier
 *
 * @param hex Hex string (upper or lower case)
 * @param out Parsed value, untouched on failure
 * @return true if the string was exactly 40 hex digits
 */
inline bool parse_hex20(const std::string& hex, std::array<uint8_t, 20>& out) {
    if (hex.length() != 40) {
        return false;
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::array<uint8_t, 20> result{};
    for (size_t i = 0; i < 20; ++i) {
        int hi = nibble(hex[i * 2]);
        int lo = nibble(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        result[i] = static_cast<uint8_t>((hi << 4) | lo);
    }

    out = result;
    return true;
}

/**
 * @brief Convert hex string to info hash
 *
 * @return Info hash, or zero-filled array on error
 */
inline InfoHash hex_to_info_hash(const std::string& hex) {
    InfoHash hash{};
    if (!parse_hex20(hex, hash)) {
        return InfoHash{};
    }
    return hash;
}

/**
 * @brief Check if a 20-byte identifier is all zeros (invalid)
 */
inline bool is_zero_hash(const std::array<uint8_t, 20>& hash) {
    for (uint8_t byte : hash) {
        if (byte != 0) return false;
    }
    return true;
}

//=============================================================================
// Block Addressing
//=============================================================================

/**
 * @brief Address of one block inside a piece
 */
struct BlockInfo {
    uint32_t piece_index;   ///< Index of the piece
    uint32_t offset;        ///< Offset within the piece
    uint32_t length;        ///< Length of the block

    BlockInfo() : piece_index(0), offset(0), length(0) {}
    BlockInfo(uint32_t piece, uint32_t off, uint32_t len)
        : piece_index(piece), offset(off), length(len) {}

    bool operator==(const BlockInfo& other) const {
        return piece_index == other.piece_index
            && offset == other.offset
            && length == other.length;
    }

    bool operator!=(const BlockInfo& other) const {
        return !(*this == other);
    }

    bool operator<(const BlockInfo& other) const {
        if (piece_index != other.piece_index) return piece_index < other.piece_index;
        if (offset != other.offset) return offset < other.offset;
        return length < other.length;
    }
};

/**
 * @brief Hash function for BlockInfo (for use in unordered containers)
 */
struct BlockInfoHash {
    size_t operator()(const BlockInfo& b) const {
        return std::hash<uint64_t>()(
            (static_cast<uint64_t>(b.piece_index) << 32) ^
            (static_cast<uint64_t>(b.offset) << 8) ^
            b.length
        );
    }
};

} // namespace peerwire
