#pragma once

/**
 * @file pw_handshake.h
 * @brief Peer wire handshake encoding and decoding
 *
 * Wire layout (68 bytes):
 * <pstrlen><pstr><reserved><info_hash><peer_id>
 *
 * - pstrlen: 1 byte, always 19
 * - pstr: 19 bytes, "BitTorrent protocol"
 * - reserved: 8 bytes, written as zero and ignored on input
 * - info_hash: 20 bytes, identifies the torrent
 * - peer_id: 20 bytes, identifies the sender
 */

#include "pw_types.h"

#include <vector>
#include <cstdint>
#include <string>

namespace peerwire {

/**
 * @brief Parsed handshake data
 */
struct Handshake {
    InfoHash info_hash;     ///< 20-byte info hash
    PeerID peer_id;         ///< 20-byte peer ID

    Handshake() : info_hash{}, peer_id{} {}
    Handshake(const InfoHash& hash, const PeerID& id) : info_hash(hash), peer_id(id) {}

    bool operator==(const Handshake& other) const {
        return info_hash == other.info_hash && peer_id == other.peer_id;
    }
    bool operator!=(const Handshake& other) const { return !(*this == other); }
};

enum class HandshakeStatus {
    Ok,
    NeedMoreBytes,
    MalformedHandshake
};

struct HandshakeResult {
    HandshakeStatus status;
    Handshake handshake;    ///< Valid only when status is Ok

    bool ok() const { return status == HandshakeStatus::Ok; }
};

/**
 * @brief Encode a handshake
 * @return 68-byte handshake with zeroed reserved field
 */
std::vector<uint8_t> encode_handshake(const InfoHash& info_hash, const PeerID& peer_id);

/**
 * @brief Decode a handshake from the front of a buffer
 *
 * A bad length byte or protocol string is reported as soon as the
 * offending bytes are present, so a garbage peer is rejected without
 * waiting for 68 bytes. Otherwise fewer than 68 bytes is NeedMoreBytes.
 * Exactly PW_HANDSHAKE_SIZE bytes are consumed on success.
 */
HandshakeResult decode_handshake(const uint8_t* data, size_t length);
HandshakeResult decode_handshake(const std::vector<uint8_t>& data);

} // namespace peerwire
