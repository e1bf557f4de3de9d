#include "pw_handshake.h"
#include <algorithm>
#include <cstring>

namespace peerwire {

namespace {

constexpr size_t RESERVED_OFFSET = 1 + PW_PROTOCOL_STRING_LEN;
constexpr size_t INFO_HASH_OFFSET = RESERVED_OFFSET + PW_RESERVED_SIZE;
constexpr size_t PEER_ID_OFFSET = INFO_HASH_OFFSET + PW_INFO_HASH_SIZE;

} // namespace

std::vector<uint8_t> encode_handshake(const InfoHash& info_hash, const PeerID& peer_id) {
    std::vector<uint8_t> handshake;
    handshake.reserve(PW_HANDSHAKE_SIZE);

    handshake.push_back(static_cast<uint8_t>(PW_PROTOCOL_STRING_LEN));
    handshake.insert(handshake.end(),
                     PW_PROTOCOL_STRING,
                     PW_PROTOCOL_STRING + PW_PROTOCOL_STRING_LEN);
    handshake.insert(handshake.end(), PW_RESERVED_SIZE, 0);
    handshake.insert(handshake.end(), info_hash.begin(), info_hash.end());
    handshake.insert(handshake.end(), peer_id.begin(), peer_id.end());

    return handshake;
}

HandshakeResult decode_handshake(const uint8_t* data, size_t length) {
    HandshakeResult result{HandshakeStatus::NeedMoreBytes, Handshake()};

    if (length == 0) {
        return result;
    }

    if (data[0] != PW_PROTOCOL_STRING_LEN) {
        result.status = HandshakeStatus::MalformedHandshake;
        return result;
    }

    // Compare whatever part of the protocol string has arrived
    size_t pstr_available = std::min(length - 1, PW_PROTOCOL_STRING_LEN);
    if (std::memcmp(data + 1, PW_PROTOCOL_STRING, pstr_available) != 0) {
        result.status = HandshakeStatus::MalformedHandshake;
        return result;
    }

    if (length < PW_HANDSHAKE_SIZE) {
        return result;
    }

    std::memcpy(result.handshake.info_hash.data(), data + INFO_HASH_OFFSET, PW_INFO_HASH_SIZE);
    std::memcpy(result.handshake.peer_id.data(), data + PEER_ID_OFFSET, PW_PEER_ID_SIZE);
    result.status = HandshakeStatus::Ok;

    return result;
}

HandshakeResult decode_handshake(const std::vector<uint8_t>& data) {
    return decode_handshake(data.data(), data.size());
}

} // namespace peerwire
