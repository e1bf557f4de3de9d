#pragma once

/**
 * @file pw_messages.h
 * @brief Peer wire message encoding and decoding
 *
 * Every message after the handshake is a frame:
 * <length prefix: 4 bytes BE><type: 1 byte><payload>
 * A zero length prefix is a keep-alive and carries no type byte.
 */

#include "pw_types.h"
#include "pw_bitfield.h"
#include "pw_handshake.h"

#include <vector>
#include <cstdint>
#include <string>
#include <variant>

namespace peerwire {

//=============================================================================
// Message Types
//=============================================================================

/**
 * @brief Wire type tags
 */
enum class MessageType : uint8_t {
    Choke = 0,
    Unchoke = 1,
    Interested = 2,
    NotInterested = 3,
    Have = 4,
    Bitfield = 5,
    Request = 6,
    Piece = 7,
    Cancel = 8
};

const char* message_type_to_string(MessageType type);

//=============================================================================
// Message Structures
//=============================================================================

namespace msg {

using Handshake = peerwire::Handshake;

struct KeepAlive {
    bool operator==(const KeepAlive&) const { return true; }
};

struct Choke {
    bool operator==(const Choke&) const { return true; }
};

struct Unchoke {
    bool operator==(const Unchoke&) const { return true; }
};

struct Interested {
    bool operator==(const Interested&) const { return true; }
};

struct NotInterested {
    bool operator==(const NotInterested&) const { return true; }
};

struct Have {
    uint32_t piece_index = 0;

    bool operator==(const Have& other) const { return piece_index == other.piece_index; }
};

/**
 * @brief Availability bitset exactly as carried on the wire
 */
struct Bitfield {
    std::vector<uint8_t> bits;

    Bitfield() = default;
    explicit Bitfield(std::vector<uint8_t> b) : bits(std::move(b)) {}
    explicit Bitfield(const peerwire::Bitfield& bf) : bits(bf.to_bytes()) {}

    /// Interpret the raw bits for a torrent of num_pieces pieces
    peerwire::Bitfield to_bitfield(size_t num_pieces) const {
        return peerwire::Bitfield::from_bytes(bits, num_pieces);
    }

    bool operator==(const Bitfield& other) const { return bits == other.bits; }
};

/**
 * @brief Request/Cancel payload
 */
struct Request {
    uint32_t piece_index = 0;
    uint32_t begin = 0;
    uint32_t length = 0;

    Request() = default;
    Request(uint32_t idx, uint32_t b, uint32_t len)
        : piece_index(idx), begin(b), length(len) {}

    BlockInfo block() const { return BlockInfo(piece_index, begin, length); }

    bool operator==(const Request& other) const {
        return piece_index == other.piece_index &&
               begin == other.begin &&
               length == other.length;
    }
};

struct Cancel {
    uint32_t piece_index = 0;
    uint32_t begin = 0;
    uint32_t length = 0;

    Cancel() = default;
    Cancel(uint32_t idx, uint32_t b, uint32_t len)
        : piece_index(idx), begin(b), length(len) {}

    BlockInfo block() const { return BlockInfo(piece_index, begin, length); }

    bool operator==(const Cancel& other) const {
        return piece_index == other.piece_index &&
               begin == other.begin &&
               length == other.length;
    }
};

/**
 * @brief Block of piece data
 */
struct Piece {
    uint32_t piece_index = 0;
    uint32_t begin = 0;
    std::vector<uint8_t> data;

    Piece() = default;
    Piece(uint32_t idx, uint32_t b, std::vector<uint8_t> d)
        : piece_index(idx), begin(b), data(std::move(d)) {}

    bool operator==(const Piece& other) const {
        return piece_index == other.piece_index &&
               begin == other.begin &&
               data == other.data;
    }
};

} // namespace msg

/**
 * @brief Closed set of everything that travels on a connection
 */
using Message = std::variant<
    msg::Handshake,
    msg::KeepAlive,
    msg::Choke,
    msg::Unchoke,
    msg::Interested,
    msg::NotInterested,
    msg::Have,
    msg::Bitfield,
    msg::Request,
    msg::Piece,
    msg::Cancel>;

/**
 * @brief Short name of the message variant for logging
 */
const char* message_name(const Message& message);

//=============================================================================
// Encoding / Decoding
//=============================================================================

enum class CodecStatus {
    Ok,
    NeedMoreBytes,
    InvalidMessageType,
    MalformedPayload
};

const char* codec_status_to_string(CodecStatus status);

struct DecodeResult {
    CodecStatus status = CodecStatus::NeedMoreBytes;
    Message message;        ///< Valid only when status is Ok
    size_t consumed = 0;    ///< Bytes of the frame including the length prefix
    std::string error;      ///< Human readable reason on failure

    bool ok() const { return status == CodecStatus::Ok; }
};

/**
 * @brief Encode a message for the wire
 *
 * Frames get the 4-byte big-endian length prefix; a Handshake variant
 * encodes to the fixed 68-byte handshake.
 */
std::vector<uint8_t> encode_message(const Message& message);

/**
 * @brief Append an encoded message to an existing buffer
 */
void encode_message_into(const Message& message, std::vector<uint8_t>& out);

/**
 * @brief Decode one frame from the front of a buffer
 *
 * Never consumes a partial frame: with fewer bytes than the declared
 * length the result is NeedMoreBytes and nothing else is reported.
 * A buffer opening with the handshake's 0x13 length byte decodes as a
 * Handshake variant consuming PW_HANDSHAKE_SIZE bytes.
 *
 * @param data Buffer starting at a length prefix or a handshake
 * @param length Bytes available
 * @param num_pieces Piece count of the torrent; when non-zero, piece
 *        indices must be below it and a bitfield must have exactly
 *        ceil(num_pieces / 8) bytes with zero spare bits
 */
DecodeResult decode_message(const uint8_t* data, size_t length, uint32_t num_pieces = 0);
DecodeResult decode_message(const std::vector<uint8_t>& data, uint32_t num_pieces = 0);

} // namespace peerwire
