#include "pw_messages.h"
#include <cstring>

namespace peerwire {

//=============================================================================
// Helpers
//=============================================================================

namespace {

void write_uint32(std::vector<uint8_t>& buf, uint32_t value) {
    buf.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(value & 0xFF));
}

uint32_t read_uint32(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

void write_header(std::vector<uint8_t>& buf, uint32_t body_len, MessageType type) {
    write_uint32(buf, body_len);
    buf.push_back(static_cast<uint8_t>(type));
}

void write_block_address(std::vector<uint8_t>& buf, MessageType type,
                         uint32_t piece_index, uint32_t begin, uint32_t length) {
    write_header(buf, 13, type);
    write_uint32(buf, piece_index);
    write_uint32(buf, begin);
    write_uint32(buf, length);
}

/**
 * @brief Appends the wire form of each variant
 */
struct FrameWriter {
    std::vector<uint8_t>& out;

    void operator()(const msg::Handshake& m) const {
        auto bytes = encode_handshake(m.info_hash, m.peer_id);
        out.insert(out.end(), bytes.begin(), bytes.end());
    }
    void operator()(const msg::KeepAlive&) const { write_uint32(out, 0); }
    void operator()(const msg::Choke&) const { write_header(out, 1, MessageType::Choke); }
    void operator()(const msg::Unchoke&) const { write_header(out, 1, MessageType::Unchoke); }
    void operator()(const msg::Interested&) const { write_header(out, 1, MessageType::Interested); }
    void operator()(const msg::NotInterested&) const { write_header(out, 1, MessageType::NotInterested); }

    void operator()(const msg::Have& m) const {
        write_header(out, 5, MessageType::Have);
        write_uint32(out, m.piece_index);
    }

    void operator()(const msg::Bitfield& m) const {
        write_header(out, static_cast<uint32_t>(1 + m.bits.size()), MessageType::Bitfield);
        out.insert(out.end(), m.bits.begin(), m.bits.end());
    }

    void operator()(const msg::Request& m) const {
        write_block_address(out, MessageType::Request, m.piece_index, m.begin, m.length);
    }

    void operator()(const msg::Cancel& m) const {
        write_block_address(out, MessageType::Cancel, m.piece_index, m.begin, m.length);
    }

    void operator()(const msg::Piece& m) const {
        write_header(out, static_cast<uint32_t>(9 + m.data.size()), MessageType::Piece);
        write_uint32(out, m.piece_index);
        write_uint32(out, m.begin);
        out.insert(out.end(), m.data.begin(), m.data.end());
    }
};

struct NameOf {
    const char* operator()(const msg::Handshake&) const { return "Handshake"; }
    const char* operator()(const msg::KeepAlive&) const { return "KeepAlive"; }
    const char* operator()(const msg::Choke&) const { return "Choke"; }
    const char* operator()(const msg::Unchoke&) const { return "Unchoke"; }
    const char* operator()(const msg::Interested&) const { return "Interested"; }
    const char* operator()(const msg::NotInterested&) const { return "NotInterested"; }
    const char* operator()(const msg::Have&) const { return "Have"; }
    const char* operator()(const msg::Bitfield&) const { return "Bitfield"; }
    const char* operator()(const msg::Request&) const { return "Request"; }
    const char* operator()(const msg::Piece&) const { return "Piece"; }
    const char* operator()(const msg::Cancel&) const { return "Cancel"; }
};

DecodeResult fail(CodecStatus status, std::string error) {
    DecodeResult result;
    result.status = status;
    result.error = std::move(error);
    return result;
}

} // namespace

const char* message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::Choke: return "Choke";
        case MessageType::Unchoke: return "Unchoke";
        case MessageType::Interested: return "Interested";
        case MessageType::NotInterested: return "NotInterested";
        case MessageType::Have: return "Have";
        case MessageType::Bitfield: return "Bitfield";
        case MessageType::Request: return "Request";
        case MessageType::Piece: return "Piece";
        case MessageType::Cancel: return "Cancel";
    }
    return "Unknown";
}

const char* message_name(const Message& message) {
    return std::visit(NameOf{}, message);
}

const char* codec_status_to_string(CodecStatus status) {
    switch (status) {
        case CodecStatus::Ok: return "ok";
        case CodecStatus::NeedMoreBytes: return "need more bytes";
        case CodecStatus::InvalidMessageType: return "invalid message type";
        case CodecStatus::MalformedPayload: return "malformed payload";
    }
    return "unknown";
}

//=============================================================================
// Encoding
//=============================================================================

void encode_message_into(const Message& message, std::vector<uint8_t>& out) {
    std::visit(FrameWriter{out}, message);
}

std::vector<uint8_t> encode_message(const Message& message) {
    std::vector<uint8_t> out;
    encode_message_into(message, out);
    return out;
}

//=============================================================================
// Decoding
//=============================================================================

DecodeResult decode_message(const uint8_t* data, size_t length, uint32_t num_pieces) {
    // A leading 0x13 would declare a frame far above PW_MAX_FRAME_SIZE,
    // so it can only start a handshake
    if (length > 0 && data[0] == PW_PROTOCOL_STRING_LEN) {
        HandshakeResult hs = decode_handshake(data, length);
        if (hs.status == HandshakeStatus::NeedMoreBytes) {
            return DecodeResult();
        }
        if (!hs.ok()) {
            return fail(CodecStatus::MalformedPayload, "malformed handshake");
        }

        DecodeResult result;
        result.status = CodecStatus::Ok;
        result.message = hs.handshake;
        result.consumed = PW_HANDSHAKE_SIZE;
        return result;
    }

    if (length < PW_LENGTH_PREFIX_SIZE) {
        return DecodeResult();
    }

    uint32_t body_len = read_uint32(data);

    if (body_len > PW_MAX_FRAME_SIZE) {
        return fail(CodecStatus::MalformedPayload,
                    "frame length " + std::to_string(body_len) + " exceeds limit");
    }

    if (length < PW_LENGTH_PREFIX_SIZE + body_len) {
        return DecodeResult();
    }

    DecodeResult result;
    result.status = CodecStatus::Ok;
    result.consumed = PW_LENGTH_PREFIX_SIZE + body_len;

    if (body_len == 0) {
        result.message = msg::KeepAlive{};
        return result;
    }

    const uint8_t* payload = data + PW_LENGTH_PREFIX_SIZE + 1;
    size_t payload_len = body_len - 1;
    uint8_t type_byte = data[PW_LENGTH_PREFIX_SIZE];

    if (type_byte > static_cast<uint8_t>(MessageType::Cancel)) {
        return fail(CodecStatus::InvalidMessageType,
                    "unknown message type " + std::to_string(type_byte));
    }

    MessageType type = static_cast<MessageType>(type_byte);

    auto index_ok = [num_pieces](uint32_t index) {
        return num_pieces == 0 || index < num_pieces;
    };

    auto bad_size = [&](size_t expected) {
        return fail(CodecStatus::MalformedPayload,
                    std::string(message_type_to_string(type)) + " payload is " +
                    std::to_string(payload_len) + " bytes, expected " +
                    std::to_string(expected));
    };

    switch (type) {
        case MessageType::Choke:
        case MessageType::Unchoke:
        case MessageType::Interested:
        case MessageType::NotInterested:
            if (payload_len != 0) return bad_size(0);
            if (type == MessageType::Choke) result.message = msg::Choke{};
            else if (type == MessageType::Unchoke) result.message = msg::Unchoke{};
            else if (type == MessageType::Interested) result.message = msg::Interested{};
            else result.message = msg::NotInterested{};
            break;

        case MessageType::Have: {
            if (payload_len != 4) return bad_size(4);
            msg::Have have;
            have.piece_index = read_uint32(payload);
            if (!index_ok(have.piece_index)) {
                return fail(CodecStatus::MalformedPayload,
                            "Have index " + std::to_string(have.piece_index) + " out of range");
            }
            result.message = have;
            break;
        }

        case MessageType::Bitfield: {
            std::vector<uint8_t> bits(payload, payload + payload_len);
            if (num_pieces > 0 && !peerwire::Bitfield::from_wire(bits, num_pieces)) {
                return fail(CodecStatus::MalformedPayload,
                            "Bitfield of " + std::to_string(payload_len) +
                            " bytes does not describe " + std::to_string(num_pieces) + " pieces");
            }
            result.message = msg::Bitfield(std::move(bits));
            break;
        }

        case MessageType::Request:
        case MessageType::Cancel: {
            if (payload_len != 12) return bad_size(12);
            uint32_t index = read_uint32(payload);
            uint32_t begin = read_uint32(payload + 4);
            uint32_t block_len = read_uint32(payload + 8);
            if (!index_ok(index)) {
                return fail(CodecStatus::MalformedPayload,
                            std::string(message_type_to_string(type)) + " index " +
                            std::to_string(index) + " out of range");
            }
            if (type == MessageType::Request) {
                result.message = msg::Request(index, begin, block_len);
            } else {
                result.message = msg::Cancel(index, begin, block_len);
            }
            break;
        }

        case MessageType::Piece: {
            if (payload_len < 8) {
                return fail(CodecStatus::MalformedPayload,
                            "Piece payload is " + std::to_string(payload_len) +
                            " bytes, expected at least 8");
            }
            uint32_t index = read_uint32(payload);
            if (!index_ok(index)) {
                return fail(CodecStatus::MalformedPayload,
                            "Piece index " + std::to_string(index) + " out of range");
            }
            result.message = msg::Piece(index, read_uint32(payload + 4),
                                        std::vector<uint8_t>(payload + 8, payload + payload_len));
            break;
        }
    }

    return result;
}

DecodeResult decode_message(const std::vector<uint8_t>& data, uint32_t num_pieces) {
    return decode_message(data.data(), data.size(), num_pieces);
}

} // namespace peerwire
