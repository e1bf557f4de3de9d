#include "bencode.h"

namespace peerwire {

namespace {

constexpr int MAX_NESTING_DEPTH = 64;

void append_text(std::vector<uint8_t>& buffer, const std::string& text) {
    buffer.insert(buffer.end(), text.begin(), text.end());
}

} // namespace

//=============================================================================
// BencodeValue
//=============================================================================

BencodeValue::BencodeValue() : value_(std::string()) {}

BencodeValue::BencodeValue(int64_t value) : value_(value) {}

BencodeValue::BencodeValue(const std::string& value) : value_(value) {}

BencodeValue::BencodeValue(const char* value) : value_(std::string(value)) {}

BencodeValue::BencodeValue(BencodeList value) : value_(std::move(value)) {}

BencodeValue::BencodeValue(BencodeDict value) : value_(std::move(value)) {}

BencodeValue::Type BencodeValue::type() const {
    switch (value_.index()) {
        case 0: return Type::Integer;
        case 1: return Type::String;
        case 2: return Type::List;
        default: return Type::Dictionary;
    }
}

int64_t BencodeValue::as_integer() const {
    if (!is_integer()) {
        throw BencodeError("BencodeValue is not an integer");
    }
    return std::get<int64_t>(value_);
}

const std::string& BencodeValue::as_string() const {
    if (!is_string()) {
        throw BencodeError("BencodeValue is not a string");
    }
    return std::get<std::string>(value_);
}

const BencodeList& BencodeValue::as_list() const {
    if (!is_list()) {
        throw BencodeError("BencodeValue is not a list");
    }
    return std::get<BencodeList>(value_);
}

const BencodeDict& BencodeValue::as_dict() const {
    if (!is_dict()) {
        throw BencodeError("BencodeValue is not a dictionary");
    }
    return std::get<BencodeDict>(value_);
}

BencodeDict& BencodeValue::as_dict() {
    if (!is_dict()) {
        throw BencodeError("BencodeValue is not a dictionary");
    }
    return std::get<BencodeDict>(value_);
}

bool BencodeValue::has_key(const std::string& key) const {
    return is_dict() && as_dict().count(key) > 0;
}

const BencodeValue& BencodeValue::operator[](const std::string& key) const {
    const auto& dict = as_dict();
    auto it = dict.find(key);
    if (it == dict.end()) {
        throw BencodeError("Key not found in dictionary: " + key);
    }
    return it->second;
}

std::vector<uint8_t> BencodeValue::encode() const {
    std::vector<uint8_t> buffer;
    encode_to_buffer(buffer);
    return buffer;
}

void BencodeValue::encode_to_buffer(std::vector<uint8_t>& buffer) const {
    switch (type()) {
        case Type::Integer:
            append_text(buffer, "i" + std::to_string(std::get<int64_t>(value_)) + "e");
            break;

        case Type::String: {
            const auto& str = std::get<std::string>(value_);
            append_text(buffer, std::to_string(str.size()) + ":");
            append_text(buffer, str);
            break;
        }

        case Type::List:
            buffer.push_back('l');
            for (const auto& item : std::get<BencodeList>(value_)) {
                item.encode_to_buffer(buffer);
            }
            buffer.push_back('e');
            break;

        case Type::Dictionary:
            buffer.push_back('d');
            for (const auto& [key, value] : std::get<BencodeDict>(value_)) {
                append_text(buffer, std::to_string(key.size()) + ":");
                append_text(buffer, key);
                value.encode_to_buffer(buffer);
            }
            buffer.push_back('e');
            break;
    }
}

//=============================================================================
// BencodeDecoder
//=============================================================================

BencodeDecoder::BencodeDecoder(const uint8_t* data, size_t size)
    : data_(data), size_(size), pos_(0), depth_(0) {}

BencodeValue BencodeDecoder::decode(const uint8_t* data, size_t size) {
    BencodeDecoder decoder(data, size);
    BencodeValue value = decoder.decode_value();
    if (decoder.pos_ != size) {
        throw BencodeError("Trailing data after bencoded value");
    }
    return value;
}

BencodeValue BencodeDecoder::decode(const std::vector<uint8_t>& data) {
    return decode(data.data(), data.size());
}

BencodeValue BencodeDecoder::decode(const std::string& data) {
    return decode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::optional<std::pair<size_t, size_t>> BencodeDecoder::find_raw_value(const uint8_t* data,
                                                                        size_t size,
                                                                        const std::string& key) {
    BencodeDecoder decoder(data, size);
    if (decoder.consume_byte() != 'd') {
        throw BencodeError("Expected a dictionary");
    }

    while (decoder.current_byte() != 'e') {
        std::string current_key = decoder.decode_string();
        size_t start = decoder.pos_;
        decoder.decode_value();
        if (current_key == key) {
            return std::make_pair(start, decoder.pos_ - start);
        }
    }

    return std::nullopt;
}

BencodeValue BencodeDecoder::decode_value() {
    uint8_t first_byte = current_byte();

    if (first_byte == 'i') {
        return decode_integer();
    } else if (first_byte == 'l') {
        return decode_list();
    } else if (first_byte == 'd') {
        return decode_dict();
    } else if (first_byte >= '0' && first_byte <= '9') {
        return BencodeValue(decode_string());
    }

    throw BencodeError("Invalid bencode data at offset " + std::to_string(pos_));
}

int64_t BencodeDecoder::parse_number(char terminator) {
    std::string digits;
    while (current_byte() != static_cast<uint8_t>(terminator)) {
        digits += static_cast<char>(consume_byte());
    }
    consume_byte();

    if (digits.empty() || digits.size() > 19) {
        throw BencodeError("Invalid number: '" + digits + "'");
    }

    size_t first = digits[0] == '-' ? 1 : 0;
    if (first == digits.size()) {
        throw BencodeError("Invalid number: '" + digits + "'");
    }
    for (size_t i = first; i < digits.size(); ++i) {
        if (digits[i] < '0' || digits[i] > '9') {
            throw BencodeError("Invalid number: '" + digits + "'");
        }
    }

    try {
        return std::stoll(digits);
    } catch (const std::out_of_range&) {
        throw BencodeError("Number out of range: " + digits);
    }
}

BencodeValue BencodeDecoder::decode_integer() {
    consume_byte();  // 'i'
    return BencodeValue(parse_number('e'));
}

std::string BencodeDecoder::decode_string() {
    int64_t length = parse_number(':');
    if (length < 0 || static_cast<uint64_t>(length) > size_ - pos_) {
        throw BencodeError("String length exceeds data size");
    }

    std::string str(reinterpret_cast<const char*>(data_ + pos_), static_cast<size_t>(length));
    pos_ += static_cast<size_t>(length);
    return str;
}

BencodeValue BencodeDecoder::decode_list() {
    consume_byte();  // 'l'
    if (++depth_ > MAX_NESTING_DEPTH) {
        throw BencodeError("Bencode nesting too deep");
    }

    BencodeList list;
    while (current_byte() != 'e') {
        list.push_back(decode_value());
    }
    consume_byte();

    --depth_;
    return BencodeValue(std::move(list));
}

BencodeValue BencodeDecoder::decode_dict() {
    consume_byte();  // 'd'
    if (++depth_ > MAX_NESTING_DEPTH) {
        throw BencodeError("Bencode nesting too deep");
    }

    BencodeDict dict;
    while (current_byte() != 'e') {
        std::string key = decode_string();
        dict[key] = decode_value();
    }
    consume_byte();

    --depth_;
    return BencodeValue(std::move(dict));
}

uint8_t BencodeDecoder::current_byte() const {
    if (pos_ >= size_) {
        throw BencodeError("Unexpected end of data");
    }
    return data_[pos_];
}

uint8_t BencodeDecoder::consume_byte() {
    if (pos_ >= size_) {
        throw BencodeError("Unexpected end of data");
    }
    return data_[pos_++];
}

} // namespace peerwire
