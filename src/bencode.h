#pragma once

/**
 * @file bencode.h
 * @brief Bencode values, used to read .torrent files and derive info hashes
 */

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace peerwire {

class BencodeValue;
using BencodeList = std::vector<BencodeValue>;
using BencodeDict = std::map<std::string, BencodeValue>;

/**
 * @brief Thrown for malformed input or a type mismatch on access
 */
class BencodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A bencoded integer, byte string, list or dictionary
 *
 * Dictionaries keep their keys sorted, so encode() always produces the
 * canonical form.
 */
class BencodeValue {
public:
    enum class Type {
        Integer,
        String,
        List,
        Dictionary
    };

    BencodeValue();
    BencodeValue(int64_t value);
    BencodeValue(const std::string& value);
    BencodeValue(const char* value);
    BencodeValue(BencodeList value);
    BencodeValue(BencodeDict value);

    Type type() const;
    bool is_integer() const { return type() == Type::Integer; }
    bool is_string() const { return type() == Type::String; }
    bool is_list() const { return type() == Type::List; }
    bool is_dict() const { return type() == Type::Dictionary; }

    // Accessors throw BencodeError on type mismatch
    int64_t as_integer() const;
    const std::string& as_string() const;
    const BencodeList& as_list() const;
    const BencodeDict& as_dict() const;
    BencodeDict& as_dict();

    bool has_key(const std::string& key) const;

    /// Dictionary lookup, throws BencodeError if missing
    const BencodeValue& operator[](const std::string& key) const;

    std::vector<uint8_t> encode() const;

private:
    void encode_to_buffer(std::vector<uint8_t>& buffer) const;

    std::variant<int64_t, std::string, BencodeList, BencodeDict> value_;
};

/**
 * @brief Recursive-descent bencode parser
 */
class BencodeDecoder {
public:
    /**
     * @brief Decode one complete value
     * @throws BencodeError on malformed data or trailing bytes
     */
    static BencodeValue decode(const uint8_t* data, size_t size);
    static BencodeValue decode(const std::vector<uint8_t>& data);
    static BencodeValue decode(const std::string& data);

    /**
     * @brief Locate the raw bytes of a value inside a top-level dictionary
     *
     * The info hash of a torrent is the SHA-1 of these exact bytes.
     *
     * @return (offset, length) of the value, or std::nullopt if the key is absent
     * @throws BencodeError on malformed data
     */
    static std::optional<std::pair<size_t, size_t>> find_raw_value(const uint8_t* data,
                                                                   size_t size,
                                                                   const std::string& key);

private:
    BencodeDecoder(const uint8_t* data, size_t size);

    BencodeValue decode_value();
    BencodeValue decode_integer();
    std::string decode_string();
    BencodeValue decode_list();
    BencodeValue decode_dict();

    int64_t parse_number(char terminator);
    uint8_t current_byte() const;
    uint8_t consume_byte();

    const uint8_t* data_;
    size_t size_;
    size_t pos_;
    int depth_;
};

} // namespace peerwire
