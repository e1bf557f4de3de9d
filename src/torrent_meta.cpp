#include "torrent_meta.h"
#include "bencode.h"
#include "fs.h"
#include "logger.h"

#include <algorithm>

#define LOG_META_INFO(message) LOG_INFO("meta", message)

namespace peerwire {

namespace {

InfoHash compute_info_hash(const std::string& name,
                           uint32_t piece_length,
                           uint64_t total_length,
                           const std::vector<Sha1Digest>& piece_hashes) {
    std::string pieces;
    pieces.reserve(piece_hashes.size() * 20);
    for (const auto& digest : piece_hashes) {
        pieces.append(reinterpret_cast<const char*>(digest.data()), digest.size());
    }

    BencodeDict info;
    info["length"] = BencodeValue(static_cast<int64_t>(total_length));
    info["name"] = BencodeValue(name);
    info["piece length"] = BencodeValue(static_cast<int64_t>(piece_length));
    info["pieces"] = BencodeValue(pieces);

    return SHA1::hash_bytes(BencodeValue(std::move(info)).encode());
}

std::vector<Sha1Digest> split_piece_hashes(const std::string& pieces) {
    if (pieces.size() % 20 != 0) {
        throw ConfigError("piece hash string length is not a multiple of 20");
    }

    std::vector<Sha1Digest> hashes(pieces.size() / 20);
    for (size_t i = 0; i < hashes.size(); ++i) {
        std::copy(pieces.begin() + i * 20, pieces.begin() + (i + 1) * 20, hashes[i].begin());
    }
    return hashes;
}

uint64_t require_positive(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || !json.at(key).is_number_integer() || json.at(key).get<int64_t>() <= 0) {
        throw ConfigError(std::string("metadata field '") + key + "' must be a positive integer");
    }
    return json.at(key).get<uint64_t>();
}

} // namespace

//=============================================================================
// Construction
//=============================================================================

TorrentMeta::TorrentMeta(const InfoHash& info_hash,
                         uint32_t piece_length,
                         uint64_t total_length,
                         std::vector<Sha1Digest> piece_hashes,
                         std::string name)
    : info_hash_(info_hash),
      piece_length_(piece_length),
      total_length_(total_length),
      piece_hashes_(std::move(piece_hashes)),
      name_(std::move(name)) {
    if (piece_length_ == 0) {
        throw ConfigError("piece length must be positive");
    }
    if (total_length_ == 0) {
        throw ConfigError("total length must be positive");
    }

    uint64_t expected = (total_length_ + piece_length_ - 1) / piece_length_;
    if (expected != piece_hashes_.size()) {
        throw ConfigError("expected " + std::to_string(expected) + " piece hashes, got " +
                          std::to_string(piece_hashes_.size()));
    }
    if (expected > UINT32_MAX) {
        throw ConfigError("too many pieces");
    }
}

//=============================================================================
// Factories
//=============================================================================

TorrentMeta TorrentMeta::from_content(const std::vector<uint8_t>& content,
                                      uint32_t piece_length,
                                      const std::string& name) {
    if (piece_length == 0) {
        throw ConfigError("piece length must be positive");
    }

    std::vector<Sha1Digest> hashes;
    for (size_t offset = 0; offset < content.size(); offset += piece_length) {
        size_t len = std::min<size_t>(piece_length, content.size() - offset);
        hashes.push_back(SHA1::hash_bytes(content.data() + offset, len));
    }

    InfoHash info_hash = compute_info_hash(name, piece_length, content.size(), hashes);
    return TorrentMeta(info_hash, piece_length, content.size(), std::move(hashes), name);
}

TorrentMeta TorrentMeta::from_torrent_file(const std::string& path) {
    std::vector<uint8_t> data;
    if (!read_file_binary(path, data)) {
        throw ConfigError("cannot read torrent file " + path);
    }

    try {
        auto span = BencodeDecoder::find_raw_value(data.data(), data.size(), "info");
        if (!span) {
            throw ConfigError("torrent file has no info dictionary");
        }

        BencodeValue root = BencodeDecoder::decode(data);
        const BencodeValue& info = root["info"];

        if (info.has_key("files")) {
            throw ConfigError("multi-file torrents are not supported");
        }

        int64_t piece_length = info["piece length"].as_integer();
        int64_t length = info["length"].as_integer();
        if (piece_length <= 0 || piece_length > UINT32_MAX || length <= 0) {
            throw ConfigError("torrent file has invalid lengths");
        }

        std::string name = info.has_key("name") ? info["name"].as_string() : std::string();

        TorrentMeta meta(SHA1::hash_bytes(data.data() + span->first, span->second),
                         static_cast<uint32_t>(piece_length),
                         static_cast<uint64_t>(length),
                         split_piece_hashes(info["pieces"].as_string()),
                         name);

        LOG_META_INFO("Loaded torrent '" << meta.name() << "' with " << meta.num_pieces()
                      << " pieces, info hash " << info_hash_to_hex(meta.info_hash()));
        return meta;
    } catch (const BencodeError& e) {
        throw ConfigError("malformed torrent file " + path + ": " + e.what());
    }
}

TorrentMeta TorrentMeta::from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigError("metadata must be a JSON object");
    }

    uint64_t piece_length = require_positive(json, "piece_length");
    uint64_t total_length = require_positive(json, "total_length");
    if (piece_length > UINT32_MAX) {
        throw ConfigError("piece_length is too large");
    }

    if (!json.contains("pieces") || !json.at("pieces").is_array()) {
        throw ConfigError("metadata field 'pieces' must be an array of hex digests");
    }

    std::vector<Sha1Digest> hashes;
    for (const auto& item : json.at("pieces")) {
        Sha1Digest digest{};
        if (!item.is_string() || !parse_hex20(item.get<std::string>(), digest)) {
            throw ConfigError("piece hash is not a 40-character hex string");
        }
        hashes.push_back(digest);
    }

    std::string name;
    if (json.contains("name")) {
        if (!json.at("name").is_string()) {
            throw ConfigError("metadata field 'name' must be a string");
        }
        name = json.at("name").get<std::string>();
    }

    InfoHash info_hash{};
    if (json.contains("info_hash")) {
        if (!json.at("info_hash").is_string() ||
            !parse_hex20(json.at("info_hash").get<std::string>(), info_hash)) {
            throw ConfigError("metadata field 'info_hash' is not a 40-character hex string");
        }
    } else {
        info_hash = compute_info_hash(name, static_cast<uint32_t>(piece_length), total_length, hashes);
    }

    return TorrentMeta(info_hash, static_cast<uint32_t>(piece_length), total_length,
                       std::move(hashes), name);
}

TorrentMeta TorrentMeta::load_json(const std::string& path) {
    return from_json(load_json_file(path));
}

nlohmann::json TorrentMeta::to_json() const {
    nlohmann::json json;
    json["info_hash"] = info_hash_to_hex(info_hash_);
    json["name"] = name_;
    json["piece_length"] = piece_length_;
    json["total_length"] = total_length_;

    nlohmann::json pieces = nlohmann::json::array();
    for (const auto& digest : piece_hashes_) {
        pieces.push_back(to_hex(digest));
    }
    json["pieces"] = pieces;

    return json;
}

bool TorrentMeta::save_json(const std::string& path) const {
    return save_json_file(path, to_json());
}

//=============================================================================
// Accessors
//=============================================================================

uint32_t TorrentMeta::piece_size(uint32_t index) const {
    if (index >= num_pieces()) {
        return 0;
    }
    if (index + 1 < num_pieces()) {
        return piece_length_;
    }
    return static_cast<uint32_t>(total_length_ - piece_offset(index));
}

Sha1Digest TorrentMeta::piece_hash(uint32_t index) const {
    if (index >= num_pieces()) {
        return Sha1Digest{};
    }
    return piece_hashes_[index];
}

uint32_t TorrentMeta::num_blocks(uint32_t index, uint32_t block_size) const {
    uint32_t size = piece_size(index);
    if (size == 0 || block_size == 0) {
        return 0;
    }
    return (size + block_size - 1) / block_size;
}

uint32_t TorrentMeta::block_length(uint32_t index, uint32_t block, uint32_t block_size) const {
    uint32_t size = piece_size(index);
    uint64_t begin = static_cast<uint64_t>(block) * block_size;
    if (begin >= size) {
        return 0;
    }
    return static_cast<uint32_t>(std::min<uint64_t>(block_size, size - begin));
}

//=============================================================================
// Seeding
//=============================================================================

TorrentMeta prepare_seed_meta(const std::string& data_path,
                              uint32_t piece_length,
                              const std::string& meta_path,
                              const std::optional<InfoHash>& expected) {
    std::vector<uint8_t> content;
    if (!read_file_binary(data_path, content)) {
        throw ConfigError("cannot read data file " + data_path);
    }

    std::string name = data_path.substr(data_path.find_last_of('/') + 1);
    TorrentMeta meta = TorrentMeta::from_content(content, piece_length, name);
    LOG_META_INFO("Hashed " << data_path << ": info hash " << info_hash_to_hex(meta.info_hash()));

    if (!meta_path.empty()) {
        if (!meta.save_json(meta_path)) {
            throw ConfigError("cannot write metadata to " + meta_path);
        }
        LOG_META_INFO("Wrote metadata to " << meta_path);
    }

    if (expected && *expected != meta.info_hash()) {
        throw ConfigError("info hash " + info_hash_to_hex(*expected) +
                          " does not match " + data_path + " (" +
                          info_hash_to_hex(meta.info_hash()) + ")");
    }
    return meta;
}

} // namespace peerwire
