#pragma once

/**
 * @file torrent_meta.h
 * @brief Immutable description of the shared content
 *
 * The content is one flat byte range cut into fixed-size pieces (the last
 * one may be shorter), each with an expected SHA-1 digest.
 */

#include "pw_types.h"
#include "pw_config.h"
#include "sha1.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace peerwire {

class TorrentMeta {
public:
    /**
     * @brief Build metadata from its parts
     * @throws ConfigError if lengths are zero or the hash count does not
     *         match the number of pieces
     */
    TorrentMeta(const InfoHash& info_hash,
                uint32_t piece_length,
                uint64_t total_length,
                std::vector<Sha1Digest> piece_hashes,
                std::string name = std::string());

    //=========================================================================
    // Factories
    //=========================================================================

    /**
     * @brief Hash local content into metadata
     *
     * The info hash is the SHA-1 of the bencoded single-file info
     * dictionary, so it matches a .torrent file made from the same data.
     */
    static TorrentMeta from_content(const std::vector<uint8_t>& content,
                                    uint32_t piece_length,
                                    const std::string& name);

    /**
     * @brief Load a single-file .torrent
     * @throws ConfigError on unreadable, malformed or multi-file torrents
     */
    static TorrentMeta from_torrent_file(const std::string& path);

    /**
     * @brief Load from the JSON form produced by to_json()
     * @throws ConfigError on missing or malformed fields
     */
    static TorrentMeta from_json(const nlohmann::json& json);
    static TorrentMeta load_json(const std::string& path);

    nlohmann::json to_json() const;
    bool save_json(const std::string& path) const;

    //=========================================================================
    // Accessors
    //=========================================================================

    const InfoHash& info_hash() const { return info_hash_; }
    const std::string& name() const { return name_; }
    uint32_t piece_length() const { return piece_length_; }
    uint64_t total_length() const { return total_length_; }
    uint32_t num_pieces() const { return static_cast<uint32_t>(piece_hashes_.size()); }

    /// Size of piece index in bytes, 0 for an invalid index
    uint32_t piece_size(uint32_t index) const;

    /// Expected digest of a piece, zeroes for an invalid index
    Sha1Digest piece_hash(uint32_t index) const;

    /// Number of blocks of block_size bytes in a piece
    uint32_t num_blocks(uint32_t index, uint32_t block_size) const;

    /// Length of one block, the last block of a piece may be shorter
    uint32_t block_length(uint32_t index, uint32_t block, uint32_t block_size) const;

    /// Byte offset of a piece within the content
    uint64_t piece_offset(uint32_t index) const {
        return static_cast<uint64_t>(index) * piece_length_;
    }

private:
    InfoHash info_hash_;
    uint32_t piece_length_;
    uint64_t total_length_;
    std::vector<Sha1Digest> piece_hashes_;
    std::string name_;
};

/**
 * @brief Hash a local file for seeding
 *
 * The metadata is written to meta_path (when non-empty) and its info hash
 * logged before it is compared with expected, so a first-time seeder can
 * learn the hash from the output.
 *
 * @param data_path File to hash; its base name becomes the torrent name
 * @param expected Info hash the caller was told to seed, if any
 * @throws ConfigError if data_path or meta_path cannot be accessed, or if
 *         the computed info hash differs from expected
 */
TorrentMeta prepare_seed_meta(const std::string& data_path,
                              uint32_t piece_length,
                              const std::string& meta_path,
                              const std::optional<InfoHash>& expected);

} // namespace peerwire
