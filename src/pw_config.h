#pragma once

/**
 * @file pw_config.h
 * @brief Runtime configuration of a torrent and its JSON form
 */

#include "pw_types.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace peerwire {

/**
 * @brief Invalid metadata or configuration, raised only while starting up
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Tunables of one torrent's actors
 */
struct TorrentConfig {
    size_t pipeline_depth;          ///< Max outstanding block requests per peer
    uint32_t block_size;            ///< Size of requested blocks
    size_t max_unchoked_peers;      ///< Upload slots
    size_t max_peers;               ///< Max established plus pending connections
    int tick_interval_ms;           ///< Period of the scheduling tick
    int keepalive_interval_ms;      ///< Send a keep-alive after this much idle time
    int handshake_timeout_ms;       ///< Drop connections that do not complete the handshake
    int connect_timeout_ms;         ///< Timeout for outgoing TCP connects
    int read_timeout_ms;            ///< Poll granularity of connection actors
    int redial_attempts;            ///< Redials of a lost outgoing peer (0 = never)
    int redial_backoff_ms;          ///< Minimum delay before each redial

    TorrentConfig()
        : pipeline_depth(PW_DEFAULT_PIPELINE_DEPTH)
        , block_size(PW_BLOCK_SIZE)
        , max_unchoked_peers(4)
        , max_peers(50)
        , tick_interval_ms(100)
        , keepalive_interval_ms(120000)
        , handshake_timeout_ms(10000)
        , connect_timeout_ms(5000)
        , read_timeout_ms(20)
        , redial_attempts(0)
        , redial_backoff_ms(2000) {}

    /**
     * @brief Overlay the keys present in a JSON object onto defaults
     *
     * Unknown keys are ignored.
     *
     * @throws ConfigError if a known key has the wrong type or an invalid value
     */
    static TorrentConfig from_json(const nlohmann::json& json);

    nlohmann::json to_json() const;

    /**
     * @throws ConfigError if a value is out of range
     */
    void validate() const;
};

/**
 * @brief Read and parse a JSON document from disk
 * @throws ConfigError if the file cannot be read or is not valid JSON
 */
nlohmann::json load_json_file(const std::string& path);

/**
 * @brief Write a JSON document to disk, pretty printed
 * @return false if the file could not be written
 */
bool save_json_file(const std::string& path, const nlohmann::json& json);

} // namespace peerwire
