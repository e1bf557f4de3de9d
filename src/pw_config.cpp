#include "pw_config.h"
#include "fs.h"
#include "logger.h"

#include <limits>

#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace peerwire {

namespace {

template <typename T>
void read_unsigned(const nlohmann::json& json, const char* key, T& out) {
    if (!json.contains(key)) {
        return;
    }
    const auto& value = json.at(key);
    if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<int64_t>() < 0)) {
        throw ConfigError(std::string("'") + key + "' must be a non-negative integer");
    }
    uint64_t number = value.get<uint64_t>();
    if (number > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        throw ConfigError(std::string("'") + key + "' is out of range (max " +
                          std::to_string(std::numeric_limits<T>::max()) + ")");
    }
    out = static_cast<T>(number);
}

} // namespace

TorrentConfig TorrentConfig::from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    TorrentConfig config;
    read_unsigned(json, "pipeline_depth", config.pipeline_depth);
    read_unsigned(json, "block_size", config.block_size);
    read_unsigned(json, "max_unchoked_peers", config.max_unchoked_peers);
    read_unsigned(json, "max_peers", config.max_peers);
    read_unsigned(json, "tick_interval_ms", config.tick_interval_ms);
    read_unsigned(json, "keepalive_interval_ms", config.keepalive_interval_ms);
    read_unsigned(json, "handshake_timeout_ms", config.handshake_timeout_ms);
    read_unsigned(json, "connect_timeout_ms", config.connect_timeout_ms);
    read_unsigned(json, "read_timeout_ms", config.read_timeout_ms);
    read_unsigned(json, "redial_attempts", config.redial_attempts);
    read_unsigned(json, "redial_backoff_ms", config.redial_backoff_ms);

    config.validate();
    return config;
}

nlohmann::json TorrentConfig::to_json() const {
    nlohmann::json json;
    json["pipeline_depth"] = pipeline_depth;
    json["block_size"] = block_size;
    json["max_unchoked_peers"] = max_unchoked_peers;
    json["max_peers"] = max_peers;
    json["tick_interval_ms"] = tick_interval_ms;
    json["keepalive_interval_ms"] = keepalive_interval_ms;
    json["handshake_timeout_ms"] = handshake_timeout_ms;
    json["connect_timeout_ms"] = connect_timeout_ms;
    json["read_timeout_ms"] = read_timeout_ms;
    json["redial_attempts"] = redial_attempts;
    json["redial_backoff_ms"] = redial_backoff_ms;
    return json;
}

void TorrentConfig::validate() const {
    if (pipeline_depth == 0) {
        throw ConfigError("pipeline_depth must be at least 1");
    }
    if (block_size == 0 || block_size > PW_MAX_BLOCK_SIZE) {
        throw ConfigError("block_size must be between 1 and " + std::to_string(PW_MAX_BLOCK_SIZE));
    }
    if (max_peers == 0) {
        throw ConfigError("max_peers must be at least 1");
    }
    if (tick_interval_ms <= 0 || read_timeout_ms <= 0) {
        throw ConfigError("tick_interval_ms and read_timeout_ms must be positive");
    }
    if (keepalive_interval_ms < 0 || handshake_timeout_ms < 0 || connect_timeout_ms < 0 ||
        redial_attempts < 0 || redial_backoff_ms < 0) {
        throw ConfigError("timeouts and redial settings must not be negative");
    }
}

nlohmann::json load_json_file(const std::string& path) {
    std::string text;
    if (!read_file_text(path, text)) {
        throw ConfigError("cannot read " + path);
    }

    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("invalid JSON in " + path + ": " + e.what());
    }
}

bool save_json_file(const std::string& path, const nlohmann::json& json) {
    if (!write_file_text(path, json.dump(4))) {
        LOG_CONFIG_ERROR("Failed to save " << path);
        return false;
    }
    LOG_CONFIG_INFO("Saved " << path);
    return true;
}

} // namespace peerwire
