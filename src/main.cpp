#include "logger.h"
#include "piece_store.h"
#include "pw_config.h"
#include "pw_transport.h"
#include "pw_types.h"
#include "torrent.h"
#include "torrent_meta.h"
#include "version.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>

// Main module logging macros
#define LOG_MAIN_DEBUG(message) LOG_DEBUG("main", message)
#define LOG_MAIN_INFO(message)  LOG_INFO("main", message)
#define LOG_MAIN_WARN(message)  LOG_WARN("main", message)
#define LOG_MAIN_ERROR(message) LOG_ERROR("main", message)

using namespace peerwire;

namespace {

std::atomic<bool> g_interrupted(false);

void handle_signal(int) {
    g_interrupted = true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <command> [options]\n";
    std::cout << "\nCommands:\n";
    std::cout << "  leech   Download a torrent from a known peer\n";
    std::cout << "  seed    Serve a local file to peers\n";
    std::cout << "\nleech options:\n";
    std::cout << "  --ip <address>        Address of the peer to dial (required)\n";
    std::cout << "  --port <port>         Port of the peer to dial (required)\n";
    std::cout << "  --info-hash <hex>     Info hash of the torrent (required)\n";
    std::cout << "  --meta <file>         Metadata JSON or .torrent file (required)\n";
    std::cout << "  --out <file>          Output file (default: name from metadata)\n";
    std::cout << "\nseed options:\n";
    std::cout << "  --port <port>         Port to listen on (required)\n";
    std::cout << "  --info-hash <hex>     Refuse to seed unless the file hashes to this\n";
    std::cout << "  --data <file>         File to serve (required)\n";
    std::cout << "  --ip <address>        Address to bind (default: 0.0.0.0)\n";
    std::cout << "  --piece-length <n>    Piece length used to hash the file (default: "
              << PW_DEFAULT_PIECE_LENGTH << ")\n";
    std::cout << "  --meta <file>         Write the computed metadata JSON here\n";
    std::cout << "\nCommon options:\n";
    std::cout << "  --config <file>       Torrent configuration JSON\n";
    std::cout << "  --log-level <level>   debug, info, warn or error (default: info)\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << program_name << " seed --port 6881 --data movie.bin --meta movie.json\n";
    std::cout << "  " << program_name << " leech --ip 127.0.0.1 --port 6881 --info-hash <hex> --meta movie.json\n";
}

/**
 * @brief Collect "--name value" pairs
 * @return false on a dangling flag or a positional argument
 */
bool parse_options(int argc, char* argv[], int first, std::map<std::string, std::string>& options) {
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 3 || arg.compare(0, 2, "--") != 0 || i + 1 >= argc) {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            return false;
        }
        options[arg.substr(2)] = argv[++i];
    }
    return true;
}

std::string require(const std::map<std::string, std::string>& options, const std::string& name) {
    auto it = options.find(name);
    if (it == options.end() || it->second.empty()) {
        throw ConfigError("missing required option --" + name);
    }
    return it->second;
}

std::string option_or(const std::map<std::string, std::string>& options,
                      const std::string& name, const std::string& fallback) {
    auto it = options.find(name);
    return it == options.end() ? fallback : it->second;
}

uint16_t parse_port(const std::string& text, bool allow_zero) {
    int port = 0;
    try {
        port = std::stoi(text);
    } catch (const std::exception&) {
        throw ConfigError("invalid port: " + text);
    }
    if (port < (allow_zero ? 0 : 1) || port > 65535) {
        throw ConfigError("port out of range: " + text);
    }
    return static_cast<uint16_t>(port);
}

InfoHash parse_info_hash(const std::string& text) {
    InfoHash hash;
    if (!parse_hex20(text, hash)) {
        throw ConfigError("info hash must be 40 hex characters: " + text);
    }
    return hash;
}

TorrentConfig load_config(const std::map<std::string, std::string>& options) {
    auto it = options.find("config");
    if (it == options.end()) {
        return TorrentConfig();
    }
    TorrentConfig config = TorrentConfig::from_json(load_json_file(it->second));
    LOG_MAIN_INFO("Loaded configuration from " << it->second);
    return config;
}

/// Metadata from a .torrent file or the JSON form
TorrentMeta load_meta(const std::string& path) {
    const std::string suffix = ".torrent";
    if (path.size() > suffix.size() &&
        path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return TorrentMeta::from_torrent_file(path);
    }
    return TorrentMeta::load_json(path);
}

void check_info_hash(const TorrentMeta& meta, const InfoHash& expected) {
    if (meta.info_hash() != expected) {
        throw ConfigError("info hash " + info_hash_to_hex(expected) +
                          " does not match metadata (" + info_hash_to_hex(meta.info_hash()) + ")");
    }
}

int run_leech(const std::map<std::string, std::string>& options) {
    std::string ip = require(options, "ip");
    uint16_t port = parse_port(require(options, "port"), false);
    InfoHash info_hash = parse_info_hash(require(options, "info-hash"));
    TorrentConfig config = load_config(options);

    TorrentMeta meta = load_meta(require(options, "meta"));
    check_info_hash(meta, info_hash);

    std::string default_out = meta.name().empty() ? info_hash_to_hex(info_hash) + ".bin" : meta.name();
    std::string out = option_or(options, "out", default_out);

    auto store = std::make_shared<FilePieceStore>(out, meta);
    if (!store->is_open()) {
        LOG_MAIN_ERROR("Cannot open output file " << out);
        return 1;
    }

    PeerID peer_id = generate_peer_id();
    LOG_MAIN_INFO("Leeching " << info_hash_to_hex(info_hash) << " from " << ip << ":" << port
                  << " into " << out);

    Torrent torrent(meta, config, peer_id, store, std::make_shared<TcpTransport>());
    if (torrent.is_complete()) {
        LOG_MAIN_INFO("All " << meta.num_pieces() << " pieces already present in " << out);
        return 0;
    }
    if (!torrent.dial(PeerAddress(ip, port))) {
        return 1;
    }

    // Give up once no connection is left and no redial can still be pending
    auto idle_limit = std::chrono::milliseconds(
        config.connect_timeout_ms + config.handshake_timeout_ms +
        (config.redial_attempts + 1) * config.redial_backoff_ms);
    auto idle_since = std::chrono::steady_clock::now();

    while (!g_interrupted.load()) {
        if (torrent.wait_for_completion(std::chrono::milliseconds(500))) {
            LOG_MAIN_INFO("Download complete: " << out);
            return 0;
        }

        auto snapshot = torrent.snapshot();
        if (!snapshot) {
            break;
        }
        LOG_MAIN_DEBUG("Progress " << snapshot->verified.count() << "/" << snapshot->num_pieces
                       << " pieces, " << snapshot->peers.size() << " peers");

        auto now = std::chrono::steady_clock::now();
        if (!snapshot->peers.empty() || snapshot->pending_connections > 0) {
            idle_since = now;
        } else if (now - idle_since > idle_limit) {
            LOG_MAIN_ERROR("Lost all peers with " << snapshot->verified.count() << "/"
                           << snapshot->num_pieces << " pieces");
            return 2;
        }
    }

    LOG_MAIN_WARN("Interrupted before completion");
    return 2;
}

int run_seed(const std::map<std::string, std::string>& options) {
    std::string bind_ip = option_or(options, "ip", "0.0.0.0");
    uint16_t port = parse_port(require(options, "port"), true);
    std::optional<InfoHash> info_hash;
    auto hash_it = options.find("info-hash");
    if (hash_it != options.end()) {
        info_hash = parse_info_hash(hash_it->second);
    }
    std::string data_path = require(options, "data");
    TorrentConfig config = load_config(options);

    uint32_t piece_length = PW_DEFAULT_PIECE_LENGTH;
    auto it = options.find("piece-length");
    if (it != options.end()) {
        try {
            piece_length = static_cast<uint32_t>(std::stoul(it->second));
        } catch (const std::exception&) {
            throw ConfigError("invalid piece length: " + it->second);
        }
    }

    TorrentMeta meta = prepare_seed_meta(data_path, piece_length,
                                         option_or(options, "meta", ""), info_hash);

    auto store = std::make_shared<FilePieceStore>(data_path, meta);
    if (!store->is_open() || store->existing_pieces() != meta.num_pieces()) {
        LOG_MAIN_ERROR("Data file " << data_path << " changed while hashing");
        return 1;
    }

    Torrent torrent(meta, config, generate_peer_id(), store, std::make_shared<TcpTransport>());
    uint16_t bound = torrent.listen(bind_ip, port);
    if (bound == 0) {
        return 1;
    }

    LOG_MAIN_INFO("Seeding " << meta.name() << " (" << meta.num_pieces() << " pieces, "
                  << meta.total_length() << " bytes) on " << bind_ip << ":" << bound);
    LOG_MAIN_INFO("Press Ctrl+C to stop");

    while (!g_interrupted.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_MAIN_INFO("Stopping seed");
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "help" || command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "version" || command == "--version") {
        print_version_info();
        return 0;
    }

    std::map<std::string, std::string> options;
    if (!parse_options(argc, argv, 2, options)) {
        print_usage(argv[0]);
        return 1;
    }

    LogLevel level = LogLevel::INFO;
    std::string level_name = option_or(options, "log-level", "info");
    if (!Logger::parse_level(level_name, level)) {
        std::cerr << "Unknown log level: " << level_name << std::endl;
        return 1;
    }
    Logger::getInstance().set_log_level(level);
    LOG_MAIN_DEBUG("peerwire " << version_string());

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        if (command == "leech") {
            return run_leech(options);
        }
        if (command == "seed") {
            return run_seed(options);
        }
    } catch (const ConfigError& e) {
        LOG_MAIN_ERROR("Configuration error: " << e.what());
        return 1;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage(argv[0]);
    return 1;
}
