#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "protocol.hpp"

namespace clipmesh {

struct PeerConfig {
    std::string host;
    uint16_t port{};

    std::string endpoint() const { return host + ":" + std::to_string(port); }
};

struct EngineConfig {
    uint16_t listen_port{};
    std::string listen_host{"0.0.0.0"};
    std::vector<uint8_t> secret_key;
    uint64_t max_file_size{10ull * 1024 * 1024};
    std::vector<PeerConfig> peers;

    std::chrono::milliseconds poll_interval{300};
    std::string download_dir;              // empty: default_download_root()
    std::optional<OriginId> origin_id;     // empty: random per run
    int threads{2};
    std::chrono::milliseconds reconnect_initial{500};
    std::chrono::milliseconds reconnect_max{30000};
};

bool validate_config(const EngineConfig& cfg, std::string& err);

// Applies one `key = value` setting. Unknown keys are an error.
bool apply_config_value(EngineConfig& cfg, const std::string& key,
                        const std::string& value, std::string& err);

// Reads a line-oriented `key = value` file. `log_level` is returned separately
// because it configures the process, not the engine.
bool load_config_file(const std::string& path, EngineConfig& cfg,
                      std::string& log_level, std::string& err);

std::string default_config_path();
// <Downloads>/lan-clipboard on the current platform.
std::string default_download_root();

} // namespace clipmesh
