#pragma once

#include "Config.h"
#include "Constants.h"
#include "Result.h"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace PeerDrop {

/**
 * @brief Effective settings for one run of the peerdrop tool
 *
 * Built from the config file with command-line overrides already applied.
 */
struct AppSettings {
    std::string displayName;
    uint16_t servicePort = config::DEFAULT_SERVICE_PORT;
    uint16_t discoveryPort = config::DEFAULT_DISCOVERY_PORT;
    std::string broadcastAddress = config::DEFAULT_BROADCAST_ADDRESS;
    int broadcastIntervalSec = config::DEFAULT_BROADCAST_INTERVAL_SEC;
    int peerTtlSec = config::DEFAULT_PEER_TTL_SEC;
    std::string saveDirectory = config::DEFAULT_SAVE_DIRECTORY;
    size_t chunkSize = config::DEFAULT_CHUNK_SIZE;
    int connectTimeoutMs = config::DEFAULT_CONNECT_TIMEOUT_MS;
    int ioTimeoutMs = config::DEFAULT_IO_TIMEOUT_MS;
    std::string keyFile = "encryption.key";
    std::string logLevel = "info";
    std::string logFile;
};

/// Parsed argv: the subcommand, its operands and the flags that are not config keys
struct CommandLine {
    std::string command;
    std::vector<std::string> operands;
    std::optional<std::string> configPath;
    std::optional<std::string> target;      // --to ADDR[:PORT]
    std::optional<std::string> keyHex;      // --key
    std::optional<std::string> outPath;     // --out
    int waitSec = config::DEFAULT_PEER_WAIT_SEC;
    bool noEncrypt = false;
    bool help = false;

    /// Config keys set from flags such as --port or --dir
    std::unordered_map<std::string, std::string> overrides;
};

/// ConfigurationError on unknown flags, missing flag values or a non-numeric --wait
Result<CommandLine> parseCommandLine(int argc, char* argv[]);

/// System file, then the per-user file under XDG_CONFIG_HOME; missing layers are skipped
std::vector<std::string> defaultConfigLayers();

/**
 * @brief Fill config from the default layers, --config and the flag overrides
 *
 * Each step overrides the one before. A --config file that cannot be read is
 * a ConfigurationError; the default layers are optional.
 */
Result<void> loadConfiguration(Config& config, const CommandLine& cmd);

/// Validate every known key and read them into AppSettings
Result<AppSettings> settingsFromConfig(const Config& config);

/// Host name, or "peerdrop" if it cannot be read
std::string defaultDisplayName();

/// Splits "10.0.0.5:7000"; the port defaults to defaultPort
Result<std::pair<std::string, uint16_t>> parseTarget(const std::string& target, uint16_t defaultPort);

std::string usageText(const std::string& program);

} // namespace PeerDrop
