#include "AppSettings.h"
#include "Logger.h"
#include "PathUtils.h"

#include <unistd.h>
#include <climits>

namespace PeerDrop {

namespace {

bool isInteger(const std::string& value, long long minValue, long long maxValue) {
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        return consumed == value.size() && parsed >= minValue && parsed <= maxValue;
    } catch (const std::exception&) {
        return false;
    }
}

Config::Validator intRange(long long minValue, long long maxValue) {
    return [minValue, maxValue](const std::string&, const std::string& value) {
        return isInteger(value, minValue, maxValue);
    };
}

// Flags that map straight onto config keys
const std::unordered_map<std::string, std::string>& flagKeys() {
    static const std::unordered_map<std::string, std::string> keys = {
        {"--name", "display_name"},
        {"--port", "service_port"},
        {"--discovery-port", "discovery_port"},
        {"--broadcast", "broadcast_address"},
        {"--dir", "save_directory"},
        {"--key-file", "key_file"},
        {"--log-level", "log_level"},
        {"--log-file", "log_file"},
    };
    return keys;
}

} // namespace

Result<CommandLine> parseCommandLine(int argc, char* argv[]) {
    CommandLine cmd;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto nextValue = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        }
        else if (arg == "--no-encrypt") {
            cmd.noEncrypt = true;
        }
        else if (arg == "--config" || arg == "--to" || arg == "--key" || arg == "--out" || arg == "--wait") {
            auto value = nextValue();
            if (!value) {
                return Err<CommandLine>(ErrorCode::ConfigurationError, "Missing value for " + arg);
            }
            if (arg == "--config") cmd.configPath = *value;
            else if (arg == "--to") cmd.target = *value;
            else if (arg == "--key") cmd.keyHex = *value;
            else if (arg == "--out") cmd.outPath = *value;
            else {
                if (!isInteger(*value, 0, INT_MAX)) {
                    return Err<CommandLine>(ErrorCode::ConfigurationError, "Invalid --wait value: " + *value);
                }
                cmd.waitSec = std::stoi(*value);
            }
        }
        else if (auto it = flagKeys().find(arg); it != flagKeys().end()) {
            auto value = nextValue();
            if (!value) {
                return Err<CommandLine>(ErrorCode::ConfigurationError, "Missing value for " + arg);
            }
            cmd.overrides[it->second] = *value;
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            return Err<CommandLine>(ErrorCode::ConfigurationError, "Unknown option: " + arg);
        }
        else if (cmd.command.empty()) {
            cmd.command = arg;
        }
        else {
            cmd.operands.push_back(arg);
        }
    }

    return Ok(std::move(cmd));
}

std::vector<std::string> defaultConfigLayers() {
    std::vector<std::string> layers = {config::SYSTEM_CONFIG_FILE};
    try {
        layers.push_back(PathUtils::getConfigFilePath().string());
    } catch (const std::exception& e) {
        Logger::instance().log(LogLevel::DEBUG, std::string("No per-user config: ") + e.what(), "Config");
    }
    return layers;
}

Result<void> loadConfiguration(Config& config, const CommandLine& cmd) {
    if (!config.loadLayered(defaultConfigLayers())) {
        Logger::instance().log(LogLevel::DEBUG, "No config file found, using defaults", "Config");
    }
    if (cmd.configPath && !config.loadFromFile(*cmd.configPath)) {
        return Err(ErrorCode::ConfigurationError, "Cannot read config file " + *cmd.configPath);
    }
    for (const auto& [key, value] : cmd.overrides) {
        config.set(key, value);
    }
    return Ok();
}

Result<AppSettings> settingsFromConfig(const Config& config) {
    const std::unordered_map<std::string, Config::Validator> schema = {
        {"service_port", intRange(0, 65535)},
        {"discovery_port", intRange(1, 65535)},
        {"broadcast_interval_sec", intRange(1, 3600)},
        {"peer_ttl_sec", intRange(1, 86400)},
        {"chunk_size", intRange(1, static_cast<long long>(config::MAX_FRAME_PAYLOAD))},
        {"connect_timeout_ms", intRange(0, INT_MAX)},
        {"io_timeout_ms", intRange(0, INT_MAX)},
        {"log_level", [](const std::string&, const std::string& value) {
            return parseLogLevel(value).has_value();
        }},
        {"display_name", [](const std::string&, const std::string& value) {
            return value.size() <= config::MAX_DISPLAY_NAME_LENGTH;
        }},
    };

    if (auto valid = config.validate(schema); !valid) {
        return valid.error();
    }

    AppSettings settings;
    settings.displayName = config.get("display_name", defaultDisplayName());
    settings.servicePort = static_cast<uint16_t>(config.getInt("service_port", settings.servicePort));
    settings.discoveryPort = static_cast<uint16_t>(config.getInt("discovery_port", settings.discoveryPort));
    settings.broadcastAddress = config.get("broadcast_address", settings.broadcastAddress);
    settings.broadcastIntervalSec = config.getInt("broadcast_interval_sec", settings.broadcastIntervalSec);
    settings.peerTtlSec = config.getInt("peer_ttl_sec", settings.peerTtlSec);
    settings.saveDirectory = config.get("save_directory", settings.saveDirectory);
    settings.chunkSize = config.getSize("chunk_size", settings.chunkSize);
    settings.connectTimeoutMs = config.getInt("connect_timeout_ms", settings.connectTimeoutMs);
    settings.ioTimeoutMs = config.getInt("io_timeout_ms", settings.ioTimeoutMs);
    settings.keyFile = config.get("key_file", settings.keyFile);
    settings.logLevel = config.get("log_level", settings.logLevel);
    settings.logFile = config.get("log_file", settings.logFile);
    return Ok(std::move(settings));
}

std::string defaultDisplayName() {
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0 || host[0] == '\0') {
        return "peerdrop";
    }
    return host;
}

Result<std::pair<std::string, uint16_t>> parseTarget(const std::string& target, uint16_t defaultPort) {
    using Target = std::pair<std::string, uint16_t>;

    auto colon = target.rfind(':');
    if (colon == std::string::npos) {
        if (target.empty()) {
            return Err<Target>(ErrorCode::ConfigurationError, "Empty target address");
        }
        return Ok(Target{target, defaultPort});
    }

    std::string host = target.substr(0, colon);
    std::string port = target.substr(colon + 1);
    if (host.empty() || !isInteger(port, 1, 65535)) {
        return Err<Target>(ErrorCode::ConfigurationError, "Invalid target: " + target);
    }
    return Ok(Target{host, static_cast<uint16_t>(std::stoi(port))});
}

std::string usageText(const std::string& program) {
    return "PeerDrop - LAN file drop\n"
           "\nUsage: " + program + " <command> [OPTIONS]\n"
           "\nCommands:\n"
           "  discover                   List devices announcing themselves on the LAN\n"
           "  send <FILE>                Send a file to a peer\n"
           "  receive                    Wait for one incoming file\n"
           "  keygen                     Generate a new shared encryption key\n"
           "  checksum <FILE>            Print the SHA-256 of a file\n"
           "\nOptions:\n"
           "  --config <PATH>            Extra config file, read after /etc/peerdrop and $XDG_CONFIG_HOME/peerdrop\n"
           "  --name <NAME>              Name announced to other devices (default: host name)\n"
           "  --port <PORT>              TCP transfer port (default: 65432)\n"
           "  --discovery-port <PORT>    UDP discovery port (default: 65433)\n"
           "  --broadcast <ADDR>         Beacon destination (default: 255.255.255.255)\n"
           "  --to <ADDR[:PORT]>         Send without discovery\n"
           "  --wait <SEC>               How long to wait for peers (default: 25)\n"
           "  --key <HEX>                64 hex digit shared key\n"
           "  --key-file <PATH>          Key file (default: encryption.key)\n"
           "  --no-encrypt               Send in the clear even if a key is available\n"
           "  --dir <PATH>               Where received files go (default: received_files)\n"
           "  --out <PATH>               keygen: write the key here instead of stdout\n"
           "  --log-level <LEVEL>        debug, info, warn, error\n"
           "  --log-file <PATH>          Also log to this file\n"
           "  --help                     Show this help message\n";
}

} // namespace PeerDrop
