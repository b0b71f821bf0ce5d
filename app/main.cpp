#include <iostream>
#include <csignal>
#include <string>
#include <filesystem>
#include <thread>
#include <atomic>
#include <memory>
#include "AppSettings.h"
#include "ChunkCipher.h"
#include "Config.h"
#include "ConsoleCollaborators.h"
#include "DiscoverySession.h"
#include "FileReceiver.h"
#include "FileSender.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "PathUtils.h"

using namespace PeerDrop;

namespace {

volatile sig_atomic_t signalReceived = 0;

void signalHandler(int) {
    signalReceived = 1;
}

int fail(const Error& error) {
    std::cerr << "Error: " << error.describe() << std::endl;
    return 1;
}

DiscoveryOptions discoveryOptions(const AppSettings& settings, uint16_t servicePort) {
    DiscoveryOptions options;
    options.displayName = settings.displayName;
    options.servicePort = servicePort;
    options.discoveryPort = settings.discoveryPort;
    options.broadcastAddress = settings.broadcastAddress;
    options.peerTtl = std::chrono::seconds(settings.peerTtlSec);
    return options;
}

/// Sleep in short steps until pred() holds, the wait runs out or Ctrl+C
template <typename Pred>
bool waitUntil(int seconds, Pred pred) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (!signalReceived) {
        if (pred()) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
    return false;
}

/// Runs cancelFn once Ctrl+C arrives, until the returned guard goes away
class InterruptWatcher {
public:
    template <typename Fn>
    explicit InterruptWatcher(Fn cancelFn) : thread_([this, cancelFn]() {
        while (!done_) {
            if (signalReceived) {
                cancelFn();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(config::POLL_SLICE_MS));
        }
    }) {}

    ~InterruptWatcher() {
        done_ = true;
        thread_.join();
    }

private:
    std::atomic<bool> done_{false};
    std::thread thread_;
};

int runDiscover(const AppSettings& settings, const CommandLine& cmd) {
    DiscoverySession session(discoveryOptions(settings, settings.servicePort));
    if (auto started = session.start(std::chrono::seconds(settings.broadcastIntervalSec)); !started) {
        return fail(started.error());
    }

    std::cout << "Listening for devices for " << cmd.waitSec << "s..." << std::endl;
    waitUntil(cmd.waitSec, [] { return false; });

    auto peers = session.listPeers();
    session.stop();

    if (peers.empty()) {
        std::cout << "No devices found." << std::endl;
        return 0;
    }
    for (const auto& peer : peers) {
        std::cout << peer.displayName << "\t" << peer.address << ":" << peer.servicePort << std::endl;
    }
    return 0;
}

int runSend(const AppSettings& settings, const CommandLine& cmd) {
    auto& logger = Logger::instance();

    if (cmd.operands.size() != 1) {
        std::cerr << "send needs exactly one file" << std::endl;
        return 2;
    }
    const std::filesystem::path file = cmd.operands[0];

    auto keyMaterial = loadKeyMaterial(cmd.keyHex, settings.keyFile);
    if (!keyMaterial) {
        return fail(keyMaterial.error());
    }
    StaticKeyProvider keyProvider(std::move(*keyMaterial));

    TransferMode mode = PlainTransfer{};
    if (!cmd.noEncrypt) {
        if (auto key = keyProvider.key()) {
            auto cipher = ChunkCipher::create(*key);
            if (!cipher) {
                return fail(cipher.error());
            }
            mode = EncryptedTransfer{std::make_shared<const ChunkCipher>(std::move(*cipher))};
        }
    }
    if (!isEncrypted(mode)) {
        logger.log(LogLevel::WARN, "Sending without encryption", "App");
    }

    std::string address;
    uint16_t port = settings.servicePort;

    if (cmd.target) {
        auto target = parseTarget(*cmd.target, settings.servicePort);
        if (!target) {
            return fail(target.error());
        }
        address = target->first;
        port = target->second;
    } else {
        DiscoverySession session(discoveryOptions(settings, settings.servicePort));
        if (auto started = session.start(std::chrono::seconds(settings.broadcastIntervalSec)); !started) {
            return fail(started.error());
        }

        std::cout << "Searching for devices (up to " << cmd.waitSec << "s)..." << std::endl;
        std::vector<PeerRecord> peers;
        waitUntil(cmd.waitSec, [&] {
            peers = session.listPeers();
            return !peers.empty();
        });
        session.stop();

        if (peers.empty()) {
            std::cout << "No devices found." << std::endl;
            return 1;
        }

        ConsolePeerSelector selector(std::cin, std::cout);
        auto chosen = selector.selectPeer(peers);
        if (!chosen) {
            std::cout << "Cancelled." << std::endl;
            return 1;
        }
        address = chosen->address;
        port = chosen->servicePort;
    }

    TransferOptions options;
    options.chunkSize = settings.chunkSize;
    options.connectTimeout = std::chrono::milliseconds(settings.connectTimeoutMs);
    options.ioTimeout = std::chrono::milliseconds(settings.ioTimeoutMs);

    FileSender sender(mode, options);
    if (auto connected = sender.connect(address, port); !connected) {
        return fail(connected.error());
    }

    InterruptWatcher watcher([&sender] { sender.cancel(); });
    auto sent = sender.sendFile(file, makeProgressBar(std::cout, "Sending"));
    if (!sent) {
        return fail(sent.error());
    }

    std::cout << "Sent " << file.filename().string() << " to " << address << ":" << port << std::endl;
    return 0;
}

int runReceive(const AppSettings& settings, const CommandLine& cmd) {
    auto keyMaterial = loadKeyMaterial(cmd.keyHex, settings.keyFile);
    if (!keyMaterial) {
        return fail(keyMaterial.error());
    }
    StaticKeyProvider keyProvider(std::move(*keyMaterial));

    std::shared_ptr<const ChunkCipher> cipher;
    if (auto key = keyProvider.key()) {
        auto created = ChunkCipher::create(*key);
        if (!created) {
            return fail(created.error());
        }
        cipher = std::make_shared<const ChunkCipher>(std::move(*created));
    }

    ReceiverOptions options;
    options.port = settings.servicePort;
    options.saveDirectory = settings.saveDirectory;
    options.ioTimeout = std::chrono::milliseconds(settings.ioTimeoutMs);

    FileReceiver receiver(options, cipher);
    if (auto started = receiver.start(); !started) {
        return fail(started.error());
    }

    // Announce ourselves so senders can find us
    DiscoverySession session(discoveryOptions(settings, receiver.boundPort()));
    if (auto started = session.start(std::chrono::seconds(settings.broadcastIntervalSec)); !started) {
        Logger::instance().log(LogLevel::WARN, "Not discoverable: " + started.error().message, "App");
    }

    std::cout << "Waiting for a file on port " << receiver.boundPort()
              << (cipher ? " (encryption key loaded)" : "") << "..." << std::endl;

    InterruptWatcher watcher([&receiver] { receiver.cancel(); });

    auto peer = receiver.acceptConnection();
    if (!peer) {
        session.stop();
        return fail(peer.error());
    }
    std::cout << "Connection from " << *peer << std::endl;

    auto received = receiver.receiveFile(makeProgressBar(std::cout, "Receiving"));
    session.stop();
    if (!received) {
        return fail(received.error());
    }

    std::cout << "Saved " << received->string() << std::endl;
    if (auto sum = ChunkCipher::checksumFile(*received)) {
        std::cout << "SHA-256 " << *sum << std::endl;
    } else {
        Logger::instance().log(LogLevel::WARN, "Checksum unavailable: " + sum.error().message, "App");
    }
    return 0;
}

int runKeygen(const CommandLine& cmd) {
    auto key = ChunkCipher::generateKey();
    if (!key) {
        return fail(key.error());
    }
    std::string hex = ChunkCipher::toHex(*key);

    if (!cmd.outPath) {
        std::cout << hex << std::endl;
        return 0;
    }

    const std::filesystem::path parent = std::filesystem::path(*cmd.outPath).parent_path();
    if (!parent.empty()) {
        try {
            PathUtils::ensureDirectory(parent);
        } catch (const std::exception& e) {
            return fail(Error(ErrorCode::FileError, e.what()));
        }
    }

    std::error_code ec;
    if (std::filesystem::exists(*cmd.outPath, ec)) {
        std::cout << "Overwriting existing key " << *cmd.outPath << std::endl;
    }
    if (auto saved = saveKeyFile(*cmd.outPath, *key); !saved) {
        return fail(saved.error());
    }
    std::cout << "New key saved to " << *cmd.outPath << std::endl;
    return 0;
}

int runChecksum(const CommandLine& cmd) {
    if (cmd.operands.size() != 1) {
        std::cerr << "checksum needs exactly one file" << std::endl;
        return 2;
    }
    auto sum = ChunkCipher::checksumFile(cmd.operands[0]);
    if (!sum) {
        return fail(sum.error());
    }
    std::cout << *sum << "  " << cmd.operands[0] << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    auto& logger = Logger::instance();
    logger.setComponent("App");

    auto cmd = parseCommandLine(argc, argv);
    if (!cmd) {
        std::cerr << cmd.error().message << "\n\n" << usageText(argv[0]);
        return 2;
    }
    if (cmd->help || cmd->command.empty()) {
        std::cout << usageText(argv[0]);
        return cmd->help ? 0 : 2;
    }

    // --- Configuration: system, user, --config, then command-line overrides ---
    Config& fileConfig = Config::instance();
    if (auto loaded = loadConfiguration(fileConfig, *cmd); !loaded) {
        return fail(loaded.error());
    }

    auto settings = settingsFromConfig(fileConfig);
    if (!settings) {
        return fail(settings.error());
    }

    // --- Logging ---
    logger.setLevel(parseLogLevel(settings->logLevel).value_or(LogLevel::INFO));
    logger.setMaxFileSize(config::MAX_LOG_FILE_SIZE_MB);
    if (!settings->logFile.empty()) {
        logger.setLogFile(settings->logFile);
    }
    logger.log(LogLevel::DEBUG, "Using config " + configPath, "App");

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    int rc = 2;
    if (cmd->command == "discover") {
        rc = runDiscover(*settings, *cmd);
    } else if (cmd->command == "send") {
        rc = runSend(*settings, *cmd);
    } else if (cmd->command == "receive") {
        rc = runReceive(*settings, *cmd);
    } else if (cmd->command == "keygen") {
        rc = runKeygen(*cmd);
    } else if (cmd->command == "checksum") {
        rc = runChecksum(*cmd);
    } else {
        std::cerr << "Unknown command: " << cmd->command << "\n\n" << usageText(argv[0]);
        return 2;
    }

    if (logger.getLevel() <= LogLevel::DEBUG) {
        logger.log(LogLevel::DEBUG, MetricsCollector::instance().getMetricsSummary(), "App");
    }
    return rc;
}
