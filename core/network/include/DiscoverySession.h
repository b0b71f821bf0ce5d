#pragma once

#include "Constants.h"
#include "PeerTable.h"
#include "Result.h"
#include "SocketGuard.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace PeerDrop {

struct DiscoveryOptions {
    std::string displayName;
    uint16_t servicePort = config::DEFAULT_SERVICE_PORT;
    uint16_t discoveryPort = config::DEFAULT_DISCOVERY_PORT;
    std::string broadcastAddress = config::DEFAULT_BROADCAST_ADDRESS;
    std::chrono::seconds peerTtl{config::DEFAULT_PEER_TTL_SEC};

    /// Address treated as "ourselves"; resolved from the routing table when unset
    std::optional<std::string> localAddress;
};

enum class ActivityState {
    Idle,
    Running,
    Stopped,
    Failed
};

const char* activityStateToString(ActivityState state);

struct ActivityStatus {
    ActivityState state = ActivityState::Idle;
    std::optional<Error> lastError;
};

struct DiscoveryStatus {
    ActivityStatus broadcaster;
    ActivityStatus listener;
};

/**
 * @brief Presence broadcaster plus beacon listener sharing one peer table
 *
 * Handles:
 * - Periodic beacon broadcast on its own thread
 * - Listening for beacons from other devices on a second thread
 * - Filtering out beacons sent by this host
 *
 * Sockets are bound in start(), so bind failures are reported directly.
 * A socket fault after that ends the affected activity and is visible
 * through status().
 */
class DiscoverySession {
public:
    explicit DiscoverySession(DiscoveryOptions options, PeerTable::Clock clock = {});
    ~DiscoverySession();

    DiscoverySession(const DiscoverySession&) = delete;
    DiscoverySession& operator=(const DiscoverySession&) = delete;

    /**
     * @brief Bind sockets and launch the broadcaster and listener threads
     * @return NetworkError if a socket cannot be set up,
     *         ConfigurationError if already running or the interval is not positive
     */
    Result<void> start(std::chrono::seconds broadcastInterval =
                           std::chrono::seconds(config::DEFAULT_BROADCAST_INTERVAL_SEC));

    /**
     * @brief Stop both threads and close the sockets. Idempotent.
     */
    void stop();

    bool isRunning() const { return running_; }

    /// Peers seen within the TTL; stale entries are pruned as a side effect
    std::vector<PeerRecord> listPeers();

    DiscoveryStatus status() const;

    /**
     * @brief Process one received datagram
     * @return true if the peer table was updated
     */
    bool ingestBeacon(const uint8_t* data, size_t size, const std::string& senderAddress);
    bool ingestBeacon(const std::vector<uint8_t>& payload, const std::string& senderAddress);

    const std::string& localAddress() const { return localAddress_; }
    const DiscoveryOptions& options() const { return options_; }

private:
    void broadcastLoop(std::vector<uint8_t> beacon, std::chrono::seconds interval);
    void listenLoop();
    void setState(ActivityStatus& activity, ActivityState state, std::optional<Error> error = std::nullopt);

    DiscoveryOptions options_;
    std::string localAddress_;
    PeerTable peers_;

    SocketGuard broadcastSocket_;
    SocketGuard listenSocket_;

    std::atomic<bool> running_{false};
    std::mutex lifecycleMutex_;

    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;
    bool stopRequested_ = false;

    std::thread broadcastThread_;
    std::thread listenThread_;

    mutable std::mutex statusMutex_;
    DiscoveryStatus status_;
};

} // namespace PeerDrop
