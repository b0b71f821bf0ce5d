#include "DiscoverySession.h"
#include "DiscoveryBeacon.h"
#include "LocalAddress.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include <cstring>
#include <cerrno>
#include <poll.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace PeerDrop {

const char* activityStateToString(ActivityState state) {
    switch (state) {
        case ActivityState::Idle: return "idle";
        case ActivityState::Running: return "running";
        case ActivityState::Stopped: return "stopped";
        case ActivityState::Failed: return "failed";
    }
    return "unknown";
}

DiscoverySession::DiscoverySession(DiscoveryOptions options, PeerTable::Clock clock)
    : options_(std::move(options))
    , localAddress_(options_.localAddress ? *options_.localAddress : resolveOutboundAddress())
    , peers_(options_.peerTtl, std::move(clock))
{
}

DiscoverySession::~DiscoverySession() {
    stop();
}

Result<void> DiscoverySession::start(std::chrono::seconds broadcastInterval) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    auto& logger = Logger::instance();

    if (running_) {
        return Err(ErrorCode::ConfigurationError, "Discovery session already running");
    }
    if (broadcastInterval.count() <= 0) {
        return Err(ErrorCode::ConfigurationError,
                   "Broadcast interval must be positive, got " + std::to_string(broadcastInterval.count()));
    }

    DiscoveryBeacon beacon{options_.displayName, options_.servicePort};
    auto encoded = beacon.encode();
    if (!encoded) {
        return Err(ErrorCode::ConfigurationError, "Cannot announce this device: " + encoded.error().message);
    }

    struct sockaddr_in target;
    memset(&target, 0, sizeof(target));
    if (inet_pton(AF_INET, options_.broadcastAddress.c_str(), &target.sin_addr) != 1) {
        return Err(ErrorCode::ConfigurationError, "Invalid broadcast address: " + options_.broadcastAddress);
    }

    auto fail = [&](ActivityStatus& activity, const std::string& what) -> Result<void> {
        Error error(ErrorCode::NetworkError, what + ": " + std::string(strerror(errno)));
        logger.log(LogLevel::ERROR, error.message, "Discovery");
        setState(activity, ActivityState::Failed, error);
        broadcastSocket_.reset();
        listenSocket_.reset();
        return error;
    };

    // Broadcaster socket
    SocketGuard broadcastSock(socket(AF_INET, SOCK_DGRAM, 0));
    if (!broadcastSock) {
        return fail(status_.broadcaster, "Failed to create broadcast socket");
    }

    int broadcast = 1;
    if (setsockopt(broadcastSock.get(), SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast)) < 0) {
        return fail(status_.broadcaster, "Failed to set broadcast option");
    }

    // Listener socket
    SocketGuard listenSock(socket(AF_INET, SOCK_DGRAM, 0));
    if (!listenSock) {
        return fail(status_.listener, "Failed to create discovery socket");
    }

    int reuse = 1;
    if (setsockopt(listenSock.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        logger.log(LogLevel::WARN, "Failed to set reuse addr option: " + std::string(strerror(errno)), "Discovery");
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(options_.discoveryPort);
    addr.sin_addr.s_addr = INADDR_ANY;

    if (bind(listenSock.get(), (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        return fail(status_.listener,
                    "Failed to bind discovery socket to port " + std::to_string(options_.discoveryPort));
    }

    broadcastSocket_ = std::move(broadcastSock);
    listenSocket_ = std::move(listenSock);

    {
        std::lock_guard<std::mutex> wakeLock(wakeMutex_);
        stopRequested_ = false;
    }
    {
        std::lock_guard<std::mutex> statusLock(statusMutex_);
        status_.broadcaster = ActivityStatus{ActivityState::Running, std::nullopt};
        status_.listener = ActivityStatus{ActivityState::Running, std::nullopt};
    }

    running_ = true;
    broadcastThread_ = std::thread(&DiscoverySession::broadcastLoop, this, std::move(*encoded), broadcastInterval);
    listenThread_ = std::thread(&DiscoverySession::listenLoop, this);

    logger.log(LogLevel::INFO, "Discovery started on port " + std::to_string(options_.discoveryPort) +
               " as '" + options_.displayName + "' (local address " + localAddress_ + ")", "Discovery");
    return Ok();
}

void DiscoverySession::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!running_) return;

    auto& logger = Logger::instance();
    logger.log(LogLevel::INFO, "Stopping discovery", "Discovery");

    running_ = false;
    {
        std::lock_guard<std::mutex> wakeLock(wakeMutex_);
        stopRequested_ = true;
    }
    wakeCv_.notify_all();

    // Unblocks a pending recvfrom
    listenSocket_.shutdown();
    broadcastSocket_.shutdown();

    if (broadcastThread_.joinable()) {
        broadcastThread_.join();
    }
    if (listenThread_.joinable()) {
        listenThread_.join();
    }

    broadcastSocket_.reset();
    listenSocket_.reset();

    {
        std::lock_guard<std::mutex> statusLock(statusMutex_);
        for (ActivityStatus* activity : {&status_.broadcaster, &status_.listener}) {
            if (activity->state == ActivityState::Running) {
                activity->state = ActivityState::Stopped;
            }
        }
    }

    logger.log(LogLevel::INFO, "Discovery stopped", "Discovery");
}

std::vector<PeerRecord> DiscoverySession::listPeers() {
    size_t removed = peers_.prune();
    if (removed > 0) {
        Logger::instance().log(LogLevel::DEBUG, "Pruned " + std::to_string(removed) + " stale peers", "Discovery");
    }
    return peers_.snapshot();
}

DiscoveryStatus DiscoverySession::status() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return status_;
}

bool DiscoverySession::ingestBeacon(const uint8_t* data, size_t size, const std::string& senderAddress) {
    auto& logger = Logger::instance();
    auto& metrics = MetricsCollector::instance();

    metrics.incrementBeaconsReceived();

    auto beacon = DiscoveryBeacon::decode(data, size);
    if (!beacon) {
        metrics.incrementBeaconsDropped();
        logger.log(LogLevel::DEBUG, "Dropped beacon from " + senderAddress + ": " + beacon.error().message, "Discovery");
        return false;
    }

    if (senderAddress == localAddress_) {
        return false;
    }

    bool isNew = peers_.upsert(senderAddress, beacon->displayName, beacon->servicePort);
    if (isNew) {
        metrics.incrementPeersDiscovered();
        logger.log(LogLevel::INFO, "Discovered peer '" + beacon->displayName + "' at " + senderAddress +
                   ":" + std::to_string(beacon->servicePort), "Discovery");
    }
    return true;
}

bool DiscoverySession::ingestBeacon(const std::vector<uint8_t>& payload, const std::string& senderAddress) {
    return ingestBeacon(payload.data(), payload.size(), senderAddress);
}

void DiscoverySession::broadcastLoop(std::vector<uint8_t> beacon, std::chrono::seconds interval) {
    auto& logger = Logger::instance();
    auto& metrics = MetricsCollector::instance();

    struct sockaddr_in target;
    memset(&target, 0, sizeof(target));
    target.sin_family = AF_INET;
    target.sin_port = htons(options_.discoveryPort);
    inet_pton(AF_INET, options_.broadcastAddress.c_str(), &target.sin_addr);  // validated in start()

    logger.log(LogLevel::DEBUG, "Broadcaster started, interval " + std::to_string(interval.count()) + "s", "Discovery");

    while (running_) {
        ssize_t sent = sendto(broadcastSocket_.get(), beacon.data(), beacon.size(), 0,
                              (struct sockaddr*)&target, sizeof(target));
        if (sent < 0) {
            if (!running_) break;
            Error error(ErrorCode::NetworkError, "Failed to broadcast presence: " + std::string(strerror(errno)));
            logger.log(LogLevel::ERROR, error.message, "Discovery");
            setState(status_.broadcaster, ActivityState::Failed, error);
            return;
        }
        metrics.incrementBeaconsSent();

        std::unique_lock<std::mutex> lock(wakeMutex_);
        if (wakeCv_.wait_for(lock, interval, [this] { return stopRequested_; })) {
            break;
        }
    }

    logger.log(LogLevel::DEBUG, "Broadcaster ended", "Discovery");
}

void DiscoverySession::listenLoop() {
    auto& logger = Logger::instance();

    logger.log(LogLevel::DEBUG, "Listener started", "Discovery");

    uint8_t buffer[config::MAX_BEACON_SIZE];
    const int fd = listenSocket_.get();

    while (running_) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, config::POLL_SLICE_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            if (!running_) break;
            Error error(ErrorCode::NetworkError, "Discovery poll failed: " + std::string(strerror(errno)));
            logger.log(LogLevel::ERROR, error.message, "Discovery");
            setState(status_.listener, ActivityState::Failed, error);
            return;
        }
        if (ready == 0) continue;

        struct sockaddr_in senderAddr;
        socklen_t senderLen = sizeof(senderAddr);
        ssize_t len = recvfrom(fd, buffer, sizeof(buffer), 0, (struct sockaddr*)&senderAddr, &senderLen);

        if (!running_) break;

        if (len < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            Error error(ErrorCode::NetworkError, "Error receiving beacon: " + std::string(strerror(errno)));
            logger.log(LogLevel::ERROR, error.message, "Discovery");
            setState(status_.listener, ActivityState::Failed, error);
            return;
        }

        char senderIpBuf[INET_ADDRSTRLEN];
        if (!inet_ntop(AF_INET, &senderAddr.sin_addr, senderIpBuf, INET_ADDRSTRLEN)) {
            continue;
        }

        ingestBeacon(buffer, static_cast<size_t>(len), senderIpBuf);
    }

    logger.log(LogLevel::DEBUG, "Listener ended", "Discovery");
}

void DiscoverySession::setState(ActivityStatus& activity, ActivityState state, std::optional<Error> error) {
    std::lock_guard<std::mutex> lock(statusMutex_);
    activity.state = state;
    if (error) {
        activity.lastError = std::move(error);
    }
}

} // namespace PeerDrop
