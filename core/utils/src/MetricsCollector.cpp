#include "MetricsCollector.h"
#include <sstream>
#include <iomanip>

namespace PeerDrop {

    MetricsCollector::MetricsCollector()
        : startTime_(std::chrono::system_clock::now()) {
    }

    MetricsCollector& MetricsCollector::instance() {
        static MetricsCollector instance;
        return instance;
    }

    // Discovery metrics
    void MetricsCollector::incrementBeaconsSent() { discoveryMetrics_.beaconsSent++; }
    void MetricsCollector::incrementBeaconsReceived() { discoveryMetrics_.beaconsReceived++; }
    void MetricsCollector::incrementBeaconsDropped() { discoveryMetrics_.beaconsDropped++; }
    void MetricsCollector::incrementPeersDiscovered() { discoveryMetrics_.peersDiscovered++; }

    // Transfer metrics
    void MetricsCollector::addBytesUploaded(uint64_t bytes) {
        transferMetrics_.bytesUploaded += bytes;
    }

    void MetricsCollector::addBytesDownloaded(uint64_t bytes) {
        transferMetrics_.bytesDownloaded += bytes;
    }

    void MetricsCollector::incrementChunksSent() { transferMetrics_.chunksSent++; }
    void MetricsCollector::incrementChunksReceived() { transferMetrics_.chunksReceived++; }
    void MetricsCollector::incrementTransfersCompleted() { transferMetrics_.transfersCompleted++; }
    void MetricsCollector::incrementTransfersFailed() { transferMetrics_.transfersFailed++; }

    // Security metrics
    void MetricsCollector::incrementAuthFailures() { securityMetrics_.authFailures++; }
    void MetricsCollector::incrementEncryptionErrors() { securityMetrics_.encryptionErrors++; }
    void MetricsCollector::incrementRejectedFileNames() { securityMetrics_.rejectedFileNames++; }

    DiscoveryMetricsSnapshot MetricsCollector::getDiscoveryMetrics() const {
        DiscoveryMetricsSnapshot snapshot;
        snapshot.beaconsSent = discoveryMetrics_.beaconsSent.load();
        snapshot.beaconsReceived = discoveryMetrics_.beaconsReceived.load();
        snapshot.beaconsDropped = discoveryMetrics_.beaconsDropped.load();
        snapshot.peersDiscovered = discoveryMetrics_.peersDiscovered.load();
        return snapshot;
    }

    TransferMetricsSnapshot MetricsCollector::getTransferMetrics() const {
        TransferMetricsSnapshot snapshot;
        snapshot.bytesUploaded = transferMetrics_.bytesUploaded.load();
        snapshot.bytesDownloaded = transferMetrics_.bytesDownloaded.load();
        snapshot.chunksSent = transferMetrics_.chunksSent.load();
        snapshot.chunksReceived = transferMetrics_.chunksReceived.load();
        snapshot.transfersCompleted = transferMetrics_.transfersCompleted.load();
        snapshot.transfersFailed = transferMetrics_.transfersFailed.load();
        return snapshot;
    }

    SecurityMetricsSnapshot MetricsCollector::getSecurityMetrics() const {
        SecurityMetricsSnapshot snapshot;
        snapshot.authFailures = securityMetrics_.authFailures.load();
        snapshot.encryptionErrors = securityMetrics_.encryptionErrors.load();
        snapshot.rejectedFileNames = securityMetrics_.rejectedFileNames.load();
        return snapshot;
    }

    std::string MetricsCollector::getMetricsSummary() const {
        auto discovery = getDiscoveryMetrics();
        auto transfer = getTransferMetrics();
        auto security = getSecurityMetrics();

        std::ostringstream oss;
        oss << "=== PeerDrop Metrics ===" << std::endl;
        oss << "Uptime: " << getUptime().count() << "s" << std::endl;
        oss << std::endl;

        oss << "--- Discovery ---" << std::endl;
        oss << "Beacons Sent: " << discovery.beaconsSent << std::endl;
        oss << "Beacons Received: " << discovery.beaconsReceived << std::endl;
        oss << "Beacons Dropped: " << discovery.beaconsDropped << std::endl;
        oss << "Peers Discovered: " << discovery.peersDiscovered << std::endl;
        oss << std::endl;

        oss << "--- Transfer ---" << std::endl;
        oss << "Uploaded: " << std::fixed << std::setprecision(2)
            << (transfer.bytesUploaded / 1024.0) << " KB" << std::endl;
        oss << "Downloaded: " << std::fixed << std::setprecision(2)
            << (transfer.bytesDownloaded / 1024.0) << " KB" << std::endl;
        oss << "Chunks Sent/Received: " << transfer.chunksSent << "/" << transfer.chunksReceived << std::endl;
        oss << "Transfers Completed: " << transfer.transfersCompleted << std::endl;
        oss << "Transfers Failed: " << transfer.transfersFailed << std::endl;
        oss << std::endl;

        oss << "--- Security ---" << std::endl;
        oss << "Auth Failures: " << security.authFailures << std::endl;
        oss << "Encryption Errors: " << security.encryptionErrors << std::endl;
        oss << "Rejected File Names: " << security.rejectedFileNames << std::endl;

        return oss.str();
    }

    void MetricsCollector::reset() {
        discoveryMetrics_.beaconsSent = 0;
        discoveryMetrics_.beaconsReceived = 0;
        discoveryMetrics_.beaconsDropped = 0;
        discoveryMetrics_.peersDiscovered = 0;

        transferMetrics_.bytesUploaded = 0;
        transferMetrics_.bytesDownloaded = 0;
        transferMetrics_.chunksSent = 0;
        transferMetrics_.chunksReceived = 0;
        transferMetrics_.transfersCompleted = 0;
        transferMetrics_.transfersFailed = 0;

        securityMetrics_.authFailures = 0;
        securityMetrics_.encryptionErrors = 0;
        securityMetrics_.rejectedFileNames = 0;

        startTime_ = std::chrono::system_clock::now();
    }

    std::chrono::seconds MetricsCollector::getUptime() const {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::seconds>(now - startTime_);
    }

} // namespace PeerDrop
