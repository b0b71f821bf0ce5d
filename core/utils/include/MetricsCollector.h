#pragma once

#include <string>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace PeerDrop {

    // Snapshot structs for returning metrics (non-atomic)
    struct DiscoveryMetricsSnapshot {
        uint64_t beaconsSent{0};
        uint64_t beaconsReceived{0};
        uint64_t beaconsDropped{0};
        uint64_t peersDiscovered{0};
    };

    struct TransferMetricsSnapshot {
        uint64_t bytesUploaded{0};
        uint64_t bytesDownloaded{0};
        uint64_t chunksSent{0};
        uint64_t chunksReceived{0};
        uint64_t transfersCompleted{0};
        uint64_t transfersFailed{0};
    };

    struct SecurityMetricsSnapshot {
        uint64_t authFailures{0};
        uint64_t encryptionErrors{0};
        uint64_t rejectedFileNames{0};
    };

    // Internal structs with atomics
    struct DiscoveryMetrics {
        std::atomic<uint64_t> beaconsSent{0};
        std::atomic<uint64_t> beaconsReceived{0};
        std::atomic<uint64_t> beaconsDropped{0};
        std::atomic<uint64_t> peersDiscovered{0};
    };

    struct TransferMetrics {
        std::atomic<uint64_t> bytesUploaded{0};
        std::atomic<uint64_t> bytesDownloaded{0};
        std::atomic<uint64_t> chunksSent{0};
        std::atomic<uint64_t> chunksReceived{0};
        std::atomic<uint64_t> transfersCompleted{0};
        std::atomic<uint64_t> transfersFailed{0};
    };

    struct SecurityMetrics {
        std::atomic<uint64_t> authFailures{0};
        std::atomic<uint64_t> encryptionErrors{0};
        std::atomic<uint64_t> rejectedFileNames{0};
    };

    class MetricsCollector {
    public:
        static MetricsCollector& instance();

        // Discovery metrics
        void incrementBeaconsSent();
        void incrementBeaconsReceived();
        void incrementBeaconsDropped();
        void incrementPeersDiscovered();

        // Transfer metrics
        void addBytesUploaded(uint64_t bytes);
        void addBytesDownloaded(uint64_t bytes);
        void incrementChunksSent();
        void incrementChunksReceived();
        void incrementTransfersCompleted();
        void incrementTransfersFailed();

        // Security metrics
        void incrementAuthFailures();
        void incrementEncryptionErrors();
        void incrementRejectedFileNames();

        // Get current metrics (returns snapshots)
        DiscoveryMetricsSnapshot getDiscoveryMetrics() const;
        TransferMetricsSnapshot getTransferMetrics() const;
        SecurityMetricsSnapshot getSecurityMetrics() const;

        // Get formatted metrics string
        std::string getMetricsSummary() const;

        // Reset all metrics
        void reset();

        // Get uptime
        std::chrono::seconds getUptime() const;

    private:
        MetricsCollector();
        ~MetricsCollector() = default;

        DiscoveryMetrics discoveryMetrics_;
        TransferMetrics transferMetrics_;
        SecurityMetrics securityMetrics_;

        std::chrono::system_clock::time_point startTime_;
    };

} // namespace PeerDrop
