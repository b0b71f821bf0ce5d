#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace PeerDrop {

struct PeerRecord {
    std::string address;
    std::string displayName;
    uint16_t servicePort = 0;
    std::chrono::steady_clock::time_point lastSeenAt;
};

/**
 * @brief Recently seen peers keyed by address
 *
 * Entries older than the TTL are invisible to snapshot() and are removed by
 * prune(); there is no background reaper. All access goes through one mutex.
 */
class PeerTable {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit PeerTable(std::chrono::seconds ttl, Clock clock = {});

    /// Insert or refresh a peer. Returns true if the address was not known.
    bool upsert(const std::string& address, const std::string& displayName, uint16_t servicePort);

    /// Non-stale peers, in no particular order
    std::vector<PeerRecord> snapshot() const;

    /// Drop stale entries, returns how many were removed
    size_t prune();

    size_t size() const;
    void clear();

    std::chrono::seconds ttl() const { return ttl_; }

private:
    bool isStale(const PeerRecord& record, std::chrono::steady_clock::time_point now) const;

    std::chrono::seconds ttl_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PeerRecord> peers_;
};

} // namespace PeerDrop
