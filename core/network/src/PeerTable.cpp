#include "PeerTable.h"

namespace PeerDrop {

PeerTable::PeerTable(std::chrono::seconds ttl, Clock clock)
    : ttl_(ttl)
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); }))
{
}

bool PeerTable::upsert(const std::string& address, const std::string& displayName, uint16_t servicePort) {
    const auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = peers_.find(address);
    // A stale entry counts as new: the peer went away and came back
    bool isNew = (it == peers_.end()) || isStale(it->second, now);

    PeerRecord& record = peers_[address];
    record.address = address;
    record.displayName = displayName;
    record.servicePort = servicePort;
    record.lastSeenAt = now;
    return isNew;
}

std::vector<PeerRecord> PeerTable::snapshot() const {
    const auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<PeerRecord> result;
    result.reserve(peers_.size());
    for (const auto& [address, record] : peers_) {
        if (!isStale(record, now)) {
            result.push_back(record);
        }
    }
    return result;
}

size_t PeerTable::prune() {
    const auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = peers_.begin(); it != peers_.end();) {
        if (isStale(it->second, now)) {
            it = peers_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t PeerTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
}

void PeerTable::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    peers_.clear();
}

bool PeerTable::isStale(const PeerRecord& record, std::chrono::steady_clock::time_point now) const {
    return now - record.lastSeenAt > ttl_;
}

} // namespace PeerDrop
