#pragma once

#include "PeerTable.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace PeerDrop {

/// Called after every chunk with the integer percentage done (0-100)
using ProgressCallback = std::function<void(int percent)>;

/**
 * @brief Chooses the transfer target among the peers discovery found
 */
class IPeerSelector {
public:
    virtual ~IPeerSelector() = default;

    /// std::nullopt means the user declined to pick one
    virtual std::optional<PeerRecord> selectPeer(const std::vector<PeerRecord>& peers) = 0;
};

/**
 * @brief Supplies the shared symmetric key, if the user has one
 */
class IKeyProvider {
public:
    virtual ~IKeyProvider() = default;

    virtual std::optional<std::vector<uint8_t>> key() = 0;
};

/// bytesDone * 100 / total, clamped to [0, 100]; an empty total counts as done
inline int progressPercent(uint64_t bytesDone, uint64_t total) {
    if (total == 0) return 100;
    uint64_t percent = (bytesDone >= total) ? 100 : (bytesDone * 100) / total;
    return static_cast<int>(percent > 100 ? 100 : percent);
}

} // namespace PeerDrop
