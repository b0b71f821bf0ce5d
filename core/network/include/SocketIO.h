#pragma once

#include "Result.h"
#include "SocketGuard.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace PeerDrop {

/**
 * @brief Deadline and cancellation applied to every blocking socket wait
 *
 * The timeout bounds each individual wait for readiness, so a slow but
 * steady transfer never times out. Waits are sliced so the cancel flag is
 * seen within config::POLL_SLICE_MS.
 */
struct IoControl {
    std::chrono::milliseconds timeout{0};           // 0 = wait forever
    const std::atomic<bool>* cancelled = nullptr;   // optional
};

namespace SocketIO {

    /// Wait until fd reports any of events (POLLIN/POLLOUT). Timeout/Cancelled/NetworkError.
    Result<void> waitFor(int fd, short events, const IoControl& control);

    /// Write every byte or fail
    Result<void> sendAll(int fd, const uint8_t* data, size_t size, const IoControl& control);

    /// Read exactly size bytes; EOF before that is ConnectionClosed
    Result<void> recvExact(int fd, uint8_t* data, size_t size, const IoControl& control);

    /// Read between 1 and maxSize bytes; EOF is ConnectionClosed
    Result<size_t> recvSome(int fd, uint8_t* data, size_t maxSize, const IoControl& control);

    /// TCP connect to an IPv4 address. NetworkError for bad address/refused, Timeout when slow.
    Result<SocketGuard> connectTo(const std::string& address, uint16_t port, const IoControl& control);

    /// Dotted-quad form of the remote end of a connected socket
    std::string peerAddress(int fd);

} // namespace SocketIO

} // namespace PeerDrop
