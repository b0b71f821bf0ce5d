#include "SocketIO.h"
#include "Constants.h"
#include <algorithm>
#include <cstring>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace PeerDrop {

namespace SocketIO {

namespace {

bool isCancelled(const IoControl& control) {
    return control.cancelled && control.cancelled->load();
}

Error systemError(const std::string& what) {
    return Error(ErrorCode::NetworkError, what + ": " + std::string(strerror(errno)));
}

bool setNonBlocking(int fd, bool enabled) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
}

} // namespace

Result<void> waitFor(int fd, short events, const IoControl& control) {
    using Clock = std::chrono::steady_clock;
    const bool bounded = control.timeout.count() > 0;
    const auto deadline = Clock::now() + control.timeout;

    while (true) {
        if (isCancelled(control)) {
            return Err(ErrorCode::Cancelled, "Operation cancelled");
        }

        int sliceMs = config::POLL_SLICE_MS;
        if (bounded) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
            if (left <= 0) {
                return Err(ErrorCode::Timeout,
                           "No activity for " + std::to_string(control.timeout.count()) + " ms");
            }
            sliceMs = static_cast<int>(std::min<long long>(sliceMs, left));
        }

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = events;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, sliceMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            return systemError("poll failed");
        }
        if (ready > 0) {
            // HUP/ERR are reported through the following read/write call
            return Ok();
        }
    }
}

Result<void> sendAll(int fd, const uint8_t* data, size_t size, const IoControl& control) {
    size_t sent = 0;
    while (sent < size) {
        if (auto ready = waitFor(fd, POLLOUT, control); !ready) {
            return ready;
        }
        ssize_t n = send(fd, data + sent, size - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return systemError("send failed");
        }
        sent += static_cast<size_t>(n);
    }
    return Ok();
}

Result<void> recvExact(int fd, uint8_t* data, size_t size, const IoControl& control) {
    size_t received = 0;
    while (received < size) {
        auto got = recvSome(fd, data + received, size - received, control);
        if (!got) {
            if (got.error().code == ErrorCode::ConnectionClosed) {
                return Err(ErrorCode::ConnectionClosed,
                           "Connection closed after " + std::to_string(received) + " of " +
                           std::to_string(size) + " bytes");
            }
            return got.error();
        }
        received += *got;
    }
    return Ok();
}

Result<size_t> recvSome(int fd, uint8_t* data, size_t maxSize, const IoControl& control) {
    while (true) {
        if (auto ready = waitFor(fd, POLLIN, control); !ready) {
            return ready.error();
        }
        ssize_t n = recv(fd, data, maxSize, 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return systemError("recv failed");
        }
        if (n == 0) {
            return Err<size_t>(ErrorCode::ConnectionClosed, "Connection closed by peer");
        }
        return Ok(static_cast<size_t>(n));
    }
}

Result<SocketGuard> connectTo(const std::string& address, uint16_t port, const IoControl& control) {
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        return Err<SocketGuard>(ErrorCode::NetworkError, "Invalid peer address: " + address);
    }

    SocketGuard sock(socket(AF_INET, SOCK_STREAM, 0));
    if (!sock) {
        return systemError("Failed to create socket");
    }
    if (!setNonBlocking(sock.get(), true)) {
        return systemError("Failed to make socket non-blocking");
    }

    if (connect(sock.get(), (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        if (errno != EINPROGRESS) {
            return systemError("Failed to connect to " + address + ":" + std::to_string(port));
        }

        auto ready = waitFor(sock.get(), POLLOUT, control);
        if (!ready) {
            if (ready.error().code == ErrorCode::Timeout) {
                return Err<SocketGuard>(ErrorCode::Timeout,
                                        "Connect to " + address + ":" + std::to_string(port) + " timed out");
            }
            return ready.error();
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len) < 0) {
            return systemError("getsockopt failed");
        }
        if (soError != 0) {
            return Err<SocketGuard>(ErrorCode::NetworkError,
                                    "Failed to connect to " + address + ":" + std::to_string(port) +
                                    ": " + std::string(strerror(soError)));
        }
    }

    if (!setNonBlocking(sock.get(), false)) {
        return systemError("Failed to restore blocking mode");
    }
    return Ok(std::move(sock));
}

std::string peerAddress(int fd) {
    struct sockaddr_in addr;
    socklen_t len = sizeof(addr);
    if (getpeername(fd, (struct sockaddr*)&addr, &len) < 0) {
        return "";
    }
    char buffer[INET_ADDRSTRLEN];
    if (!inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer))) {
        return "";
    }
    return buffer;
}

} // namespace SocketIO

} // namespace PeerDrop
