#include "LocalAddress.h"
#include "Constants.h"
#include "Logger.h"
#include "SocketGuard.h"
#include <cstring>
#include <cerrno>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace PeerDrop {

std::string resolveOutboundAddress() {
    auto& logger = Logger::instance();

    SocketGuard sock(socket(AF_INET, SOCK_DGRAM, 0));
    if (!sock) {
        logger.log(LogLevel::WARN, "Failed to create probe socket: " + std::string(strerror(errno)), "Discovery");
        return config::LOOPBACK_ADDRESS;
    }

    struct sockaddr_in probe;
    memset(&probe, 0, sizeof(probe));
    probe.sin_family = AF_INET;
    probe.sin_port = htons(config::OUTBOUND_PROBE_PORT);
    inet_pton(AF_INET, config::OUTBOUND_PROBE_ADDRESS, &probe.sin_addr);

    if (connect(sock.get(), (struct sockaddr*)&probe, sizeof(probe)) < 0) {
        logger.log(LogLevel::DEBUG, "No outbound route, using loopback: " + std::string(strerror(errno)), "Discovery");
        return config::LOOPBACK_ADDRESS;
    }

    struct sockaddr_in local;
    socklen_t localLen = sizeof(local);
    if (getsockname(sock.get(), (struct sockaddr*)&local, &localLen) < 0) {
        logger.log(LogLevel::DEBUG, "getsockname failed, using loopback: " + std::string(strerror(errno)), "Discovery");
        return config::LOOPBACK_ADDRESS;
    }

    char buffer[INET_ADDRSTRLEN];
    if (!inet_ntop(AF_INET, &local.sin_addr, buffer, sizeof(buffer))) {
        return config::LOOPBACK_ADDRESS;
    }
    return buffer;
}

} // namespace PeerDrop
