#pragma once

#include <string>

namespace PeerDrop {

/**
 * @brief IPv4 address of the interface used for outbound traffic
 *
 * Connects a throwaway UDP socket toward a public address (no packet is
 * sent) and reads back the bound source address. Falls back to 127.0.0.1.
 */
std::string resolveOutboundAddress();

} // namespace PeerDrop
