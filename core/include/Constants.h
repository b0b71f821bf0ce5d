#pragma once

/**
 * @file Constants.h
 * @brief Centralized configuration constants for PeerDrop
 *
 * All magic numbers and default configuration values live here so the
 * discovery, transfer and CLI layers agree on them.
 */

#include <cstddef>
#include <cstdint>

namespace PeerDrop::config {

// =============================================================================
// Network Configuration
// =============================================================================

/// Default TCP port the receiver listens on
constexpr int DEFAULT_SERVICE_PORT = 65432;

/// Default UDP port for presence beacons
constexpr int DEFAULT_DISCOVERY_PORT = 65433;

/// Receiver accepts exactly one pending connection
constexpr int RECEIVER_BACKLOG = 1;

/// Broadcast target for beacons
constexpr const char* DEFAULT_BROADCAST_ADDRESS = "255.255.255.255";

/// Address used to find the outbound-facing interface (nothing is sent to it)
constexpr const char* OUTBOUND_PROBE_ADDRESS = "8.8.8.8";
constexpr int OUTBOUND_PROBE_PORT = 80;

/// Reported when the outbound interface cannot be determined
constexpr const char* LOOPBACK_ADDRESS = "127.0.0.1";

// =============================================================================
// Discovery Configuration
// =============================================================================

/// Seconds between presence broadcasts
constexpr int DEFAULT_BROADCAST_INTERVAL_SEC = 5;

/// Peers not heard from for this long are dropped from listPeers()
constexpr int DEFAULT_PEER_TTL_SEC = 30;

/// How long the CLI waits for peers before giving up
constexpr int DEFAULT_PEER_WAIT_SEC = 25;

/// Largest datagram the listener reads
constexpr std::size_t MAX_BEACON_SIZE = 1024;

/// Longest display name carried in a beacon (bytes of UTF-8)
constexpr std::size_t MAX_DISPLAY_NAME_LENGTH = 255;

// =============================================================================
// Transfer Configuration
// =============================================================================

/// Plaintext bytes per chunk on the sender side
constexpr std::size_t DEFAULT_CHUNK_SIZE = 4096;

/// Read buffer for unframed (plain) transfers
constexpr std::size_t RECEIVE_BUFFER_SIZE = 4096;

/// Upper bound for a single ciphertext field accepted from the wire
constexpr std::size_t MAX_FRAME_PAYLOAD = 16 * 1024 * 1024;  // 16MB

/// Longest file name accepted from the wire (bytes of UTF-8)
constexpr std::size_t MAX_FILENAME_LENGTH = 255;

/// Default directory for received files
constexpr const char* DEFAULT_SAVE_DIRECTORY = "received_files";

// =============================================================================
// Timeout Configuration
// =============================================================================

/// Connect deadline (milliseconds, 0 = wait forever)
constexpr int DEFAULT_CONNECT_TIMEOUT_MS = 10000;

/// Per-operation socket read/write deadline (milliseconds, 0 = wait forever)
constexpr int DEFAULT_IO_TIMEOUT_MS = 30000;

/// Granularity at which blocking waits re-check cancellation
constexpr int POLL_SLICE_MS = 200;

// =============================================================================
// Logging
// =============================================================================

/// Maximum log file size before rotation (MB)
constexpr std::size_t MAX_LOG_FILE_SIZE_MB = 100;

// =============================================================================
// Configuration
// =============================================================================

/// Machine-wide defaults, read before the per-user file
constexpr const char* SYSTEM_CONFIG_FILE = "/etc/peerdrop/peerdrop.conf";

} // namespace PeerDrop::config
