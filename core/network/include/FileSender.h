#pragma once

#include "Constants.h"
#include "Result.h"
#include "SocketGuard.h"
#include "SocketIO.h"
#include "TransferInterfaces.h"
#include "TransferMode.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace PeerDrop {

struct TransferOptions {
    size_t chunkSize = config::DEFAULT_CHUNK_SIZE;
    std::chrono::milliseconds connectTimeout{config::DEFAULT_CONNECT_TIMEOUT_MS};
    std::chrono::milliseconds ioTimeout{config::DEFAULT_IO_TIMEOUT_MS};
};

/**
 * @brief Pushes one file to a listening FileReceiver
 *
 * Usage:
 * @code
 * FileSender sender(PlainTransfer{});
 * if (auto r = sender.connect("192.168.1.20", 65432); !r) { ... }
 * auto sent = sender.sendFile("photo.jpg", [](int pct) { ... });
 * @endcode
 *
 * The connection is closed when sendFile() returns, whatever the outcome.
 */
class FileSender {
public:
    explicit FileSender(TransferMode mode, TransferOptions options = {});
    ~FileSender() = default;

    FileSender(const FileSender&) = delete;
    FileSender& operator=(const FileSender&) = delete;

    /**
     * @brief Open the TCP connection
     * @return NetworkError on refused/unreachable/invalid address, Timeout on a slow peer
     */
    Result<void> connect(const std::string& peerAddress, uint16_t port = config::DEFAULT_SERVICE_PORT);

    /**
     * @brief Send the header and every chunk of the file
     * @param path File to send; only its base name goes on the wire
     * @param progress Called after each chunk
     */
    Result<void> sendFile(const std::filesystem::path& path, const ProgressCallback& progress = {});

    /// Abort a transfer in progress; observed between chunks and inside socket waits
    void cancel();

    bool isConnected() const { return socket_.valid(); }

private:
    Result<void> transfer(const std::filesystem::path& path, const ProgressCallback& progress);

    template <typename Mode>
    Result<void> streamChunks(std::ifstream& file, uint64_t fileSize, const Mode& mode,
                              const ProgressCallback& progress);

    Result<void> sendChunk(const PlainTransfer& mode, const uint8_t* data, size_t size);
    Result<void> sendChunk(const EncryptedTransfer& mode, const uint8_t* data, size_t size);

    IoControl ioControl() const { return IoControl{options_.ioTimeout, &cancelled_}; }

    TransferMode mode_;
    TransferOptions options_;
    SocketGuard socket_;
    std::string peer_;
    std::atomic<bool> cancelled_{false};
};

} // namespace PeerDrop
