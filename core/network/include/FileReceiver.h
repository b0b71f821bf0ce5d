#pragma once

#include "ChunkCipher.h"
#include "Constants.h"
#include "Result.h"
#include "SocketGuard.h"
#include "SocketIO.h"
#include "TransferInterfaces.h"
#include "TransferMode.h"
#include "TransferProtocol.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace PeerDrop {

struct ReceiverOptions {
    uint16_t port = config::DEFAULT_SERVICE_PORT;               // 0 = ephemeral, see boundPort()
    std::filesystem::path saveDirectory = config::DEFAULT_SAVE_DIRECTORY;
    size_t bufferSize = config::RECEIVE_BUFFER_SIZE;
    std::chrono::milliseconds ioTimeout{config::DEFAULT_IO_TIMEOUT_MS};
    bool keepPartialOnFailure = false;
};

/**
 * @brief Accepts one sender and writes the file it pushes
 *
 * Data lands in a hidden ".<name>.part" file beside the destination and is
 * renamed into place only after the last byte is written, so a failed
 * transfer never leaves a truncated file under the real name. Long names
 * are shortened in the temporary so it stays within NAME_MAX.
 */
class FileReceiver {
public:
    /**
     * @param options Listening and storage settings
     * @param cipher Needed only for encrypted transfers; plain ones are accepted either way
     */
    explicit FileReceiver(ReceiverOptions options, std::shared_ptr<const ChunkCipher> cipher = nullptr);
    ~FileReceiver();

    FileReceiver(const FileReceiver&) = delete;
    FileReceiver& operator=(const FileReceiver&) = delete;

    /// Create the save directory, bind and listen (backlog 1)
    Result<void> start();

    /// Actual listening port, useful when options.port was 0
    uint16_t boundPort() const { return boundPort_; }

    /// Blocks until a sender connects; returns its address
    Result<std::string> acceptConnection();

    /**
     * @brief Read the header and the whole body from the accepted connection
     * @return Final path of the written file
     *
     * Both the connection and the listening socket are closed on return.
     */
    Result<std::filesystem::path> receiveFile(const ProgressCallback& progress = {});

    /// Abort acceptConnection()/receiveFile() from another thread
    void cancel();

    /// Where the partial data of the last failed transfer was kept (keepPartialOnFailure only)
    const std::optional<std::filesystem::path>& lastPartialPath() const { return lastPartialPath_; }

private:
    Result<std::filesystem::path> receive(const ProgressCallback& progress);

    template <typename Mode>
    Result<void> receiveChunks(std::ofstream& out, uint64_t fileSize, const Mode& mode,
                               const ProgressCallback& progress);

    /// Reads and writes one chunk, returns the plaintext byte count
    Result<size_t> receiveChunk(const PlainTransfer& mode, std::ofstream& out, uint64_t remaining);
    Result<size_t> receiveChunk(const EncryptedTransfer& mode, std::ofstream& out, uint64_t remaining);

    IoControl ioControl() const { return IoControl{options_.ioTimeout, &cancelled_}; }

    ReceiverOptions options_;
    std::shared_ptr<const ChunkCipher> cipher_;

    SocketGuard listenSocket_;
    SocketGuard connection_;
    uint16_t boundPort_ = 0;
    std::string peer_;

    std::vector<uint8_t> buffer_;
    std::optional<std::filesystem::path> lastPartialPath_;
    std::atomic<bool> cancelled_{false};
};

} // namespace PeerDrop
