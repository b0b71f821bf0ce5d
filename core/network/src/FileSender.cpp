#include "FileSender.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "TransferProtocol.h"
#include <algorithm>
#include <vector>

namespace PeerDrop {

FileSender::FileSender(TransferMode mode, TransferOptions options)
    : mode_(std::move(mode))
    , options_(options)
{
}

Result<void> FileSender::connect(const std::string& peerAddress, uint16_t port) {
    auto& logger = Logger::instance();

    cancelled_ = false;
    socket_.reset();

    logger.log(LogLevel::INFO, "Connecting to " + peerAddress + ":" + std::to_string(port), "FileSender");

    auto sock = SocketIO::connectTo(peerAddress, port, IoControl{options_.connectTimeout, &cancelled_});
    if (!sock) {
        logger.log(LogLevel::ERROR, sock.error().message, "FileSender");
        return sock.error();
    }

    socket_ = std::move(*sock);
    peer_ = peerAddress + ":" + std::to_string(port);
    logger.log(LogLevel::INFO, "Connected to " + peer_, "FileSender");
    return Ok();
}

void FileSender::cancel() {
    cancelled_ = true;
}

Result<void> FileSender::sendFile(const std::filesystem::path& path, const ProgressCallback& progress) {
    auto& logger = Logger::instance();
    auto& metrics = MetricsCollector::instance();

    auto result = transfer(path, progress);
    socket_.reset();

    if (result) {
        metrics.incrementTransfersCompleted();
        logger.log(LogLevel::INFO, "Sent " + path.filename().string() + " to " + peer_, "FileSender");
    } else {
        metrics.incrementTransfersFailed();
        logger.log(LogLevel::ERROR, "Transfer of " + path.string() + " failed: " + result.error().describe(),
                   "FileSender");
    }
    return result;
}

Result<void> FileSender::transfer(const std::filesystem::path& path, const ProgressCallback& progress) {
    if (!socket_) {
        return Err(ErrorCode::NetworkError, "Not connected");
    }
    if (options_.chunkSize == 0) {
        return Err(ErrorCode::ConfigurationError, "Chunk size must be positive");
    }
    if (auto* encrypted = std::get_if<EncryptedTransfer>(&mode_); encrypted && !encrypted->cipher) {
        return Err(ErrorCode::ConfigurationError, "Encrypted transfer requested without a key");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Err(ErrorCode::FileError, "File not found: " + path.string());
    }
    const uint64_t fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
        return Err(ErrorCode::FileError, "Cannot stat " + path.string() + ": " + ec.message());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err(ErrorCode::FileError, "Cannot open " + path.string());
    }

    TransferHeader header;
    header.fileName = path.filename().string();
    header.fileSize = fileSize;
    header.encrypted = isEncrypted(mode_);

    if (header.fileName.size() > config::MAX_FILENAME_LENGTH) {
        return Err(ErrorCode::FileError, "File name too long: " + header.fileName);
    }

    Logger::instance().log(LogLevel::INFO, "Sending " + header.fileName + " (" + std::to_string(fileSize) +
                           " bytes, " + (header.encrypted ? "encrypted" : "plain") + ")", "FileSender");

    const auto headerBytes = TransferProtocol::encodeHeader(header);
    if (auto r = SocketIO::sendAll(socket_.get(), headerBytes.data(), headerBytes.size(), ioControl()); !r) {
        return r;
    }

    return std::visit([&](const auto& mode) {
        return streamChunks(file, fileSize, mode, progress);
    }, mode_);
}

template <typename Mode>
Result<void> FileSender::streamChunks(std::ifstream& file, uint64_t fileSize, const Mode& mode,
                                      const ProgressCallback& progress) {
    auto& metrics = MetricsCollector::instance();

    std::vector<uint8_t> buffer(options_.chunkSize);
    uint64_t bytesSent = 0;

    while (bytesSent < fileSize) {
        if (cancelled_) {
            return Err(ErrorCode::Cancelled, "Transfer cancelled");
        }

        const size_t want = static_cast<size_t>(std::min<uint64_t>(options_.chunkSize, fileSize - bytesSent));
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
        if (static_cast<size_t>(file.gcount()) != want) {
            return Err(ErrorCode::FileError, "File shrank while reading (" + std::to_string(bytesSent +
                       static_cast<uint64_t>(file.gcount())) + " of " + std::to_string(fileSize) + " bytes)");
        }

        if (auto r = sendChunk(mode, buffer.data(), want); !r) {
            return r;
        }

        bytesSent += want;
        metrics.incrementChunksSent();
        metrics.addBytesUploaded(want);

        if (progress) {
            progress(progressPercent(bytesSent, fileSize));
        }
    }

    if (fileSize == 0 && progress) {
        progress(100);
    }
    return Ok();
}

Result<void> FileSender::sendChunk(const PlainTransfer&, const uint8_t* data, size_t size) {
    return SocketIO::sendAll(socket_.get(), data, size, ioControl());
}

Result<void> FileSender::sendChunk(const EncryptedTransfer& mode, const uint8_t* data, size_t size) {
    auto chunk = mode.cipher->encryptChunk(data, size);
    if (!chunk) {
        return chunk.error();
    }
    const auto frame = ChunkCipher::packFrame(*chunk);
    return SocketIO::sendAll(socket_.get(), frame.data(), frame.size(), ioControl());
}

} // namespace PeerDrop
