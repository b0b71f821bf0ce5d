#include "FileReceiver.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "PathValidator.h"
#include <algorithm>
#include <cstring>
#include <cerrno>
#include <poll.h>
#include <sys/socket.h>
#include <netinet/in.h>

namespace PeerDrop {

namespace {

constexpr const char* PART_PREFIX = ".";
constexpr const char* PART_SUFFIX = ".part";

// ".<name>.part", with the name cut back on a UTF-8 boundary so the
// temporary still fits in one directory entry
std::string partFileName(const std::string& name) {
    const size_t room = config::MAX_FILENAME_LENGTH - std::strlen(PART_PREFIX) - std::strlen(PART_SUFFIX);
    size_t keep = std::min(name.size(), room);
    while (keep > 0 && keep < name.size() && (static_cast<unsigned char>(name[keep]) & 0xC0) == 0x80) {
        --keep;
    }
    return PART_PREFIX + name.substr(0, keep) + PART_SUFFIX;
}

} // namespace

FileReceiver::FileReceiver(ReceiverOptions options, std::shared_ptr<const ChunkCipher> cipher)
    : options_(std::move(options))
    , cipher_(std::move(cipher))
{
}

FileReceiver::~FileReceiver() = default;

Result<void> FileReceiver::start() {
    auto& logger = Logger::instance();

    if (options_.bufferSize == 0) {
        return Err(ErrorCode::ConfigurationError, "Receive buffer size must be positive");
    }

    std::error_code ec;
    std::filesystem::create_directories(options_.saveDirectory, ec);
    if (ec) {
        return Err(ErrorCode::FileError, "Failed to create directory: " + options_.saveDirectory.string() +
                   " (" + ec.message() + ")");
    }

    cancelled_ = false;
    SocketGuard sock(socket(AF_INET, SOCK_STREAM, 0));
    if (!sock) {
        return Err(ErrorCode::NetworkError, "Failed to create server socket: " + std::string(strerror(errno)));
    }

    int opt = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return Err(ErrorCode::NetworkError, "Failed to set socket options: " + std::string(strerror(errno)));
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(options_.port);

    if (bind(sock.get(), (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        std::string message = "Failed to bind port " + std::to_string(options_.port) + ": " +
                              std::string(strerror(errno));
        logger.log(LogLevel::ERROR, message, "FileReceiver");
        return Err(ErrorCode::NetworkError, message);
    }

    if (listen(sock.get(), config::RECEIVER_BACKLOG) < 0) {
        return Err(ErrorCode::NetworkError, "Failed to listen: " + std::string(strerror(errno)));
    }

    socklen_t len = sizeof(addr);
    if (getsockname(sock.get(), (struct sockaddr*)&addr, &len) < 0) {
        return Err(ErrorCode::NetworkError, "getsockname failed: " + std::string(strerror(errno)));
    }
    boundPort_ = ntohs(addr.sin_port);
    listenSocket_ = std::move(sock);

    logger.log(LogLevel::INFO, "Listening on port " + std::to_string(boundPort_) + ", saving to " +
               options_.saveDirectory.string(), "FileReceiver");
    return Ok();
}

Result<std::string> FileReceiver::acceptConnection() {
    if (!listenSocket_) {
        return Err<std::string>(ErrorCode::NetworkError, "Receiver not started");
    }

    // No deadline: waiting for a sender is open-ended, only cancel() ends it
    if (auto ready = SocketIO::waitFor(listenSocket_.get(), POLLIN, IoControl{std::chrono::milliseconds(0), &cancelled_});
        !ready) {
        return ready.error();
    }

    SocketGuard client(accept(listenSocket_.get(), nullptr, nullptr));
    if (!client) {
        return Err<std::string>(ErrorCode::NetworkError, "accept failed: " + std::string(strerror(errno)));
    }

    std::string clientIp = SocketIO::peerAddress(client.get());
    if (clientIp.empty()) {
        return Err<std::string>(ErrorCode::NetworkError, "Unreadable peer address: " + std::string(strerror(errno)));
    }

    connection_ = std::move(client);
    peer_ = clientIp;
    Logger::instance().log(LogLevel::INFO, "Connection from " + peer_, "FileReceiver");
    return Ok(peer_);
}

void FileReceiver::cancel() {
    cancelled_ = true;
}

Result<std::filesystem::path> FileReceiver::receiveFile(const ProgressCallback& progress) {
    auto& logger = Logger::instance();
    auto& metrics = MetricsCollector::instance();

    auto result = receive(progress);

    connection_.reset();
    listenSocket_.reset();

    if (result) {
        metrics.incrementTransfersCompleted();
        logger.log(LogLevel::INFO, "Received " + result->string() + " from " + peer_, "FileReceiver");
    } else {
        metrics.incrementTransfersFailed();
        logger.log(LogLevel::ERROR, "Receive from " + peer_ + " failed: " + result.error().describe(),
                   "FileReceiver");
    }
    return result;
}

Result<std::filesystem::path> FileReceiver::receive(const ProgressCallback& progress) {
    auto& logger = Logger::instance();

    lastPartialPath_.reset();
    if (!connection_) {
        return Err<std::filesystem::path>(ErrorCode::NetworkError, "No accepted connection");
    }

    auto header = TransferProtocol::readHeader(connection_.get(), ioControl());
    if (!header) {
        if (header.error().code == ErrorCode::ProtocolError) {
            MetricsCollector::instance().incrementRejectedFileNames();
        }
        return header.error();
    }

    if (!PathValidator::isPathWithinDirectory(options_.saveDirectory, header->fileName)) {
        MetricsCollector::instance().incrementRejectedFileNames();
        return Err<std::filesystem::path>(ErrorCode::ProtocolError,
                                          "File name escapes the save directory: " + header->fileName);
    }

    TransferMode mode = PlainTransfer{};
    if (header->encrypted) {
        if (!cipher_) {
            return Err<std::filesystem::path>(ErrorCode::ConfigurationError,
                                              "Sender requested encryption but no key is configured");
        }
        mode = EncryptedTransfer{cipher_};
    }

    logger.log(LogLevel::INFO, "Receiving " + header->fileName + " (" + std::to_string(header->fileSize) +
               " bytes, " + (header->encrypted ? "encrypted" : "plain") + ")", "FileReceiver");

    const std::filesystem::path finalPath = options_.saveDirectory / header->fileName;
    const std::filesystem::path partPath = options_.saveDirectory / partFileName(header->fileName);

    std::ofstream out(partPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Err<std::filesystem::path>(ErrorCode::FileError, "Cannot create " + partPath.string());
    }

    buffer_.resize(options_.bufferSize);
    auto body = std::visit([&](const auto& m) {
        return receiveChunks(out, header->fileSize, m, progress);
    }, mode);

    if (body) {
        out.flush();
        if (!out) {
            body = Err(ErrorCode::FileError, "Failed to flush " + partPath.string());
        }
    }
    out.close();

    std::error_code ec;
    if (!body) {
        if (options_.keepPartialOnFailure) {
            lastPartialPath_ = partPath;
        } else {
            std::filesystem::remove(partPath, ec);
        }
        return body.error();
    }

    std::filesystem::rename(partPath, finalPath, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(partPath, ignored);
        return Err<std::filesystem::path>(ErrorCode::FileError, "Failed to move " + partPath.string() +
                                          " into place: " + ec.message());
    }
    return Ok(finalPath);
}

template <typename Mode>
Result<void> FileReceiver::receiveChunks(std::ofstream& out, uint64_t fileSize, const Mode& mode,
                                         const ProgressCallback& progress) {
    auto& metrics = MetricsCollector::instance();
    uint64_t written = 0;

    while (written < fileSize) {
        if (cancelled_) {
            return Err(ErrorCode::Cancelled, "Transfer cancelled");
        }

        auto count = receiveChunk(mode, out, fileSize - written);
        if (!count) {
            return count.error();
        }
        if (!out) {
            return Err(ErrorCode::FileError, "Write failed after " + std::to_string(written) + " bytes");
        }

        written += *count;
        metrics.incrementChunksReceived();
        metrics.addBytesDownloaded(*count);

        if (progress) {
            progress(progressPercent(written, fileSize));
        }
    }

    if (fileSize == 0 && progress) {
        progress(100);
    }
    return Ok();
}

Result<size_t> FileReceiver::receiveChunk(const PlainTransfer&, std::ofstream& out, uint64_t remaining) {
    const size_t want = static_cast<size_t>(std::min<uint64_t>(buffer_.size(), remaining));
    auto got = SocketIO::recvSome(connection_.get(), buffer_.data(), want, ioControl());
    if (!got) {
        return got.error();
    }
    out.write(reinterpret_cast<const char*>(buffer_.data()), static_cast<std::streamsize>(*got));
    return got;
}

Result<size_t> FileReceiver::receiveChunk(const EncryptedTransfer& mode, std::ofstream& out, uint64_t remaining) {
    auto frame = TransferProtocol::readFrame(connection_.get(), remaining, ioControl());
    if (!frame) {
        return frame.error();
    }

    auto plaintext = mode.cipher->decryptChunk(frame->iv, frame->ciphertext, frame->tag);
    if (!plaintext) {
        return plaintext.error();
    }
    if (plaintext->size() > remaining) {
        return Err<size_t>(ErrorCode::ProtocolError, "Chunk overruns declared file size");
    }

    out.write(reinterpret_cast<const char*>(plaintext->data()), static_cast<std::streamsize>(plaintext->size()));
    return Ok(plaintext->size());
}

} // namespace PeerDrop
