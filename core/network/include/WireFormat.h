#pragma once

/**
 * @file WireFormat.h
 * @brief Big-endian integer codec shared by the beacon, header and frame formats
 */

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace PeerDrop {

namespace WireFormat {

    void appendU8(std::vector<uint8_t>& out, uint8_t value);
    void appendU16(std::vector<uint8_t>& out, uint16_t value);
    void appendU32(std::vector<uint8_t>& out, uint32_t value);
    void appendU64(std::vector<uint8_t>& out, uint64_t value);
    void appendBytes(std::vector<uint8_t>& out, const uint8_t* data, std::size_t size);
    void appendBytes(std::vector<uint8_t>& out, const std::string& data);

    // Callers check bounds; these read exactly sizeof(T) bytes at data.
    uint16_t readU16(const uint8_t* data);
    uint32_t readU32(const uint8_t* data);
    uint64_t readU64(const uint8_t* data);

    /// Strict UTF-8 check: rejects overlongs, surrogates and code points past U+10FFFF
    bool isValidUtf8(const std::string& text);

    /**
     * @brief Bounds-checked sequential reader over a byte buffer
     *
     * Every read returns false instead of running past the end; nothing is
     * consumed on a failed read.
     */
    class Reader {
    public:
        Reader(const uint8_t* data, std::size_t size) : data_(data), size_(size) {}
        explicit Reader(const std::vector<uint8_t>& buffer) : Reader(buffer.data(), buffer.size()) {}

        bool readU8(uint8_t& value);
        bool readU16(uint16_t& value);
        bool readU32(uint32_t& value);
        bool readU64(uint64_t& value);
        bool readBytes(std::size_t count, std::vector<uint8_t>& out);
        bool readString(std::size_t count, std::string& out);

        std::size_t remaining() const { return size_ - offset_; }
        bool atEnd() const { return offset_ == size_; }

    private:
        const uint8_t* data_;
        std::size_t size_;
        std::size_t offset_ = 0;
    };

} // namespace WireFormat

} // namespace PeerDrop
