#include "WireFormat.h"

namespace PeerDrop {

namespace WireFormat {

    void appendU8(std::vector<uint8_t>& out, uint8_t value) {
        out.push_back(value);
    }

    void appendU16(std::vector<uint8_t>& out, uint16_t value) {
        out.push_back(static_cast<uint8_t>(value >> 8));
        out.push_back(static_cast<uint8_t>(value));
    }

    void appendU32(std::vector<uint8_t>& out, uint32_t value) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            out.push_back(static_cast<uint8_t>(value >> shift));
        }
    }

    void appendU64(std::vector<uint8_t>& out, uint64_t value) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            out.push_back(static_cast<uint8_t>(value >> shift));
        }
    }

    void appendBytes(std::vector<uint8_t>& out, const uint8_t* data, std::size_t size) {
        out.insert(out.end(), data, data + size);
    }

    void appendBytes(std::vector<uint8_t>& out, const std::string& data) {
        out.insert(out.end(), data.begin(), data.end());
    }

    uint16_t readU16(const uint8_t* data) {
        return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) | data[1]);
    }

    uint32_t readU32(const uint8_t* data) {
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value = (value << 8) | data[i];
        }
        return value;
    }

    uint64_t readU64(const uint8_t* data) {
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | data[i];
        }
        return value;
    }

    bool isValidUtf8(const std::string& text) {
        const auto* bytes = reinterpret_cast<const unsigned char*>(text.data());
        const std::size_t size = text.size();
        std::size_t i = 0;

        while (i < size) {
            unsigned char lead = bytes[i];
            if (lead < 0x80) {
                ++i;
                continue;
            }

            std::size_t extra = 0;
            uint32_t codePoint = 0;
            if ((lead & 0xE0) == 0xC0) {
                extra = 1;
                codePoint = lead & 0x1F;
            } else if ((lead & 0xF0) == 0xE0) {
                extra = 2;
                codePoint = lead & 0x0F;
            } else if ((lead & 0xF8) == 0xF0) {
                extra = 3;
                codePoint = lead & 0x07;
            } else {
                return false;
            }

            if (i + extra >= size) {
                return false;
            }
            for (std::size_t k = 1; k <= extra; ++k) {
                unsigned char cont = bytes[i + k];
                if ((cont & 0xC0) != 0x80) {
                    return false;
                }
                codePoint = (codePoint << 6) | (cont & 0x3F);
            }

            // Overlong encodings
            if ((extra == 1 && codePoint < 0x80) ||
                (extra == 2 && codePoint < 0x800) ||
                (extra == 3 && codePoint < 0x10000)) {
                return false;
            }
            if (codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
                return false;
            }

            i += extra + 1;
        }
        return true;
    }

    bool Reader::readU8(uint8_t& value) {
        if (remaining() < 1) return false;
        value = data_[offset_++];
        return true;
    }

    bool Reader::readU16(uint16_t& value) {
        if (remaining() < 2) return false;
        value = WireFormat::readU16(data_ + offset_);
        offset_ += 2;
        return true;
    }

    bool Reader::readU32(uint32_t& value) {
        if (remaining() < 4) return false;
        value = WireFormat::readU32(data_ + offset_);
        offset_ += 4;
        return true;
    }

    bool Reader::readU64(uint64_t& value) {
        if (remaining() < 8) return false;
        value = WireFormat::readU64(data_ + offset_);
        offset_ += 8;
        return true;
    }

    bool Reader::readBytes(std::size_t count, std::vector<uint8_t>& out) {
        if (remaining() < count) return false;
        out.assign(data_ + offset_, data_ + offset_ + count);
        offset_ += count;
        return true;
    }

    bool Reader::readString(std::size_t count, std::string& out) {
        if (remaining() < count) return false;
        out.assign(reinterpret_cast<const char*>(data_ + offset_), count);
        offset_ += count;
        return true;
    }

} // namespace WireFormat

} // namespace PeerDrop
