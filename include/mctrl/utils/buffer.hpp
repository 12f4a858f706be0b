#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <stdexcept>
#include <utility>

namespace mctrl::utils {

/**
 * Buffer reader for parsing little-endian binary data
 */
class BufferReader {
public:
    explicit BufferReader(const std::vector<uint8_t>& data)
        : m_data(data.data())
        , m_size(data.size())
        , m_pos(0)
    {}

    BufferReader(const uint8_t* data, size_t size)
        : m_data(data)
        , m_size(size)
        , m_pos(0)
    {}

    uint8_t readU8() {
        checkBounds(1);
        return m_data[m_pos++];
    }

    uint32_t readU32() {
        checkBounds(4);
        uint32_t value = static_cast<uint32_t>(m_data[m_pos]) |
                        (static_cast<uint32_t>(m_data[m_pos + 1]) << 8) |
                        (static_cast<uint32_t>(m_data[m_pos + 2]) << 16) |
                        (static_cast<uint32_t>(m_data[m_pos + 3]) << 24);
        m_pos += 4;
        return value;
    }

    int32_t readI32() {
        return static_cast<int32_t>(readU32());
    }

    // Read fixed-length string, embedded nulls preserved
    std::string readString(size_t length) {
        checkBounds(length);
        std::string result(reinterpret_cast<const char*>(m_data + m_pos), length);
        m_pos += length;
        return result;
    }

    size_t position() const { return m_pos; }
    size_t remaining() const { return m_size - m_pos; }
    bool hasMore() const { return m_pos < m_size; }

private:
    void checkBounds(size_t count) const {
        if (m_pos + count > m_size) {
            throw std::out_of_range("Buffer read out of bounds");
        }
    }

    const uint8_t* m_data;
    size_t m_size;
    size_t m_pos;
};

/**
 * Buffer writer for building little-endian binary data
 */
class BufferWriter {
public:
    BufferWriter() {
        m_data.reserve(256);
    }

    explicit BufferWriter(size_t reserveSize) {
        m_data.reserve(reserveSize);
    }

    void writeU32(uint32_t value) {
        m_data.push_back(value & 0xFF);
        m_data.push_back((value >> 8) & 0xFF);
        m_data.push_back((value >> 16) & 0xFF);
        m_data.push_back((value >> 24) & 0xFF);
    }

    void writeI32(int32_t value) {
        writeU32(static_cast<uint32_t>(value));
    }

    // Write string bytes without a terminator
    void writeRaw(const std::string& str) {
        m_data.insert(m_data.end(), str.begin(), str.end());
    }

    // Pad with zeros
    void pad(size_t count) {
        m_data.insert(m_data.end(), count, 0);
    }

    // Overwrite a previously written int32 (for length prefixes)
    void patchI32(size_t offset, int32_t value) {
        if (offset + 4 > m_data.size()) {
            throw std::out_of_range("Buffer patch out of bounds");
        }
        uint32_t bits = static_cast<uint32_t>(value);
        m_data[offset] = bits & 0xFF;
        m_data[offset + 1] = (bits >> 8) & 0xFF;
        m_data[offset + 2] = (bits >> 16) & 0xFF;
        m_data[offset + 3] = (bits >> 24) & 0xFF;
    }

    std::vector<uint8_t>&& take() { return std::move(m_data); }
    size_t size() const { return m_data.size(); }

private:
    std::vector<uint8_t> m_data;
};

/**
 * Check that a byte range is well-formed UTF-8
 * (no overlongs, no surrogates, nothing above U+10FFFF).
 */
bool isValidUtf8(const uint8_t* data, size_t size);

} // namespace mctrl::utils
