#pragma once

/**
 * @file byte_buffer.hpp
 * @brief Bounds-checked primitives shared by the manifest and pack codecs
 *
 * BYTE ORDER:
 * Fixed-width integers are written in network byte order (big-endian) so a
 * blob reads the same on every host. Varints are LEB128: 7 value bits per
 * byte, high bit set on every byte except the last.
 *
 * Every read checks the remaining length first and fails with
 * ErrorCode::Truncation instead of reading past the end.
 */

#include "usync/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace usync {

class ByteWriter {
public:
    void write_uint8(std::uint8_t value) { buffer_.push_back(value); }

    void write_uint16(std::uint16_t value) {
        buffer_.push_back(static_cast<std::uint8_t>(value >> 8));
        buffer_.push_back(static_cast<std::uint8_t>(value));
    }

    void write_uint32(std::uint32_t value) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            buffer_.push_back(static_cast<std::uint8_t>(value >> shift));
        }
    }

    void write_uint64(std::uint64_t value) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            buffer_.push_back(static_cast<std::uint8_t>(value >> shift));
        }
    }

    void write_varint(std::uint64_t value) {
        while (value >= 0x80) {
            buffer_.push_back(static_cast<std::uint8_t>((value & 0x7F) | 0x80));
            value >>= 7;
        }
        buffer_.push_back(static_cast<std::uint8_t>(value));
    }

    void write_bytes(const std::uint8_t* data, std::size_t size) {
        buffer_.insert(buffer_.end(), data, data + size);
    }

    /// u16 length prefix followed by the raw bytes; caller guarantees size <= 65535.
    void write_short_string(std::string_view text) {
        write_uint16(static_cast<std::uint16_t>(text.size()));
        buffer_.insert(buffer_.end(), text.begin(), text.end());
    }

    std::size_t size() const { return buffer_.size(); }
    const std::vector<std::uint8_t>& data() const { return buffer_; }
    std::vector<std::uint8_t> release() { return std::move(buffer_); }

private:
    std::vector<std::uint8_t> buffer_;
};

class ByteReader {
public:
    ByteReader(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}
    explicit ByteReader(const std::vector<std::uint8_t>& buffer)
        : data_(buffer.data()), size_(buffer.size()) {}

    std::size_t remaining() const { return size_ - cursor_; }
    std::size_t position() const { return cursor_; }

    Result<std::uint8_t> read_uint8() {
        if (remaining() < 1) {
            return Err<std::uint8_t>(ErrorCode::Truncation, "Buffer underflow reading uint8");
        }
        return Ok(data_[cursor_++]);
    }

    Result<std::uint16_t> read_uint16() {
        if (remaining() < 2) {
            return Err<std::uint16_t>(ErrorCode::Truncation, "Buffer underflow reading uint16");
        }
        const auto value = static_cast<std::uint16_t>((data_[cursor_] << 8) | data_[cursor_ + 1]);
        cursor_ += 2;
        return Ok(value);
    }

    Result<std::uint32_t> read_uint32() {
        if (remaining() < 4) {
            return Err<std::uint32_t>(ErrorCode::Truncation, "Buffer underflow reading uint32");
        }
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value = (value << 8) | data_[cursor_++];
        }
        return Ok(value);
    }

    Result<std::uint64_t> read_uint64() {
        if (remaining() < 8) {
            return Err<std::uint64_t>(ErrorCode::Truncation, "Buffer underflow reading uint64");
        }
        std::uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | data_[cursor_++];
        }
        return Ok(value);
    }

    Result<std::uint64_t> read_varint() {
        std::uint64_t value = 0;
        for (int shift = 0; shift < 64; shift += 7) {
            if (remaining() < 1) {
                return Err<std::uint64_t>(ErrorCode::Truncation, "Buffer underflow reading varint");
            }
            const std::uint8_t byte = data_[cursor_++];
            value |= static_cast<std::uint64_t>(byte & 0x7F) << shift;
            if ((byte & 0x80) == 0) {
                return Ok(value);
            }
        }
        return Err<std::uint64_t>(ErrorCode::Format, "Varint longer than 64 bits");
    }

    Result<std::vector<std::uint8_t>> read_bytes(std::size_t size) {
        if (remaining() < size) {
            return Err<std::vector<std::uint8_t>>(ErrorCode::Truncation,
                                                  "Buffer underflow reading " + std::to_string(size) + " bytes");
        }
        std::vector<std::uint8_t> bytes(data_ + cursor_, data_ + cursor_ + size);
        cursor_ += size;
        return Ok(std::move(bytes));
    }

    Result<std::string> read_short_string() {
        auto length = read_uint16();
        if (length.is_error()) {
            return Err<std::string>(length.error());
        }
        if (remaining() < length.value()) {
            return Err<std::string>(ErrorCode::Truncation, "Buffer underflow reading string");
        }
        std::string value(reinterpret_cast<const char*>(data_ + cursor_), length.value());
        cursor_ += length.value();
        return Ok(std::move(value));
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t cursor_ = 0;
};

} // namespace usync
