/**
 * @file bytereader.hpp
 * @brief Sequential little-endian reading from capture data.
 *
 * The byte reader provides stateful access to a RIFL byte stream. All
 * multi-byte fields are assembled explicitly from little-endian bytes so
 * the result does not depend on host byte order.
 */

#ifndef RAWRFID_BYTEREADER_HPP
#define RAWRFID_BYTEREADER_HPP

#include <cstring>

#include "config.hpp"
#include "error.hpp"

namespace rawrfid {

/**
 * @brief Load a little-endian u32.
 *
 * @warning Caller must ensure 4 bytes are readable at @p bytes.
 */
inline std::uint32_t load_u32_le(const std::uint8_t* bytes) noexcept {
    return static_cast<std::uint32_t>(bytes[0]) | (static_cast<std::uint32_t>(bytes[1]) << 8U) |
           (static_cast<std::uint32_t>(bytes[2]) << 16U) |
           (static_cast<std::uint32_t>(bytes[3]) << 24U);
}

/**
 * @brief Load a little-endian IEEE-754 single precision float.
 *
 * @warning Caller must ensure 4 bytes are readable at @p bytes.
 */
inline float load_f32_le(const std::uint8_t* bytes) noexcept {
    static_assert(sizeof(float) == sizeof(std::uint32_t), "float must be 32 bits");
    std::uint32_t bits = load_u32_le(bytes);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

/**
 * @brief Store a u32 as 4 little-endian bytes.
 */
inline void store_u32_le(std::uint8_t* bytes, std::uint32_t value) noexcept {
    bytes[0] = static_cast<std::uint8_t>(value & 0xFFU);
    bytes[1] = static_cast<std::uint8_t>((value >> 8U) & 0xFFU);
    bytes[2] = static_cast<std::uint8_t>((value >> 16U) & 0xFFU);
    bytes[3] = static_cast<std::uint8_t>((value >> 24U) & 0xFFU);
}

/**
 * @brief Store a float as 4 little-endian IEEE-754 bytes.
 */
inline void store_f32_le(std::uint8_t* bytes, float value) noexcept {
    std::uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    store_u32_le(bytes, bits);
}

/**
 * @brief Sequential byte reader for capture data.
 *
 * Tracks position within a byte buffer. Does not own the buffer.
 */
class ByteReader {
public:
    /**
     * @brief Construct a byte reader.
     *
     * @param data Pointer to source data buffer
     * @param size Number of valid bytes in buffer
     */
    ByteReader(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    /**
     * @brief Read a single byte.
     *
     * @return Byte value (0-255), or -1 if no bytes remaining
     */
    inline int read_byte() noexcept {
        if (pos_ >= size_) [[unlikely]] {
            return -1;
        }
        return data_[pos_++];
    }

    /**
     * @brief Read a little-endian u32.
     *
     * @param[out] value Decoded value, untouched on failure
     * @return Error::Ok, or Error::TruncatedInput with position unchanged
     */
    Error read_u32_le(std::uint32_t& value) noexcept {
        if (remaining() < 4) [[unlikely]] {
            return Error::TruncatedInput;
        }
        value = load_u32_le(&data_[pos_]);
        pos_ += 4;
        return Error::Ok;
    }

    /**
     * @brief Read a little-endian f32.
     *
     * @param[out] value Decoded value, untouched on failure
     * @return Error::Ok, or Error::TruncatedInput with position unchanged
     */
    Error read_f32_le(float& value) noexcept {
        if (remaining() < 4) [[unlikely]] {
            return Error::TruncatedInput;
        }
        value = load_f32_le(&data_[pos_]);
        pos_ += 4;
        return Error::Ok;
    }

    /**
     * @brief Split off the next @p count bytes as their own reader.
     *
     * Advances this reader past the split bytes.
     *
     * @param count Number of bytes
     * @param[out] sub Reader over exactly those bytes
     * @return Error::Ok, or Error::TruncatedInput if fewer bytes remain
     */
    Error take(std::size_t count, ByteReader& sub) noexcept {
        if (count > remaining()) [[unlikely]] {
            return Error::TruncatedInput;
        }
        sub = ByteReader(&data_[pos_], count);
        pos_ += count;
        return Error::Ok;
    }

    /**
     * @brief Skip bytes.
     *
     * @return Error::Ok, or Error::TruncatedInput if fewer bytes remain
     */
    Error skip(std::size_t count) noexcept {
        if (count > remaining()) [[unlikely]] {
            return Error::TruncatedInput;
        }
        pos_ += count;
        return Error::Ok;
    }

    /**
     * @brief Get current byte position.
     *
     * @return Number of bytes already read
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    /**
     * @brief Get remaining bytes.
     *
     * @return Number of bytes remaining to read
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return (pos_ < size_) ? (size_ - pos_) : 0;
    }

    /**
     * @brief Pointer to the start of the underlying buffer.
     */
    [[nodiscard]] const std::uint8_t* data() const noexcept {
        return data_;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

} // namespace rawrfid

#endif // RAWRFID_BYTEREADER_HPP
