/**
 * @file bytebuffer.hpp
 * @brief Growable byte buffer for building RIFL output.
 *
 * Bytes are appended sequentially. Multi-byte fields are written
 * little-endian, matching what ByteReader expects.
 */

#ifndef RAWRFID_BYTEBUFFER_HPP
#define RAWRFID_BYTEBUFFER_HPP

#include <vector>

#include "bytereader.hpp"
#include "config.hpp"
#include "error.hpp"

namespace rawrfid {

/**
 * @brief Growable byte buffer.
 *
 * Heap backed; appends may throw std::bad_alloc.
 */
class ByteBuffer {
public:
    ByteBuffer() = default;

    /**
     * @brief Clear buffer to empty state.
     */
    void clear() noexcept {
        data_.clear();
    }

    /**
     * @brief Reserve capacity for @p bytes.
     */
    void reserve(std::size_t bytes) {
        data_.reserve(bytes);
    }

    /**
     * @brief Get number of bytes in buffer.
     */
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }

    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    /**
     * @brief Append a single byte.
     */
    void append_byte(std::uint8_t value) {
        data_.push_back(value);
    }

    /**
     * @brief Append raw bytes.
     *
     * @param bytes Source bytes
     * @param count Number of bytes to append
     */
    void append_bytes(const std::uint8_t* bytes, std::size_t count) {
        data_.insert(data_.end(), bytes, bytes + count);
    }

    /**
     * @brief Append all bytes of another buffer.
     */
    void append_buffer(const ByteBuffer& other) {
        data_.insert(data_.end(), other.data_.begin(), other.data_.end());
    }

    /**
     * @brief Append a u32 as 4 little-endian bytes.
     */
    void append_u32_le(std::uint32_t value) {
        std::uint8_t bytes[4];
        store_u32_le(bytes, value);
        append_bytes(bytes, sizeof(bytes));
    }

    /**
     * @brief Append a float as 4 little-endian IEEE-754 bytes.
     */
    void append_f32_le(float value) {
        std::uint8_t bytes[4];
        store_f32_le(bytes, value);
        append_bytes(bytes, sizeof(bytes));
    }

    /**
     * @brief Overwrite a u32 already in the buffer.
     *
     * @param offset Byte offset of the field
     * @param value New value
     * @return Error::Ok, or Error::InvalidArg if the field lies past the end
     */
    Error patch_u32_le(std::size_t offset, std::uint32_t value) noexcept {
        if (offset > data_.size() || data_.size() - offset < 4) {
            return Error::InvalidArg;
        }
        store_u32_le(&data_[offset], value);
        return Error::Ok;
    }

    [[nodiscard]] const std::uint8_t* data() const noexcept { return data_.data(); }

    /**
     * @brief Access the accumulated bytes.
     */
    [[nodiscard]] const std::vector<std::uint8_t>& bytes() const noexcept { return data_; }

    /**
     * @brief Move the accumulated bytes out, leaving the buffer empty.
     */
    std::vector<std::uint8_t> release() noexcept {
        std::vector<std::uint8_t> out;
        out.swap(data_);
        return out;
    }

private:
    std::vector<std::uint8_t> data_;
};

} // namespace rawrfid

#endif // RAWRFID_BYTEBUFFER_HPP
