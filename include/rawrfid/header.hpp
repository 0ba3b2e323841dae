/**
 * @file header.hpp
 * @brief RIFL file header layout, decoding and encoding.
 *
 * @par Header Layout (20 bytes, little-endian)
 * | offset | width | field           | type |
 * |--------|-------|-----------------|------|
 * | 0      | 4     | magic "RIFL"    | u32  |
 * | 4      | 4     | version         | u32  |
 * | 8      | 4     | frequency (Hz)  | f32  |
 * | 12     | 4     | duty_cycle      | f32  |
 * | 16     | 4     | max_buffer_size | u32  |
 */

#ifndef RAWRFID_HEADER_HPP
#define RAWRFID_HEADER_HPP

#include "bytebuffer.hpp"
#include "config.hpp"
#include "error.hpp"

namespace rawrfid {

/**
 * @brief Position of one fixed-width header field.
 */
struct FieldLayout {
    std::size_t offset;
    std::size_t width;
};

inline constexpr FieldLayout FIELD_MAGIC{0U, 4U};
inline constexpr FieldLayout FIELD_VERSION{4U, 4U};
inline constexpr FieldLayout FIELD_FREQUENCY{8U, 4U};
inline constexpr FieldLayout FIELD_DUTY_CYCLE{12U, 4U};
inline constexpr FieldLayout FIELD_MAX_BUFFER_SIZE{16U, 4U};

/// Header fields in file order
inline constexpr FieldLayout HEADER_LAYOUT[] = {
    FIELD_MAGIC, FIELD_VERSION, FIELD_FREQUENCY, FIELD_DUTY_CYCLE, FIELD_MAX_BUFFER_SIZE};

/**
 * @brief Check that the fields of HEADER_LAYOUT follow each other without
 *        gaps and end at HEADER_SIZE.
 */
constexpr bool header_layout_is_packed() noexcept {
    std::size_t next = 0;
    for (const auto& field : HEADER_LAYOUT) {
        if (field.offset != next) {
            return false;
        }
        next += field.width;
    }
    return next == HEADER_SIZE;
}

static_assert(header_layout_is_packed(), "header fields must tile HEADER_SIZE bytes");

/**
 * @brief Decoded RIFL header.
 *
 * The magic is a format constant and is not stored.
 */
struct Header {
    /// File format version, only RIFL_VERSION is supported
    std::uint32_t version = RIFL_VERSION;

    /// Timing base of the capture in Hz
    float frequency = DEFAULT_FREQUENCY;

    /// Carrier duty cycle (0.0 - 1.0)
    float duty_cycle = DEFAULT_DUTY_CYCLE;

    /// Largest pair buffer in bytes
    std::uint32_t max_buffer_size = DEFAULT_MAX_BUFFER_SIZE;

    bool operator==(const Header& other) const noexcept {
        return version == other.version && frequency == other.frequency &&
               duty_cycle == other.duty_cycle && max_buffer_size == other.max_buffer_size;
    }

    bool operator!=(const Header& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * @brief Check header field ranges.
 *
 * @param header Header to check
 * @return Error::Ok
 *         Error::UnsupportedVersion if version is not RIFL_VERSION
 *         Error::InvalidHeader if frequency is not a positive finite value
 *         or duty_cycle lies outside [0, 1]
 */
Error validate_header(const Header& header) noexcept;

/**
 * @brief Decode and validate a header from the start of a byte stream.
 *
 * Reads field by field at the offsets of HEADER_LAYOUT.
 *
 * @param data Input bytes
 * @param size Number of input bytes (only the first HEADER_SIZE are read)
 * @param[out] header Decoded header, untouched on failure
 * @return Error::Ok on success
 *         Error::TruncatedInput if size < HEADER_SIZE
 *         Error::BadMagic if the magic field is not "RIFL"
 *         or any error of validate_header()
 */
Error decode_header(const std::uint8_t* data, std::size_t size, Header& header) noexcept;

/**
 * @brief Append the 20 header bytes for @p header.
 */
void encode_header(ByteBuffer& output, const Header& header);

} // namespace rawrfid

#endif // RAWRFID_HEADER_HPP
