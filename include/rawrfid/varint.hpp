/**
 * @file varint.hpp
 * @brief Variable-length integer coding used inside RIFL pair buffers.
 *
 * Unsigned LEB128 as written by the Flipper firmware toolbox:
 * - low 7 bits of each byte carry value bits, least significant group first
 * - bit 7 set means another byte follows
 * - a u32 takes 1 to 5 bytes
 *
 * @see https://github.com/flipperdevices/flipperzero-firmware/blob/dev/lib/toolbox/varint.c
 */

#ifndef RAWRFID_VARINT_HPP
#define RAWRFID_VARINT_HPP

#include "bytebuffer.hpp"
#include "bytereader.hpp"
#include "config.hpp"
#include "error.hpp"

namespace rawrfid {

/**
 * @brief Number of bytes varint_encode() emits for a value.
 *
 * @param value Value to measure
 * @return 1 to MAX_VARINT_BYTES
 */
constexpr std::size_t varint_size(std::uint32_t value) noexcept {
    std::size_t size = 1;
    while (value >= 0x80U) {
        value >>= 7U;
        ++size;
    }
    return size;
}

/**
 * @brief Encode a value into a caller-provided array.
 *
 * @param[out] out Destination, at least MAX_VARINT_BYTES long
 * @param value Value to encode
 * @return Number of bytes written
 */
inline std::size_t varint_encode(std::uint8_t* out, std::uint32_t value) noexcept {
    std::size_t i = 0;
    while (value >= 0x80U) {
        out[i++] = static_cast<std::uint8_t>((value & 0x7FU) | 0x80U);
        value >>= 7U;
    }
    out[i++] = static_cast<std::uint8_t>(value);
    return i;
}

/**
 * @brief Append one encoded value to a byte buffer.
 *
 * @param output Buffer to append to
 * @param value Value to encode
 * @return Number of bytes appended
 */
inline std::size_t varint_encode(ByteBuffer& output, std::uint32_t value) {
    std::uint8_t bytes[MAX_VARINT_BYTES];
    std::size_t size = varint_encode(bytes, value);
    output.append_bytes(bytes, size);
    return size;
}

/**
 * @brief Decode one value.
 *
 * @param reader Reader positioned at the first byte of the varint
 * @param[out] value Decoded value, untouched on failure
 * @return Error::Ok on success
 *         Error::TruncatedInput if the reader ends before the last byte
 *         Error::MalformedPair if the value does not fit in 32 bits
 */
inline Error varint_decode(ByteReader& reader, std::uint32_t& value) noexcept {
    std::uint64_t result = 0;

    for (std::size_t i = 0; i < MAX_VARINT_BYTES; ++i) {
        int byte = reader.read_byte();
        if (byte < 0) {
            return Error::TruncatedInput;
        }

        result |= static_cast<std::uint64_t>(static_cast<unsigned>(byte) & 0x7FU) << (7U * i);

        // Stop when continuation bit is clear
        if ((static_cast<unsigned>(byte) & 0x80U) == 0) {
            if (result > 0xFFFFFFFFULL) {
                return Error::MalformedPair;
            }
            value = static_cast<std::uint32_t>(result);
            return Error::Ok;
        }
    }

    // Fifth byte still had the continuation bit set
    return Error::MalformedPair;
}

} // namespace rawrfid

#endif // RAWRFID_VARINT_HPP
