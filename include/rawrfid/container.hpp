/**
 * @file container.hpp
 * @brief Decoded RIFL capture: header plus pulse/duration pairs.
 *
 * @par Pair Data Layout
 * After the header the file holds zero or more frames until end of input:
 * - u32 LE frame length n (n <= header.max_buffer_size)
 * - n bytes of varints: pulse0, duration0, pulse1, duration1, ...
 *
 * A frame always holds whole pairs.
 *
 * @par Pulse and Duration
 * @code
 *  ______________      __________
 *                ______          __________ ...
 *
 *  ^ - pulse0 - ^      ^-pulse1-^
 *  ^ -   duration0   -^^ -   duration1   -^
 * @endcode
 * Both are counted in samples.
 */

#ifndef RAWRFID_CONTAINER_HPP
#define RAWRFID_CONTAINER_HPP

#include <utility>
#include <vector>

#include "bytebuffer.hpp"
#include "config.hpp"
#include "error.hpp"
#include "header.hpp"

namespace rawrfid {

/**
 * @brief One pad pair.
 */
struct PulseAndDuration {
    /// Samples at high level at the start of the interval
    std::uint32_t pulse = 0;

    /// Total samples in the interval (high + low)
    std::uint32_t duration = 0;

    /**
     * @brief Samples at low level after the pulse.
     *
     * @warning Only meaningful when pulse <= duration.
     */
    [[nodiscard]] std::uint32_t low() const noexcept {
        return duration - pulse;
    }

    bool operator==(const PulseAndDuration& other) const noexcept {
        return pulse == other.pulse && duration == other.duration;
    }

    bool operator!=(const PulseAndDuration& other) const noexcept {
        return !(*this == other);
    }
};

using PairList = std::vector<PulseAndDuration>;

/**
 * @brief Check a pair against the structural invariants.
 *
 * @return Error::Ok, or Error::MalformedPair if duration is 0 or
 *         pulse exceeds duration
 */
constexpr Error validate_pair(const PulseAndDuration& pair) noexcept {
    if (pair.duration == 0 || pair.pulse > pair.duration) {
        return Error::MalformedPair;
    }
    return Error::Ok;
}

/**
 * @brief Decoder options.
 *
 * Pass nullptr to decode() for the defaults.
 */
struct DecodeParams {
    /// Reject pairs with zero duration or pulse > duration
    bool strict_pairs = true;

    /// Treat 1-3 bytes after the last frame as end of file
    bool ignore_trailing_bytes = false;
};

/**
 * @brief A decoded capture.
 *
 * Immutable once constructed.
 */
class Container {
public:
    Container() = default;

    Container(const Header& header, PairList pairs)
        : header_(header), pairs_(std::move(pairs)) {}

    [[nodiscard]] const Header& header() const noexcept { return header_; }

    /**
     * @brief Pulse/duration pairs in stream order.
     */
    [[nodiscard]] const PairList& pairs() const noexcept { return pairs_; }

    [[nodiscard]] std::size_t size() const noexcept { return pairs_.size(); }

    [[nodiscard]] bool empty() const noexcept { return pairs_.empty(); }

    /**
     * @brief Sum of all durations, the length of the reconstructed signal.
     */
    [[nodiscard]] std::uint64_t total_samples() const noexcept;

    bool operator==(const Container& other) const noexcept {
        return header_ == other.header_ && pairs_ == other.pairs_;
    }

    bool operator!=(const Container& other) const noexcept {
        return !(*this == other);
    }

private:
    Header header_;
    PairList pairs_;
};

/**
 * @brief Decode a RIFL byte stream.
 *
 * Fails on the first malformation; @p out is only assigned on success.
 *
 * @param data Input bytes
 * @param size Number of input bytes
 * @param[out] out Decoded container
 * @param params Decoder options, nullptr for defaults
 * @param[out] error_offset If not nullptr, receives the byte offset at which
 *             decoding failed (unchanged on success)
 * @return Error::Ok on success
 *         Error::TruncatedInput header, frame or varint cut short
 *         Error::BadMagic header identifier mismatch
 *         Error::UnsupportedVersion / Error::InvalidHeader bad header fields
 *         Error::BufferTooLarge frame longer than max_buffer_size
 *         Error::MisalignedPairData odd varint count or 1-3 trailing bytes
 *         Error::MalformedPair oversized varint, or invalid pair when strict
 */
Error decode(const std::uint8_t* data, std::size_t size, Container& out,
             const DecodeParams* params = nullptr, std::size_t* error_offset = nullptr);

/**
 * @brief Encode a container as RIFL bytes.
 *
 * Pairs are packed greedily into frames of at most
 * header.max_buffer_size bytes. A pair never spans two frames. The last
 * frame is always written, so an empty container still gets one empty frame.
 *
 * @param container Container to encode
 * @param[out] output Buffer the encoded file is appended to
 * @return Error::Ok on success
 *         Error::BufferTooLarge if a single pair does not fit in a frame
 *         (output is left unchanged)
 */
Error encode(const Container& container, ByteBuffer& output);

} // namespace rawrfid

#endif // RAWRFID_CONTAINER_HPP
