/**
 * @file container.cpp
 * @brief RIFL container decoding and encoding.
 */

#include <rawrfid/container.hpp>
#include <rawrfid/bytereader.hpp>
#include <rawrfid/varint.hpp>

namespace rawrfid {

namespace {

Error fail(Error error, std::size_t offset, std::size_t* error_offset) noexcept {
    if (error_offset != nullptr) {
        *error_offset = offset;
    }
    return error;
}

/**
 * @brief Decode all pairs of one frame.
 *
 * @param frame Reader over exactly the frame payload
 * @param base Absolute file offset of the frame payload
 */
Error decode_frame(ByteReader& frame, std::size_t base, bool strict_pairs, PairList& pairs,
                   std::size_t* error_offset) {
    while (frame.remaining() > 0) {
        std::size_t pair_offset = base + frame.position();

        PulseAndDuration pair;
        Error result = varint_decode(frame, pair.pulse);
        if (result != Error::Ok) {
            return fail(result, pair_offset, error_offset);
        }

        // Pulse without a duration
        if (frame.remaining() == 0) {
            return fail(Error::MisalignedPairData, pair_offset, error_offset);
        }

        std::size_t duration_offset = base + frame.position();
        result = varint_decode(frame, pair.duration);
        if (result != Error::Ok) {
            return fail(result, duration_offset, error_offset);
        }

        if (strict_pairs) {
            result = validate_pair(pair);
            if (result != Error::Ok) {
                return fail(result, pair_offset, error_offset);
            }
        }

        pairs.push_back(pair);
    }

    return Error::Ok;
}

} // namespace

std::uint64_t Container::total_samples() const noexcept {
    std::uint64_t total = 0;
    for (const auto& pair : pairs_) {
        total += pair.duration;
    }
    return total;
}

Error decode(const std::uint8_t* data, std::size_t size, Container& out,
             const DecodeParams* params, std::size_t* error_offset) {
    const DecodeParams defaults;
    const DecodeParams& opts = (params != nullptr) ? *params : defaults;

    Header header;
    Error result = decode_header(data, size, header);
    if (result != Error::Ok) {
        return fail(result, 0, error_offset);
    }

    ByteReader reader(data + HEADER_SIZE, size - HEADER_SIZE);
    PairList pairs;
    // Smallest pair is two single-byte varints
    pairs.reserve(reader.remaining() / 4);

    while (reader.remaining() > 0) {
        std::size_t frame_offset = HEADER_SIZE + reader.position();

        if (reader.remaining() < FRAME_LENGTH_SIZE) {
            if (opts.ignore_trailing_bytes) {
                break;
            }
            return fail(Error::MisalignedPairData, frame_offset, error_offset);
        }

        std::uint32_t frame_size = 0;
        result = reader.read_u32_le(frame_size);
        if (result != Error::Ok) {
            return fail(result, frame_offset, error_offset);
        }

        if (frame_size > header.max_buffer_size) {
            return fail(Error::BufferTooLarge, frame_offset, error_offset);
        }

        ByteReader frame(nullptr, 0);
        result = reader.take(frame_size, frame);
        if (result != Error::Ok) {
            return fail(result, frame_offset, error_offset);
        }

        result = decode_frame(frame, frame_offset + FRAME_LENGTH_SIZE, opts.strict_pairs, pairs,
                              error_offset);
        if (result != Error::Ok) {
            return result;
        }
    }

    pairs.shrink_to_fit();
    out = Container(header, std::move(pairs));
    return Error::Ok;
}

Error encode(const Container& container, ByteBuffer& output) {
    const Header& header = container.header();

    ByteBuffer encoded;
    encoded.reserve(HEADER_SIZE + FRAME_LENGTH_SIZE + container.size() * 4U);
    encode_header(encoded, header);

    // The last frame is always written, even when empty
    std::size_t frame_start = encoded.size();
    std::size_t frame_bytes = 0;
    encoded.append_u32_le(0);

    for (const auto& pair : container.pairs()) {
        std::uint8_t pair_bytes[2 * MAX_VARINT_BYTES];
        std::size_t pair_size = varint_encode(pair_bytes, pair.pulse);
        pair_size += varint_encode(pair_bytes + pair_size, pair.duration);

        if (pair_size > header.max_buffer_size) {
            return Error::BufferTooLarge;
        }

        // Close the current frame when the pair does not fit
        if (frame_bytes + pair_size > header.max_buffer_size) {
            Error result =
                encoded.patch_u32_le(frame_start, static_cast<std::uint32_t>(frame_bytes));
            if (result != Error::Ok) {
                return result;
            }
            frame_start = encoded.size();
            frame_bytes = 0;
            encoded.append_u32_le(0);
        }

        encoded.append_bytes(pair_bytes, pair_size);
        frame_bytes += pair_size;
    }

    Error result = encoded.patch_u32_le(frame_start, static_cast<std::uint32_t>(frame_bytes));
    if (result != Error::Ok) {
        return result;
    }

    output.append_buffer(encoded);
    return Error::Ok;
}

} // namespace rawrfid
