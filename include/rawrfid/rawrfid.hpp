/**
 * @file rawrfid.hpp
 * @brief High-level rawrfid API.
 *
 * Includes the whole library and adds value-returning wrappers that throw
 * on failure:
 *
 * @code
 * rawrfid::Container rifl = rawrfid::load("path/to/raw.ask.raw");
 * float frequency = rifl.header().frequency;
 * const rawrfid::PairList& pads = rifl.pairs();
 * rawrfid::Signal signal = rawrfid::to_signal(pads);
 * @endcode
 */

#ifndef RAWRFID_HPP
#define RAWRFID_HPP

#include <string>
#include <vector>

#include "bytebuffer.hpp"
#include "bytereader.hpp"
#include "config.hpp"
#include "container.hpp"
#include "dsp.hpp"
#include "error.hpp"
#include "export.hpp"
#include "file.hpp"
#include "header.hpp"
#include "signal.hpp"
#include "stats.hpp"
#include "varint.hpp"

namespace rawrfid {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

#if !RAWRFID_NO_EXCEPTIONS

/**
 * @brief Decode a RIFL byte stream.
 *
 * @throws FormatException with the failing byte offset in the message
 */
inline Container decode(const std::vector<std::uint8_t>& bytes,
                        const DecodeParams* params = nullptr) {
    Container out;
    std::size_t offset = 0;
    Error result = decode(bytes.data(), bytes.size(), out, params, &offset);
    if (result != Error::Ok) {
        throw_error(result, "at byte offset " + std::to_string(offset));
    }
    return out;
}

/**
 * @brief Read and decode a RIFL file.
 *
 * @throws IoException if the file cannot be read
 * @throws FormatException if the contents are malformed
 */
inline Container load(const std::string& path, const DecodeParams* params = nullptr) {
    Container out;
    std::size_t offset = 0;
    Error result = load(path, out, params, &offset);
    if (result == Error::Io) {
        throw_error(result, path);
    }
    if (result != Error::Ok) {
        throw_error(result, path + " at byte offset " + std::to_string(offset));
    }
    return out;
}

/**
 * @brief Encode a container as RIFL bytes.
 *
 * @throws FormatException (BufferTooLarge) if a pair does not fit in a frame
 */
inline std::vector<std::uint8_t> encode(const Container& container) {
    ByteBuffer output;
    Error result = encode(container, output);
    if (result != Error::Ok) {
        throw_error(result);
    }
    return output.release();
}

/**
 * @brief Reconstruct the dense signal from pairs.
 *
 * @throws FormatException (MalformedPair) if a pulse exceeds its duration
 * @throws OverflowException if the signal exceeds MAX_SIGNAL_SAMPLES
 */
inline Signal to_signal(const PairList& pairs) {
    Signal signal;
    Error result = to_signal(pairs, signal);
    if (result != Error::Ok) {
        throw_error(result);
    }
    return signal;
}

/**
 * @brief Recover pairs from a signal's edges.
 *
 * @throws OverflowException if a run does not fit in 32 bits
 */
inline PairList to_pairs(const Signal& signal) {
    PairList pairs;
    Error result = to_pairs(signal, pairs);
    if (result != Error::Ok) {
        throw_error(result);
    }
    return pairs;
}

/**
 * @brief Gaussian smoothing of a signal into levels.
 *
 * @throws InvalidArgumentException if sigma is not positive and finite
 * @throws OverflowException if the kernel exceeds MAX_SIGNAL_SAMPLES
 */
inline Samples smooth(const Signal& signal, float sigma = DEFAULT_SMOOTH_SIGMA) {
    Samples levels;
    Error result = smooth(signal, sigma, levels);
    if (result != Error::Ok) {
        throw_error(result);
    }
    return levels;
}

/**
 * @brief Normalized autocorrelation of levels.
 *
 * @throws InvalidArgumentException for empty or constant input
 */
inline Samples autocorrelate(const Samples& samples) {
    Samples correlation;
    Error result = autocorrelate(samples, correlation);
    if (result != Error::Ok) {
        throw_error(result);
    }
    return correlation;
}

#endif // !RAWRFID_NO_EXCEPTIONS

} // namespace rawrfid

#endif // RAWRFID_HPP
