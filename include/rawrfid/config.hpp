/**
 * @file config.hpp
 * @brief rawrfid compile-time configuration and RIFL format constants.
 *
 * RIFL: raw low-frequency RFID captures written by the Flipper Zero
 * (xyz.ask.raw / xyz.psk.raw).
 */

#ifndef RAWRFID_CONFIG_HPP
#define RAWRFID_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace rawrfid {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup format RIFL Format Constants
 * @{
 */

/// "RIFL" read as a little-endian u32
inline constexpr std::uint32_t RIFL_MAGIC = 0x4C464952U;

/// Only supported file version
inline constexpr std::uint32_t RIFL_VERSION = 1U;

/// magic + version + frequency + duty_cycle + max_buffer_size
inline constexpr std::size_t HEADER_SIZE = 20U;

/// Every pair buffer is prefixed by its byte length as u32
inline constexpr std::size_t FRAME_LENGTH_SIZE = 4U;

/// 32 value bits at 7 bits per byte
inline constexpr std::size_t MAX_VARINT_BYTES = 5U;

/// Values the Flipper firmware writes for an ASK capture
inline constexpr std::uint32_t DEFAULT_MAX_BUFFER_SIZE = 2048U;
inline constexpr float DEFAULT_FREQUENCY = 125000.0F;
inline constexpr float DEFAULT_DUTY_CYCLE = 0.5F;

/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Upper bound on reconstructed signal length in samples
#ifndef RAWRFID_MAX_SIGNAL_SAMPLES
#define RAWRFID_MAX_SIGNAL_SAMPLES (1ULL << 30U)
#endif

inline constexpr std::uint64_t MAX_SIGNAL_SAMPLES = RAWRFID_MAX_SIGNAL_SAMPLES;

/// Default Gaussian sigma for smooth(), in samples
inline constexpr float DEFAULT_SMOOTH_SIGMA = 10.0F;

/// Gaussian kernel radius in sigmas
inline constexpr float SMOOTH_TRUNCATE = 4.0F;

/// Default level threshold for binarize()
inline constexpr float DEFAULT_BINARIZE_THRESHOLD = 0.5F;

/// 32-bit word type for packed signal storage
using word_t = std::uint32_t;
inline constexpr std::size_t BITS_PER_WORD = 32U;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define RAWRFID_NO_EXCEPTIONS=1 to drop the throwing API and build
 * with -fno-exceptions.
 * @{
 */
#ifndef RAWRFID_NO_EXCEPTIONS
#define RAWRFID_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace rawrfid

#endif // RAWRFID_CONFIG_HPP
