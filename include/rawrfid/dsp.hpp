/**
 * @file dsp.hpp
 * @brief Analog-style processing of reconstructed signals.
 *
 * Levels are floats, one per sample. A Signal converts to levels 0.0/1.0
 * and back with a threshold.
 *
 * Typical clean-up of a noisy capture:
 * @code
 * rawrfid::Samples levels;
 * rawrfid::smooth(signal, 10.0F, levels);
 * rawrfid::Signal clean = rawrfid::binarize(levels);
 * @endcode
 */

#ifndef RAWRFID_DSP_HPP
#define RAWRFID_DSP_HPP

#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "signal.hpp"

namespace rawrfid {

using Samples = std::vector<float>;

/**
 * @brief Expand a signal to levels, 1.0 for high and 0.0 for low.
 */
Samples to_levels(const Signal& signal);

/**
 * @brief Threshold levels into a signal.
 *
 * @param samples Levels
 * @param threshold A sample is high when strictly above this value
 */
Signal binarize(const Samples& samples, float threshold = DEFAULT_BINARIZE_THRESHOLD);

/**
 * @brief Gaussian smoothing.
 *
 * The kernel is cut off at SMOOTH_TRUNCATE sigmas and normalized to sum 1.
 * Samples beyond either end repeat the nearest edge sample.
 *
 * @param signal Input signal
 * @param sigma Standard deviation in samples, must be positive and finite
 * @param[out] out Smoothed levels, same length as the signal; untouched
 *             on failure
 * @return Error::Ok, Error::InvalidArg for a bad sigma, or
 *         Error::Overflow if the kernel exceeds MAX_SIGNAL_SAMPLES
 */
Error smooth(const Signal& signal, float sigma, Samples& out);

/**
 * @brief Normalized autocorrelation, FFT based.
 *
 * The mean is removed and the result divided by variance and length, so
 * lag 0 is 1.0. The input is zero padded to the next power of two of at
 * least 2n - 1 samples; half that many lags are returned, lags n and
 * above being zero.
 *
 * @param samples Input levels
 * @param[out] out Correlation per lag; untouched on failure
 * @return Error::Ok
 *         Error::InvalidArg for empty or constant input (zero variance)
 *         Error::Overflow if the transform size does not fit FFTW's int
 */
Error autocorrelate(const Samples& samples, Samples& out);

} // namespace rawrfid

#endif // RAWRFID_DSP_HPP
