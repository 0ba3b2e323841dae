/**
 * @file dsp.cpp
 * @brief Smoothing, thresholding and autocorrelation of signals.
 */

#include <rawrfid/dsp.hpp>

#include <fftw3.h>

#include <climits>
#include <cmath>
#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>

namespace rawrfid {

namespace {

struct FftwFree {
    void operator()(void* ptr) const noexcept {
        fftwf_free(ptr);
    }
};

struct FftwPlanDestroy {
    void operator()(fftwf_plan plan) const noexcept {
        fftwf_destroy_plan(plan);
    }
};

using RealBuffer = std::unique_ptr<float, FftwFree>;
using ComplexBuffer = std::unique_ptr<fftwf_complex, FftwFree>;
using Plan = std::unique_ptr<std::remove_pointer_t<fftwf_plan>, FftwPlanDestroy>;

} // namespace

Samples to_levels(const Signal& signal) {
    Samples levels(signal.size(), 0.0F);
    for (std::size_t i = 0; i < signal.size(); ++i) {
        levels[i] = static_cast<float>(signal.get_bit_unchecked(i));
    }
    return levels;
}

Signal binarize(const Samples& samples, float threshold) {
    Signal signal;
    signal.reserve(samples.size());

    std::size_t pos = 0;
    while (pos < samples.size()) {
        const bool high = samples[pos] > threshold;
        std::size_t end = pos + 1;
        while (end < samples.size() && (samples[end] > threshold) == high) {
            ++end;
        }
        signal.append_run(high ? 1 : 0, end - pos);
        pos = end;
    }

    return signal;
}

Error smooth(const Signal& signal, float sigma, Samples& out) {
    if (!std::isfinite(sigma) || sigma <= 0.0F) {
        return Error::InvalidArg;
    }

    const double radius_real = static_cast<double>(SMOOTH_TRUNCATE) * sigma + 0.5;
    if (radius_real > static_cast<double>(MAX_SIGNAL_SAMPLES)) {
        return Error::Overflow;
    }
    const auto radius = static_cast<std::ptrdiff_t>(radius_real);

    // Symmetric kernel, index radius is the center
    std::vector<double> kernel(static_cast<std::size_t>(2 * radius + 1));
    const double scale = -0.5 / (static_cast<double>(sigma) * sigma);
    double total = 0.0;
    for (std::ptrdiff_t k = -radius; k <= radius; ++k) {
        double weight = std::exp(scale * static_cast<double>(k * k));
        kernel[static_cast<std::size_t>(k + radius)] = weight;
        total += weight;
    }
    for (double& weight : kernel) {
        weight /= total;
    }

    const Samples levels = to_levels(signal);
    const auto last = static_cast<std::ptrdiff_t>(levels.size()) - 1;

    Samples result(levels.size(), 0.0F);
    for (std::ptrdiff_t i = 0; i <= last; ++i) {
        double acc = 0.0;
        for (std::ptrdiff_t k = -radius; k <= radius; ++k) {
            std::ptrdiff_t j = i + k;
            // Nearest edge sample outside the signal
            if (j < 0) {
                j = 0;
            } else if (j > last) {
                j = last;
            }
            acc += kernel[static_cast<std::size_t>(k + radius)] *
                   static_cast<double>(levels[static_cast<std::size_t>(j)]);
        }
        result[static_cast<std::size_t>(i)] = static_cast<float>(acc);
    }

    out = std::move(result);
    return Error::Ok;
}

Error autocorrelate(const Samples& samples, Samples& out) {
    const std::size_t n = samples.size();
    if (n == 0) {
        return Error::InvalidArg;
    }

    double mean = 0.0;
    for (float value : samples) {
        mean += value;
    }
    mean /= static_cast<double>(n);

    double variance = 0.0;
    for (float value : samples) {
        double centered = value - mean;
        variance += centered * centered;
    }
    variance /= static_cast<double>(n);
    if (!(variance > 0.0)) {
        return Error::InvalidArg;
    }

    // Zero padding to 2n - 1 avoids circular wrap-around
    std::size_t fft_size = 1;
    while (fft_size < 2 * n - 1) {
        fft_size <<= 1U;
    }
    if (fft_size > static_cast<std::size_t>(INT_MAX)) {
        return Error::Overflow;
    }
    const int size = static_cast<int>(fft_size);
    const std::size_t bins = fft_size / 2 + 1;

    RealBuffer real(fftwf_alloc_real(fft_size));
    ComplexBuffer spectrum(fftwf_alloc_complex(bins));
    if (!real || !spectrum) {
        return Error::Overflow;
    }

    Plan forward(fftwf_plan_dft_r2c_1d(size, real.get(), spectrum.get(), FFTW_ESTIMATE));
    Plan backward(fftwf_plan_dft_c2r_1d(size, spectrum.get(), real.get(), FFTW_ESTIMATE));
    if (!forward || !backward) {
        return Error::InvalidArg;
    }

    float* data = real.get();
    for (std::size_t i = 0; i < fft_size; ++i) {
        data[i] = (i < n) ? static_cast<float>(samples[i] - mean) : 0.0F;
    }

    fftwf_execute(forward.get());

    // Power spectrum
    fftwf_complex* bin = spectrum.get();
    for (std::size_t i = 0; i < bins; ++i) {
        float re = bin[i][0];
        float im = bin[i][1];
        bin[i][0] = re * re + im * im;
        bin[i][1] = 0.0F;
    }

    fftwf_execute(backward.get());

    // c2r is unnormalized
    const double norm = 1.0 / (static_cast<double>(fft_size) * variance * static_cast<double>(n));
    Samples result(fft_size / 2);
    for (std::size_t lag = 0; lag < result.size(); ++lag) {
        result[lag] = static_cast<float>(static_cast<double>(data[lag]) * norm);
    }

    out = std::move(result);
    return Error::Ok;
}

} // namespace rawrfid
