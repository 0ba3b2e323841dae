/**
 * @file signal.hpp
 * @brief Dense binary signal reconstructed from pulse/duration pairs.
 *
 * One bit per sample, packed into 32-bit words.
 *
 * @par Bit Numbering Convention
 * - Sample 0 = MSB of word 0 (earliest in time)
 * - Sample 31 = LSB of word 0
 *
 * Bits past size() in the last word are always zero.
 */

#ifndef RAWRFID_SIGNAL_HPP
#define RAWRFID_SIGNAL_HPP

#include <vector>

#include "config.hpp"
#include "container.hpp"
#include "error.hpp"

namespace rawrfid {

namespace detail {

/**
 * @brief Word with @p count set bits starting @p start bits from the MSB.
 *
 * @warning Requires count >= 1 and start + count <= 32.
 */
constexpr word_t run_mask(std::size_t start, std::size_t count) noexcept {
    if (count >= BITS_PER_WORD) {
        return ~word_t{0};
    }
    return ((word_t{1} << count) - 1U) << (BITS_PER_WORD - start - count);
}

} // namespace detail

/**
 * @brief Dense bit-packed sample sequence.
 */
class Signal {
public:
    Signal() = default;

    /**
     * @brief Construct a signal of @p length low samples.
     */
    explicit Signal(std::size_t length)
        : data_((length + BITS_PER_WORD - 1) / BITS_PER_WORD, 0), size_(length) {}

    /**
     * @brief Build a signal from one byte per sample (non-zero = high).
     */
    static Signal from_samples(const std::uint8_t* samples, std::size_t count);

    /**
     * @brief Get the number of samples.
     */
    [[nodiscard]] std::size_t size() const noexcept {
        return size_;
    }

    [[nodiscard]] bool empty() const noexcept {
        return size_ == 0;
    }

    /**
     * @brief Get the number of 32-bit words used for storage.
     */
    [[nodiscard]] std::size_t num_words() const noexcept {
        return data_.size();
    }

    void clear() noexcept {
        data_.clear();
        size_ = 0;
    }

    /**
     * @brief Reserve storage for @p samples samples.
     */
    void reserve(std::size_t samples) {
        data_.reserve((samples + BITS_PER_WORD - 1) / BITS_PER_WORD);
    }

    /**
     * @brief Get sample value at position.
     *
     * @param pos Sample index
     * @return Sample value (0 or 1), 0 past the end
     */
    [[nodiscard]] inline int get_bit(std::size_t pos) const noexcept {
        if (pos >= size_) [[unlikely]]
            return 0;
        return get_bit_unchecked(pos);
    }

    /**
     * @brief Get sample value without bounds checking.
     *
     * @warning Caller must ensure pos < size().
     */
    [[nodiscard]] inline int get_bit_unchecked(std::size_t pos) const noexcept {
        std::size_t word_idx = pos >> 5;
        std::size_t bit_in_word = 31U - (pos & 31U);
        return static_cast<int>((data_[word_idx] >> bit_in_word) & 1U);
    }

    /**
     * @brief Set sample value at position, ignored past the end.
     */
    inline void set_bit(std::size_t pos, int value) noexcept {
        if (pos >= size_) [[unlikely]]
            return;
        std::size_t word_idx = pos >> 5;
        std::size_t bit_in_word = 31U - (pos & 31U);

        if (value) {
            data_[word_idx] |= (1U << bit_in_word);
        } else {
            data_[word_idx] &= ~(1U << bit_in_word);
        }
    }

    /**
     * @brief Append one sample.
     */
    void append_bit(int value) {
        append_run(value, 1);
    }

    /**
     * @brief Append @p count samples of the same level.
     *
     * Fills whole words at a time.
     *
     * @param value Level (0 or non-zero)
     * @param count Number of samples
     */
    void append_run(int value, std::size_t count);

    /**
     * @brief Length of the run of equal samples starting at @p pos.
     *
     * Scans whole words; cost is proportional to run length / 32.
     *
     * @return Run length, 0 if pos >= size()
     */
    [[nodiscard]] std::size_t run_length(std::size_t pos) const noexcept;

    /**
     * @brief Count high samples (Hamming weight).
     */
    [[nodiscard]] std::size_t hamming_weight() const noexcept;

    /**
     * @brief Expand to one byte per sample (0 or 1).
     */
    [[nodiscard]] std::vector<std::uint8_t> to_samples() const;

    [[nodiscard]] bool operator==(const Signal& other) const noexcept {
        return size_ == other.size_ && data_ == other.data_;
    }

    [[nodiscard]] bool operator!=(const Signal& other) const noexcept {
        return !(*this == other);
    }

    /**
     * @brief Get raw word storage (for advanced use).
     */
    [[nodiscard]] const word_t* data() const noexcept {
        return data_.data();
    }

private:
    std::vector<word_t> data_;
    std::size_t size_ = 0;
};

/**
 * @brief Reconstruct the dense signal from pulse/duration pairs.
 *
 * Each pair contributes @c pulse high samples followed by
 * @c duration - @c pulse low samples, in pair order. A pair with
 * pulse == duration == 0 contributes nothing.
 *
 * @param pairs Pairs in stream order
 * @param[out] signal Reconstructed signal, untouched on failure
 * @return Error::Ok on success
 *         Error::MalformedPair if any pair has pulse > duration
 *         Error::Overflow if the total exceeds MAX_SIGNAL_SAMPLES
 */
Error to_signal(const PairList& pairs, Signal& signal);

/**
 * @brief Recover pulse/duration pairs from a signal's edges.
 *
 * - a leading low run gives (0, low)
 * - each high run plus the following low run gives (high, high + low)
 * - a trailing high run without low run gives (high, high)
 *
 * @param signal Signal to scan
 * @param[out] pairs Recovered pairs, untouched on failure
 * @return Error::Ok on success
 *         Error::Overflow if a pair does not fit in 32 bits
 */
Error to_pairs(const Signal& signal, PairList& pairs);

} // namespace rawrfid

#endif // RAWRFID_SIGNAL_HPP
