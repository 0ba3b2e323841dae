/**
 * @file signal.cpp
 * @brief Signal storage and pair/signal conversion.
 */

#include <rawrfid/signal.hpp>

#include <algorithm>
#include <utility>

namespace rawrfid {

Signal Signal::from_samples(const std::uint8_t* samples, std::size_t count) {
    Signal signal;
    signal.reserve(count);

    std::size_t pos = 0;
    while (pos < count) {
        int level = samples[pos] != 0 ? 1 : 0;
        std::size_t end = pos + 1;
        while (end < count && (samples[end] != 0 ? 1 : 0) == level) {
            ++end;
        }
        signal.append_run(level, end - pos);
        pos = end;
    }

    return signal;
}

void Signal::append_run(int value, std::size_t count) {
    if (count == 0) {
        return;
    }

    std::size_t pos = size_;
    size_ += count;
    // New words are zero, so low runs need no further work
    data_.resize((size_ + BITS_PER_WORD - 1) / BITS_PER_WORD, 0);

    if (!value) {
        return;
    }

    // Head: fill up the partially used word
    std::size_t bit = pos & 31U;
    if (bit != 0) {
        std::size_t n = std::min(count, BITS_PER_WORD - bit);
        data_[pos >> 5] |= detail::run_mask(bit, n);
        pos += n;
        count -= n;
    }

    // Body: whole words
    while (count >= BITS_PER_WORD) {
        data_[pos >> 5] = ~word_t{0};
        pos += BITS_PER_WORD;
        count -= BITS_PER_WORD;
    }

    // Tail
    if (count > 0) {
        data_[pos >> 5] |= detail::run_mask(0, count);
    }
}

std::size_t Signal::run_length(std::size_t pos) const noexcept {
    if (pos >= size_) {
        return 0;
    }

    // XOR with the run level turns every differing sample into a set bit
    word_t flip = get_bit_unchecked(pos) ? ~word_t{0} : word_t{0};
    std::size_t word_idx = pos >> 5;
    word_t diff = (data_[word_idx] ^ flip) & (~word_t{0} >> (pos & 31U));

    while (diff == 0) {
        ++word_idx;
        if (word_idx >= data_.size()) {
            return size_ - pos;
        }
        diff = data_[word_idx] ^ flip;
    }

    std::size_t edge = (word_idx << 5) + static_cast<std::size_t>(__builtin_clz(diff));
    // Padding past size_ is zero and shows up as an edge for high runs
    return std::min(edge, size_) - pos;
}

std::size_t Signal::hamming_weight() const noexcept {
    std::size_t count = 0;
    for (word_t word : data_) {
        count += static_cast<std::size_t>(__builtin_popcount(word));
    }
    return count;
}

std::vector<std::uint8_t> Signal::to_samples() const {
    std::vector<std::uint8_t> samples(size_, 0);
    for (std::size_t i = 0; i < size_; ++i) {
        samples[i] = static_cast<std::uint8_t>(get_bit_unchecked(i));
    }
    return samples;
}

Error to_signal(const PairList& pairs, Signal& signal) {
    std::uint64_t total = 0;
    for (const auto& pair : pairs) {
        if (pair.pulse > pair.duration) {
            return Error::MalformedPair;
        }
        total += pair.duration;
    }

    if (total > MAX_SIGNAL_SAMPLES) {
        return Error::Overflow;
    }

    Signal result;
    result.reserve(static_cast<std::size_t>(total));
    for (const auto& pair : pairs) {
        result.append_run(1, pair.pulse);
        result.append_run(0, pair.low());
    }

    signal = std::move(result);
    return Error::Ok;
}

Error to_pairs(const Signal& signal, PairList& pairs) {
    constexpr std::size_t max_value = 0xFFFFFFFFU;

    PairList result;
    std::size_t pos = 0;

    // Signal starting low: the first pair has no pulse
    if (!signal.empty() && signal.get_bit_unchecked(0) == 0) {
        std::size_t low = signal.run_length(0);
        if (low > max_value) {
            return Error::Overflow;
        }
        result.push_back({0, static_cast<std::uint32_t>(low)});
        pos = low;
    }

    while (pos < signal.size()) {
        std::size_t high = signal.run_length(pos);
        pos += high;
        // 0 at the end of the signal
        std::size_t low = signal.run_length(pos);
        pos += low;

        if (high + low > max_value) {
            return Error::Overflow;
        }
        result.push_back(
            {static_cast<std::uint32_t>(high), static_cast<std::uint32_t>(high + low)});
    }

    pairs = std::move(result);
    return Error::Ok;
}

} // namespace rawrfid
