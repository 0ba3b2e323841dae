/**
 * @file stats.cpp
 * @brief Pair statistics.
 */

#include <rawrfid/stats.hpp>

#include <algorithm>

namespace rawrfid {

PairStats compute_stats(const PairList& pairs) noexcept {
    PairStats stats;
    if (pairs.empty()) {
        return stats;
    }

    stats.count = pairs.size();
    stats.min_pulse = pairs.front().pulse;
    stats.min_duration = pairs.front().duration;

    bool have_low = false;
    std::uint64_t pulse_sum = 0;

    for (const auto& pair : pairs) {
        stats.min_pulse = std::min(stats.min_pulse, pair.pulse);
        stats.max_pulse = std::max(stats.max_pulse, pair.pulse);
        stats.min_duration = std::min(stats.min_duration, pair.duration);
        stats.max_duration = std::max(stats.max_duration, pair.duration);
        pulse_sum += pair.pulse;
        stats.total_samples += pair.duration;

        if (pair.pulse <= pair.duration) {
            std::uint32_t low = pair.low();
            stats.min_low = have_low ? std::min(stats.min_low, low) : low;
            stats.max_low = std::max(stats.max_low, low);
            have_low = true;
        }
    }

    stats.mean_pulse = static_cast<double>(pulse_sum) / static_cast<double>(stats.count);
    stats.mean_duration =
        static_cast<double>(stats.total_samples) / static_cast<double>(stats.count);
    return stats;
}

} // namespace rawrfid
