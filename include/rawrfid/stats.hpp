/**
 * @file stats.hpp
 * @brief Summary statistics over pulse/duration pairs.
 */

#ifndef RAWRFID_STATS_HPP
#define RAWRFID_STATS_HPP

#include "config.hpp"
#include "container.hpp"

namespace rawrfid {

/**
 * @brief Pair statistics. All fields are zero for an empty pair list.
 *
 * Low lengths are only taken from pairs with pulse <= duration.
 */
struct PairStats {
    std::size_t count = 0;
    std::uint64_t total_samples = 0;
    std::uint32_t min_pulse = 0;
    std::uint32_t max_pulse = 0;
    std::uint32_t min_duration = 0;
    std::uint32_t max_duration = 0;
    std::uint32_t min_low = 0;
    std::uint32_t max_low = 0;
    double mean_pulse = 0.0;
    double mean_duration = 0.0;
};

/**
 * @brief Compute statistics in one pass.
 */
PairStats compute_stats(const PairList& pairs) noexcept;

} // namespace rawrfid

#endif // RAWRFID_STATS_HPP
