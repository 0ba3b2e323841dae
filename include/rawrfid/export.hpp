/**
 * @file export.hpp
 * @brief CSV output of pairs and signals.
 *
 * @par pad format
 * One line per pair, stream order:
 * @code
 * pulse0,duration0
 * pulse1,duration1
 * @endcode
 *
 * @par signal format
 * One line per sample, "1" for high and "0" for low.
 */

#ifndef RAWRFID_EXPORT_HPP
#define RAWRFID_EXPORT_HPP

#include <ostream>

#include "container.hpp"
#include "error.hpp"
#include "signal.hpp"

namespace rawrfid {

/**
 * @brief Write pairs in pad format.
 *
 * @return Error::Ok, or Error::Io if the stream fails
 */
Error write_pad_csv(std::ostream& out, const PairList& pairs);

/**
 * @brief Write samples in signal format.
 *
 * @return Error::Ok, or Error::Io if the stream fails
 */
Error write_signal_csv(std::ostream& out, const Signal& signal);

} // namespace rawrfid

#endif // RAWRFID_EXPORT_HPP
