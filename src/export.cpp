/**
 * @file export.cpp
 * @brief CSV output of pairs and signals.
 */

#include <rawrfid/export.hpp>

#include <string>

namespace rawrfid {

Error write_pad_csv(std::ostream& out, const PairList& pairs) {
    std::string line;
    for (const auto& pair : pairs) {
        line = std::to_string(pair.pulse);
        line += ',';
        line += std::to_string(pair.duration);
        line += '\n';
        out.write(line.data(), static_cast<std::streamsize>(line.size()));
        if (!out) {
            return Error::Io;
        }
    }
    out.flush();
    return out ? Error::Ok : Error::Io;
}

Error write_signal_csv(std::ostream& out, const Signal& signal) {
    // Two chars per sample: digit and newline
    constexpr std::size_t chunk_samples = 4096;
    char chunk[chunk_samples * 2];

    std::size_t pos = 0;
    while (pos < signal.size()) {
        std::size_t count = signal.size() - pos;
        if (count > chunk_samples) {
            count = chunk_samples;
        }
        for (std::size_t i = 0; i < count; ++i) {
            chunk[2 * i] = signal.get_bit_unchecked(pos + i) ? '1' : '0';
            chunk[2 * i + 1] = '\n';
        }
        out.write(chunk, static_cast<std::streamsize>(count * 2));
        if (!out) {
            return Error::Io;
        }
        pos += count;
    }
    out.flush();
    return out ? Error::Ok : Error::Io;
}

} // namespace rawrfid
