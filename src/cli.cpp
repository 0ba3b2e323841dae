/**
 * @file cli.cpp
 * @brief rawrfid command line interface.
 *
 * Reads a raw RFID capture from the Flipper Zero and converts, summarizes
 * or plots the signal.
 */

#include <rawrfid/rawrfid.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace rawrfid;

static constexpr const char* BANNER = "                          \n"
                                      "  ____  ___ _____ _       \n"
                                      " |  _ \\|_ _|  ___| |      \n"
                                      " | |_) || || |_  | |      \n"
                                      " |  _ < | ||  _| | |___   \n"
                                      " |_| \\_\\___|_|   |_____|  \n"
                                      "                          \n";

static constexpr long DEFAULT_PLOT_SAMPLES = 20000;
static constexpr long DEFAULT_PLOT_WIDTH = 100;

struct Options {
    std::string command;
    const char* input = nullptr;
    const char* output = nullptr;
    bool signal_format = false;
    bool lenient = false;
    long samples = DEFAULT_PLOT_SAMPLES;
    long width = DEFAULT_PLOT_WIDTH;
};

static void print_version() {
    std::printf("rawrfid %s (C++)\n", version());
}

static void print_usage(const char* prog_name) {
    std::printf("Usage:\n");
    std::printf("  %s convert [-f pad|signal] [--lenient] <raw_file> [output_file]\n", prog_name);
    std::printf("  %s info [--lenient] <raw_file>\n", prog_name);
    std::printf("  %s plot [-n samples] [-w width] [--lenient] <raw_file>\n", prog_name);
    std::printf("  %s -h | --help\n", prog_name);
    std::printf("  %s -v | --version\n\n", prog_name);
}

static void print_help(const char* prog_name) {
    std::printf("\n%s\n", BANNER);
    std::printf("Flipper Zero raw RFID reader (v%s C++)\n", version());
    std::printf("=======================================\n\n");
    print_usage(prog_name);
    std::printf("Arguments:\n");
    std::printf("  raw_file       Raw RFID capture (xyz.ask.raw or xyz.psk.raw)\n");
    std::printf("  output_file    Converted CSV file (default: stdout, or '-')\n\n");
    std::printf("Options:\n");
    std::printf("  -f, --format   Output format [default: pad]\n");
    std::printf("                   pad:    one 'pulse,duration' line per pair\n");
    std::printf("                   signal: one '1' (high) or '0' (low) line per sample\n");
    std::printf("  -n, --samples  Samples to plot [default: %ld]\n", DEFAULT_PLOT_SAMPLES);
    std::printf("  -w, --width    Plot width in columns [default: %ld]\n", DEFAULT_PLOT_WIDTH);
    std::printf("  --lenient      Accept pairs with zero duration or pulse > duration\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Pulse and duration format:\n");
    std::printf("  ______________      __________\n");
    std::printf("                ______          __________ ...\n\n");
    std::printf("  ^ - pulse0 - ^      ^-pulse1-^\n");
    std::printf("  ^ -   duration0   -^^ -   duration1   -^\n\n");
    std::printf("  Both values are counted in samples.\n\n");
    std::printf("Examples:\n");
    std::printf("  %s convert tag.ask.raw tag.csv            # pairs as CSV\n", prog_name);
    std::printf("  %s convert -f signal tag.ask.raw - | head # signal on stdout\n", prog_name);
    std::printf("  %s plot -n 5000 tag.ask.raw               # text waveform\n\n", prog_name);
}

static bool parse_positive(const char* text, long& value) {
    char* end = nullptr;
    long parsed = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || parsed <= 0) {
        return false;
    }
    value = parsed;
    return true;
}

static bool load_container(const Options& opts, Container& container) {
    DecodeParams params;
    params.strict_pairs = !opts.lenient;

    std::size_t offset = 0;
    Error result = load(opts.input, container, &params, &offset);
    if (result == Error::Io) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", opts.input);
        return false;
    }
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s at byte offset %zu: %s\n", error_string(result), offset,
                     opts.input);
        return false;
    }
    return true;
}

static bool make_signal(const Container& container, Signal& signal) {
    Error result = to_signal(container.pairs(), signal);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Cannot reconstruct signal: %s\n", error_string(result));
        return false;
    }
    return true;
}

static int do_convert(const Options& opts) {
    Container container;
    if (!load_container(opts, container)) {
        return 1;
    }

    std::ofstream file;
    std::ostream* out = &std::cout;
    const bool to_stdout = opts.output == nullptr || std::strcmp(opts.output, "-") == 0;
    if (!to_stdout) {
        file.open(opts.output, std::ios::binary | std::ios::trunc);
        if (!file) {
            std::fprintf(stderr, "Error: Cannot write output file: %s\n", opts.output);
            return 1;
        }
        out = &file;
    }

    Error result;
    if (opts.signal_format) {
        Signal signal;
        if (!make_signal(container, signal)) {
            return 1;
        }
        result = write_signal_csv(*out, signal);
    } else {
        result = write_pad_csv(*out, container.pairs());
    }

    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Cannot write output: %s\n",
                     to_stdout ? "stdout" : opts.output);
        return 1;
    }

    return 0;
}

static int do_info(const Options& opts) {
    Container container;
    if (!load_container(opts, container)) {
        return 1;
    }

    const Header& header = container.header();
    PairStats stats = compute_stats(container.pairs());

    std::printf("Input:       %s\n", opts.input);
    std::printf("Version:     %u\n", header.version);
    std::printf("Frequency:   %.1f Hz\n", static_cast<double>(header.frequency));
    std::printf("Duty cycle:  %.2f\n", static_cast<double>(header.duty_cycle));
    std::printf("Max buffer:  %u bytes\n", header.max_buffer_size);
    std::printf("Pairs:       %zu\n", stats.count);
    std::printf("Samples:     %llu\n", static_cast<unsigned long long>(stats.total_samples));
    if (stats.count > 0) {
        std::printf("Pulse:       min %u, mean %.1f, max %u\n", stats.min_pulse, stats.mean_pulse,
                    stats.max_pulse);
        std::printf("Duration:    min %u, mean %.1f, max %u\n", stats.min_duration,
                    stats.mean_duration, stats.max_duration);
        std::printf("Low:         min %u, max %u\n", stats.min_low, stats.max_low);
    }

    return 0;
}

static int do_plot(const Options& opts) {
    Container container;
    if (!load_container(opts, container)) {
        return 1;
    }

    Signal signal;
    if (!make_signal(container, signal)) {
        return 1;
    }

    std::size_t samples = static_cast<std::size_t>(opts.samples);
    if (samples > signal.size()) {
        samples = signal.size();
    }
    if (samples == 0) {
        std::printf("(empty signal)\n");
        return 0;
    }

    std::size_t columns = static_cast<std::size_t>(opts.width);
    if (columns > samples) {
        columns = samples;
    }
    std::size_t per_column = (samples + columns - 1) / columns;
    columns = (samples + per_column - 1) / per_column;

    // Column is high when at least half of its samples are high
    std::string high_row(columns, ' ');
    std::string low_row(columns, ' ');
    for (std::size_t col = 0; col < columns; ++col) {
        std::size_t start = col * per_column;
        std::size_t end = start + per_column;
        if (end > samples) {
            end = samples;
        }
        std::size_t high = 0;
        for (std::size_t i = start; i < end; ++i) {
            high += static_cast<std::size_t>(signal.get_bit_unchecked(i));
        }
        if (2 * high >= end - start) {
            high_row[col] = '-';
        } else {
            low_row[col] = '_';
        }
    }

    std::printf("%s\n%s\n", high_row.c_str(), low_row.c_str());
    std::printf("Samples 0-%zu of %zu, %zu per column\n", samples - 1, signal.size(), per_column);

    return 0;
}

static bool parse_options(int argc, char** argv, Options& opts, std::string& error) {
    std::vector<const char*> positional;

    for (int i = 2; i < argc; ++i) {
        const char* arg = argv[i];
        const bool has_value = (i + 1) < argc;

        if (std::strcmp(arg, "-f") == 0 || std::strcmp(arg, "--format") == 0 ||
            std::strncmp(arg, "--format=", 9) == 0) {
            const char* value = nullptr;
            if (std::strncmp(arg, "--format=", 9) == 0) {
                value = arg + 9;
            } else if (has_value) {
                value = argv[++i];
            }
            if (value == nullptr) {
                error = std::string(arg) + " requires a value";
                return false;
            }
            if (std::strcmp(value, "pad") == 0) {
                opts.signal_format = false;
            } else if (std::strcmp(value, "signal") == 0) {
                opts.signal_format = true;
            } else {
                error = std::string("Format must be one of: pad/signal but was \"") + value + "\"";
                return false;
            }
        } else if (std::strcmp(arg, "-n") == 0 || std::strcmp(arg, "--samples") == 0) {
            if (!has_value || !parse_positive(argv[++i], opts.samples)) {
                error = std::string(arg) + " requires a positive number";
                return false;
            }
        } else if (std::strcmp(arg, "-w") == 0 || std::strcmp(arg, "--width") == 0) {
            if (!has_value || !parse_positive(argv[++i], opts.width)) {
                error = std::string(arg) + " requires a positive number";
                return false;
            }
        } else if (std::strcmp(arg, "--lenient") == 0) {
            opts.lenient = true;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            error = std::string("Unknown option: ") + arg;
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    const std::size_t max_positional = (opts.command == "convert") ? 2 : 1;
    if (positional.empty() || positional.size() > max_positional) {
        error = opts.command + " expects " +
                (max_positional == 2 ? "<raw_file> [output_file]" : "<raw_file>");
        return false;
    }

    opts.input = positional[0];
    if (positional.size() > 1) {
        opts.output = positional[1];
    }
    return true;
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    Options opts;
    opts.command = argv[1];
    if (opts.command != "convert" && opts.command != "info" && opts.command != "plot") {
        print_usage(argv[0]);
        std::fflush(stdout);
        std::fprintf(stderr, "Error: Unknown command: %s\n", argv[1]);
        return 1;
    }

    std::string error;
    if (!parse_options(argc, argv, opts, error)) {
        print_usage(argv[0]);
        std::fflush(stdout);
        std::fprintf(stderr, "Error: %s\n", error.c_str());
        return 1;
    }

    if (opts.command == "convert") {
        return do_convert(opts);
    }
    if (opts.command == "info") {
        return do_info(opts);
    }
    return do_plot(opts);
}
