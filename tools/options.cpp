#include "options.hpp"

#include <getopt.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

double parse_num(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Invalid number: empty");
    }

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || errno == ERANGE || !std::isfinite(value)) {
        throw std::invalid_argument("Invalid number: " + text);
    }

    std::string suffix(end);
    if (suffix == "k" || suffix == "K") {
        value = kHz(value);
    } else if (suffix == "M") {
        value = MHz(value);
    } else if (suffix == "G") {
        value = GHz(value);
    } else if (!suffix.empty()) {
        throw std::invalid_argument("Invalid number: " + text);
    }
    return value;
}

// One past the largest value of T, exactly representable as a double.
template <typename T>
static double integer_limit() {
    return std::ldexp(1.0, std::numeric_limits<T>::digits);
}

static std::uint64_t parse_count(const std::string& text) {
    const double value = parse_num(text);
    if (value < 1 || value != std::floor(value) ||
        value >= integer_limit<std::uint64_t>()) {
        throw std::invalid_argument("Invalid count: " + text);
    }
    return static_cast<std::uint64_t>(value);
}

static std::size_t parse_index(const std::string& text) {
    const double value = parse_num(text);
    if (value < 0 || value != std::floor(value) ||
        value >= integer_limit<std::size_t>()) {
        throw std::invalid_argument("Invalid channel: " + text);
    }
    return static_cast<std::size_t>(value);
}

Config parse_options(int argc, char** argv) {
    static const struct option long_options[] = {
        {"device", required_argument, nullptr, 'd'},
        {"receive", required_argument, nullptr, 'r'},
        {"transmit", required_argument, nullptr, 't'},
        {"channel", required_argument, nullptr, 'c'},
        {"frequency", required_argument, nullptr, 'f'},
        {"rate", required_argument, nullptr, 's'},
        {"antenna", required_argument, nullptr, 'a'},
        {"bandwidth", required_argument, nullptr, 'b'},
        {"gain", required_argument, nullptr, 'g'},
        {"count", required_argument, nullptr, 'n'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    Config config = Config::default_config();
    std::string rx_path;
    std::string tx_path;
    std::optional<std::uint64_t> count;

    // Restart the scan so a process can parse more than one command line.
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "d:r:t:c:f:s:a:b:g:n:vh",
                              long_options, nullptr)) != -1) {
        switch (opt) {
            case 'd':
                config.device_filter = optarg;
                break;
            case 'r':
                rx_path = optarg;
                break;
            case 't':
                tx_path = optarg;
                break;
            case 'c':
                config.channel = parse_index(optarg);
                break;
            case 'f':
                config.frequency_hz = parse_num(optarg);
                break;
            case 's':
                config.sample_rate_hz = parse_num(optarg);
                break;
            case 'a':
                config.antenna = std::string(optarg);
                break;
            case 'b':
                config.bandwidth_hz = parse_num(optarg);
                break;
            case 'g':
                config.gain_db = parse_num(optarg);
                break;
            case 'n':
                count = parse_count(optarg);
                break;
            case 'v':
                config.verbose = true;
                break;
            case 'h':
                config.show_help = true;
                return config;
            default:
                throw std::invalid_argument("Unknown or incomplete option: " +
                                            std::string(argv[optind - 1]));
        }
    }

    if (optind < argc) {
        throw std::invalid_argument("Unexpected argument: " +
                                    std::string(argv[optind]));
    }

    if (rx_path.empty() == tx_path.empty()) {
        throw std::invalid_argument(
            "Specify exactly one of --receive FILE or --transmit FILE");
    }

    if (!rx_path.empty()) {
        config.direction = sdrkit::Direction::Rx;
        config.file_path = rx_path;
        if (count) config.num_samples = *count;
    } else {
        config.direction = sdrkit::Direction::Tx;
        config.file_path = tx_path;
        if (count) config.repeat = *count;
    }

    if (!config.is_valid()) {
        throw std::invalid_argument("Invalid configuration");
    }
    return config;
}

void show_usage(std::ostream& os, const char* progname) {
    os << "Usage: " << progname << " (-r FILE | -t FILE) [options]" << std::endl;
    os << std::endl;
    os << "Streams raw CF32 samples between a file and an SDR." << std::endl;
    os << std::endl;
    os << "Options:" << std::endl;
    os << "  -r, --receive FILE     Record samples to FILE" << std::endl;
    os << "  -t, --transmit FILE    Transmit samples from FILE" << std::endl;
    os << "  -d, --device ARGS      Device filter, e.g. driver=hackrf"
       << std::endl;
    os << "  -c, --channel N        Channel (default: 0)" << std::endl;
    os << "  -f, --frequency HZ     Center frequency" << std::endl;
    os << "  -s, --rate HZ          Sample rate" << std::endl;
    os << "  -a, --antenna NAME     Antenna" << std::endl;
    os << "  -b, --bandwidth HZ     Filter bandwidth" << std::endl;
    os << "  -g, --gain DB          Overall gain" << std::endl;
    os << "  -n, --count N          Samples to record, or times to transmit "
          "FILE"
       << std::endl;
    os << "  -v, --verbose          Show debug messages" << std::endl;
    os << "  -h, --help             Show this help" << std::endl;
    os << std::endl;
    os << "Numbers accept k, M and G suffixes." << std::endl;
    os << std::endl;
    os << "Examples:" << std::endl;
    os << "  " << progname << " -d driver=rtlsdr -f 100.1M -s 2.4M -n 10M -r "
       << "fm.cf32" << std::endl;
    os << "  " << progname << " -d driver=hackrf -f 433.92M -s 2M -t burst.cf32"
       << std::endl;
}
