#include <iostream>
#include <string>
#include <vector>

#include "config.hpp"
#include "sdrkit/device.hpp"
#include "sdrkit/error.hpp"

using sdrkit::Device;
using sdrkit::Direction;

static void print_ranges(const std::vector<sdrkit::Range>& ranges,
                         double scale, const char* units) {
    bool first = true;
    for (const auto& range : ranges) {
        if (!first) std::cout << ", ";
        first = false;
        if (range.minimum == range.maximum) {
            std::cout << range.minimum / scale;
        } else {
            std::cout << "[" << range.minimum / scale << ", "
                      << range.maximum / scale << "]";
        }
    }
    std::cout << " " << units << std::endl;
}

static void print_list(const std::vector<std::string>& names) {
    bool first = true;
    for (const auto& name : names) {
        if (!first) std::cout << ", ";
        first = false;
        std::cout << name;
    }
    std::cout << std::endl;
}

static void print_channel(const Device& device, Direction dir,
                          std::size_t ch) {
    std::cout << "  " << dir << " channel " << ch << std::endl;

    std::cout << "    Frequencies: ";
    print_ranges(device.frequency_range(dir, ch), HZ_TO_MHZ, "MHz");

    std::cout << "    Sample rates: ";
    print_ranges(device.sample_rate_range(dir, ch), SAMPLES_TO_MEGASAMPLES,
                 "MSPS");

    std::cout << "    Antennas: ";
    print_list(device.antennas(dir, ch));

    const auto gain = device.gain_range(dir, ch);
    std::cout << "    Gain: [" << gain.minimum << ", " << gain.maximum
              << "] dB" << std::endl;
    for (const auto& name : device.list_gains(dir, ch)) {
        const auto range = device.gain_element_range(dir, ch, name);
        std::cout << "      " << name << ": [" << range.minimum << ", "
                  << range.maximum << "] dB" << std::endl;
    }

    std::cout << "    Formats: ";
    print_list(device.stream_formats(dir, ch));
}

int main(int argc, char** argv) {
    if (argc > 2 || (argc == 2 && (std::string(argv[1]) == "-h" ||
                                   std::string(argv[1]) == "--help"))) {
        std::cout << "Usage: " << argv[0] << " [device_filter]" << std::endl;
        return argc > 2 ? 1 : 0;
    }

    int status = 0;
    try {
        const sdrkit::Args filter(argc == 2 ? argv[1] : "");
        const auto devices = Device::enumerate(filter);
        if (devices.empty()) {
            std::cout << "No devices found" << std::endl;
            return 0;
        }

        for (const auto& args : devices) {
            std::cout << "Device: " << args << std::endl;
            try {
                const Device device(args);
                std::cout << "  Driver: " << device.driver_key()
                          << ", hardware: " << device.hardware_key()
                          << std::endl;
                for (Direction dir : {Direction::Rx, Direction::Tx}) {
                    const std::size_t count = device.num_channels(dir);
                    for (std::size_t ch = 0; ch < count; ++ch) {
                        print_channel(device, dir, ch);
                    }
                }
            } catch (const sdrkit::Error& e) {
                std::cerr << "  Error: " << e.what() << std::endl;
                status = 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return status;
}
