#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

#include "config.hpp"
#include "options.hpp"
#include "sample_file.hpp"
#include "sdr_interface.hpp"
#include "sdrkit/error.hpp"
#include "sdrkit/logging.hpp"

static std::atomic<bool> stop_flag{false};

static void handle_signal(int sig) {
    std::cout << "Waiting for process to finish... Got signal " << sig
              << std::endl;
    stop_flag = true;
}

static void print_config(const Config& config) {
    std::cout << "* sdrkit-stream" << std::endl;
    std::cout << "* Direction: " << config.direction << std::endl;
    std::cout << "* File: " << config.file_path << std::endl;
    std::cout << "* Channel: " << config.channel << std::endl;
    if (config.frequency_hz) {
        std::cout << "* Frequency: " << *config.frequency_hz / HZ_TO_MHZ
                  << " MHz" << std::endl;
    }
    if (config.sample_rate_hz) {
        std::cout << "* Sample Rate: "
                  << *config.sample_rate_hz / SAMPLES_TO_MEGASAMPLES << " MSPS"
                  << std::endl;
    }
    if (config.bandwidth_hz) {
        std::cout << "* Bandwidth: " << *config.bandwidth_hz / HZ_TO_MHZ
                  << " MHz" << std::endl;
    }
    if (config.antenna) {
        std::cout << "* Antenna: " << *config.antenna << std::endl;
    }
    if (config.gain_db) {
        std::cout << "* Gain: " << *config.gain_db << " dB" << std::endl;
    }
}

static void print_status(const Stats& stats) {
    std::cout << "\t" << stats.samples_transferred / SAMPLES_TO_MEGASAMPLES
              << " MSmp, " << stats.samples_per_second() / SAMPLES_TO_MEGASAMPLES
              << " MSPS";
    if (stats.overflows > 0) {
        std::cout << ", " << stats.overflows << " overflows";
    }
    if (stats.timeouts > 0) {
        std::cout << ", " << stats.timeouts << " timeouts";
    }
    std::cout << std::endl;
}

int main(int argc, char** argv) {
    try {
        Config config = parse_options(argc, argv);
        if (config.show_help) {
            show_usage(std::cout, argv[0]);
            return 0;
        }

        sdrkit::set_log_level(config.verbose ? sdrkit::LogLevel::Debug
                                             : sdrkit::LogLevel::Warning);

        std::signal(SIGINT, handle_signal);

        print_config(config);

        SDRInterface sdr(config.device_filter);
        sdr.configure(config);

        std::cout << "* Using " << sdr.device().driver_key() << " "
                  << sdr.device().hardware_key() << std::endl;
        std::cout << "* Streaming (press CTRL+C to stop)" << std::endl;

        Stats stats;
        if (config.direction == sdrkit::Direction::Rx) {
            SampleFileWriter file(config.file_path);
            sdr.record(config, file, stop_flag, stats, print_status);
        } else {
            SampleFileReader file(config.file_path);
            sdr.playback(config, file, stop_flag, stats, print_status);
        }

        print_status(stats);
        std::cout << "* Shutting down" << std::endl;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        show_usage(std::cerr, argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
