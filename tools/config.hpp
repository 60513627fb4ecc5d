#pragma once

#include <chrono>
#include <complex>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "sdrkit/types.hpp"

// Type aliases for clarity
using Complex = std::complex<float>;
using IQBuffer = std::vector<Complex>;

// STREAM CONSTANTS
constexpr long STREAM_TIMEOUT_US = 1000000;
constexpr std::size_t STREAM_FALLBACK_MTU = 1024;
constexpr std::uint64_t UNLIMITED_SAMPLES =
    std::numeric_limits<std::uint64_t>::max();

// STATUS CONSTANTS
constexpr int STATUS_UPDATE_INTERVAL_SEC = 2;

// UNIT CONVERSION HELPERS
constexpr double SAMPLES_TO_MEGASAMPLES = 1e6;
constexpr double HZ_TO_MHZ = 1e6;

constexpr double GHz(double x) { return x * 1000000000.0; }
constexpr double MHz(double x) { return x * 1000000.0; }
constexpr double kHz(double x) { return x * 1000.0; }

// Settings of one sdrkit-stream run
struct Config {
    // Transfer settings
    sdrkit::Direction direction = sdrkit::Direction::Rx;
    std::string file_path;
    // Rx: samples to record. Tx: times to play the file.
    std::uint64_t num_samples = UNLIMITED_SAMPLES;
    std::uint64_t repeat = 1;
    long timeout_us = STREAM_TIMEOUT_US;

    // Device settings
    std::string device_filter;
    std::size_t channel = 0;

    // Radio settings, left alone when unset
    std::optional<double> frequency_hz;
    std::optional<double> sample_rate_hz;
    std::optional<double> bandwidth_hz;
    std::optional<double> gain_db;
    std::optional<std::string> antenna;

    bool verbose = false;
    bool show_help = false;

    // Validation
    bool is_valid() const {
        return !file_path.empty() && num_samples > 0 && repeat > 0 &&
               timeout_us > 0 && (!frequency_hz || *frequency_hz > 0) &&
               (!sample_rate_hz || *sample_rate_hz > 0) &&
               (!bandwidth_hz || *bandwidth_hz > 0);
    }

    static Config default_config() { return Config{}; }
};

// Statistics for monitoring
struct Stats {
    std::uint64_t samples_transferred = 0;
    std::uint64_t overflows = 0;
    std::uint64_t timeouts = 0;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point last_update;

    Stats()
        : start_time(std::chrono::steady_clock::now()),
          last_update(start_time) {}

    double elapsed_seconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time).count();
    }

    double samples_per_second() const {
        auto elapsed = elapsed_seconds();
        return elapsed > 0 ? samples_transferred / elapsed : 0.0;
    }

    bool should_update_status() const {
        auto now = std::chrono::steady_clock::now();
        auto since_update =
            std::chrono::duration_cast<std::chrono::seconds>(now - last_update)
                .count();
        return since_update >= STATUS_UPDATE_INTERVAL_SEC;
    }

    void mark_status_updated() {
        last_update = std::chrono::steady_clock::now();
    }
};
