#include "sdr_interface.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "sdrkit/error.hpp"
#include "sdrkit/logging.hpp"
#include "sdrkit/stream.hpp"

using sdrkit::Direction;
using sdrkit::ErrorCode;

SDRInterface::SDRInterface(const std::string& filter)
    : device_(find_device(filter)) {}

sdrkit::Args SDRInterface::find_device(const std::string& filter) {
    const auto devices = sdrkit::Device::enumerate(sdrkit::Args(filter));
    if (devices.empty()) {
        throw std::runtime_error("No matching devices found");
    }
    if (devices.size() > 1) {
        std::ostringstream msg;
        msg << "Multiple matching devices found. Choose one with -d:";
        for (const auto& args : devices) {
            msg << "\n  -d '" << args.to_string() << "'";
        }
        throw std::runtime_error(msg.str());
    }
    return devices.front();
}

void SDRInterface::configure(const Config& config) {
    const Direction dir = config.direction;
    const std::size_t ch = config.channel;

    if (ch >= device_.num_channels(dir)) {
        std::ostringstream msg;
        msg << "Device has no " << dir << " channel " << ch;
        throw std::runtime_error(msg.str());
    }

    if (config.sample_rate_hz) {
        device_.set_sample_rate(dir, ch, *config.sample_rate_hz);
    }
    if (config.frequency_hz) {
        device_.set_frequency(dir, ch, *config.frequency_hz);
    }
    if (config.antenna) {
        device_.set_antenna(dir, ch, *config.antenna);
    }
    if (config.bandwidth_hz) {
        device_.set_bandwidth(dir, ch, *config.bandwidth_hz);
    }
    if (config.gain_db) {
        device_.set_gain(dir, ch, *config.gain_db);
    }
}

void SDRInterface::record(const Config& config, SampleFileWriter& file,
                          const std::atomic<bool>& stop, Stats& stats,
                          const StatusCallback& on_status) {
    auto stream = device_.rx_stream<Complex>({config.channel});
    const std::size_t mtu = stream.mtu() > 0 ? stream.mtu() : STREAM_FALLBACK_MTU;
    IQBuffer buffer(mtu);
    std::uint64_t remaining = config.num_samples;

    stream.activate();
    while (remaining > 0 && !stop) {
        const std::size_t request =
            static_cast<std::size_t>(std::min<std::uint64_t>(remaining, mtu));

        std::size_t count = 0;
        try {
            count = stream.read({buffer.data()}, request, config.timeout_us);
        } catch (const sdrkit::Error& e) {
            if (e.code() == ErrorCode::Timeout) {
                ++stats.timeouts;
                continue;
            }
            if (e.code() == ErrorCode::Overflow) {
                ++stats.overflows;
                continue;
            }
            throw;
        }

        file.write(buffer.data(), count);
        remaining -= count;
        stats.samples_transferred += count;

        if (on_status && stats.should_update_status()) {
            on_status(stats);
            stats.mark_status_updated();
        }
    }
    stream.deactivate();
    file.flush();
}

void SDRInterface::playback(const Config& config, SampleFileReader& file,
                            const std::atomic<bool>& stop, Stats& stats,
                            const StatusCallback& on_status) {
    auto stream = device_.tx_stream<Complex>({config.channel});
    const std::size_t mtu = stream.mtu() > 0 ? stream.mtu() : STREAM_FALLBACK_MTU;

    // One chunk of read-ahead so the last write of the last pass is known.
    std::vector<IQBuffer> current(1, IQBuffer(mtu));
    std::vector<IQBuffer> next(1, IQBuffer(mtu));

    stream.activate();
    for (std::uint64_t pass = 0; pass < config.repeat && !stop; ++pass) {
        file.rewind();
        current[0].resize(mtu);
        current[0].resize(file.read(current[0].data(), mtu));
        if (current[0].empty()) {
            sdrkit::log(sdrkit::LogLevel::Warning, "Sample file is empty");
            break;
        }

        while (!current[0].empty() && !stop) {
            next[0].resize(mtu);
            next[0].resize(file.read(next[0].data(), mtu));

            const bool last = next[0].empty() && pass + 1 == config.repeat;
            stream.write_all(current, std::nullopt, last, config.timeout_us);
            stats.samples_transferred += current[0].size();

            if (on_status && stats.should_update_status()) {
                on_status(stats);
                stats.mark_status_updated();
            }
            std::swap(current, next);
        }
    }
    stream.deactivate();
}
