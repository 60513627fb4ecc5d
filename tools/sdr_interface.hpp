#pragma once

#include <atomic>
#include <functional>
#include <string>

#include "config.hpp"
#include "sample_file.hpp"
#include "sdrkit/device.hpp"

using StatusCallback = std::function<void(const Stats&)>;

// The device side of sdrkit-stream: opens the one device matching a filter,
// applies the radio settings of a Config and moves samples between the
// device and a sample file.
class SDRInterface {
   private:
    sdrkit::Device device_;

   public:
    // Throws std::runtime_error unless exactly one device matches filter.
    explicit SDRInterface(const std::string& filter);

    sdrkit::Device& device() { return device_; }

    // Applies the settings present in config. Order: sample rate, frequency,
    // antenna, bandwidth, gain.
    void configure(const Config& config);

    // Receives until config.num_samples have been written to file or stop is
    // set. Timeouts and overflows are counted in stats and do not end the
    // recording.
    void record(const Config& config, SampleFileWriter& file,
                const std::atomic<bool>& stop, Stats& stats,
                const StatusCallback& on_status = nullptr);

    // Transmits file config.repeat times. The final write carries the end of
    // burst flag.
    void playback(const Config& config, SampleFileReader& file,
                  const std::atomic<bool>& stop, Stats& stats,
                  const StatusCallback& on_status = nullptr);

   private:
    static sdrkit::Args find_device(const std::string& filter);
};
