#pragma once

#include <SoapySDR/Constants.h>
#include <SoapySDR/Device.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "sdrkit/args.hpp"
#include "sdrkit/device.hpp"
#include "sdrkit/error.hpp"
#include "sdrkit/format.hpp"
#include "sdrkit/types.hpp"

namespace sdrkit {

// Reported by TxStream::read_status.
struct StreamStatus {
    std::size_t channel_mask = 0;
    int flags = 0;
    long long time_ns = 0;
};

// Renders SOAPY_SDR_* stream flags, e.g. "END_BURST, HAS_TIME".
std::string stream_flag_names(int flags);

// Untyped part of a stream: owns the native handle and a reference to the
// device, and runs the activation state machine.
//
// Not synchronized. One thread at a time may use a stream, although it can be
// moved to another thread between calls.
class StreamCore {
   private:
    std::shared_ptr<SoapySDRDevice> device_;
    SoapySDRStream* stream_ = nullptr;
    std::size_t num_channels_ = 0;
    bool active_ = false;

   public:
    // Throws Error(NotSupported) when element_size does not match the size
    // SoapySDR reports for format. An empty channel list selects channel 0.
    StreamCore(std::shared_ptr<SoapySDRDevice> device, Direction direction,
               Format format, std::size_t element_size,
               const std::vector<std::size_t>& channels, const Args& args);
    ~StreamCore();

    StreamCore(StreamCore&& other) noexcept;
    StreamCore& operator=(StreamCore&& other) noexcept;
    StreamCore(const StreamCore&) = delete;
    StreamCore& operator=(const StreamCore&) = delete;

    std::size_t mtu() const;
    void activate(std::optional<long long> time_ns);
    void deactivate(std::optional<long long> time_ns);
    bool active() const { return active_; }
    std::size_t num_channels() const { return num_channels_; }

    std::size_t read(void* const* buffs, std::size_t num_elems, int& flags,
                     long long& time_ns, long timeout_us);
    std::size_t write(const void* const* buffs, std::size_t num_elems,
                      int flags, long long time_ns, long timeout_us);
    StreamStatus read_status(long timeout_us);

   private:
    void close() noexcept;
};

// A stream open for receiving samples of type E on one or more channels.
// Obtain one from Device::rx_stream.
template <typename E>
class RxStream {
   private:
    StreamCore core_;
    int flags_ = 0;
    long long time_ns_ = 0;

   public:
    RxStream(std::shared_ptr<SoapySDRDevice> device,
             const std::vector<std::size_t>& channels, const Args& args)
        : core_(std::move(device), Direction::Rx, StreamSample<E>::format,
                sizeof(E), channels, args) {}

    // Recommended elements per read; use it to size buffers.
    std::size_t mtu() const { return core_.mtu(); }

    // Throws if already active. A start time sets SOAPY_SDR_HAS_TIME.
    void activate(std::optional<long long> time_ns = std::nullopt) {
        core_.activate(time_ns);
    }
    // Throws if not active.
    void deactivate(std::optional<long long> time_ns = std::nullopt) {
        core_.deactivate(time_ns);
    }
    bool active() const { return core_.active(); }
    std::size_t num_channels() const { return core_.num_channels(); }

    // Reads up to num_elems samples into each of buffers, one per channel.
    //
    // Returns the number read, which may be less than requested. Timeouts and
    // driver errors throw sdrkit::Error. A buffer count different from the
    // channel count throws std::invalid_argument.
    std::size_t read(const std::vector<E*>& buffers, std::size_t num_elems,
                     long timeout_us = DEFAULT_TIMEOUT_US) {
        check_channel_count(buffers.size());
        const std::vector<void*> ptrs(buffers.begin(), buffers.end());
        flags_ = 0;
        time_ns_ = 0;
        return core_.read(ptrs.data(), num_elems, flags_, time_ns_, timeout_us);
    }

    // Reads into each vector as is, up to the length of the shortest one.
    std::size_t read(std::vector<std::vector<E>>& buffers,
                     long timeout_us = DEFAULT_TIMEOUT_US) {
        check_channel_count(buffers.size());
        std::vector<E*> ptrs;
        std::size_t num_elems = buffers.empty() ? 0 : buffers.front().size();
        for (auto& buffer : buffers) {
            ptrs.push_back(buffer.data());
            num_elems = std::min(num_elems, buffer.size());
        }
        return read(ptrs, num_elems, timeout_us);
    }

    // What the driver reported with the most recent read.
    int last_flags() const { return flags_; }
    bool has_time() const { return (flags_ & SOAPY_SDR_HAS_TIME) != 0; }
    long long time_ns() const { return time_ns_; }
    bool end_burst() const { return (flags_ & SOAPY_SDR_END_BURST) != 0; }
    bool more_fragments() const {
        return (flags_ & SOAPY_SDR_MORE_FRAGMENTS) != 0;
    }

   private:
    void check_channel_count(std::size_t count) const {
        if (count != core_.num_channels()) {
            throw std::invalid_argument(
                "Number of buffers must equal number of channels on stream");
        }
    }
};

// A stream open for transmitting samples of type E on one or more channels.
// Obtain one from Device::tx_stream.
template <typename E>
class TxStream {
   private:
    StreamCore core_;

   public:
    TxStream(std::shared_ptr<SoapySDRDevice> device,
             const std::vector<std::size_t>& channels, const Args& args)
        : core_(std::move(device), Direction::Tx, StreamSample<E>::format,
                sizeof(E), channels, args) {}

    std::size_t mtu() const { return core_.mtu(); }

    void activate(std::optional<long long> time_ns = std::nullopt) {
        core_.activate(time_ns);
    }
    void deactivate(std::optional<long long> time_ns = std::nullopt) {
        core_.deactivate(time_ns);
    }
    bool active() const { return core_.active(); }
    std::size_t num_channels() const { return core_.num_channels(); }

    // Writes num_elems samples from each of buffers, one per channel.
    //
    // at_ns asks the device to start transmitting at that time; pass it only
    // on the first write of a burst. end_burst marks the last write of a
    // burst. Returns the number written, which may be less than requested.
    std::size_t write(const std::vector<const E*>& buffers,
                      std::size_t num_elems,
                      std::optional<long long> at_ns = std::nullopt,
                      bool end_burst = false,
                      long timeout_us = DEFAULT_TIMEOUT_US) {
        check_channel_count(buffers.size());
        const std::vector<const void*> ptrs(buffers.begin(), buffers.end());
        int flags = 0;
        if (at_ns) flags |= SOAPY_SDR_HAS_TIME;
        if (end_burst) flags |= SOAPY_SDR_END_BURST;
        return core_.write(ptrs.data(), num_elems, flags, at_ns.value_or(0),
                           timeout_us);
    }

    // All vectors must be the same length.
    std::size_t write(const std::vector<std::vector<E>>& buffers,
                      std::optional<long long> at_ns = std::nullopt,
                      bool end_burst = false,
                      long timeout_us = DEFAULT_TIMEOUT_US) {
        const std::size_t num_elems = check_buffers(buffers);
        return write(pointers(buffers), num_elems, at_ns, end_burst,
                     timeout_us);
    }

    // Keeps writing until every sample of buffers has been accepted. at_ns
    // goes with the first write only.
    void write_all(const std::vector<std::vector<E>>& buffers,
                   std::optional<long long> at_ns = std::nullopt,
                   bool end_burst = false,
                   long timeout_us = DEFAULT_TIMEOUT_US) {
        std::size_t remaining = check_buffers(buffers);
        std::vector<const E*> ptrs = pointers(buffers);
        while (remaining > 0) {
            const std::size_t written =
                write(ptrs, remaining, at_ns, end_burst, timeout_us);
            if (written > remaining) {
                throw Error(ErrorCode::StreamError,
                            "Driver accepted more samples than were written");
            }
            at_ns.reset();
            for (auto& ptr : ptrs) ptr += written;
            remaining -= written;
        }
    }

    // Reports asynchronous events such as underflows and late bursts.
    StreamStatus read_status(long timeout_us = DEFAULT_TIMEOUT_US) {
        return core_.read_status(timeout_us);
    }

   private:
    void check_channel_count(std::size_t count) const {
        if (count != core_.num_channels()) {
            throw std::invalid_argument(
                "Number of buffers must equal number of channels on stream");
        }
    }

    std::size_t check_buffers(const std::vector<std::vector<E>>& buffers) const {
        check_channel_count(buffers.size());
        const std::size_t num_elems =
            buffers.empty() ? 0 : buffers.front().size();
        for (const auto& buffer : buffers) {
            if (buffer.size() != num_elems) {
                throw std::invalid_argument(
                    "All buffers must be the same length");
            }
        }
        return num_elems;
    }

    static std::vector<const E*> pointers(
        const std::vector<std::vector<E>>& buffers) {
        std::vector<const E*> ptrs;
        ptrs.reserve(buffers.size());
        for (const auto& buffer : buffers) ptrs.push_back(buffer.data());
        return ptrs;
    }
};

template <typename E>
RxStream<E> Device::rx_stream(const std::vector<std::size_t>& channels,
                              const Args& args) const {
    return RxStream<E>(device_, channels, args);
}

template <typename E>
TxStream<E> Device::tx_stream(const std::vector<std::size_t>& channels,
                              const Args& args) const {
    return TxStream<E>(device_, channels, args);
}

}  // namespace sdrkit
