#include "sdrkit/stream.hpp"

#include <SoapySDR/Errors.h>
#include <SoapySDR/Logger.h>

#include "native.hpp"

namespace sdrkit {

std::string stream_flag_names(int flags) {
    static const std::pair<int, const char*> FLAG_NAMES[] = {
        {SOAPY_SDR_END_BURST, "END_BURST"},
        {SOAPY_SDR_HAS_TIME, "HAS_TIME"},
        {SOAPY_SDR_END_ABRUPT, "END_ABRUPT"},
        {SOAPY_SDR_ONE_PACKET, "ONE_PACKET"},
        {SOAPY_SDR_MORE_FRAGMENTS, "MORE_FRAGMENTS"},
        {SOAPY_SDR_WAIT_TRIGGER, "WAIT_TRIGGER"},
    };

    std::string names;
    for (const auto& [flag, name] : FLAG_NAMES) {
        if ((flags & flag) == 0) continue;
        if (!names.empty()) names += ", ";
        names += name;
    }
    return names;
}

StreamCore::StreamCore(std::shared_ptr<SoapySDRDevice> device,
                       Direction direction, Format format,
                       std::size_t element_size,
                       const std::vector<std::size_t>& channels,
                       const Args& args)
    : device_(std::move(device)),
      num_channels_(channels.empty() ? 1 : channels.size()) {
    if (format_size(format) != element_size) {
        throw Error(ErrorCode::NotSupported,
                    std::string("Element size ") +
                        std::to_string(element_size) + " does not match " +
                        format_name(format) + " (" +
                        std::to_string(format_size(format)) + " bytes)");
    }

    stream_ = native::call([&] {
        return SoapySDRDevice_setupStream(device_.get(), to_native(direction),
                                          format_name(format), channels.data(),
                                          channels.size(), args.native());
    });
    if (stream_ == nullptr) {
        throw Error(ErrorCode::Other, "Driver returned no stream");
    }

    SoapySDR_logf(SOAPY_SDR_DEBUG,
                  "sdrkit: %s stream set up, %zu channel(s) as %s",
                  to_string(direction), num_channels_, format_name(format));
}

StreamCore::~StreamCore() { close(); }

StreamCore::StreamCore(StreamCore&& other) noexcept
    : device_(std::move(other.device_)),
      stream_(std::exchange(other.stream_, nullptr)),
      num_channels_(other.num_channels_),
      active_(std::exchange(other.active_, false)) {}

StreamCore& StreamCore::operator=(StreamCore&& other) noexcept {
    if (this != &other) {
        close();
        device_ = std::move(other.device_);
        stream_ = std::exchange(other.stream_, nullptr);
        num_channels_ = other.num_channels_;
        active_ = std::exchange(other.active_, false);
    }
    return *this;
}

std::size_t StreamCore::mtu() const {
    return native::call(
        [&] { return SoapySDRDevice_getStreamMTU(device_.get(), stream_); });
}

void StreamCore::activate(std::optional<long long> time_ns) {
    if (active_) {
        throw Error(ErrorCode::Other, "Stream is already active");
    }
    const int flags = time_ns ? SOAPY_SDR_HAS_TIME : 0;
    native::check_code(SoapySDRDevice_activateStream(
        device_.get(), stream_, flags, time_ns.value_or(0), 0));
    active_ = true;
}

void StreamCore::deactivate(std::optional<long long> time_ns) {
    if (!active_) {
        throw Error(ErrorCode::Other, "Stream is not active");
    }
    const int flags = time_ns ? SOAPY_SDR_HAS_TIME : 0;
    native::check_code(SoapySDRDevice_deactivateStream(
        device_.get(), stream_, flags, time_ns.value_or(0)));
    active_ = false;
}

std::size_t StreamCore::read(void* const* buffs, std::size_t num_elems,
                             int& flags, long long& time_ns, long timeout_us) {
    return static_cast<std::size_t>(native::check_code(
        SoapySDRDevice_readStream(device_.get(), stream_, buffs, num_elems,
                                  &flags, &time_ns, timeout_us)));
}

std::size_t StreamCore::write(const void* const* buffs, std::size_t num_elems,
                              int flags, long long time_ns, long timeout_us) {
    return static_cast<std::size_t>(native::check_code(
        SoapySDRDevice_writeStream(device_.get(), stream_, buffs, num_elems,
                                   &flags, time_ns, timeout_us)));
}

StreamStatus StreamCore::read_status(long timeout_us) {
    StreamStatus status;
    native::check_code(SoapySDRDevice_readStreamStatus(
        device_.get(), stream_, &status.channel_mask, &status.flags,
        &status.time_ns, timeout_us));
    return status;
}

void StreamCore::close() noexcept {
    if (stream_ == nullptr) return;

    if (active_) {
        const int ret =
            SoapySDRDevice_deactivateStream(device_.get(), stream_, 0, 0);
        if (ret != 0) {
            SoapySDR_logf(SOAPY_SDR_DEBUG,
                          "sdrkit: deactivate on close failed: %s",
                          SoapySDR_errToStr(ret));
        }
        active_ = false;
    }

    if (SoapySDRDevice_closeStream(device_.get(), stream_) != 0) {
        SoapySDR_logf(SOAPY_SDR_WARNING, "sdrkit: failed to close stream: %s",
                      SoapySDRDevice_lastError());
    }
    stream_ = nullptr;
    device_.reset();
}

}  // namespace sdrkit
