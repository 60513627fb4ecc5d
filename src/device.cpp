#include "sdrkit/device.hpp"

#include <SoapySDR/Logger.h>

#include "native.hpp"
#include "sdrkit/error.hpp"

namespace sdrkit {

using native::c_str;

namespace {

void release_device(SoapySDRDevice* device) {
    if (device == nullptr) return;
    if (SoapySDRDevice_unmake(device) != 0) {
        SoapySDR_logf(SOAPY_SDR_WARNING, "sdrkit: failed to release device: %s",
                      SoapySDRDevice_lastError());
        return;
    }
    SoapySDR_log(SOAPY_SDR_DEBUG, "sdrkit: released device");
}

}  // namespace

std::vector<Args> Device::enumerate(const Args& filter) {
    std::size_t length = 0;
    SoapySDRKwargs* results = native::call(
        [&] { return SoapySDRDevice_enumerate(filter.native(), &length); });
    return native::kwargs_list(results, length);
}

Device::Device(const Args& args) {
    SoapySDRDevice* device =
        native::call([&] { return SoapySDRDevice_make(args.native()); });
    if (device == nullptr) {
        throw Error(ErrorCode::Other, "No device for " + args.to_string());
    }
    device_.reset(device, release_device);

    SoapySDR_logf(SOAPY_SDR_DEBUG, "sdrkit: opened device %s",
                  args.to_string().c_str());
}

/*******************************************************************
 * Identification
 ******************************************************************/

std::string Device::driver_key() const {
    return native::string_call([&] { return SoapySDRDevice_getDriverKey(get()); });
}

std::string Device::hardware_key() const {
    return native::string_call(
        [&] { return SoapySDRDevice_getHardwareKey(get()); });
}

Args Device::hardware_info() const {
    return native::kwargs_call(
        [&] { return SoapySDRDevice_getHardwareInfo(get()); });
}

/*******************************************************************
 * Channels
 ******************************************************************/

std::string Device::frontend_mapping(Direction direction) const {
    return native::string_call([&] {
        return SoapySDRDevice_getFrontendMapping(get(), to_native(direction));
    });
}

void Device::set_frontend_mapping(Direction direction,
                                  const std::string& mapping) {
    const char* mapping_c = c_str(mapping, "Frontend mapping");
    native::status_call([&] {
        return SoapySDRDevice_setFrontendMapping(get(), to_native(direction),
                                                 mapping_c);
    });
}

std::size_t Device::num_channels(Direction direction) const {
    return native::call([&] {
        return SoapySDRDevice_getNumChannels(get(), to_native(direction));
    });
}

Args Device::channel_info(Direction direction, std::size_t channel) const {
    return native::kwargs_call([&] {
        return SoapySDRDevice_getChannelInfo(get(), to_native(direction),
                                             channel);
    });
}

bool Device::full_duplex(Direction direction, std::size_t channel) const {
    return native::call([&] {
        return SoapySDRDevice_getFullDuplex(get(), to_native(direction),
                                            channel);
    });
}

/*******************************************************************
 * Streams
 ******************************************************************/

std::vector<std::string> Device::stream_formats(Direction direction,
                                                std::size_t channel) const {
    return native::strings_call([&](std::size_t* length) {
        return SoapySDRDevice_getStreamFormats(get(), to_native(direction),
                                               channel, length);
    });
}

std::pair<std::string, double> Device::native_stream_format(
    Direction direction, std::size_t channel) const {
    double full_scale = 0.0;
    std::string format = native::string_call([&] {
        return SoapySDRDevice_getNativeStreamFormat(
            get(), to_native(direction), channel, &full_scale);
    });
    return {format, full_scale};
}

std::vector<ArgInfo> Device::stream_args_info(Direction direction,
                                              std::size_t channel) const {
    return native::arg_info_call([&](std::size_t* length) {
        return SoapySDRDevice_getStreamArgsInfo(get(), to_native(direction),
                                                channel, length);
    });
}

/*******************************************************************
 * Antennas
 ******************************************************************/

std::vector<std::string> Device::antennas(Direction direction,
                                          std::size_t channel) const {
    return native::strings_call([&](std::size_t* length) {
        return SoapySDRDevice_listAntennas(get(), to_native(direction), channel,
                                           length);
    });
}

void Device::set_antenna(Direction direction, std::size_t channel,
                         const std::string& name) {
    const char* name_c = c_str(name, "Antenna name");
    native::status_call([&] {
        return SoapySDRDevice_setAntenna(get(), to_native(direction), channel,
                                         name_c);
    });
}

std::string Device::antenna(Direction direction, std::size_t channel) const {
    return native::string_call([&] {
        return SoapySDRDevice_getAntenna(get(), to_native(direction), channel);
    });
}

/*******************************************************************
 * Frontend corrections
 ******************************************************************/

bool Device::has_dc_offset_mode(Direction direction,
                                std::size_t channel) const {
    return native::call([&] {
        return SoapySDRDevice_hasDCOffsetMode(get(), to_native(direction),
                                              channel);
    });
}

void Device::set_dc_offset_mode(Direction direction, std::size_t channel,
                                bool automatic) {
    native::status_call([&] {
        return SoapySDRDevice_setDCOffsetMode(get(), to_native(direction),
                                              channel, automatic);
    });
}

bool Device::dc_offset_mode(Direction direction, std::size_t channel) const {
    return native::call([&] {
        return SoapySDRDevice_getDCOffsetMode(get(), to_native(direction),
                                              channel);
    });
}

bool Device::has_dc_offset(Direction direction, std::size_t channel) const {
    return native::call([&] {
        return SoapySDRDevice_hasDCOffset(get(), to_native(direction), channel);
    });
}

void Device::set_dc_offset(Direction direction, std::size_t channel,
                           double offset_i, double offset_q) {
    native::status_call([&] {
        return SoapySDRDevice_setDCOffset(get(), to_native(direction), channel,
                                          offset_i, offset_q);
    });
}

std::pair<double, double> Device::dc_offset(Direction direction,
                                            std::size_t channel) const {
    double i = 0.0;
    double q = 0.0;
    native::status_call([&] {
        return SoapySDRDevice_getDCOffset(get(), to_native(direction), channel,
                                          &i, &q);
    });
    return {i, q};
}

bool Device::has_iq_balance(Direction direction, std::size_t channel) const {
    return native::call([&] {
        return SoapySDRDevice_hasIQBalance(get(), to_native(direction),
                                           channel);
    });
}

void Device::set_iq_balance(Direction direction, std::size_t channel,
                            double balance_i, double balance_q) {
    native::status_call([&] {
        return SoapySDRDevice_setIQBalance(get(), to_native(direction), channel,
                                           balance_i, balance_q);
    });
}

std::pair<double, double> Device::iq_balance(Direction direction,
                                             std::size_t channel) const {
    double i = 0.0;
    double q = 0.0;
    native::status_call([&] {
        return SoapySDRDevice_getIQBalance(get(), to_native(direction), channel,
                                           &i, &q);
    });
    return {i, q};
}

/*******************************************************************
 * Gain
 ******************************************************************/

std::vector<std::string> Device::list_gains(Direction direction,
                                            std::size_t channel) const {
    return native::strings_call([&](std::size_t* length) {
        return SoapySDRDevice_listGains(get(), to_native(direction), channel,
                                        length);
    });
}

bool Device::has_gain_mode(Direction direction, std::size_t channel) const {
    return native::call([&] {
        return SoapySDRDevice_hasGainMode(get(), to_native(direction), channel);
    });
}

void Device::set_gain_mode(Direction direction, std::size_t channel,
                           bool automatic) {
    native::status_call([&] {
        return SoapySDRDevice_setGainMode(get(), to_native(direction), channel,
                                          automatic);
    });
}

bool Device::gain_mode(Direction direction, std::size_t channel) const {
    return native::call([&] {
        return SoapySDRDevice_getGainMode(get(), to_native(direction), channel);
    });
}

void Device::set_gain(Direction direction, std::size_t channel,
                      double gain_db) {
    native::status_call([&] {
        return SoapySDRDevice_setGain(get(), to_native(direction), channel,
                                      gain_db);
    });
}

double Device::gain(Direction direction, std::size_t channel) const {
    return native::call([&] {
        return SoapySDRDevice_getGain(get(), to_native(direction), channel);
    });
}

Range Device::gain_range(Direction direction, std::size_t channel) const {
    return Range::from_native(native::call([&] {
        return SoapySDRDevice_getGainRange(get(), to_native(direction),
                                           channel);
    }));
}

void Device::set_gain_element(Direction direction, std::size_t channel,
                              const std::string& name, double gain_db) {
    const char* name_c = c_str(name, "Gain name");
    native::status_call([&] {
        return SoapySDRDevice_setGainElement(get(), to_native(direction),
                                             channel, name_c, gain_db);
    });
}

double Device::gain_element(Direction direction, std::size_t channel,
                            const std::string& name) const {
    const char* name_c = c_str(name, "Gain name");
    return native::call([&] {
        return SoapySDRDevice_getGainElement(get(), to_native(direction),
                                             channel, name_c);
    });
}

Range Device::gain_element_range(Direction direction, std::size_t channel,
                                 const std::string& name) const {
    const char* name_c = c_str(name, "Gain name");
    return Range::from_native(native::call([&] {
        return SoapySDRDevice_getGainElementRange(get(), to_native(direction),
                                                  channel, name_c);
    }));
}

/*******************************************************************
 * Frequency
 ******************************************************************/

std::vector<Range> Device::frequency_range(Direction direction,
                                           std::size_t channel) const {
    return native::ranges_call([&](std::size_t* length) {
        return SoapySDRDevice_getFrequencyRange(get(), to_native(direction),
                                                channel, length);
    });
}

double Device::frequency(Direction direction, std::size_t channel) const {
    return native::call([&] {
        return SoapySDRDevice_getFrequency(get(), to_native(direction),
                                           channel);
    });
}

void Device::set_frequency(Direction direction, std::size_t channel,
                           double frequency_hz, const Args& args) {
    native::status_call([&] {
        return SoapySDRDevice_setFrequency(get(), to_native(direction), channel,
                                           frequency_hz, args.native());
    });
}

std::vector<std::string> Device::list_frequencies(Direction direction,
                                                  std::size_t channel) const {
    return native::strings_call([&](std::size_t* length) {
        return SoapySDRDevice_listFrequencies(get(), to_native(direction),
                                              channel, length);
    });
}

std::vector<Range> Device::component_frequency_range(
    Direction direction, std::size_t channel, const std::string& name) const {
    const char* name_c = c_str(name, "Component name");
    return native::ranges_call([&](std::size_t* length) {
        return SoapySDRDevice_getFrequencyRangeComponent(
            get(), to_native(direction), channel, name_c, length);
    });
}

double Device::component_frequency(Direction direction, std::size_t channel,
                                   const std::string& name) const {
    const char* name_c = c_str(name, "Component name");
    return native::call([&] {
        return SoapySDRDevice_getFrequencyComponent(get(), to_native(direction),
                                                    channel, name_c);
    });
}

void Device::set_component_frequency(Direction direction, std::size_t channel,
                                     const std::string& name,
                                     double frequency_hz, const Args& args) {
    const char* name_c = c_str(name, "Component name");
    native::status_call([&] {
        return SoapySDRDevice_setFrequencyComponent(get(), to_native(direction),
                                                    channel, name_c,
                                                    frequency_hz, args.native());
    });
}

std::vector<ArgInfo> Device::frequency_args_info(Direction direction,
                                                 std::size_t channel) const {
    return native::arg_info_call([&](std::size_t* length) {
        return SoapySDRDevice_getFrequencyArgsInfo(get(), to_native(direction),
                                                   channel, length);
    });
}

/*******************************************************************
 * Sample rate
 ******************************************************************/

double Device::sample_rate(Direction direction, std::size_t channel) const {
    return native::call([&] {
        return SoapySDRDevice_getSampleRate(get(), to_native(direction),
                                            channel);
    });
}

void Device::set_sample_rate(Direction direction, std::size_t channel,
                             double rate) {
    native::status_call([&] {
        return SoapySDRDevice_setSampleRate(get(), to_native(direction),
                                            channel, rate);
    });
}

std::vector<double> Device::list_sample_rates(Direction direction,
                                              std::size_t channel) const {
    return native::array_call<double>([&](std::size_t* length) {
        return SoapySDRDevice_listSampleRates(get(), to_native(direction),
                                              channel, length);
    });
}

std::vector<Range> Device::sample_rate_range(Direction direction,
                                             std::size_t channel) const {
    return native::ranges_call([&](std::size_t* length) {
        return SoapySDRDevice_getSampleRateRange(get(), to_native(direction),
                                                 channel, length);
    });
}

/*******************************************************************
 * Bandwidth
 ******************************************************************/

double Device::bandwidth(Direction direction, std::size_t channel) const {
    return native::call([&] {
        return SoapySDRDevice_getBandwidth(get(), to_native(direction),
                                           channel);
    });
}

void Device::set_bandwidth(Direction direction, std::size_t channel,
                           double bandwidth_hz) {
    native::status_call([&] {
        return SoapySDRDevice_setBandwidth(get(), to_native(direction), channel,
                                           bandwidth_hz);
    });
}

std::vector<double> Device::list_bandwidths(Direction direction,
                                            std::size_t channel) const {
    return native::array_call<double>([&](std::size_t* length) {
        return SoapySDRDevice_listBandwidths(get(), to_native(direction),
                                             channel, length);
    });
}

std::vector<Range> Device::bandwidth_range(Direction direction,
                                           std::size_t channel) const {
    return native::ranges_call([&](std::size_t* length) {
        return SoapySDRDevice_getBandwidthRange(get(), to_native(direction),
                                                channel, length);
    });
}

/*******************************************************************
 * Clocking and time
 ******************************************************************/

double Device::master_clock_rate() const {
    return native::call([&] { return SoapySDRDevice_getMasterClockRate(get()); });
}

void Device::set_master_clock_rate(double rate) {
    native::status_call(
        [&] { return SoapySDRDevice_setMasterClockRate(get(), rate); });
}

std::vector<std::string> Device::list_clock_sources() const {
    return native::strings_call([&](std::size_t* length) {
        return SoapySDRDevice_listClockSources(get(), length);
    });
}

void Device::set_clock_source(const std::string& source) {
    const char* source_c = c_str(source, "Clock source");
    native::status_call(
        [&] { return SoapySDRDevice_setClockSource(get(), source_c); });
}

std::string Device::clock_source() const {
    return native::string_call(
        [&] { return SoapySDRDevice_getClockSource(get()); });
}

std::vector<std::string> Device::list_time_sources() const {
    return native::strings_call([&](std::size_t* length) {
        return SoapySDRDevice_listTimeSources(get(), length);
    });
}

void Device::set_time_source(const std::string& source) {
    const char* source_c = c_str(source, "Time source");
    native::status_call(
        [&] { return SoapySDRDevice_setTimeSource(get(), source_c); });
}

std::string Device::time_source() const {
    return native::string_call(
        [&] { return SoapySDRDevice_getTimeSource(get()); });
}

bool Device::has_hardware_time(const std::string& what) const {
    const char* what_c = c_str(what, "Time source");
    return native::call(
        [&] { return SoapySDRDevice_hasHardwareTime(get(), what_c); });
}

long long Device::hardware_time(const std::string& what) const {
    const char* what_c = c_str(what, "Time source");
    return native::call(
        [&] { return SoapySDRDevice_getHardwareTime(get(), what_c); });
}

void Device::set_hardware_time(long long time_ns, const std::string& what) {
    const char* what_c = c_str(what, "Time source");
    native::status_call(
        [&] { return SoapySDRDevice_setHardwareTime(get(), time_ns, what_c); });
}

/*******************************************************************
 * Settings
 ******************************************************************/

std::vector<ArgInfo> Device::setting_info() const {
    return native::arg_info_call([&](std::size_t* length) {
        return SoapySDRDevice_getSettingInfo(get(), length);
    });
}

void Device::write_setting(const std::string& key, const std::string& value) {
    const char* key_c = c_str(key, "Setting key");
    const char* value_c = c_str(value, "Setting value");
    native::status_call(
        [&] { return SoapySDRDevice_writeSetting(get(), key_c, value_c); });
}

std::string Device::read_setting(const std::string& key) const {
    const char* key_c = c_str(key, "Setting key");
    return native::string_call(
        [&] { return SoapySDRDevice_readSetting(get(), key_c); });
}

std::vector<ArgInfo> Device::channel_setting_info(Direction direction,
                                                  std::size_t channel) const {
    return native::arg_info_call([&](std::size_t* length) {
        return SoapySDRDevice_getChannelSettingInfo(get(), to_native(direction),
                                                    channel, length);
    });
}

void Device::write_channel_setting(Direction direction, std::size_t channel,
                                   const std::string& key,
                                   const std::string& value) {
    const char* key_c = c_str(key, "Setting key");
    const char* value_c = c_str(value, "Setting value");
    native::status_call([&] {
        return SoapySDRDevice_writeChannelSetting(get(), to_native(direction),
                                                  channel, key_c, value_c);
    });
}

std::string Device::read_channel_setting(Direction direction,
                                         std::size_t channel,
                                         const std::string& key) const {
    const char* key_c = c_str(key, "Setting key");
    return native::string_call([&] {
        return SoapySDRDevice_readChannelSetting(get(), to_native(direction),
                                                 channel, key_c);
    });
}

}  // namespace sdrkit
