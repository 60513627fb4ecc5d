#pragma once

#include <SoapySDR/Device.h>

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "sdrkit/arg_info.hpp"
#include "sdrkit/args.hpp"
#include "sdrkit/types.hpp"

namespace sdrkit {

template <typename E>
class RxStream;
template <typename E>
class TxStream;

// An opened SDR device.
//
// Copies share the native handle, and so does every stream opened from the
// device. The handle is released when the last of them goes away. A Device
// may be used from several threads at once; the driver serializes access.
//
// Failures are reported by throwing sdrkit::Error.
class Device {
   private:
    std::shared_ptr<SoapySDRDevice> device_;

   public:
    // Lists the devices matching filter. Each result can be passed to the
    // constructor. No match is an empty list, not an error.
    static std::vector<Args> enumerate(const Args& filter = Args());

    // args may be markup, e.g. Device("driver=rtlsdr,serial=00000001").
    explicit Device(const Args& args);

    const std::shared_ptr<SoapySDRDevice>& handle() const { return device_; }

    /*******************************************************************
     * Identification
     ******************************************************************/

    std::string driver_key() const;
    std::string hardware_key() const;
    Args hardware_info() const;

    /*******************************************************************
     * Channels
     ******************************************************************/

    std::string frontend_mapping(Direction direction) const;
    void set_frontend_mapping(Direction direction, const std::string& mapping);
    std::size_t num_channels(Direction direction) const;
    Args channel_info(Direction direction, std::size_t channel) const;
    bool full_duplex(Direction direction, std::size_t channel) const;

    /*******************************************************************
     * Streams
     ******************************************************************/

    std::vector<std::string> stream_formats(Direction direction,
                                            std::size_t channel) const;
    // Format used by the transport layer and its full-scale value.
    std::pair<std::string, double> native_stream_format(
        Direction direction, std::size_t channel) const;
    std::vector<ArgInfo> stream_args_info(Direction direction,
                                          std::size_t channel) const;

    // Defined in stream.hpp.
    template <typename E>
    RxStream<E> rx_stream(const std::vector<std::size_t>& channels,
                          const Args& args = Args()) const;
    template <typename E>
    TxStream<E> tx_stream(const std::vector<std::size_t>& channels,
                          const Args& args = Args()) const;

    /*******************************************************************
     * Antennas
     ******************************************************************/

    std::vector<std::string> antennas(Direction direction,
                                      std::size_t channel) const;
    void set_antenna(Direction direction, std::size_t channel,
                     const std::string& name);
    std::string antenna(Direction direction, std::size_t channel) const;

    /*******************************************************************
     * Frontend corrections
     ******************************************************************/

    bool has_dc_offset_mode(Direction direction, std::size_t channel) const;
    void set_dc_offset_mode(Direction direction, std::size_t channel,
                            bool automatic);
    bool dc_offset_mode(Direction direction, std::size_t channel) const;

    bool has_dc_offset(Direction direction, std::size_t channel) const;
    // Offsets for the I and Q components, 1.0 max.
    void set_dc_offset(Direction direction, std::size_t channel,
                       double offset_i, double offset_q);
    std::pair<double, double> dc_offset(Direction direction,
                                        std::size_t channel) const;

    bool has_iq_balance(Direction direction, std::size_t channel) const;
    void set_iq_balance(Direction direction, std::size_t channel,
                        double balance_i, double balance_q);
    std::pair<double, double> iq_balance(Direction direction,
                                         std::size_t channel) const;

    /*******************************************************************
     * Gain
     ******************************************************************/

    // Amplification elements, RF to baseband.
    std::vector<std::string> list_gains(Direction direction,
                                        std::size_t channel) const;
    bool has_gain_mode(Direction direction, std::size_t channel) const;
    void set_gain_mode(Direction direction, std::size_t channel,
                       bool automatic);
    bool gain_mode(Direction direction, std::size_t channel) const;

    // Overall gain in dB, distributed across the elements by the driver.
    void set_gain(Direction direction, std::size_t channel, double gain_db);
    double gain(Direction direction, std::size_t channel) const;
    Range gain_range(Direction direction, std::size_t channel) const;

    void set_gain_element(Direction direction, std::size_t channel,
                          const std::string& name, double gain_db);
    double gain_element(Direction direction, std::size_t channel,
                        const std::string& name) const;
    Range gain_element_range(Direction direction, std::size_t channel,
                             const std::string& name) const;

    /*******************************************************************
     * Frequency
     ******************************************************************/

    std::vector<Range> frequency_range(Direction direction,
                                       std::size_t channel) const;
    double frequency(Direction direction, std::size_t channel) const;
    // Tunes the "RF" component as close as possible and compensates with
    // "BB". args can pin a component ("RF=1e9"), skip one ("BB=IGNORE") or
    // request an "OFFSET".
    void set_frequency(Direction direction, std::size_t channel,
                       double frequency_hz, const Args& args = Args());

    // Tunable elements, RF to baseband.
    std::vector<std::string> list_frequencies(Direction direction,
                                              std::size_t channel) const;
    std::vector<Range> component_frequency_range(
        Direction direction, std::size_t channel,
        const std::string& name) const;
    double component_frequency(Direction direction, std::size_t channel,
                               const std::string& name) const;
    void set_component_frequency(Direction direction, std::size_t channel,
                                 const std::string& name, double frequency_hz,
                                 const Args& args = Args());
    std::vector<ArgInfo> frequency_args_info(Direction direction,
                                             std::size_t channel) const;

    /*******************************************************************
     * Sample rate
     ******************************************************************/

    double sample_rate(Direction direction, std::size_t channel) const;
    void set_sample_rate(Direction direction, std::size_t channel,
                         double rate);
    std::vector<double> list_sample_rates(Direction direction,
                                          std::size_t channel) const;
    std::vector<Range> sample_rate_range(Direction direction,
                                         std::size_t channel) const;

    /*******************************************************************
     * Bandwidth
     ******************************************************************/

    double bandwidth(Direction direction, std::size_t channel) const;
    void set_bandwidth(Direction direction, std::size_t channel,
                       double bandwidth_hz);
    std::vector<double> list_bandwidths(Direction direction,
                                        std::size_t channel) const;
    std::vector<Range> bandwidth_range(Direction direction,
                                       std::size_t channel) const;

    /*******************************************************************
     * Clocking and time
     ******************************************************************/

    double master_clock_rate() const;
    void set_master_clock_rate(double rate);
    std::vector<std::string> list_clock_sources() const;
    void set_clock_source(const std::string& source);
    std::string clock_source() const;

    std::vector<std::string> list_time_sources() const;
    void set_time_source(const std::string& source);
    std::string time_source() const;

    // what names a hardware time source; empty selects the default one.
    bool has_hardware_time(const std::string& what = "") const;
    long long hardware_time(const std::string& what = "") const;
    void set_hardware_time(long long time_ns, const std::string& what = "");

    /*******************************************************************
     * Settings
     ******************************************************************/

    std::vector<ArgInfo> setting_info() const;
    void write_setting(const std::string& key, const std::string& value);
    std::string read_setting(const std::string& key) const;

    std::vector<ArgInfo> channel_setting_info(Direction direction,
                                              std::size_t channel) const;
    void write_channel_setting(Direction direction, std::size_t channel,
                               const std::string& key,
                               const std::string& value);
    std::string read_channel_setting(Direction direction, std::size_t channel,
                                     const std::string& key) const;

   private:
    SoapySDRDevice* get() const { return device_.get(); }
};

}  // namespace sdrkit
