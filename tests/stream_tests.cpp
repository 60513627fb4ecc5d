// stream_tests.cpp
// Tests for typed Rx/Tx streams, run against the in-process fake driver.
//

#include <gtest/gtest.h>

#include <SoapySDR/Constants.h>
#include <SoapySDR/Errors.h>

#include <algorithm>
#include <complex>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "fake_device.hpp"
#include "sdrkit/device.hpp"
#include "sdrkit/error.hpp"
#include "sdrkit/logging.hpp"
#include "sdrkit/stream.hpp"

using namespace sdrkit;
using sdrkit_test::FAKE_DRIVER;
using sdrkit_test::fake_sample;
using sdrkit_test::fake_state;

using CF32 = std::complex<float>;

class StreamTests : public ::testing::Test {
   protected:
    void SetUp() override { sdrkit_test::reset_fake_state(); }

    static std::vector<CF32> ramp(std::size_t count) {
        std::vector<CF32> samples(count);
        for (std::size_t i = 0; i < count; ++i) {
            samples[i] = CF32(static_cast<float>(i), 0.5f);
        }
        return samples;
    }
};

//==============================================================================
// Setup
//==============================================================================

TEST_F(StreamTests, SetupPassesFormatChannelsAndArgs) {
    Device device(FAKE_DRIVER);
    auto stream =
        device.rx_stream<CF32>({0, 1}, Args{{"buffers", "8"}});

    EXPECT_EQ(stream.num_channels(), 2u);
    EXPECT_FALSE(stream.active());
    ASSERT_EQ(fake_state().streams_opened, 1);
    EXPECT_EQ(fake_state().stream_formats.back(), "CF32");
    EXPECT_EQ(fake_state().stream_channels.back(),
              (std::vector<std::size_t>{0, 1}));
    EXPECT_EQ(fake_state().last_stream_args.at("buffers"), "8");
}

TEST_F(StreamTests, FormatFollowsElementType) {
    Device device(FAKE_DRIVER);
    auto cs16 = device.rx_stream<std::complex<int16_t>>({0});
    auto f32 = device.tx_stream<float>({0});
    EXPECT_EQ(fake_state().stream_formats,
              (std::vector<std::string>{"CS16", "F32"}));
}

TEST_F(StreamTests, EmptyChannelListIsOneChannel) {
    Device device(FAKE_DRIVER);
    auto stream = device.rx_stream<CF32>({});
    EXPECT_EQ(stream.num_channels(), 1u);
    EXPECT_TRUE(fake_state().stream_channels.back().empty());
}

TEST_F(StreamTests, DriverRejectsFormat) {
    Device device(FAKE_DRIVER);
    try {
        auto stream = device.rx_stream<double>({0});
        FAIL() << "Expected setup to fail";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::Other);
        EXPECT_NE(e.message().find("Unsupported format F64"),
                  std::string::npos);
    }
    EXPECT_EQ(fake_state().streams_opened, 0);
}

TEST_F(StreamTests, DriverRejectsChannel) {
    Device device(FAKE_DRIVER);
    EXPECT_THROW(device.tx_stream<CF32>({3}), Error);
}

TEST_F(StreamTests, ElementSizeMustMatchFormat) {
    Device device(FAKE_DRIVER);
    try {
        StreamCore core(device.handle(), Direction::Rx, Format::CF32, 4, {0},
                        Args());
        FAIL() << "Expected size check to fail";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotSupported);
    }
    EXPECT_EQ(fake_state().streams_opened, 0);
}

TEST_F(StreamTests, ReportsMtu) {
    fake_state().mtu = 4096;
    Device device(FAKE_DRIVER);
    auto stream = device.rx_stream<CF32>({0});
    EXPECT_EQ(stream.mtu(), 4096u);
}

//==============================================================================
// Activation
//==============================================================================

TEST_F(StreamTests, ActivationStateMachine) {
    Device device(FAKE_DRIVER);
    auto stream = device.rx_stream<CF32>({0});

    EXPECT_THROW(stream.deactivate(), Error);
    stream.activate();
    EXPECT_TRUE(stream.active());
    EXPECT_THROW(stream.activate(), Error);
    stream.deactivate();
    EXPECT_FALSE(stream.active());

    EXPECT_EQ(fake_state().activations, 1);
    EXPECT_EQ(fake_state().deactivations, 1);
}

TEST_F(StreamTests, TimedActivation) {
    Device device(FAKE_DRIVER);
    auto stream = device.rx_stream<CF32>({0});
    stream.activate(5000);
    EXPECT_EQ(fake_state().last_activate_flags, SOAPY_SDR_HAS_TIME);
    EXPECT_EQ(fake_state().last_activate_time_ns, 5000);
}

TEST_F(StreamTests, FailedActivationStaysInactive) {
    fake_state().activate_result = SOAPY_SDR_NOT_SUPPORTED;
    Device device(FAKE_DRIVER);
    auto stream = device.rx_stream<CF32>({0});

    try {
        stream.activate();
        FAIL() << "Expected activation to fail";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotSupported);
    }
    EXPECT_FALSE(stream.active());
}

//==============================================================================
// Receive
//==============================================================================

TEST_F(StreamTests, ReadFillsBuffer) {
    Device device(FAKE_DRIVER);
    auto stream = device.rx_stream<CF32>({0});
    stream.activate();

    std::vector<CF32> buffer(100);
    ASSERT_EQ(stream.read({buffer.data()}, buffer.size()), 100u);
    EXPECT_EQ(buffer[0], fake_sample(0));
    EXPECT_EQ(buffer[99], fake_sample(99));

    ASSERT_EQ(stream.read({buffer.data()}, 10), 10u);
    EXPECT_EQ(buffer[0], fake_sample(100));
}

TEST_F(StreamTests, ShortRead) {
    fake_state().read_results = {10};
    Device device(FAKE_DRIVER);
    auto stream = device.rx_stream<CF32>({0});
    stream.activate();

    std::vector<CF32> buffer(100);
    EXPECT_EQ(stream.read({buffer.data()}, buffer.size()), 10u);
}

TEST_F(StreamTests, ReadTimeout) {
    fake_state().read_results = {SOAPY_SDR_TIMEOUT};
    Device device(FAKE_DRIVER);
    auto stream = device.rx_stream<CF32>({0});
    stream.activate();

    std::vector<CF32> buffer(16);
    try {
        stream.read({buffer.data()}, buffer.size(), 1000);
        FAIL() << "Expected timeout";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::Timeout);
        EXPECT_EQ(e.message(), SoapySDR_errToStr(SOAPY_SDR_TIMEOUT));
    }
    // The stream stays usable.
    EXPECT_EQ(stream.read({buffer.data()}, buffer.size()), 16u);
}

TEST_F(StreamTests, ReadOverflow) {
    fake_state().read_results = {SOAPY_SDR_OVERFLOW};
    Device device(FAKE_DRIVER);
    auto stream = device.rx_stream<CF32>({0});
    stream.activate();

    std::vector<CF32> buffer(16);
    try {
        stream.read({buffer.data()}, buffer.size());
        FAIL() << "Expected overflow";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::Overflow);
    }
}

TEST_F(StreamTests, ReadReportsFlagsAndTime) {
    fake_state().read_flags = SOAPY_SDR_HAS_TIME | SOAPY_SDR_END_BURST;
    fake_state().read_time_ns = 777;
    Device device(FAKE_DRIVER);
    auto stream = device.rx_stream<CF32>({0});
    stream.activate();

    std::vector<CF32> buffer(8);
    stream.read({buffer.data()}, buffer.size());
    EXPECT_TRUE(stream.has_time());
    EXPECT_EQ(stream.time_ns(), 777);
    EXPECT_TRUE(stream.end_burst());
    EXPECT_FALSE(stream.more_fragments());
    EXPECT_EQ(stream.last_flags(), SOAPY_SDR_HAS_TIME | SOAPY_SDR_END_BURST);
}

TEST_F(StreamTests, ReadNeedsOneBufferPerChannel) {
    Device device(FAKE_DRIVER);
    auto stream = device.rx_stream<CF32>({0, 1});
    stream.activate();

    std::vector<CF32> buffer(8);
    EXPECT_THROW(stream.read({buffer.data()}, buffer.size()),
                 std::invalid_argument);
}

TEST_F(StreamTests, ReadVectorsUsesShortestLength) {
    Device device(FAKE_DRIVER);
    auto stream = device.rx_stream<CF32>({0, 1});
    stream.activate();

    std::vector<std::vector<CF32>> buffers = {std::vector<CF32>(100),
                                              std::vector<CF32>(50)};
    EXPECT_EQ(stream.read(buffers), 50u);
    EXPECT_EQ(buffers[0][49], fake_sample(49));
    EXPECT_EQ(buffers[1][49], fake_sample(49));
    EXPECT_EQ(buffers[0][50], CF32());
}

//==============================================================================
// Transmit
//==============================================================================

TEST_F(StreamTests, WritePassesTimeAndEndBurst) {
    Device device(FAKE_DRIVER);
    auto stream = device.tx_stream<CF32>({0});
    stream.activate();

    const auto samples = ramp(64);
    EXPECT_EQ(stream.write({samples.data()}, samples.size(), 1234, true), 64u);

    ASSERT_EQ(fake_state().writes.size(), 1u);
    EXPECT_EQ(fake_state().writes[0].flags,
              SOAPY_SDR_HAS_TIME | SOAPY_SDR_END_BURST);
    EXPECT_EQ(fake_state().writes[0].time_ns, 1234);
    EXPECT_EQ(fake_state().written_samples, samples);
}

TEST_F(StreamTests, PlainWriteHasNoFlags) {
    Device device(FAKE_DRIVER);
    auto stream = device.tx_stream<CF32>({0});
    stream.activate();

    const std::vector<std::vector<CF32>> buffers = {ramp(10)};
    EXPECT_EQ(stream.write(buffers), 10u);
    EXPECT_EQ(fake_state().writes.back().flags, 0);
}

TEST_F(StreamTests, WriteUnderflow) {
    fake_state().write_results = {SOAPY_SDR_UNDERFLOW};
    Device device(FAKE_DRIVER);
    auto stream = device.tx_stream<CF32>({0});
    stream.activate();

    const std::vector<std::vector<CF32>> buffers = {ramp(10)};
    try {
        stream.write(buffers);
        FAIL() << "Expected underflow";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::Underflow);
    }
}

TEST_F(StreamTests, WriteNeedsEqualLengths) {
    fake_state().tx_channels = 2;
    Device device(FAKE_DRIVER);
    auto stream = device.tx_stream<CF32>({0, 1});
    stream.activate();

    const std::vector<std::vector<CF32>> buffers = {ramp(10), ramp(9)};
    EXPECT_THROW(stream.write(buffers), std::invalid_argument);
    EXPECT_THROW(stream.write_all(buffers), std::invalid_argument);
    EXPECT_TRUE(fake_state().writes.empty());
}

TEST_F(StreamTests, WriteAllRetriesPartialWrites) {
    fake_state().write_results = {100, 50};
    Device device(FAKE_DRIVER);
    auto stream = device.tx_stream<CF32>({0});
    stream.activate();

    const std::vector<std::vector<CF32>> buffers = {ramp(300)};
    stream.write_all(buffers, 99, true);

    const auto& writes = fake_state().writes;
    ASSERT_EQ(writes.size(), 3u);
    EXPECT_EQ(writes[0].num_elems, 300u);
    EXPECT_EQ(writes[1].num_elems, 200u);
    EXPECT_EQ(writes[2].num_elems, 150u);

    EXPECT_EQ(writes[0].flags, SOAPY_SDR_HAS_TIME | SOAPY_SDR_END_BURST);
    EXPECT_EQ(writes[0].time_ns, 99);
    EXPECT_EQ(writes[1].flags, SOAPY_SDR_END_BURST);
    EXPECT_EQ(writes[2].flags, SOAPY_SDR_END_BURST);

    EXPECT_EQ(fake_state().written_samples, buffers[0]);
}

TEST_F(StreamTests, WriteAllRejectsOvercount) {
    fake_state().write_results = {500};
    Device device(FAKE_DRIVER);
    auto stream = device.tx_stream<CF32>({0});
    stream.activate();

    try {
        stream.write_all({ramp(300)});
        FAIL() << "Expected stream error";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::StreamError);
    }
}

TEST_F(StreamTests, WriteAllOfNothingDoesNotCallDriver) {
    Device device(FAKE_DRIVER);
    auto stream = device.tx_stream<CF32>({0});
    stream.activate();
    stream.write_all({std::vector<CF32>()});
    EXPECT_TRUE(fake_state().writes.empty());
}

TEST_F(StreamTests, ReadStatus) {
    fake_state().status_results = {0};
    Device device(FAKE_DRIVER);
    auto stream = device.tx_stream<CF32>({0});
    stream.activate();

    const StreamStatus status = stream.read_status();
    EXPECT_EQ(status.channel_mask, 1u);
    EXPECT_EQ(status.flags, SOAPY_SDR_END_BURST | SOAPY_SDR_HAS_TIME);
    EXPECT_EQ(status.time_ns, 1000);

    try {
        stream.read_status(10);
        FAIL() << "Expected timeout";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::Timeout);
    }
}

TEST_F(StreamTests, FlagNames) {
    EXPECT_EQ(stream_flag_names(0), "");
    EXPECT_EQ(stream_flag_names(SOAPY_SDR_END_BURST | SOAPY_SDR_HAS_TIME),
              "END_BURST, HAS_TIME");
    EXPECT_EQ(stream_flag_names(SOAPY_SDR_MORE_FRAGMENTS), "MORE_FRAGMENTS");
}

//==============================================================================
// Teardown
//==============================================================================

TEST_F(StreamTests, DropDeactivatesAndCloses) {
    Device device(FAKE_DRIVER);
    {
        auto stream = device.rx_stream<CF32>({0});
        stream.activate();
    }
    EXPECT_EQ(fake_state().deactivations, 1);
    EXPECT_EQ(fake_state().streams_closed, 1);
}

TEST_F(StreamTests, DropInactiveOnlyCloses) {
    Device device(FAKE_DRIVER);
    { auto stream = device.rx_stream<CF32>({0}); }
    EXPECT_EQ(fake_state().deactivations, 0);
    EXPECT_EQ(fake_state().streams_closed, 1);
}

TEST_F(StreamTests, MovedStreamClosesOnce) {
    Device device(FAKE_DRIVER);
    {
        auto first = device.rx_stream<CF32>({0});
        first.activate();
        auto second = std::move(first);
        EXPECT_TRUE(second.active());

        auto third = device.rx_stream<CF32>({1});
        third = std::move(second);
        EXPECT_EQ(fake_state().streams_closed, 1);
        EXPECT_TRUE(third.active());
    }
    EXPECT_EQ(fake_state().streams_closed, 2);
    EXPECT_EQ(fake_state().deactivations, 1);
}

TEST_F(StreamTests, StreamKeepsDeviceOpen) {
    std::vector<CF32> buffer(8);
    {
        auto stream = [] {
            Device device(FAKE_DRIVER);
            return device.rx_stream<CF32>({0});
        }();
        EXPECT_EQ(fake_state().devices_destroyed, 0);

        stream.activate();
        EXPECT_EQ(stream.read({buffer.data()}, buffer.size()), 8u);
    }
    EXPECT_EQ(fake_state().streams_closed, 1);
    EXPECT_EQ(fake_state().devices_destroyed, 1);
}

TEST_F(StreamTests, TeardownFailuresAreLoggedNotThrown) {
    fake_state().deactivate_result = SOAPY_SDR_STREAM_ERROR;
    fake_state().fail_close = true;

    std::vector<std::string> warnings;
    set_log_handler([&](LogLevel level, const std::string& message) {
        if (level == LogLevel::Warning) warnings.push_back(message);
    });

    {
        Device device(FAKE_DRIVER);
        auto stream = device.rx_stream<CF32>({0});
        stream.activate();
    }
    set_log_handler(nullptr);

    EXPECT_EQ(fake_state().deactivations, 1);
    EXPECT_EQ(fake_state().streams_closed, 1);
    EXPECT_EQ(fake_state().devices_destroyed, 1);
    const auto close_warnings = std::count_if(
        warnings.begin(), warnings.end(), [](const std::string& message) {
            return message.find("failed to close stream: close failed") !=
                   std::string::npos;
        });
    EXPECT_EQ(close_warnings, 1);
}
