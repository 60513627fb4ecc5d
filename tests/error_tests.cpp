// error_tests.cpp
// Tests for error codes and the Error exception.
//

#include <gtest/gtest.h>

#include <SoapySDR/Errors.h>

#include <sstream>

#include "sdrkit/error.hpp"

using sdrkit::Error;
using sdrkit::ErrorCode;

TEST(ErrorTests, MapsNativeCodes) {
    EXPECT_EQ(sdrkit::error_code_from_native(SOAPY_SDR_TIMEOUT),
              ErrorCode::Timeout);
    EXPECT_EQ(sdrkit::error_code_from_native(SOAPY_SDR_STREAM_ERROR),
              ErrorCode::StreamError);
    EXPECT_EQ(sdrkit::error_code_from_native(SOAPY_SDR_CORRUPTION),
              ErrorCode::Corruption);
    EXPECT_EQ(sdrkit::error_code_from_native(SOAPY_SDR_OVERFLOW),
              ErrorCode::Overflow);
    EXPECT_EQ(sdrkit::error_code_from_native(SOAPY_SDR_NOT_SUPPORTED),
              ErrorCode::NotSupported);
    EXPECT_EQ(sdrkit::error_code_from_native(SOAPY_SDR_TIME_ERROR),
              ErrorCode::TimeError);
    EXPECT_EQ(sdrkit::error_code_from_native(SOAPY_SDR_UNDERFLOW),
              ErrorCode::Underflow);
}

TEST(ErrorTests, UnknownNativeCodesAreOther) {
    EXPECT_EQ(sdrkit::error_code_from_native(-99), ErrorCode::Other);
    EXPECT_EQ(sdrkit::error_code_from_native(-1000), ErrorCode::Other);
}

TEST(ErrorTests, CarriesCodeAndMessage) {
    const Error error(ErrorCode::Overflow, "dropped samples");
    EXPECT_EQ(error.code(), ErrorCode::Overflow);
    EXPECT_EQ(error.message(), "dropped samples");
    EXPECT_STREQ(error.what(), "Overflow: dropped samples");
}

TEST(ErrorTests, IsRuntimeError) {
    try {
        throw Error(ErrorCode::Other, "bad antenna");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "Other: bad antenna");
    }
}

TEST(ErrorTests, CodeNames) {
    std::ostringstream os;
    os << ErrorCode::TimeError << " " << ErrorCode::Underflow;
    EXPECT_EQ(os.str(), "TimeError Underflow");
}
