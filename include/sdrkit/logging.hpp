#pragma once

#include <SoapySDR/Logger.h>

#include <functional>
#include <string>

namespace sdrkit {

// Same values as SoapySDRLogLevel. Ssi is for streaming status indicators
// such as "O" (overflow) and "U" (underflow).
enum class LogLevel {
    Fatal = SOAPY_SDR_FATAL,
    Critical = SOAPY_SDR_CRITICAL,
    Error = SOAPY_SDR_ERROR,
    Warning = SOAPY_SDR_WARNING,
    Notice = SOAPY_SDR_NOTICE,
    Info = SOAPY_SDR_INFO,
    Debug = SOAPY_SDR_DEBUG,
    Trace = SOAPY_SDR_TRACE,
    Ssi = SOAPY_SDR_SSI
};

using LogHandler = std::function<void(LogLevel, const std::string&)>;

const char* to_string(LogLevel level);

// Messages less severe than level are dropped, including the drivers'.
void set_log_level(LogLevel level);

// Routes SoapySDR's log output, ours and the drivers', to handler. Leading
// '\r' and '\n' characters are stripped from each message. An empty handler
// restores SoapySDR's default stderr logger.
void set_log_handler(LogHandler handler);

void log(LogLevel level, const std::string& message);

}  // namespace sdrkit
