#include "sdrkit/logging.hpp"

#include <mutex>

namespace sdrkit {

namespace {

std::mutex& handler_mutex() {
    static std::mutex mutex;
    return mutex;
}

LogHandler& handler_slot() {
    static LogHandler handler;
    return handler;
}

void forward_log(const SoapySDRLogLevel level, const char* message) {
    std::string text(message ? message : "");
    text.erase(0, text.find_first_not_of("\r\n"));

    LogHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex());
        handler = handler_slot();
    }
    if (handler) {
        handler(static_cast<LogLevel>(level), text);
    }
}

}  // namespace

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Fatal:
            return "FATAL";
        case LogLevel::Critical:
            return "CRITICAL";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warning:
            return "WARNING";
        case LogLevel::Notice:
            return "NOTICE";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Ssi:
            return "SSI";
    }
    return "UNKNOWN";
}

void set_log_level(LogLevel level) {
    SoapySDR_setLogLevel(static_cast<SoapySDRLogLevel>(level));
}

void set_log_handler(LogHandler handler) {
    const bool install = static_cast<bool>(handler);
    {
        std::lock_guard<std::mutex> lock(handler_mutex());
        handler_slot() = std::move(handler);
    }
    SoapySDR_registerLogHandler(install ? forward_log : nullptr);
}

void log(LogLevel level, const std::string& message) {
    SoapySDR_log(static_cast<SoapySDRLogLevel>(level), message.c_str());
}

}  // namespace sdrkit
