#include "sdrkit/error.hpp"

#include <SoapySDR/Errors.h>

namespace sdrkit {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Timeout:
            return "Timeout";
        case ErrorCode::StreamError:
            return "StreamError";
        case ErrorCode::Corruption:
            return "Corruption";
        case ErrorCode::Overflow:
            return "Overflow";
        case ErrorCode::NotSupported:
            return "NotSupported";
        case ErrorCode::TimeError:
            return "TimeError";
        case ErrorCode::Underflow:
            return "Underflow";
        case ErrorCode::Other:
            break;
    }
    return "Other";
}

std::ostream& operator<<(std::ostream& os, ErrorCode code) {
    return os << to_string(code);
}

ErrorCode error_code_from_native(int ret) {
    switch (ret) {
        case SOAPY_SDR_TIMEOUT:
            return ErrorCode::Timeout;
        case SOAPY_SDR_STREAM_ERROR:
            return ErrorCode::StreamError;
        case SOAPY_SDR_CORRUPTION:
            return ErrorCode::Corruption;
        case SOAPY_SDR_OVERFLOW:
            return ErrorCode::Overflow;
        case SOAPY_SDR_NOT_SUPPORTED:
            return ErrorCode::NotSupported;
        case SOAPY_SDR_TIME_ERROR:
            return ErrorCode::TimeError;
        case SOAPY_SDR_UNDERFLOW:
            return ErrorCode::Underflow;
        default:
            return ErrorCode::Other;
    }
}

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(to_string(code)) + ": " + message),
      code_(code),
      message_(message) {}

}  // namespace sdrkit
