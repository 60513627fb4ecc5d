#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

namespace sdrkit {

// Status codes reported by SoapySDR stream calls.
enum class ErrorCode {
    Timeout = -1,
    StreamError = -2,
    Corruption = -3,
    Overflow = -4,
    NotSupported = -5,
    TimeError = -6,
    Underflow = -7,
    // No specific code, see the message.
    Other = 0
};

const char* to_string(ErrorCode code);
std::ostream& operator<<(std::ostream& os, ErrorCode code);

// Maps a native SOAPY_SDR_* return value to an ErrorCode. Unknown values map
// to Other.
ErrorCode error_code_from_native(int ret);

class Error : public std::runtime_error {
   private:
    ErrorCode code_;
    std::string message_;

   public:
    Error(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
};

}  // namespace sdrkit
