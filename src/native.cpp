#include "native.hpp"

#include <SoapySDR/Errors.h>

#include <stdexcept>

namespace sdrkit::native {

std::string last_error() {
    const char* message = SoapySDRDevice_lastError();
    return message ? std::string(message) : std::string();
}

void check_last_status() {
    if (SoapySDRDevice_lastStatus() != 0) {
        throw Error(ErrorCode::Other, last_error());
    }
}

void check_status(int ret) {
    if (ret != 0) {
        throw Error(ErrorCode::Other, last_error());
    }
}

int check_code(int ret) {
    if (ret >= 0) return ret;

    std::string message = last_error();
    if (message.empty()) {
        message = SoapySDR_errToStr(ret);
    }
    throw Error(error_code_from_native(ret), message);
}

const char* c_str(const std::string& s, const char* what) {
    if (s.find('\0') != std::string::npos) {
        throw std::invalid_argument(std::string(what) +
                                    " cannot contain NUL bytes");
    }
    return s.c_str();
}

std::vector<Args> kwargs_list(SoapySDRKwargs* list, std::size_t length) {
    std::vector<Args> out;
    try {
        out.reserve(length);
    } catch (const std::bad_alloc&) {
        SoapySDRKwargsList_clear(list, length);
        throw;
    }
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(Args::adopt(list[i]));
    }
    // The entries now belong to the Args values; only the array remains.
    SoapySDR_free(list);
    return out;
}

}  // namespace sdrkit::native
