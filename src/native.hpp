#pragma once

#include <SoapySDR/Device.h>
#include <SoapySDR/Types.h>

#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include "sdrkit/arg_info.hpp"
#include "sdrkit/args.hpp"
#include "sdrkit/error.hpp"
#include "sdrkit/types.hpp"

// Helpers around SoapySDR's C API. Every native call site goes through one of
// these so the thread-local status is read right after the call it belongs
// to, before anything else can run on this thread and overwrite it.
namespace sdrkit::native {

struct FreeDeleter {
    void operator()(void* ptr) const { SoapySDR_free(ptr); }
};

template <typename T>
using NativePtr = std::unique_ptr<T, FreeDeleter>;

// Message recorded by the last failing call on this thread.
std::string last_error();

// Throws Error(Other) when the last call on this thread failed.
void check_last_status();

// For setters returning an int status: nonzero is Other.
void check_status(int ret);

// For stream calls returning a SOAPY_SDR_* code: negative values are
// translated to the matching ErrorCode. Returns ret otherwise.
int check_code(int ret);

// Throws std::invalid_argument when s cannot be passed as a C string.
const char* c_str(const std::string& s, const char* what);

template <typename F>
auto call(F&& f) -> decltype(f()) {
    if constexpr (std::is_void_v<decltype(f())>) {
        f();
        check_last_status();
    } else {
        auto result = f();
        check_last_status();
        return result;
    }
}

template <typename F>
void status_call(F&& f) {
    check_status(f());
}

template <typename F>
std::string string_call(F&& f) {
    NativePtr<char> ptr(f());
    check_last_status();
    return ptr ? std::string(ptr.get()) : std::string();
}

template <typename F>
Args kwargs_call(F&& f) {
    Args args = Args::adopt(f());
    check_last_status();
    return args;
}

template <typename F>
std::vector<std::string> strings_call(F&& f) {
    std::size_t length = 0;
    char** strings = f(&length);
    struct Guard {
        char** strings;
        std::size_t length;
        ~Guard() { SoapySDRStrings_clear(&strings, length); }
    } guard{strings, length};
    check_last_status();

    std::vector<std::string> out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        out.emplace_back(strings[i]);
    }
    return out;
}

template <typename T, typename F>
std::vector<T> array_call(F&& f) {
    std::size_t length = 0;
    NativePtr<T> ptr(f(&length));
    check_last_status();
    if (!ptr) return {};
    return std::vector<T>(ptr.get(), ptr.get() + length);
}

template <typename F>
std::vector<Range> ranges_call(F&& f) {
    std::vector<Range> out;
    for (const auto& r : array_call<SoapySDRRange>(std::forward<F>(f))) {
        out.push_back(Range::from_native(r));
    }
    return out;
}

template <typename F>
std::vector<ArgInfo> arg_info_call(F&& f) {
    std::size_t length = 0;
    SoapySDRArgInfo* infos = f(&length);
    if (SoapySDRDevice_lastStatus() != 0) {
        const std::string message = last_error();
        SoapySDRArgInfoList_clear(infos, length);
        throw Error(ErrorCode::Other, message);
    }
    return arg_info_list_from_native(infos, length);
}

std::vector<Args> kwargs_list(SoapySDRKwargs* list, std::size_t length);

}  // namespace sdrkit::native
