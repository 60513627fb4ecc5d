#include "sdrkit/format.hpp"

#include <SoapySDR/Formats.h>

#include <array>
#include <utility>

namespace sdrkit {

namespace {

constexpr std::array<std::pair<Format, const char*>, 20> FORMAT_NAMES = {{
    {Format::CF64, SOAPY_SDR_CF64}, {Format::CF32, SOAPY_SDR_CF32},
    {Format::CS32, SOAPY_SDR_CS32}, {Format::CU32, SOAPY_SDR_CU32},
    {Format::CS16, SOAPY_SDR_CS16}, {Format::CU16, SOAPY_SDR_CU16},
    {Format::CS12, SOAPY_SDR_CS12}, {Format::CU12, SOAPY_SDR_CU12},
    {Format::CS8, SOAPY_SDR_CS8},   {Format::CU8, SOAPY_SDR_CU8},
    {Format::CS4, SOAPY_SDR_CS4},   {Format::CU4, SOAPY_SDR_CU4},
    {Format::F64, SOAPY_SDR_F64},   {Format::F32, SOAPY_SDR_F32},
    {Format::S32, SOAPY_SDR_S32},   {Format::U32, SOAPY_SDR_U32},
    {Format::S16, SOAPY_SDR_S16},   {Format::U16, SOAPY_SDR_U16},
    {Format::S8, SOAPY_SDR_S8},     {Format::U8, SOAPY_SDR_U8},
}};

}  // namespace

const char* format_name(Format format) {
    for (const auto& [f, name] : FORMAT_NAMES) {
        if (f == format) return name;
    }
    return "";
}

std::optional<Format> parse_format(std::string_view name) {
    for (const auto& [f, n] : FORMAT_NAMES) {
        if (name == n) return f;
    }
    return std::nullopt;
}

std::size_t format_size(Format format) {
    return SoapySDR_formatToSize(format_name(format));
}

bool is_complex(Format format) { return format_name(format)[0] == 'C'; }

bool is_packed(Format format) {
    switch (format) {
        case Format::CS12:
        case Format::CU12:
        case Format::CS4:
        case Format::CU4:
            return true;
        default:
            return false;
    }
}

std::ostream& operator<<(std::ostream& os, Format format) {
    return os << format_name(format);
}

}  // namespace sdrkit
