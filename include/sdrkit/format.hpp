#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

namespace sdrkit {

// Wire-level sample layouts understood by SoapySDR.
//
// The first letter selects complex (C) or real, followed by float (F),
// signed (S) or unsigned (U) and the bits per number. CS12, CU12, CS4 and
// CU4 pack several numbers per byte.
enum class Format {
    CF64,
    CF32,
    CS32,
    CU32,
    CS16,
    CU16,
    CS12,
    CU12,
    CS8,
    CU8,
    CS4,
    CU4,
    F64,
    F32,
    S32,
    U32,
    S16,
    U16,
    S8,
    U8
};

// SoapySDR markup name, e.g. "CF32".
const char* format_name(Format format);
std::optional<Format> parse_format(std::string_view name);

// Bytes per element as reported by SoapySDR. CF32 is 8, CS16 is 4.
std::size_t format_size(Format format);

bool is_complex(Format format);
// Packed formats have no fixed-layout host element type.
bool is_packed(Format format);

std::ostream& operator<<(std::ostream& os, Format format);

// Maps a host element type to the format it is streamed as.
//
// Only byte-aligned types whose size, alignment and component order match the
// wire layout are specialized. Using any other type as a stream element is a
// compile error.
template <typename E>
struct StreamSample;

template <>
struct StreamSample<uint8_t> {
    static constexpr Format format = Format::U8;
};

template <>
struct StreamSample<uint16_t> {
    static constexpr Format format = Format::U16;
};

template <>
struct StreamSample<uint32_t> {
    static constexpr Format format = Format::U32;
};

template <>
struct StreamSample<int8_t> {
    static constexpr Format format = Format::S8;
};

template <>
struct StreamSample<int16_t> {
    static constexpr Format format = Format::S16;
};

template <>
struct StreamSample<int32_t> {
    static constexpr Format format = Format::S32;
};

template <>
struct StreamSample<float> {
    static constexpr Format format = Format::F32;
};

template <>
struct StreamSample<double> {
    static constexpr Format format = Format::F64;
};

template <>
struct StreamSample<std::complex<uint8_t>> {
    static constexpr Format format = Format::CU8;
};

template <>
struct StreamSample<std::complex<uint16_t>> {
    static constexpr Format format = Format::CU16;
};

template <>
struct StreamSample<std::complex<uint32_t>> {
    static constexpr Format format = Format::CU32;
};

template <>
struct StreamSample<std::complex<int8_t>> {
    static constexpr Format format = Format::CS8;
};

template <>
struct StreamSample<std::complex<int16_t>> {
    static constexpr Format format = Format::CS16;
};

template <>
struct StreamSample<std::complex<int32_t>> {
    static constexpr Format format = Format::CS32;
};

template <>
struct StreamSample<std::complex<float>> {
    static constexpr Format format = Format::CF32;
};

template <>
struct StreamSample<std::complex<double>> {
    static constexpr Format format = Format::CF64;
};

}  // namespace sdrkit
