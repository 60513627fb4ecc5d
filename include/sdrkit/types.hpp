#pragma once

#include <SoapySDR/Constants.h>
#include <SoapySDR/Types.h>

#include <ostream>

namespace sdrkit {

// Default blocking bound for stream transfers, matching SoapySDR's own.
constexpr long DEFAULT_TIMEOUT_US = 100000;

enum class Direction { Tx = SOAPY_SDR_TX, Rx = SOAPY_SDR_RX };

constexpr int to_native(Direction direction) {
    return static_cast<int>(direction);
}

inline const char* to_string(Direction direction) {
    return direction == Direction::Rx ? "RX" : "TX";
}

inline std::ostream& operator<<(std::ostream& os, Direction direction) {
    return os << to_string(direction);
}

// Inclusive range of values; step is 0 for a continuous range.
struct Range {
    double minimum = 0.0;
    double maximum = 0.0;
    double step = 0.0;

    static Range from_native(const SoapySDRRange& r) {
        return Range{r.minimum, r.maximum, r.step};
    }

    bool contains(double value) const {
        return value >= minimum && value <= maximum;
    }
};

inline bool operator==(const Range& a, const Range& b) {
    return a.minimum == b.minimum && a.maximum == b.maximum &&
           a.step == b.step;
}

}  // namespace sdrkit
