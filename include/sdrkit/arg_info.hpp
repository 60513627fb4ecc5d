#pragma once

#include <SoapySDR/Types.h>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sdrkit/types.hpp"

namespace sdrkit {

// Unrecognized covers type tags added to SoapySDR after this was built.
enum class ArgType { Bool, Float, Int, String, Unrecognized };

const char* to_string(ArgType type);

// Metadata about one configurable argument (a setting, a stream arg or a
// tune arg).
struct ArgInfo {
    using Option = std::pair<std::string, std::optional<std::string>>;

    // Key used to identify the argument.
    std::string key;
    // Default value when the argument is not specified.
    std::string value;
    // Displayable name.
    std::optional<std::string> name;
    std::optional<std::string> description;
    // dB, Hz, etc.
    std::optional<std::string> units;
    ArgType type = ArgType::Unrecognized;
    // Valid for numeric types.
    Range range;
    // When non-empty, the argument is restricted to these values. Each option
    // carries an optional display name.
    std::vector<Option> options;

    // Throws std::logic_error when the driver handed back a record with a
    // null key, value or option.
    static ArgInfo from_native(const SoapySDRArgInfo& info);
};

// Converts and then releases a list allocated by SoapySDR. The native list is
// freed exactly once, including when a record fails to convert.
std::vector<ArgInfo> arg_info_list_from_native(SoapySDRArgInfo* infos,
                                               std::size_t length);

}  // namespace sdrkit
