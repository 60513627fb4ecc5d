#include "sdrkit/arg_info.hpp"

#include <stdexcept>

namespace sdrkit {

namespace {

std::string required_string(const char* s, const char* field) {
    if (s == nullptr) {
        throw std::logic_error(std::string("Null ") + field +
                               " in SoapySDR argument info");
    }
    return s;
}

std::optional<std::string> optional_string(const char* s) {
    if (s == nullptr) return std::nullopt;
    return std::string(s);
}

ArgType arg_type_from_native(SoapySDRArgInfoType type) {
    switch (type) {
        case SOAPY_SDR_ARG_INFO_BOOL:
            return ArgType::Bool;
        case SOAPY_SDR_ARG_INFO_FLOAT:
            return ArgType::Float;
        case SOAPY_SDR_ARG_INFO_INT:
            return ArgType::Int;
        case SOAPY_SDR_ARG_INFO_STRING:
            return ArgType::String;
        default:
            return ArgType::Unrecognized;
    }
}

class ArgInfoListGuard {
   private:
    SoapySDRArgInfo* infos_;
    std::size_t length_;

   public:
    ArgInfoListGuard(SoapySDRArgInfo* infos, std::size_t length)
        : infos_(infos), length_(length) {}
    ~ArgInfoListGuard() { SoapySDRArgInfoList_clear(infos_, length_); }

    ArgInfoListGuard(const ArgInfoListGuard&) = delete;
    ArgInfoListGuard& operator=(const ArgInfoListGuard&) = delete;
};

}  // namespace

const char* to_string(ArgType type) {
    switch (type) {
        case ArgType::Bool:
            return "bool";
        case ArgType::Float:
            return "float";
        case ArgType::Int:
            return "int";
        case ArgType::String:
            return "string";
        case ArgType::Unrecognized:
            break;
    }
    return "unrecognized";
}

ArgInfo ArgInfo::from_native(const SoapySDRArgInfo& info) {
    ArgInfo out;
    out.key = required_string(info.key, "key");
    out.value = required_string(info.value, "value");
    out.name = optional_string(info.name);
    out.description = optional_string(info.description);
    out.units = optional_string(info.units);
    out.type = arg_type_from_native(info.type);
    out.range = Range::from_native(info.range);

    if (info.numOptions > 0 && info.options == nullptr) {
        throw std::logic_error("Null option list in SoapySDR argument info");
    }
    out.options.reserve(info.numOptions);
    for (std::size_t i = 0; i < info.numOptions; ++i) {
        const char* option_name =
            info.optionNames != nullptr ? info.optionNames[i] : nullptr;
        out.options.emplace_back(required_string(info.options[i], "option"),
                                 optional_string(option_name));
    }
    return out;
}

std::vector<ArgInfo> arg_info_list_from_native(SoapySDRArgInfo* infos,
                                               std::size_t length) {
    ArgInfoListGuard guard(infos, length);

    std::vector<ArgInfo> list;
    list.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        list.push_back(ArgInfo::from_native(infos[i]));
    }
    return list;
}

}  // namespace sdrkit
