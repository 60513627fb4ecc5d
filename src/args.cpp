#include "sdrkit/args.hpp"

#include <cstdlib>
#include <cstring>
#include <new>
#include <sstream>
#include <stdexcept>

namespace sdrkit {

namespace {

constexpr const char* WHITESPACE = " \t\r\n";

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(WHITESPACE);
    return s.substr(first, last - first + 1);
}

}  // namespace

Args::const_iterator::value_type Args::const_iterator::operator*() const {
    return {kwargs_->keys[pos_], kwargs_->vals[pos_]};
}

Args::Args() : kwargs_{0, nullptr, nullptr} {}

Args::Args(const std::string& markup) : Args() {
    std::stringstream ss(markup);
    std::string segment;
    while (std::getline(ss, segment, ',')) {
        const auto pos = segment.find('=');
        if (pos == std::string::npos) continue;
        set(trim(segment.substr(0, pos)), trim(segment.substr(pos + 1)));
    }
}

Args::Args(const char* markup) : Args(std::string(markup ? markup : "")) {}

Args::Args(std::initializer_list<std::pair<std::string, std::string>> pairs)
    : Args(pairs.begin(), pairs.end()) {}

// Copies entry by entry so repeated keys survive. The arrays come from the C
// allocator because SoapySDRKwargs_clear releases them with free().
Args::Args(const Args& other) : Args() {
    const std::size_t count = other.kwargs_.size;
    if (count == 0) return;

    kwargs_.keys = static_cast<char**>(std::calloc(count, sizeof(char*)));
    kwargs_.vals = static_cast<char**>(std::calloc(count, sizeof(char*)));
    if (kwargs_.keys == nullptr || kwargs_.vals == nullptr) {
        throw std::bad_alloc();
    }
    for (std::size_t i = 0; i < count; ++i) {
        kwargs_.keys[i] = strdup(other.kwargs_.keys[i]);
        kwargs_.vals[i] = strdup(other.kwargs_.vals[i]);
        kwargs_.size = i + 1;
        if (kwargs_.keys[i] == nullptr || kwargs_.vals[i] == nullptr) {
            throw std::bad_alloc();
        }
    }
}

Args::Args(Args&& other) noexcept : kwargs_(other.kwargs_) {
    other.kwargs_ = {0, nullptr, nullptr};
}

Args& Args::operator=(const Args& other) {
    if (this != &other) {
        Args copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Args& Args::operator=(Args&& other) noexcept {
    if (this != &other) {
        clear();
        kwargs_ = other.kwargs_;
        other.kwargs_ = {0, nullptr, nullptr};
    }
    return *this;
}

Args::~Args() { clear(); }

Args Args::adopt(SoapySDRKwargs kwargs) {
    Args args;
    args.kwargs_ = kwargs;
    return args;
}

void Args::set(const std::string& key, const std::string& value) {
    if (key.find('\0') != std::string::npos) {
        throw std::invalid_argument("Args key cannot contain NUL bytes");
    }
    if (value.find('\0') != std::string::npos) {
        throw std::invalid_argument("Args value cannot contain NUL bytes");
    }
    if (SoapySDRKwargs_set(&kwargs_, key.c_str(), value.c_str()) != 0) {
        throw std::bad_alloc();
    }
}

std::optional<std::string> Args::get(std::string_view key) const {
    for (const auto& [k, v] : *this) {
        if (k == key) return std::string(v);
    }
    return std::nullopt;
}

bool Args::contains(std::string_view key) const {
    return get(key).has_value();
}

std::string Args::to_string() const {
    std::string out;
    for (const auto& [k, v] : *this) {
        if (!out.empty()) out += ", ";
        out.append(k).append("=").append(v);
    }
    return out;
}

std::map<std::string, std::string> Args::to_map() const {
    std::map<std::string, std::string> map;
    for (const auto& [k, v] : *this) {
        map[std::string(k)] = std::string(v);
    }
    return map;
}

void Args::clear() {
    SoapySDRKwargs_clear(&kwargs_);
    kwargs_ = {0, nullptr, nullptr};
}

std::ostream& operator<<(std::ostream& os, const Args& args) {
    return os << args.to_string();
}

}  // namespace sdrkit
