#pragma once

#include <SoapySDR/Types.h>

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace sdrkit {

// Ordered list of key=value strings backed by a native SoapySDRKwargs.
//
// Used to filter and open devices and to pass extra parameters to stream
// setup and tuning. Keys are expected to be unique: set() overwrites the
// first matching key, get() returns the first match.
class Args {
   private:
    SoapySDRKwargs kwargs_;

   public:
    class const_iterator {
       private:
        const SoapySDRKwargs* kwargs_;
        std::size_t pos_;

       public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::pair<std::string_view, std::string_view>;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = value_type;

        const_iterator(const SoapySDRKwargs* kwargs, std::size_t pos)
            : kwargs_(kwargs), pos_(pos) {}

        value_type operator*() const;
        const_iterator& operator++() {
            ++pos_;
            return *this;
        }
        const_iterator operator++(int) {
            const_iterator prev = *this;
            ++pos_;
            return prev;
        }
        bool operator==(const const_iterator& other) const {
            return kwargs_ == other.kwargs_ && pos_ == other.pos_;
        }
        bool operator!=(const const_iterator& other) const {
            return !(*this == other);
        }
    };

    Args();
    // Parses markup of the form "key=value, key2=value2". Segments without
    // '=' are skipped.
    Args(const std::string& markup);
    Args(const char* markup);
    Args(std::initializer_list<std::pair<std::string, std::string>> pairs);

    template <typename It>
    Args(It first, It last) : Args() {
        for (; first != last; ++first) {
            const auto& pair = *first;
            set(std::string(pair.first), std::string(pair.second));
        }
    }

    Args(const Args& other);
    Args(Args&& other) noexcept;
    Args& operator=(const Args& other);
    Args& operator=(Args&& other) noexcept;
    ~Args();

    // Takes ownership of kwargs allocated by SoapySDR.
    static Args adopt(SoapySDRKwargs kwargs);

    // Throws std::invalid_argument if key or value contains a NUL byte.
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(std::string_view key) const;
    bool contains(std::string_view key) const;

    std::size_t size() const { return kwargs_.size; }
    bool empty() const { return kwargs_.size == 0; }

    const_iterator begin() const { return const_iterator(&kwargs_, 0); }
    const_iterator end() const { return const_iterator(&kwargs_, kwargs_.size); }

    std::string to_string() const;
    std::map<std::string, std::string> to_map() const;

    const SoapySDRKwargs* native() const { return &kwargs_; }

   private:
    void clear();
};

std::ostream& operator<<(std::ostream& os, const Args& args);

}  // namespace sdrkit
