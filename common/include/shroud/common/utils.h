#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <sys/time.h>

#include "shroud/common/clock.h"
#include "shroud/common/defs.h"

/**
 * Macros for fmt::format with compile-time checked FMT_STRING
 */
#define SHROUD_FMT(FORMAT, ...) fmt::format(FMT_STRING(FORMAT), __VA_ARGS__)

namespace shroud::utils {

/**
 * Transform string in lowercase
 */
static inline std::string to_lower(std::string_view str) {
    std::string lwr;
    lwr.reserve(str.length());
    std::transform(str.cbegin(), str.cend(), std::back_inserter(lwr), [](unsigned char c) {
        return (char) std::tolower(c);
    });
    return lwr;
}

/**
 * Transform string in uppercase
 */
static inline std::string to_upper(std::string_view str) {
    std::string upr;
    upr.reserve(str.length());
    std::transform(str.cbegin(), str.cend(), std::back_inserter(upr), [](unsigned char c) {
        return (char) std::toupper(c);
    });
    return upr;
}

/**
 * Trim whitespaces-only prefix and suffix
 */
static inline void trim(std::string_view &str) {
    auto is_space = [](unsigned char c) {
        return std::isspace(c) != 0;
    };
    auto pos1 = std::find_if_not(str.begin(), str.end(), is_space);
    str.remove_prefix(std::distance(str.begin(), pos1));
    auto pos2 = std::find_if_not(str.rbegin(), str.rend(), is_space);
    str.remove_suffix(std::distance(str.rbegin(), pos2));
}

/**
 * Trim whitespaces-only prefix and suffix
 */
static inline std::string_view trim(std::string_view &&str) {
    trim(str);
    return str;
}

/**
 * Check if string starts with prefix
 */
static inline constexpr bool starts_with(std::string_view str, std::string_view prefix) {
    return str.length() >= prefix.length() && 0 == str.compare(0, prefix.length(), prefix);
}

/**
 * Check if string ends with suffix
 */
static inline constexpr bool ends_with(std::string_view str, std::string_view suffix) {
    return str.length() >= suffix.length()
            && 0 == str.compare(str.length() - suffix.length(), suffix.length(), suffix);
}

/**
 * Splits string by any character in delimiters. Parts are trimmed, empty parts are skipped.
 */
std::vector<std::string_view> split_by_any_of(std::string_view str, std::string_view delim);

/**
 * Check if string is a valid IPv4 address
 */
bool is_valid_ip4(std::string_view str);

/**
 * Check if string is a valid IPv6 address
 */
bool is_valid_ip6(std::string_view str);

/**
 * 64-bit FNV-1a hash of a byte string
 */
static inline uint64_t fnv1a64(std::string_view str) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : str) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

/**
 * Combine two hash values
 */
static inline size_t hash_combine(size_t seed, size_t value) {
    return seed ^ (value + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

/**
 * Convert duration to timeval
 */
template <typename Rep, typename Period>
static inline timeval duration_to_timeval(std::chrono::duration<Rep, Period> t) {
    auto usecs = std::chrono::duration_cast<Micros>(t).count();
    return timeval{.tv_sec = (time_t) (usecs / 1000000), .tv_usec = (suseconds_t) (usecs % 1000000)};
}

/**
 * Timer measures time since creating object
 */
class Timer {
public:
    /**
     * Returns elapsed time duration since creating object
     * @tparam T Duration type
     * @return Elapsed time duration since creating object
     */
    template <typename T>
    T elapsed() const {
        return std::chrono::duration_cast<T>(SteadyClock::now() - m_start);
    }

    void reset() {
        m_start = SteadyClock::now();
    }

private:
    SteadyClock::time_point m_start = SteadyClock::now();
};

/**
 * Executes the function on scope exit
 */
class ScopeExit {
public:
    explicit ScopeExit(std::function<void()> func)
            : m_func(std::move(func)) {
    }

    ~ScopeExit() {
        if (m_func) {
            m_func();
        }
    }

    ScopeExit(const ScopeExit &) = delete;
    ScopeExit &operator=(const ScopeExit &) = delete;
    ScopeExit(ScopeExit &&) = delete;
    ScopeExit &operator=(ScopeExit &&) = delete;

    /** Do not execute the function */
    void release() {
        m_func = nullptr;
    }

private:
    std::function<void()> m_func;
};

} // namespace shroud::utils
