#include <arpa/inet.h>
#include <netinet/in.h>

#include "shroud/common/utils.h"

namespace shroud::utils {

std::vector<std::string_view> split_by_any_of(std::string_view str, std::string_view delim) {
    std::vector<std::string_view> out;
    if (str.empty()) {
        return out;
    }

    out.reserve(1 + std::count_if(str.begin(), str.end(), [&delim](char c) {
        return delim.find(c) != std::string_view::npos;
    }));
    size_t seek = 0;
    while (seek <= str.length()) {
        size_t end = str.find_first_of(delim, seek);
        if (end == std::string_view::npos) {
            end = str.length();
        }
        std::string_view s = trim(str.substr(seek, end - seek));
        if (!s.empty()) {
            out.push_back(s);
        }
        seek = end + 1;
    }
    return out;
}

bool is_valid_ip4(std::string_view str) {
    if (str.empty() || str.length() >= INET_ADDRSTRLEN) {
        return false;
    }
    std::string s{str};
    in_addr addr{};
    return 1 == inet_pton(AF_INET, s.c_str(), &addr);
}

bool is_valid_ip6(std::string_view str) {
    if (str.empty() || str.length() >= INET6_ADDRSTRLEN) {
        return false;
    }
    std::string s{str};
    in6_addr addr{};
    return 1 == inet_pton(AF_INET6, s.c_str(), &addr);
}

} // namespace shroud::utils
