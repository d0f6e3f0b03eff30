#include "shroud/blocklist/domain.h"
#include "shroud/common/utils.h"

namespace shroud::dns {

static bool is_valid_domain_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

Result<std::string, DomainError> normalize_domain(std::string_view domain) {
    if (!domain.empty() && domain.back() == '.') {
        domain.remove_suffix(1);
    }
    if (domain.empty()) {
        return make_error(DomainError::AE_EMPTY);
    }
    if (domain.size() > MAX_DOMAIN_LENGTH) {
        return make_error(DomainError::AE_TOO_LONG);
    }

    std::string normalized = utils::to_lower(domain);
    size_t label_length = 0;
    for (char c : normalized) {
        if (c == '.') {
            if (label_length == 0) {
                return make_error(DomainError::AE_EMPTY_LABEL);
            }
            label_length = 0;
            continue;
        }
        if (!is_valid_domain_char(c)) {
            return make_error(DomainError::AE_INVALID_CHARACTER);
        }
        if (++label_length > MAX_LABEL_LENGTH) {
            return make_error(DomainError::AE_LABEL_TOO_LONG);
        }
    }
    if (label_length == 0) {
        return make_error(DomainError::AE_EMPTY_LABEL);
    }

    return normalized;
}

std::vector<std::string_view> reversed_labels(std::string_view domain) {
    std::vector<std::string_view> labels;
    size_t end = domain.size();
    while (true) {
        size_t dot = domain.rfind('.', end == 0 ? 0 : end - 1);
        if (end == 0 || dot == std::string_view::npos) {
            labels.push_back(domain.substr(0, end));
            break;
        }
        labels.push_back(domain.substr(dot + 1, end - dot - 1));
        end = dot;
    }
    return labels;
}

std::vector<std::string_view> domain_suffixes(std::string_view domain) {
    std::vector<std::string_view> suffixes;
    size_t pos = 0;
    while (pos != std::string_view::npos) {
        suffixes.push_back(domain.substr(pos));
        pos = domain.find('.', pos);
        if (pos != std::string_view::npos) {
            ++pos;
        }
    }
    return suffixes;
}

} // namespace shroud::dns
