#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "shroud/common/error.h"

namespace shroud::dns {

static constexpr size_t MAX_DOMAIN_LENGTH = 253;
static constexpr size_t MAX_LABEL_LENGTH = 63;

enum class DomainError {
    AE_EMPTY,
    AE_TOO_LONG,
    AE_EMPTY_LABEL,
    AE_LABEL_TOO_LONG,
    AE_INVALID_CHARACTER,
};

/**
 * Normalize a domain name: lowercase it and strip one trailing dot.
 * Fails if the result is empty, longer than 253 characters, has an empty label,
 * a label longer than 63 characters, or a character outside `[a-z0-9-_]`.
 */
Result<std::string, DomainError> normalize_domain(std::string_view domain);

/**
 * Split a normalized domain into labels in reversed order ("a.b.com" -> com, b, a)
 */
std::vector<std::string_view> reversed_labels(std::string_view domain);

/**
 * Get the domain and all its parent suffixes ("a.b.com" -> a.b.com, b.com, com)
 */
std::vector<std::string_view> domain_suffixes(std::string_view domain);

} // namespace shroud::dns

template <>
struct shroud::ErrorCodeToString<shroud::dns::DomainError> {
    std::string operator()(shroud::dns::DomainError e) {
        switch (e) {
        case decltype(e)::AE_EMPTY: return "Domain is empty";
        case decltype(e)::AE_TOO_LONG: return "Domain is too long";
        case decltype(e)::AE_EMPTY_LABEL: return "Domain has an empty label";
        case decltype(e)::AE_LABEL_TOO_LONG: return "Domain label is too long";
        case decltype(e)::AE_INVALID_CHARACTER: return "Domain contains an invalid character";
        }
        return "Unknown error";
    }
};
