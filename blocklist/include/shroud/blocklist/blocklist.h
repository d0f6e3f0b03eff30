#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "shroud/common/clock.h"
#include "shroud/common/defs.h"

namespace shroud::dns {

/**
 * Blocklist category
 */
enum class Category : uint8_t {
    ADS,
    TRACKING,
    MALWARE,
    CUSTOM,
};

static constexpr size_t CATEGORY_COUNT = 4;

enum class MatchType : uint8_t {
    EXACT,  /**< Matches the domain only */
    SUFFIX, /**< Matches the domain and all its subdomains */
};

enum class Action : uint8_t {
    BLOCK,
    ALLOW, /**< Explicit exemption, e.g. `@@||example.org^` */
};

enum class MatchedBy : uint8_t {
    NONE,
    EXACT,
    TRIE,
};

struct BlocklistEntry {
    /** Normalized domain */
    std::string domain;
    MatchType match_type = MatchType::EXACT;
    Action action = Action::BLOCK;
    Category category = Category::CUSTOM;
    /** Name of the source the entry came from */
    std::string source;
    /** Priority of the source, higher wins */
    int32_t priority = 0;
    SystemClock::time_point created_at{};

    /** Entries are equal if they would produce the same verdict */
    [[nodiscard]] bool same_rule(const BlocklistEntry &other) const {
        return match_type == other.match_type && action == other.action && category == other.category;
    }
};

struct CheckResult {
    bool blocked = false;
    /** Category of the matched rule, set for both blocking and exempting matches */
    std::optional<Category> category;
    MatchedBy matched_by = MatchedBy::NONE;
    /** False if no snapshot has been published yet */
    bool ready = true;
};

} // namespace shroud::dns
