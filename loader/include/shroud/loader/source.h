#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "shroud/blocklist/blocklist.h"
#include "shroud/common/clock.h"
#include "shroud/common/error.h"

namespace shroud::dns {

enum class SourceFormat {
    HOSTS,         /**< `0.0.0.0 domain [domain...]` */
    FILTER_LIST,   /**< `||domain^`, `|domain^`, `@@||domain^` */
    PLAIN_DOMAINS, /**< one domain per line, `*.domain` for a domain with subdomains */
};

/**
 * Blocklist source description
 */
struct SourceConfig {
    /** Unique source name */
    std::string name;
    /**
     * Where the rules come from:
     *     /path/to/file, file:///path/to/file -- local file
     *     https://example.org/list.txt -- remote list, needs a fetcher supporting it
     * If `in_memory` is set, this is the rules text itself.
     */
    std::string origin;
    bool in_memory = false;
    SourceFormat format = SourceFormat::PLAIN_DOMAINS;
    /** Category assigned to all the rules of the source */
    Category category = Category::CUSTOM;
    /** Higher priority wins when several sources list the same domain */
    int32_t priority = 0;
    bool enabled = true;
};

/**
 * Outcome of reloading one source
 */
struct ReloadResult {
    std::string source_name;
    size_t added = 0;
    size_t removed = 0;
    /** Entries whose match type, action or category changed */
    size_t updated = 0;
    /** Lines or domains dropped as invalid */
    size_t rejected = 0;
    /** Number of entries the source contributes after the reload */
    size_t entry_count = 0;
    /** Fetch error, the previous entries of the source are kept */
    std::optional<std::string> error;
};

/**
 * Current state of a loaded source
 */
struct SourceStatus {
    std::string name;
    int32_t priority = 0;
    Category category = Category::CUSTOM;
    size_t entry_count = 0;
    /** Modification time of the content currently in use */
    std::optional<SystemClock::time_point> last_update;
    std::optional<std::string> last_error;
};

enum class LoaderError {
    AE_EMPTY_NAME,
    AE_EMPTY_ORIGIN,
    AE_DUPLICATE_NAME,
    AE_UNSUPPORTED_ORIGIN,
    AE_FETCH_FAILED,
};

} // namespace shroud::dns

template <>
struct shroud::ErrorCodeToString<shroud::dns::LoaderError> {
    std::string operator()(shroud::dns::LoaderError e) {
        switch (e) {
        case decltype(e)::AE_EMPTY_NAME: return "Source name is empty";
        case decltype(e)::AE_EMPTY_ORIGIN: return "Source origin is empty";
        case decltype(e)::AE_DUPLICATE_NAME: return "Source name is not unique";
        case decltype(e)::AE_UNSUPPORTED_ORIGIN: return "Source origin is not supported";
        case decltype(e)::AE_FETCH_FAILED: return "Failed to fetch source";
        }
        return "Unknown error";
    }
};
