#pragma once

#include <string>
#include <vector>

#include "shroud/blocklist/blocklist.h"
#include "shroud/common/clock.h"

namespace shroud::dns {

/**
 * Entries of one source taking part in a merge
 */
struct MergeInput {
    std::string source;
    int32_t priority = 0;
    SystemClock::time_point updated_at{};
    const std::vector<BlocklistEntry> *entries = nullptr;
};

struct MergeDiff {
    size_t added = 0;
    size_t removed = 0;
    size_t updated = 0;
};

/**
 * Merge the entries of several sources into a set with unique domains.
 * For a domain claimed by several sources the entry of the source with the highest priority wins,
 * ties are broken by the most recently updated source, then by the source name.
 * @param max_entries maximum size of the result, 0 means unlimited;
 *                    entries of the lowest priority are dropped first
 * @param dropped receives the number of entries dropped because of the limit
 */
std::vector<BlocklistEntry> merge_sources(const std::vector<MergeInput> &inputs, size_t max_entries, size_t *dropped);

/**
 * Count the changes between two entry sets of one source (compared by domain)
 */
MergeDiff diff_entries(const std::vector<BlocklistEntry> &before, const std::vector<BlocklistEntry> &after);

} // namespace shroud::dns
