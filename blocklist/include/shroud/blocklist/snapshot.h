#pragma once

#include <array>
#include <memory>
#include <string_view>
#include <vector>

#include "shroud/blocklist/blocklist.h"
#include "shroud/blocklist/bloom_filter.h"
#include "shroud/blocklist/exact_match_table.h"
#include "shroud/blocklist/suffix_trie.h"
#include "shroud/common/clock.h"

namespace shroud::dns {

class Snapshot;
using SnapshotPtr = std::shared_ptr<const Snapshot>;

/**
 * Immutable set of matching structures built from a merged entry set.
 * Shared between readers, freed when the last reader drops it.
 */
class Snapshot {
public:
    /**
     * Build a snapshot. Entries must have normalized, unique domains.
     * @param entries merged entries
     * @param false_positive_rate target Bloom filter false-positive rate
     */
    static SnapshotPtr build(std::vector<BlocklistEntry> entries, double false_positive_rate);

    /**
     * Match a normalized domain
     */
    [[nodiscard]] CheckResult check(std::string_view domain) const;

    [[nodiscard]] const std::vector<BlocklistEntry> &entries() const {
        return m_entries;
    }

    [[nodiscard]] size_t size() const {
        return m_entries.size();
    }

    [[nodiscard]] SystemClock::time_point built_at() const {
        return m_built_at;
    }

    /** Number of blocking entries per category, indexed by `Category` */
    [[nodiscard]] const std::array<size_t, CATEGORY_COUNT> &category_counts() const {
        return m_category_counts;
    }

    [[nodiscard]] const BloomFilter &bloom() const {
        return m_bloom;
    }

    [[nodiscard]] const ExactMatchTable &exact() const {
        return m_exact;
    }

    [[nodiscard]] const SuffixTrie &trie() const {
        return m_trie;
    }

private:
    std::vector<BlocklistEntry> m_entries;
    BloomFilter m_bloom;
    ExactMatchTable m_exact;
    SuffixTrie m_trie;
    SystemClock::time_point m_built_at;
    std::array<size_t, CATEGORY_COUNT> m_category_counts{};

    Snapshot(std::vector<BlocklistEntry> entries, double false_positive_rate);

    [[nodiscard]] CheckResult make_result(uint32_t idx, MatchedBy matched_by) const;
};

} // namespace shroud::dns
