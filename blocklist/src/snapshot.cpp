#include "shroud/blocklist/domain.h"
#include "shroud/blocklist/snapshot.h"

namespace shroud::dns {

Snapshot::Snapshot(std::vector<BlocklistEntry> entries, double false_positive_rate)
        : m_entries(std::move(entries))
        , m_bloom(m_entries.size(), false_positive_rate)
        , m_built_at(SystemClock::now()) {
    m_exact.reserve(m_entries.size());
    for (uint32_t i = 0; i < m_entries.size(); ++i) {
        const BlocklistEntry &entry = m_entries[i];
        m_bloom.add(entry.domain);
        switch (entry.match_type) {
        case MatchType::EXACT:
            m_exact.insert(entry.domain, i);
            break;
        case MatchType::SUFFIX:
            m_trie.insert(entry.domain, i);
            break;
        }
        if (entry.action == Action::BLOCK) {
            ++m_category_counts[(size_t) entry.category];
        }
    }
}

SnapshotPtr Snapshot::build(std::vector<BlocklistEntry> entries, double false_positive_rate) {
    return SnapshotPtr{new Snapshot(std::move(entries), false_positive_rate)};
}

CheckResult Snapshot::make_result(uint32_t idx, MatchedBy matched_by) const {
    const BlocklistEntry &entry = m_entries[idx];
    return CheckResult{
            .blocked = entry.action == Action::BLOCK,
            .category = entry.category,
            .matched_by = matched_by,
            .ready = true,
    };
}

CheckResult Snapshot::check(std::string_view domain) const {
    std::vector<std::string_view> suffixes = domain_suffixes(domain);
    bool maybe_listed = false;
    for (std::string_view suffix : suffixes) {
        if (m_bloom.possibly_contains(suffix)) {
            maybe_listed = true;
            break;
        }
    }
    if (!maybe_listed) {
        return {};
    }

    if (auto idx = m_exact.find(domain); idx.has_value()) {
        return make_result(*idx, MatchedBy::EXACT);
    }

    if (auto match = m_trie.find_deepest(domain); match.has_value()) {
        return make_result(match->value, MatchedBy::TRIE);
    }

    // Bloom false positive
    return {};
}

} // namespace shroud::dns
