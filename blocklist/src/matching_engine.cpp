#include <atomic>

#include "shroud/blocklist/domain.h"
#include "shroud/blocklist/matching_engine.h"

namespace shroud::dns {

CheckResult MatchingEngine::check(const Snapshot *snapshot, std::string_view domain) {
    if (snapshot == nullptr) {
        return CheckResult{.ready = false};
    }
    auto normalized = normalize_domain(domain);
    if (normalized.has_error()) {
        return {};
    }
    return snapshot->check(normalized.value());
}

CheckResult MatchingEngine::check(std::string_view domain) const {
    SnapshotPtr snapshot = this->snapshot();
    return check(snapshot.get(), domain);
}

std::vector<CheckResult> MatchingEngine::check_batch(const std::vector<std::string> &domains) const {
    SnapshotPtr snapshot = this->snapshot();
    std::vector<CheckResult> results;
    results.reserve(domains.size());
    for (const std::string &domain : domains) {
        results.push_back(check(snapshot.get(), domain));
    }
    return results;
}

void MatchingEngine::publish(SnapshotPtr snapshot) {
    if (snapshot != nullptr) {
        infolog(m_log, "Publishing snapshot: entries={} bloom_bits={} hashes={} exact={} suffix={}", snapshot->size(),
                snapshot->bloom().bit_count(), snapshot->bloom().hash_count(), snapshot->exact().size(),
                snapshot->trie().size());
    }
    std::atomic_store(&m_snapshot, std::move(snapshot));
}

SnapshotPtr MatchingEngine::snapshot() const {
    return std::atomic_load(&m_snapshot);
}

} // namespace shroud::dns
