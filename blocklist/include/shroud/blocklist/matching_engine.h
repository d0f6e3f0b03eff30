#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "shroud/blocklist/blocklist.h"
#include "shroud/blocklist/snapshot.h"
#include "shroud/common/logger.h"

namespace shroud::dns {

/**
 * Decides whether a domain is blocked against the currently published snapshot.
 * Readers never take a lock: the snapshot pointer is swapped atomically and
 * every check keeps its own reference for the duration of the call.
 */
class MatchingEngine {
public:
    MatchingEngine() = default;

    /**
     * Check a domain. Never fails: an invalid domain or a missing snapshot
     * produce a non-blocking result.
     * @param domain domain name in any case, with or without the trailing dot
     */
    [[nodiscard]] CheckResult check(std::string_view domain) const;

    /**
     * Check several domains against one snapshot
     */
    [[nodiscard]] std::vector<CheckResult> check_batch(const std::vector<std::string> &domains) const;

    /**
     * Replace the published snapshot. Readers in flight keep the previous one.
     */
    void publish(SnapshotPtr snapshot);

    /**
     * @return the published snapshot, nullptr before the first publication
     */
    [[nodiscard]] SnapshotPtr snapshot() const;

    [[nodiscard]] bool ready() const {
        return snapshot() != nullptr;
    }

    MatchingEngine(const MatchingEngine &) = delete;
    MatchingEngine &operator=(const MatchingEngine &) = delete;
    MatchingEngine(MatchingEngine &&) = delete;
    MatchingEngine &operator=(MatchingEngine &&) = delete;

private:
    Logger m_log{"matching_engine"};
    SnapshotPtr m_snapshot;

    static CheckResult check(const Snapshot *snapshot, std::string_view domain);
};

} // namespace shroud::dns
