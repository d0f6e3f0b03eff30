#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "shroud/blocklist/bloom_filter.h"
#include "shroud/blocklist/matching_engine.h"
#include "shroud/common/defs.h"
#include "shroud/common/logger.h"
#include "shroud/loader/source.h"
#include "shroud/loader/source_fetcher.h"

namespace shroud::dns {

struct LoaderSettings {
    /** Number of fetch attempts for a source */
    uint32_t fetch_attempts = 3;
    /** Delay before the second attempt, doubled for every next one */
    Millis fetch_backoff{200};
    /** Maximum number of entries in a snapshot, 0 means unlimited */
    size_t max_entries = 0;
    /** Target false-positive rate of the snapshot Bloom filter */
    double false_positive_rate = BloomFilter::DEFAULT_FALSE_POSITIVE_RATE;
};

/**
 * Loads blocklist sources, merges them and publishes snapshots to the matching engine.
 * Reloads are serialized; they never block the engine readers.
 */
class SourceLoader {
public:
    /**
     * @param settings loader settings
     * @param engine engine receiving the snapshots
     * @param fetcher source fetcher, `LocalSourceFetcher` is used if null
     */
    SourceLoader(LoaderSettings settings, MatchingEngine &engine, SourceFetcherPtr fetcher = nullptr);

    /**
     * Reload the sources and publish a new snapshot if anything changed.
     * A source which fails to fetch keeps its previous entries.
     * Previously loaded sources that are disabled or absent from the list are dropped.
     * @return per-source results, in the order of `sources` followed by the dropped sources
     */
    std::vector<ReloadResult> reload(const std::vector<SourceConfig> &sources);

    /**
     * @return state of every loaded source as of the last completed reload
     */
    [[nodiscard]] std::vector<SourceStatus> statuses() const;

    SourceLoader(const SourceLoader &) = delete;
    SourceLoader &operator=(const SourceLoader &) = delete;
    SourceLoader(SourceLoader &&) = delete;
    SourceLoader &operator=(SourceLoader &&) = delete;

private:
    struct SourceState {
        SourceConfig config;
        std::vector<BlocklistEntry> entries;
        SystemClock::time_point updated_at{};
        uint64_t content_hash = 0;
        bool loaded = false;
        std::optional<std::string> last_error;
    };

    Logger m_log{"source_loader"};
    LoaderSettings m_settings;
    MatchingEngine &m_engine;
    SourceFetcherPtr m_fetcher;

    std::mutex m_reload_mtx;
    HashMap<std::string, SourceState> m_states;
    mutable WithMtx<std::vector<SourceStatus>> m_statuses;

    Result<FetchedSource, LoaderError> fetch(const SourceConfig &source);
    bool reload_source(const SourceConfig &config, ReloadResult &result);
    void publish();
    void update_statuses();
};

} // namespace shroud::dns
