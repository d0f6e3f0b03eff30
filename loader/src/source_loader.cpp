#include <algorithm>
#include <thread>

#include "shroud/common/utils.h"
#include "shroud/loader/merger.h"
#include "shroud/loader/source_loader.h"
#include "shroud/loader/source_parser.h"

namespace shroud::dns {

SourceLoader::SourceLoader(LoaderSettings settings, MatchingEngine &engine, SourceFetcherPtr fetcher)
        : m_settings(std::move(settings))
        , m_engine(engine)
        , m_fetcher(fetcher ? std::move(fetcher) : std::make_shared<LocalSourceFetcher>()) {
    if (m_settings.fetch_attempts == 0) {
        m_settings.fetch_attempts = 1;
    }
}

Result<FetchedSource, LoaderError> SourceLoader::fetch(const SourceConfig &source) {
    Millis backoff = m_settings.fetch_backoff;
    for (uint32_t attempt = 1;; ++attempt) {
        auto result = m_fetcher->fetch(source);
        if (!result.has_error()) {
            return result;
        }
        if (result.error()->value() != LoaderError::AE_FETCH_FAILED || attempt >= m_settings.fetch_attempts) {
            return result;
        }
        dbglog(m_log, "{}: fetch attempt {} failed, retrying in {}", source.name, attempt, backoff);
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }
}

static std::vector<BlocklistEntry> make_entries(const SourceConfig &config, std::vector<ParsedRule> rules) {
    SystemClock::time_point now = SystemClock::now();
    std::vector<BlocklistEntry> entries;
    entries.reserve(rules.size());
    HashMap<std::string, size_t> index;
    index.reserve(rules.size());
    for (ParsedRule &rule : rules) {
        auto [it, inserted] = index.try_emplace(rule.domain, entries.size());
        if (!inserted) {
            // An exemption overrides a blocking rule of the same source
            BlocklistEntry &existing = entries[it->second];
            if (rule.action == Action::ALLOW && existing.action == Action::BLOCK) {
                existing.action = Action::ALLOW;
                existing.match_type = rule.match_type;
            }
            continue;
        }
        entries.push_back(BlocklistEntry{
                .domain = std::move(rule.domain),
                .match_type = rule.match_type,
                .action = rule.action,
                .category = config.category,
                .source = config.name,
                .priority = config.priority,
                .created_at = now,
        });
    }
    return entries;
}

// Returns true if the merged set may have changed
bool SourceLoader::reload_source(const SourceConfig &config, ReloadResult &result) {
    auto [it, created] = m_states.try_emplace(config.name);
    SourceState &state = it->second;
    bool priority_changed = !created && state.config.priority != config.priority;
    state.config = config;

    auto fetched = fetch(config);
    if (fetched.has_error()) {
        warnlog(m_log, "{}: {}", config.name, fetched.error()->str());
        result.error = fetched.error()->str();
        state.last_error = result.error;
        for (BlocklistEntry &e : state.entries) {
            e.priority = config.priority;
        }
        result.entry_count = state.entries.size();
        return priority_changed;
    }

    ParseResult parsed = parse_source(fetched->content, config.format);
    std::vector<BlocklistEntry> entries = make_entries(config, std::move(parsed.rules));
    MergeDiff diff = diff_entries(state.entries, entries);

    uint64_t content_hash = utils::fnv1a64(fetched->content);
    if (fetched->modified_at.has_value()) {
        state.updated_at = *fetched->modified_at;
    } else if (!state.loaded || content_hash != state.content_hash) {
        state.updated_at = SystemClock::now();
    }
    state.content_hash = content_hash;
    state.entries = std::move(entries);
    state.loaded = true;
    state.last_error.reset();

    result.added = diff.added;
    result.removed = diff.removed;
    result.updated = diff.updated;
    result.rejected = parsed.rejected;
    result.entry_count = state.entries.size();

    infolog(m_log, "{}: entries={} added={} removed={} updated={} rejected={}", config.name, result.entry_count,
            result.added, result.removed, result.updated, result.rejected);

    return priority_changed || diff.added != 0 || diff.removed != 0 || diff.updated != 0;
}

std::vector<ReloadResult> SourceLoader::reload(const std::vector<SourceConfig> &sources) {
    std::scoped_lock l(m_reload_mtx);
    utils::Timer timer;

    std::vector<ReloadResult> results;
    results.reserve(sources.size());
    HashSet<std::string> active;
    bool changed = false;

    for (const SourceConfig &config : sources) {
        ReloadResult &result = results.emplace_back(ReloadResult{.source_name = config.name});
        if (config.name.empty()) {
            result.error = make_error(LoaderError::AE_EMPTY_NAME)->str();
            continue;
        }
        if (!config.in_memory && config.origin.empty()) {
            result.error = make_error(LoaderError::AE_EMPTY_ORIGIN)->str();
            continue;
        }
        if (!config.enabled) {
            continue;
        }
        if (!active.insert(config.name).second) {
            result.error = make_error(LoaderError::AE_DUPLICATE_NAME)->str();
            continue;
        }
        changed |= reload_source(config, result);
    }

    for (auto it = m_states.begin(); it != m_states.end();) {
        if (active.contains(it->first)) {
            ++it;
            continue;
        }
        auto existing = std::find_if(results.begin(), results.end(), [&name = it->first](const ReloadResult &r) {
            return r.source_name == name;
        });
        ReloadResult &result = (existing != results.end()) ? *existing
                                                            : results.emplace_back(ReloadResult{.source_name = it->first});
        result.removed = it->second.entries.size();
        result.entry_count = 0;
        changed |= !it->second.entries.empty();
        infolog(m_log, "{}: dropped, entries={}", it->first, result.removed);
        it = m_states.erase(it);
    }

    if (changed || !m_engine.ready()) {
        publish();
    } else {
        dbglog(m_log, "Nothing changed, keeping the current snapshot");
    }
    update_statuses();

    infolog(m_log, "Reloaded {} sources in {}", sources.size(), timer.elapsed<Millis>());
    return results;
}

void SourceLoader::publish() {
    std::vector<MergeInput> inputs;
    inputs.reserve(m_states.size());
    for (const auto &[name, state] : m_states) {
        inputs.push_back(MergeInput{
                .source = name,
                .priority = state.config.priority,
                .updated_at = state.updated_at,
                .entries = &state.entries,
        });
    }

    size_t dropped = 0;
    std::vector<BlocklistEntry> merged = merge_sources(inputs, m_settings.max_entries, &dropped);
    if (dropped != 0) {
        warnlog(m_log, "Entry limit {} reached, {} entries dropped", m_settings.max_entries, dropped);
    }

    m_engine.publish(Snapshot::build(std::move(merged), m_settings.false_positive_rate));
}

void SourceLoader::update_statuses() {
    std::vector<SourceStatus> statuses;
    statuses.reserve(m_states.size());
    for (const auto &[name, state] : m_states) {
        statuses.push_back(SourceStatus{
                .name = name,
                .priority = state.config.priority,
                .category = state.config.category,
                .entry_count = state.entries.size(),
                .last_update = state.loaded ? std::make_optional(state.updated_at) : std::nullopt,
                .last_error = state.last_error,
        });
    }
    std::sort(statuses.begin(), statuses.end(), [](const SourceStatus &l, const SourceStatus &r) {
        return l.name < r.name;
    });

    std::scoped_lock l(m_statuses.mtx);
    m_statuses.val = std::move(statuses);
}

std::vector<SourceStatus> SourceLoader::statuses() const {
    std::scoped_lock l(m_statuses.mtx);
    return m_statuses.val;
}

} // namespace shroud::dns
