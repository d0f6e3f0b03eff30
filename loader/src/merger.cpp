#include <algorithm>
#include <string_view>
#include <unordered_map>

#include "shroud/loader/merger.h"

namespace shroud::dns {

// Ordering of sources for a contested domain, the first one wins
static bool takes_precedence(const MergeInput &l, const MergeInput &r) {
    if (l.priority != r.priority) {
        return l.priority > r.priority;
    }
    if (l.updated_at != r.updated_at) {
        return l.updated_at > r.updated_at;
    }
    return l.source < r.source;
}

std::vector<BlocklistEntry> merge_sources(const std::vector<MergeInput> &inputs, size_t max_entries, size_t *dropped) {
    size_t total = 0;
    for (const MergeInput &input : inputs) {
        total += (input.entries != nullptr) ? input.entries->size() : 0;
    }

    // domain -> (input index, entry index)
    std::unordered_map<std::string_view, std::pair<size_t, size_t>> winners;
    winners.reserve(total);
    for (size_t i = 0; i < inputs.size(); ++i) {
        if (inputs[i].entries == nullptr) {
            continue;
        }
        const std::vector<BlocklistEntry> &entries = *inputs[i].entries;
        for (size_t j = 0; j < entries.size(); ++j) {
            auto [it, inserted] = winners.try_emplace(entries[j].domain, i, j);
            if (!inserted && takes_precedence(inputs[i], inputs[it->second.first])) {
                it->second = {i, j};
            }
        }
    }

    std::vector<BlocklistEntry> merged;
    merged.reserve(winners.size());
    for (const auto &[domain, idx] : winners) {
        merged.push_back((*inputs[idx.first].entries)[idx.second]);
    }

    if (dropped != nullptr) {
        *dropped = 0;
    }
    if (max_entries != 0 && merged.size() > max_entries) {
        std::sort(merged.begin(), merged.end(), [](const BlocklistEntry &l, const BlocklistEntry &r) {
            return (l.priority != r.priority) ? (l.priority > r.priority) : (l.domain < r.domain);
        });
        if (dropped != nullptr) {
            *dropped = merged.size() - max_entries;
        }
        merged.resize(max_entries);
    }

    return merged;
}

MergeDiff diff_entries(const std::vector<BlocklistEntry> &before, const std::vector<BlocklistEntry> &after) {
    std::unordered_map<std::string_view, const BlocklistEntry *> old_entries;
    old_entries.reserve(before.size());
    for (const BlocklistEntry &e : before) {
        old_entries.emplace(e.domain, &e);
    }

    MergeDiff diff;
    for (const BlocklistEntry &e : after) {
        auto it = old_entries.find(e.domain);
        if (it == old_entries.end()) {
            ++diff.added;
            continue;
        }
        if (!it->second->same_rule(e)) {
            ++diff.updated;
        }
        old_entries.erase(it);
    }
    diff.removed = old_entries.size();
    return diff;
}

} // namespace shroud::dns
