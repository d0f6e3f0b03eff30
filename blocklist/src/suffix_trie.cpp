#include "shroud/blocklist/domain.h"
#include "shroud/blocklist/suffix_trie.h"

namespace shroud::dns {

SuffixTrie::SuffixTrie() {
    m_nodes.emplace_back();
}

bool SuffixTrie::insert(std::string_view domain, uint32_t value) {
    uint32_t idx = 0;
    for (std::string_view label : reversed_labels(domain)) {
        auto it = m_nodes[idx].children.find(label);
        if (it != m_nodes[idx].children.end()) {
            idx = it->second;
            continue;
        }
        auto next = (uint32_t) m_nodes.size();
        m_nodes[idx].children.emplace(std::string{label}, next);
        m_nodes.emplace_back();
        idx = next;
    }

    bool was_terminal = m_nodes[idx].value != NO_VALUE;
    m_nodes[idx].value = value;
    if (!was_terminal) {
        ++m_terminal_count;
    }
    return !was_terminal;
}

std::optional<SuffixTrie::Match> SuffixTrie::find_deepest(std::string_view domain) const {
    std::optional<Match> deepest;
    uint32_t idx = 0;
    size_t depth = 0;
    for (std::string_view label : reversed_labels(domain)) {
        const auto &children = m_nodes[idx].children;
        auto it = children.find(label);
        if (it == children.end()) {
            break;
        }
        idx = it->second;
        ++depth;
        if (m_nodes[idx].value != NO_VALUE) {
            deepest = Match{m_nodes[idx].value, depth};
        }
    }
    return deepest;
}

} // namespace shroud::dns
