#include "shroud/blocklist/exact_match_table.h"

namespace shroud::dns {

bool ExactMatchTable::insert(std::string domain, uint32_t value) {
    auto [it, inserted] = m_table.try_emplace(std::move(domain), value);
    if (!inserted) {
        it->second = value;
    }
    return inserted;
}

std::optional<uint32_t> ExactMatchTable::find(std::string_view domain) const {
    auto it = m_table.find(domain);
    if (it == m_table.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace shroud::dns
