#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace shroud::dns {

/**
 * Hash table from a normalized domain to the index of its entry
 */
class ExactMatchTable {
public:
    ExactMatchTable() = default;

    void reserve(size_t n) {
        m_table.reserve(n);
    }

    /**
     * @return false if the domain was already present (the value is replaced)
     */
    bool insert(std::string domain, uint32_t value);

    [[nodiscard]] std::optional<uint32_t> find(std::string_view domain) const;

    [[nodiscard]] size_t size() const {
        return m_table.size();
    }

private:
    struct StringHash {
        using is_transparent = void;
        size_t operator()(std::string_view s) const {
            return std::hash<std::string_view>{}(s);
        }
    };

    std::unordered_map<std::string, uint32_t, StringHash, std::equal_to<>> m_table;
};

} // namespace shroud::dns
