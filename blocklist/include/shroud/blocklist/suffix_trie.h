#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace shroud::dns {

/**
 * Trie over reversed domain labels ("a.b.com" is stored as com -> b -> a).
 * A node marked terminal carries the value of the rule inserted for that domain.
 */
class SuffixTrie {
public:
    struct Match {
        uint32_t value;
        /** Number of labels of the matched suffix */
        size_t depth;
    };

    SuffixTrie();

    /**
     * Mark a normalized domain as terminal
     * @return false if the domain was already terminal (the value is replaced)
     */
    bool insert(std::string_view domain, uint32_t value);

    /**
     * Find the deepest terminal node on the path of a normalized domain.
     * The domain itself counts as its own suffix.
     */
    [[nodiscard]] std::optional<Match> find_deepest(std::string_view domain) const;

    /** Number of terminal nodes */
    [[nodiscard]] size_t size() const {
        return m_terminal_count;
    }

    [[nodiscard]] size_t node_count() const {
        return m_nodes.size();
    }

private:
    static constexpr uint32_t NO_VALUE = UINT32_MAX;

    struct StringHash {
        using is_transparent = void;
        size_t operator()(std::string_view s) const {
            return std::hash<std::string_view>{}(s);
        }
    };

    struct Node {
        std::unordered_map<std::string, uint32_t, StringHash, std::equal_to<>> children;
        uint32_t value = NO_VALUE;
    };

    /** Node 0 is the root */
    std::vector<Node> m_nodes;
    size_t m_terminal_count = 0;
};

} // namespace shroud::dns
