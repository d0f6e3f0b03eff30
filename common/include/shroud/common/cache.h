#pragma once

#include <cassert>
#include <list>
#include <unordered_map>

#include "shroud/common/defs.h"

namespace shroud {

/**
 * Generic cache with least-recently-used eviction policy.
 * Not thread-safe, the owner is responsible for synchronization.
 */
template <typename Key, typename Val, typename Hash = std::hash<Key>>
class LruCache {
public:
    using Node = std::pair<const Key, Val>;

private:
    /** Cache capacity */
    size_t m_max_size;

    /** MRU gravitate to the front, LRU gravitate to the back */
    mutable std::list<Node> m_key_values;

    /** The main map */
    using MapType = std::unordered_map<Key, typename std::list<Node>::iterator, Hash>;
    MapType m_mapped_values;

public:
    static constexpr size_t DEFAULT_CAPACITY = 128;

    /** A pointer-like object for accessing the cached value */
    struct Accessor {
        using ItType = typename MapType::iterator;
        ItType m_it{};
        bool m_valid = false;

        Accessor() = default;

        explicit Accessor(ItType it)
                : m_it{it}
                , m_valid{true} {
        }

        explicit operator bool() const {
            return m_valid;
        }

        Val &operator*() const {
            return m_it->second->second;
        }

        Val *operator->() const {
            return &m_it->second->second;
        }
    };

    /**
     * Initialize a new cache
     * @param max_size cache capacity, 0 means default
     */
    explicit LruCache(size_t max_size = DEFAULT_CAPACITY)
            : m_max_size{max_size ? max_size : DEFAULT_CAPACITY} {
    }

    /**
     * Insert a new key-value pair or update an existing one.
     * The new or updated entry will become most-recently-used.
     * @return false if an entry with this key already exists and was updated, or
     *         true if an entry with this key didn't exist.
     */
    bool insert(Key k, Val v) {
        return insert(std::move(k), std::move(v), nullptr);
    }

    /**
     * Same as `insert(k, v)`, but reports the number of evicted entries
     */
    bool insert(Key k, Val v, size_t *evicted) {
        auto i = m_mapped_values.find(k);
        if (i != m_mapped_values.end()) {
            m_key_values.splice(m_key_values.begin(), m_key_values, i->second);
            i->second = m_key_values.begin();
            i->second->second = std::move(v);
            return false;
        }
        assert(m_max_size);
        if (m_key_values.size() == m_max_size) {
            m_mapped_values.erase(m_key_values.back().first);
            m_key_values.pop_back();
            if (evicted != nullptr) {
                ++*evicted;
            }
        }
        m_key_values.push_front(std::make_pair(k, std::move(v)));
        m_mapped_values.emplace(std::move(k), m_key_values.begin());
        return true;
    }

    /**
     * Get the value associated with the given key.
     * The corresponding entry will become most-recently-used.
     * The returned accessor will only be valid until the next modification of the cache!
     * @return accessor to the found value, or an empty one if nothing was found
     */
    Accessor get(const Key &k) {
        auto i = m_mapped_values.find(k);
        if (i == m_mapped_values.end()) {
            return {};
        }
        m_key_values.splice(m_key_values.begin(), m_key_values, i->second);
        return Accessor(i);
    }

    /**
     * Peek at the least-recently-used entry without refreshing it
     * @return pointer to the entry, or nullptr if the cache is empty
     */
    const Node *oldest() const {
        return m_key_values.empty() ? nullptr : &m_key_values.back();
    }

    /**
     * Delete the value with the given key from the cache
     */
    void erase(const Key &k) {
        auto i = m_mapped_values.find(k);
        if (i != m_mapped_values.end()) {
            m_key_values.erase(i->second);
            m_mapped_values.erase(i);
        }
    }

    /**
     * Delete all the entries matching the predicate
     * @return number of deleted entries
     */
    template <typename Pred>
    size_t erase_if(Pred &&pred) {
        size_t erased = 0;
        for (auto it = m_key_values.begin(); it != m_key_values.end();) {
            if (pred(it->first, it->second)) {
                m_mapped_values.erase(it->first);
                it = m_key_values.erase(it);
                ++erased;
            } else {
                ++it;
            }
        }
        return erased;
    }

    /**
     * Clear the cache
     */
    void clear() {
        m_key_values.clear();
        m_mapped_values.clear();
    }

    /**
     * @return current cache size
     */
    [[nodiscard]] size_t size() const {
        return m_mapped_values.size();
    }

    /**
     * @return maximum cache size
     */
    [[nodiscard]] size_t max_size() const {
        return m_max_size;
    }
};

} // namespace shroud
