#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace shroud::dns {

/**
 * Append-only probabilistic set. Never yields false negatives.
 * Removal is only possible by rebuilding the filter.
 */
class BloomFilter {
public:
    static constexpr double DEFAULT_FALSE_POSITIVE_RATE = 0.001;
    static constexpr size_t MIN_BIT_COUNT = 64;
    static constexpr size_t MIN_HASH_COUNT = 1;
    static constexpr size_t MAX_HASH_COUNT = 16;

    /**
     * Create a filter sized for the given number of items and the target false-positive rate.
     * Bits: m = -n * ln(p) / (ln 2)^2, hash functions: k = m / n * ln 2.
     * @param expected_items expected number of items (0 is treated as 1)
     * @param false_positive_rate target rate in (0, 1), out of range values fall back to the default
     */
    BloomFilter(size_t expected_items, double false_positive_rate);

    void add(std::string_view item);

    [[nodiscard]] bool possibly_contains(std::string_view item) const;

    [[nodiscard]] size_t bit_count() const {
        return m_bit_count;
    }

    [[nodiscard]] size_t hash_count() const {
        return m_hash_count;
    }

    [[nodiscard]] size_t item_count() const {
        return m_item_count;
    }

    [[nodiscard]] size_t memory_usage() const {
        return m_bits.size() * sizeof(uint64_t);
    }

    /**
     * False-positive rate expected for the current fill: (1 - e^(-k*n/m))^k
     */
    [[nodiscard]] double estimated_false_positive_rate() const;

private:
    std::vector<uint64_t> m_bits;
    size_t m_bit_count = 0;
    size_t m_hash_count = 0;
    size_t m_item_count = 0;

    struct HashPair {
        uint64_t h1;
        uint64_t h2;
    };
    static HashPair hash(std::string_view item);
};

} // namespace shroud::dns
