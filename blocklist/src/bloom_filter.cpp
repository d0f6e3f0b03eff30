#include <algorithm>
#include <cmath>

#include "shroud/blocklist/bloom_filter.h"
#include "shroud/common/utils.h"

namespace shroud::dns {

static uint64_t fmix64(uint64_t k) {
    k ^= k >> 33;
    k *= 0xff51afd7ed558ccdULL;
    k ^= k >> 33;
    k *= 0xc4ceb9fe1a85ec53ULL;
    k ^= k >> 33;
    return k;
}

BloomFilter::BloomFilter(size_t expected_items, double false_positive_rate) {
    double n = (double) std::max<size_t>(expected_items, 1);
    double p = (false_positive_rate > 0.0 && false_positive_rate < 1.0) ? false_positive_rate
                                                                         : DEFAULT_FALSE_POSITIVE_RATE;
    double ln2 = std::log(2.0);

    double m = std::ceil(-n * std::log(p) / (ln2 * ln2));
    m_bit_count = std::max<size_t>((size_t) m, MIN_BIT_COUNT);
    // round up to whole words
    m_bit_count = (m_bit_count + 63) / 64 * 64;

    auto k = (size_t) std::llround((double) m_bit_count / n * ln2);
    m_hash_count = std::clamp<size_t>(k, MIN_HASH_COUNT, MAX_HASH_COUNT);

    m_bits.assign(m_bit_count / 64, 0);
}

BloomFilter::HashPair BloomFilter::hash(std::string_view item) {
    uint64_t h1 = fmix64(utils::fnv1a64(item));
    // second hash must be odd so that the probe sequence covers the whole array
    uint64_t h2 = fmix64(h1 ^ 0x9e3779b97f4a7c15ULL) | 1;
    return {h1, h2};
}

void BloomFilter::add(std::string_view item) {
    auto [h1, h2] = hash(item);
    for (size_t i = 0; i < m_hash_count; ++i) {
        uint64_t bit = (h1 + i * h2) % m_bit_count;
        m_bits[bit / 64] |= (uint64_t(1) << (bit % 64));
    }
    ++m_item_count;
}

bool BloomFilter::possibly_contains(std::string_view item) const {
    auto [h1, h2] = hash(item);
    for (size_t i = 0; i < m_hash_count; ++i) {
        uint64_t bit = (h1 + i * h2) % m_bit_count;
        if (0 == (m_bits[bit / 64] & (uint64_t(1) << (bit % 64)))) {
            return false;
        }
    }
    return true;
}

double BloomFilter::estimated_false_positive_rate() const {
    if (m_item_count == 0) {
        return 0.0;
    }
    double exponent = -(double) m_hash_count * (double) m_item_count / (double) m_bit_count;
    return std::pow(1.0 - std::exp(exponent), (double) m_hash_count);
}

} // namespace shroud::dns
