#include <algorithm>
#include <cstring>

#include <netinet/in.h>

#include "shroud/upstream/tcp_dns_buffer.h"

namespace shroud::dns {

static constexpr size_t BUFFER_MIN_CAPACITY = 512;

static size_t read_length(const uint8_t *data) {
    uint16_t net_length;
    std::memcpy(&net_length, data, TcpDnsBuffer::LENGTH_PREFIX_SIZE);
    return ntohs(net_length);
}

std::optional<Uint8Vector> TcpDnsBuffer::frame(Uint8View packet) {
    if (packet.size() > UINT16_MAX) {
        return std::nullopt;
    }
    Uint8Vector framed;
    framed.reserve(packet.size() + LENGTH_PREFIX_SIZE);
    uint16_t net_length = htons((uint16_t) packet.size());
    framed.resize(LENGTH_PREFIX_SIZE);
    std::memcpy(framed.data(), &net_length, LENGTH_PREFIX_SIZE);
    framed.insert(framed.end(), packet.begin(), packet.end());
    return framed;
}

Uint8View TcpDnsBuffer::store(Uint8View data) {
    if (!m_total_length.has_value()) {
        if (m_buffer.empty() && data.size() >= LENGTH_PREFIX_SIZE) {
            m_total_length = read_length(data.data());
            data.remove_prefix(LENGTH_PREFIX_SIZE);
        } else {
            // The prefix itself is split between reads
            size_t to_insert = std::min(data.size(), LENGTH_PREFIX_SIZE - m_buffer.size());
            m_buffer.insert(m_buffer.end(), data.begin(), data.begin() + to_insert);
            data.remove_prefix(to_insert);
            if (m_buffer.size() < LENGTH_PREFIX_SIZE) {
                return data;
            }
            m_total_length = read_length(m_buffer.data());
            m_buffer.clear();
        }
        m_buffer.reserve(std::max(*m_total_length, BUFFER_MIN_CAPACITY));
    }

    size_t to_insert = std::min(data.size(), *m_total_length - m_buffer.size());
    m_buffer.insert(m_buffer.end(), data.begin(), data.begin() + to_insert);
    data.remove_prefix(to_insert);
    return data;
}

std::optional<Uint8Vector> TcpDnsBuffer::extract_packet() {
    if (!m_total_length.has_value() || m_buffer.size() < *m_total_length) {
        return std::nullopt;
    }
    Uint8Vector packet = std::move(m_buffer);
    m_buffer.clear();
    m_total_length.reset();
    return packet;
}

} // namespace shroud::dns
