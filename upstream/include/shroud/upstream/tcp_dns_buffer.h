#pragma once

#include <optional>

#include "shroud/common/defs.h"

namespace shroud::dns {

/**
 * Reassembles DNS messages from a stream where each one is prefixed with its 2-byte length
 */
class TcpDnsBuffer {
public:
    static constexpr size_t LENGTH_PREFIX_SIZE = 2;

    /**
     * Prepend the length prefix to a message
     * @return nullopt if the message does not fit the prefix
     */
    static std::optional<Uint8Vector> frame(Uint8View packet);

    /**
     * Store data in the buffer
     * @return the part of the data that was not consumed, it belongs to the next message
     */
    Uint8View store(Uint8View data);

    /**
     * Take the completed message out of the buffer
     * @return nullopt if the message is not complete yet
     */
    std::optional<Uint8Vector> extract_packet();

private:
    Uint8Vector m_buffer;
    std::optional<size_t> m_total_length;
};

} // namespace shroud::dns
