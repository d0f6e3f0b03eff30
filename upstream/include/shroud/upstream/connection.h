#pragma once

#include <memory>

#include "shroud/common/defs.h"
#include "shroud/common/error.h"
#include "shroud/dns/dns_defs.h"
#include "shroud/upstream/server.h"

namespace shroud::dns {

class Connection;
class ConnectionFactory;

using ConnectionPtr = std::unique_ptr<Connection>;
using ConnectionFactoryPtr = std::shared_ptr<ConnectionFactory>;

/**
 * Established encrypted connection to an upstream server.
 * One exchange at a time, the pool hands a connection to a single caller.
 */
class Connection {
public:
    using ExchangeResult = Result<Uint8Vector, DnsError>;

    virtual ~Connection() = default;

    /**
     * Send a wire-format query and wait for the reply
     * @param request wire-format DNS message
     * @param timeout how long to wait for the whole exchange
     */
    virtual ExchangeResult exchange(Uint8View request, Millis timeout) = 0;

    /**
     * Check that an idle connection is still usable, pending control records (e.g. session tickets) are consumed
     * @return false if the peer closed the connection or it is otherwise not reusable
     */
    virtual bool is_open() = 0;
};

/**
 * Creates connections of one protocol
 */
class ConnectionFactory {
public:
    using ConnectResult = Result<ConnectionPtr, DnsError>;

    virtual ~ConnectionFactory() = default;

    /**
     * Establish a connection, including the handshake
     */
    virtual ConnectResult connect(const ServerConfig &server, Millis timeout) = 0;
};

} // namespace shroud::dns
