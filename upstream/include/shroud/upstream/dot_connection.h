#pragma once

#include <memory>
#include <string>

#include <openssl/ssl.h>

#include "shroud/common/clock.h"
#include "shroud/common/logger.h"
#include "shroud/upstream/connection.h"
#include "shroud/upstream/tcp_dns_buffer.h"
#include "shroud/upstream/tls_session_cache.h"

namespace shroud::dns {

using SslPtr = UniquePtr<SSL, &SSL_free>;
using SslCtxPtr = UniquePtr<SSL_CTX, &SSL_CTX_free>;

/**
 * DNS-over-TLS connection on a blocking-with-deadline socket.
 * TLS runs over memory BIOs, the socket is driven by the connection itself.
 */
class DotConnection : public Connection {
public:
    DotConnection(std::string server, int fd, SslPtr ssl);
    ~DotConnection() override;

    DotConnection(const DotConnection &) = delete;
    DotConnection &operator=(const DotConnection &) = delete;
    DotConnection(DotConnection &&) = delete;
    DotConnection &operator=(DotConnection &&) = delete;

    /**
     * Run the TLS handshake
     */
    Error<DnsError> handshake(SteadyClock::time_point deadline);

    ExchangeResult exchange(Uint8View request, Millis timeout) override;

    bool is_open() override;

private:
    Logger m_log{"dot_connection"};
    std::string m_server;
    int m_fd;
    SslPtr m_ssl;
    bool m_broken = false;

    // Send everything TLS produced
    Error<DnsError> flush(SteadyClock::time_point deadline);
    // Receive at least one chunk from the socket into TLS
    Error<DnsError> fill(SteadyClock::time_point deadline);
};

/**
 * Creates DNS-over-TLS connections.
 * Certificates are verified against the system trust store (or `ca_file`) and the server name.
 */
class DotConnectionFactory : public ConnectionFactory {
public:
    static constexpr uint16_t DEFAULT_PORT = 853;

    /**
     * @param ca_file PEM bundle to trust instead of the system store, empty to use the system store
     */
    static Result<std::shared_ptr<DotConnectionFactory>, DnsError> create(const std::string &ca_file = {});

    ConnectResult connect(const ServerConfig &server, Millis timeout) override;

    TlsSessionCache &session_cache() {
        return m_session_cache;
    }

private:
    Logger m_log{"dot_factory"};
    SslCtxPtr m_ctx;
    TlsSessionCache m_session_cache;

    explicit DotConnectionFactory(SslCtxPtr ctx);
};

} // namespace shroud::dns
