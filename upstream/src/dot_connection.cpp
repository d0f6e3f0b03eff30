#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include "shroud/common/utils.h"
#include "shroud/upstream/dot_connection.h"

namespace shroud::dns {

static constexpr size_t READ_CHUNK_SIZE = 4096;

static std::string ssl_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown TLS error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

static bool make_sockaddr(std::string_view address, uint16_t port, sockaddr_storage &addr, socklen_t &len) {
    std::memset(&addr, 0, sizeof(addr));
    if (address.size() > 2 && address.front() == '[' && address.back() == ']') {
        address = address.substr(1, address.size() - 2);
    }
    std::string host{address};
    auto *sin = (sockaddr_in *) &addr;
    if (inet_pton(AF_INET, host.c_str(), &sin->sin_addr) == 1) {
        sin->sin_family = AF_INET;
        sin->sin_port = htons(port);
        len = sizeof(sockaddr_in);
        return true;
    }
    auto *sin6 = (sockaddr_in6 *) &addr;
    if (inet_pton(AF_INET6, host.c_str(), &sin6->sin6_addr) == 1) {
        sin6->sin6_family = AF_INET6;
        sin6->sin6_port = htons(port);
        len = sizeof(sockaddr_in6);
        return true;
    }
    return false;
}

// Wait until the socket is ready for `events` or the deadline passes
static Error<DnsError> wait_socket(int fd, short events, SteadyClock::time_point deadline) {
    for (;;) {
        auto remaining = std::chrono::duration_cast<Millis>(deadline - SteadyClock::now());
        if (remaining.count() <= 0) {
            return make_error(DnsError::AE_TIMED_OUT);
        }
        pollfd pfd{.fd = fd, .events = events, .revents = 0};
        int r = poll(&pfd, 1, (int) remaining.count());
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            return make_error(DnsError::AE_SOCKET_ERROR, SHROUD_FMT("poll: {}", strerror(errno)));
        }
        if (r == 0) {
            return make_error(DnsError::AE_TIMED_OUT);
        }
        if ((pfd.revents & (events | POLLHUP | POLLERR)) != 0) {
            return {};
        }
    }
}

DotConnection::DotConnection(std::string server, int fd, SslPtr ssl)
        : m_server(std::move(server))
        , m_fd(fd)
        , m_ssl(std::move(ssl)) {
}

DotConnection::~DotConnection() {
    if (m_ssl != nullptr && !m_broken && SSL_is_init_finished(m_ssl.get())) {
        // Best effort close_notify, the socket is closed right after
        SSL_shutdown(m_ssl.get());
        BIO *wbio = SSL_get_wbio(m_ssl.get());
        uint8_t buf[READ_CHUNK_SIZE];
        int n = BIO_read(wbio, buf, sizeof(buf));
        if (n > 0) {
            ssize_t sent = send(m_fd, buf, n, MSG_NOSIGNAL | MSG_DONTWAIT);
            (void) sent;
        }
    }
    m_ssl.reset();
    if (m_fd >= 0) {
        close(m_fd);
    }
}

Error<DnsError> DotConnection::flush(SteadyClock::time_point deadline) {
    BIO *wbio = SSL_get_wbio(m_ssl.get());
    uint8_t buf[READ_CHUNK_SIZE];
    while (BIO_pending(wbio) > 0) {
        int n = BIO_read(wbio, buf, sizeof(buf));
        if (n <= 0) {
            return make_error(DnsError::AE_INTERNAL_ERROR, "failed to read from TLS buffer");
        }
        Uint8View data{buf, (size_t) n};
        while (!data.empty()) {
            ssize_t sent = send(m_fd, data.data(), data.size(), MSG_NOSIGNAL);
            if (sent < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    if (auto err = wait_socket(m_fd, POLLOUT, deadline)) {
                        return err;
                    }
                    continue;
                }
                if (errno == EINTR) {
                    continue;
                }
                return make_error(DnsError::AE_SOCKET_ERROR, SHROUD_FMT("send: {}", strerror(errno)));
            }
            data.remove_prefix(sent);
        }
    }
    return {};
}

Error<DnsError> DotConnection::fill(SteadyClock::time_point deadline) {
    uint8_t buf[READ_CHUNK_SIZE];
    for (;;) {
        ssize_t n = recv(m_fd, buf, sizeof(buf), 0);
        if (n > 0) {
            if (BIO_write(SSL_get_rbio(m_ssl.get()), buf, (int) n) != n) {
                return make_error(DnsError::AE_INTERNAL_ERROR, "failed to write to TLS buffer");
            }
            return {};
        }
        if (n == 0) {
            return make_error(DnsError::AE_CONNECTION_CLOSED);
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (auto err = wait_socket(m_fd, POLLIN, deadline)) {
                return err;
            }
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        return make_error(DnsError::AE_SOCKET_ERROR, SHROUD_FMT("recv: {}", strerror(errno)));
    }
}

Error<DnsError> DotConnection::handshake(SteadyClock::time_point deadline) {
    for (;;) {
        int r = SSL_do_handshake(m_ssl.get());
        int ssl_err = (r == 1) ? SSL_ERROR_NONE : SSL_get_error(m_ssl.get(), r);
        if (auto err = flush(deadline)) {
            m_broken = true;
            return err;
        }
        if (r == 1) {
            dbglog(m_log, "{}: handshake done, session reused: {}", m_server, (bool) SSL_session_reused(m_ssl.get()));
            return {};
        }
        if (ssl_err != SSL_ERROR_WANT_READ) {
            m_broken = true;
            long verify = SSL_get_verify_result(m_ssl.get());
            if (verify != X509_V_OK) {
                return make_error(DnsError::AE_HANDSHAKE_ERROR,
                        SHROUD_FMT("certificate verification failed: {}", X509_verify_cert_error_string(verify)));
            }
            return make_error(DnsError::AE_HANDSHAKE_ERROR, ssl_error_string());
        }
        if (auto err = fill(deadline)) {
            m_broken = true;
            return make_error(DnsError::AE_HANDSHAKE_ERROR, err);
        }
    }
}

Connection::ExchangeResult DotConnection::exchange(Uint8View request, Millis timeout) {
    if (m_broken) {
        return make_error(DnsError::AE_CONNECTION_CLOSED);
    }
    auto deadline = SteadyClock::now() + timeout;

    auto framed = TcpDnsBuffer::frame(request);
    if (!framed.has_value()) {
        return make_error(DnsError::AE_ENCODE_ERROR, "message is too long");
    }
    // Every exit except a complete reply leaves the stream in an unknown state
    utils::ScopeExit mark_broken([this] {
        m_broken = true;
    });

    int w = SSL_write(m_ssl.get(), framed->data(), (int) framed->size());
    if (w <= 0) {
        return make_error(DnsError::AE_SOCKET_ERROR, ssl_error_string());
    }
    if (auto err = flush(deadline)) {
        return err;
    }

    TcpDnsBuffer reply;
    uint8_t buf[READ_CHUNK_SIZE];
    for (;;) {
        int r = SSL_read(m_ssl.get(), buf, sizeof(buf));
        if (r > 0) {
            Uint8View rest = reply.store({buf, (size_t) r});
            if (auto packet = reply.extract_packet()) {
                if (rest.empty()) {
                    mark_broken.release();
                }
                return std::move(*packet);
            }
            continue;
        }
        switch (SSL_get_error(m_ssl.get(), r)) {
        case SSL_ERROR_WANT_READ:
            // Post-handshake messages may need an answer
            if (auto err = flush(deadline)) {
                return err;
            }
            if (auto err = fill(deadline)) {
                return err;
            }
            break;
        case SSL_ERROR_ZERO_RETURN:
            return make_error(DnsError::AE_CONNECTION_CLOSED);
        default:
            return make_error(DnsError::AE_SOCKET_ERROR, ssl_error_string());
        }
    }
}

bool DotConnection::is_open() {
    if (m_broken) {
        return false;
    }
    uint8_t buf[READ_CHUNK_SIZE];
    for (;;) {
        ssize_t n = recv(m_fd, buf, sizeof(buf), MSG_DONTWAIT);
        if (n == 0) {
            m_broken = true;
            return false;
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            m_broken = true;
            return false;
        }
        if (BIO_write(SSL_get_rbio(m_ssl.get()), buf, (int) n) != n) {
            m_broken = true;
            return false;
        }
    }
    if (BIO_pending(SSL_get_rbio(m_ssl.get())) == 0) {
        return true;
    }
    // Let TLS consume tickets and alerts, application data at this point is unexpected
    int r = SSL_read(m_ssl.get(), buf, sizeof(buf));
    if (r > 0 || SSL_get_error(m_ssl.get(), r) != SSL_ERROR_WANT_READ) {
        m_broken = true;
        return false;
    }
    return true;
}

DotConnectionFactory::DotConnectionFactory(SslCtxPtr ctx)
        : m_ctx(std::move(ctx)) {
}

Result<std::shared_ptr<DotConnectionFactory>, DnsError> DotConnectionFactory::create(const std::string &ca_file) {
    SslCtxPtr ctx{SSL_CTX_new(TLS_client_method())};
    if (ctx == nullptr) {
        return make_error(DnsError::AE_INTERNAL_ERROR, ssl_error_string());
    }
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
    if (SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION) != 1) {
        return make_error(DnsError::AE_INTERNAL_ERROR, ssl_error_string());
    }
    int loaded = ca_file.empty() ? SSL_CTX_set_default_verify_paths(ctx.get())
                                 : SSL_CTX_load_verify_locations(ctx.get(), ca_file.c_str(), nullptr);
    if (loaded != 1) {
        return make_error(DnsError::AE_INTERNAL_ERROR, SHROUD_FMT("failed to load trust store: {}", ssl_error_string()));
    }
    TlsSessionCache::prepare_ssl_ctx(ctx.get());
    return std::shared_ptr<DotConnectionFactory>(new DotConnectionFactory(std::move(ctx)));
}

ConnectionFactory::ConnectResult DotConnectionFactory::connect(const ServerConfig &server, Millis timeout) {
    auto deadline = SteadyClock::now() + timeout;

    sockaddr_storage addr{};
    socklen_t addr_len = 0;
    if (!make_sockaddr(server.address, server.port, addr, addr_len)) {
        return make_error(DnsError::AE_SOCKET_ERROR, "server address is not an IP address");
    }

    int fd = socket(addr.ss_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return make_error(DnsError::AE_SOCKET_ERROR, SHROUD_FMT("socket: {}", strerror(errno)));
    }
    utils::ScopeExit close_fd([fd] {
        close(fd);
    });

    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    if (::connect(fd, (sockaddr *) &addr, addr_len) != 0) {
        if (errno != EINPROGRESS) {
            return make_error(DnsError::AE_SOCKET_ERROR, SHROUD_FMT("connect: {}", strerror(errno)));
        }
        if (auto err = wait_socket(fd, POLLOUT, deadline)) {
            return err;
        }
        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0 || so_error != 0) {
            return make_error(DnsError::AE_SOCKET_ERROR, SHROUD_FMT("connect: {}", strerror(so_error ? so_error : errno)));
        }
    }

    SslPtr ssl{SSL_new(m_ctx.get())};
    if (ssl == nullptr) {
        return make_error(DnsError::AE_INTERNAL_ERROR, ssl_error_string());
    }
    const std::string &name = server.tls_server_name.empty() ? server.address : server.tls_server_name;
    if (utils::is_valid_ip4(name) || utils::is_valid_ip6(name)) {
        if (X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl.get()), name.c_str()) != 1) {
            return make_error(DnsError::AE_INTERNAL_ERROR, "failed to set expected address");
        }
    } else {
        SSL_set_tlsext_host_name(ssl.get(), name.c_str());
        if (SSL_set1_host(ssl.get(), name.c_str()) != 1) {
            return make_error(DnsError::AE_INTERNAL_ERROR, "failed to set expected host name");
        }
    }
    if (!m_session_cache.prepare_ssl(ssl.get(), server.name)) {
        return make_error(DnsError::AE_INTERNAL_ERROR, "failed to attach session cache");
    }
    if (SslSessionPtr session = m_session_cache.get_session(server.name)) {
        // Takes its own reference
        SSL_set_session(ssl.get(), session.get());
    }
    SSL_set_bio(ssl.get(), BIO_new(BIO_s_mem()), BIO_new(BIO_s_mem()));
    SSL_set_connect_state(ssl.get());

    close_fd.release();
    auto conn = std::make_unique<DotConnection>(server.name, fd, std::move(ssl));
    if (auto err = conn->handshake(deadline)) {
        dbglog(m_log, "{}: {}", server.name, err->str());
        return err;
    }
    return ConnectionPtr{std::move(conn)};
}

} // namespace shroud::dns
