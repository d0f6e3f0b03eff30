#pragma once

#include <list>
#include <memory>
#include <mutex>
#include <string>

#include <openssl/ssl.h>

#include "shroud/common/defs.h"
#include "shroud/common/logger.h"

namespace shroud::dns {

using SslSessionPtr = UniquePtr<SSL_SESSION, &SSL_SESSION_free>;

/**
 * Client-side TLS session store, keyed by upstream server.
 * The SSL_CTX must be prepared with `prepare_ssl_ctx` and each SSL object with `prepare_ssl`.
 */
class TlsSessionCache {
public:
    static constexpr size_t MAX_SIZE_PER_SERVER = 5;

    TlsSessionCache() = default;
    ~TlsSessionCache() = default;

    TlsSessionCache(const TlsSessionCache &) = delete;
    TlsSessionCache &operator=(const TlsSessionCache &) = delete;
    TlsSessionCache(TlsSessionCache &&) = delete;
    TlsSessionCache &operator=(TlsSessionCache &&) = delete;

    /**
     * Enable client session caching on the context
     */
    static void prepare_ssl_ctx(SSL_CTX *ctx);

    /**
     * Associate the SSL object with a server so that new sessions land in its slot
     * @return false if the association failed
     */
    bool prepare_ssl(SSL *ssl, const std::string &server);

    /**
     * Take a session for resumption. A session is used only once.
     * @return nullptr if none is cached
     */
    SslSessionPtr get_session(const std::string &server);

    [[nodiscard]] size_t size(const std::string &server) const;

private:
    struct Slot {
        TlsSessionCache *cache;
        std::string server;
    };

    static Logger m_log;

    mutable std::mutex m_mtx;
    HashMap<std::string, std::list<SslSessionPtr>> m_sessions;
    // Slots outlive every SSL object which refers to them
    HashMap<std::string, std::unique_ptr<Slot>> m_slots;

    static int ex_data_index();
    static int session_new_cb(SSL *ssl, SSL_SESSION *session);
    void save_session(const std::string &server, SSL_SESSION *session);
};

} // namespace shroud::dns
