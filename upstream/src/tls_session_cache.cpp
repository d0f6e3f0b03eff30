#include "shroud/upstream/tls_session_cache.h"

namespace shroud::dns {

Logger TlsSessionCache::m_log{"tls_session_cache"};

int TlsSessionCache::ex_data_index() {
    static const int idx = SSL_get_ex_new_index(0, nullptr, nullptr, nullptr, nullptr);
    return idx;
}

void TlsSessionCache::prepare_ssl_ctx(SSL_CTX *ctx) {
    SSL_CTX_set_session_cache_mode(ctx, SSL_SESS_CACHE_CLIENT | SSL_SESS_CACHE_NO_INTERNAL_STORE);
    SSL_CTX_sess_set_new_cb(ctx, session_new_cb);
}

bool TlsSessionCache::prepare_ssl(SSL *ssl, const std::string &server) {
    int idx = ex_data_index();
    if (idx < 0) {
        return false;
    }
    Slot *slot;
    {
        std::scoped_lock l(m_mtx);
        auto &ptr = m_slots[server];
        if (ptr == nullptr) {
            ptr = std::make_unique<Slot>(Slot{.cache = this, .server = server});
        }
        slot = ptr.get();
    }
    return SSL_set_ex_data(ssl, idx, slot) == 1;
}

int TlsSessionCache::session_new_cb(SSL *ssl, SSL_SESSION *session) {
    if (ssl == nullptr || session == nullptr) {
        return 0;
    }
    auto *slot = (Slot *) SSL_get_ex_data(ssl, ex_data_index());
    if (slot == nullptr) {
        dbglog(m_log, "SSL object is not associated with a cache");
        return 0;
    }
    slot->cache->save_session(slot->server, session);
    // Take ownership of the session
    return 1;
}

void TlsSessionCache::save_session(const std::string &server, SSL_SESSION *session) {
    std::scoped_lock l(m_mtx);
    auto &sessions = m_sessions[server];
    if (sessions.size() == MAX_SIZE_PER_SERVER) {
        sessions.pop_front();
    }
    sessions.emplace_back(session);
    dbglog(m_log, "Session saved, {} sessions available for {}", sessions.size(), server);
}

SslSessionPtr TlsSessionCache::get_session(const std::string &server) {
    std::scoped_lock l(m_mtx);
    auto it = m_sessions.find(server);
    if (it == m_sessions.end() || it->second.empty()) {
        return nullptr;
    }
    SslSessionPtr session = std::move(it->second.back());
    it->second.pop_back();
    return session;
}

size_t TlsSessionCache::size(const std::string &server) const {
    std::scoped_lock l(m_mtx);
    auto it = m_sessions.find(server);
    return (it == m_sessions.end()) ? 0 : it->second.size();
}

} // namespace shroud::dns
