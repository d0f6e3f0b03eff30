#include <magic_enum.hpp>

#include "shroud/common/utils.h"
#include "shroud/resolver/core_settings.h"

namespace shroud::dns {

static const CoreSettings DEFAULT_CORE_SETTINGS = {
        .servers = {},
        .sources = {},
        .cache = {.capacity = 10000, .min_ttl = Secs{0}, .max_ttl = Secs{3600}, .shard_count = 8},
        .cache_sweep_interval = Millis{60000},
        .pool =
                {
                        .max_connections_per_server = 10,
                        .idle_timeout = Millis{30000},
                        .breaker = {.failure_threshold = 5, .cooldown = Millis{30000}, .backoff_multiplier = 2.0,
                                .max_cooldown = Millis{300000}},
                },
        .resolve = {.timeout = Millis{5000}, .max_attempts = 3, .per_server_timeout = Millis{2000},
                .negative_ttl = Secs{60}},
        .loader = {.fetch_attempts = 3, .fetch_backoff = Millis{200}, .max_entries = 0, .false_positive_rate = 0.001},
        .source_refresh_interval = Millis{0},
        .max_batch_size = 100,
        .transports = {},
        .ca_file = {},
        .fetcher = nullptr,
        .log_level = LogLevel::LOG_LEVEL_INFO,
};

const CoreSettings &CoreSettings::get_default() {
    return DEFAULT_CORE_SETTINGS;
}

static bool is_ip_literal(std::string_view address) {
    if (address.size() > 2 && address.front() == '[' && address.back() == ']') {
        address = address.substr(1, address.size() - 2);
    }
    return utils::is_valid_ip4(address) || utils::is_valid_ip6(address);
}

static Error<CoreInitError> validate_servers(const CoreSettings &settings) {
    if (settings.servers.empty()) {
        return make_error(CoreInitError::AE_NO_SERVERS);
    }
    HashSet<std::string> names;
    for (const ServerConfig &server : settings.servers) {
        if (server.name.empty() || server.address.empty() || server.port == 0) {
            return make_error(CoreInitError::AE_INVALID_SERVER, "name, address and port are required");
        }
        if (!names.insert(server.name).second) {
            return make_error(CoreInitError::AE_DUPLICATE_NAME, SHROUD_FMT("server {}", server.name));
        }
        auto transport = settings.transports.find(server.protocol);
        bool has_transport = transport != settings.transports.end() && transport->second != nullptr;
        if (!has_transport && server.protocol != Protocol::DOT) {
            return make_error(CoreInitError::AE_PROTOCOL_NOT_SUPPORTED,
                    SHROUD_FMT("{}: {}", server.name, magic_enum::enum_name(server.protocol)));
        }
        // The built-in transport connects to addresses only, resolving a host name would leak it in plaintext
        if (!has_transport && !is_ip_literal(server.address)) {
            return make_error(CoreInitError::AE_INVALID_SERVER, SHROUD_FMT("{}: address must be an IP address", server.name));
        }
    }
    return {};
}

static Error<CoreInitError> validate_sources(const CoreSettings &settings) {
    HashSet<std::string> names;
    for (const SourceConfig &source : settings.sources) {
        if (source.name.empty()) {
            return make_error(CoreInitError::AE_INVALID_SOURCE, "source name is empty");
        }
        if (source.origin.empty()) {
            return make_error(CoreInitError::AE_INVALID_SOURCE, SHROUD_FMT("{}: origin is empty", source.name));
        }
        if (!names.insert(source.name).second) {
            return make_error(CoreInitError::AE_DUPLICATE_NAME, SHROUD_FMT("source {}", source.name));
        }
    }
    return {};
}

Error<CoreInitError> validate_settings(const CoreSettings &settings) {
    if (auto err = validate_servers(settings)) {
        return err;
    }
    if (auto err = validate_sources(settings)) {
        return err;
    }
    if (settings.cache.capacity == 0 || settings.cache.shard_count == 0) {
        return make_error(CoreInitError::AE_INVALID_SETTINGS, "cache capacity and shard count must be positive");
    }
    if (settings.cache.max_ttl < settings.cache.min_ttl) {
        return make_error(CoreInitError::AE_INVALID_SETTINGS, "maximum TTL is less than minimum TTL");
    }
    if (settings.resolve.timeout.count() <= 0 || settings.resolve.per_server_timeout.count() <= 0
            || settings.resolve.max_attempts == 0) {
        return make_error(CoreInitError::AE_INVALID_SETTINGS, "resolve timeouts and attempts must be positive");
    }
    if (settings.pool.max_connections_per_server == 0 || settings.pool.breaker.failure_threshold == 0) {
        return make_error(CoreInitError::AE_INVALID_SETTINGS, "pool size and failure threshold must be positive");
    }
    if (settings.max_batch_size == 0) {
        return make_error(CoreInitError::AE_INVALID_SETTINGS, "batch size must be positive");
    }
    double fp = settings.loader.false_positive_rate;
    if (!(fp > 0 && fp < 1)) {
        return make_error(CoreInitError::AE_INVALID_SETTINGS, "false-positive rate must be in (0, 1)");
    }
    return {};
}

} // namespace shroud::dns
