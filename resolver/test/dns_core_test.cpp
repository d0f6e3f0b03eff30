#include <chrono>
#include <cstdlib>
#include <future>
#include <map>
#include <mutex>
#include <thread>

#include <fmt/format.h>
#include <gtest/gtest.h>
#include <ldns/ldns.h>

#include "fake_transport.h"
#include "shroud/common/logger.h"
#include "shroud/common/utils.h"
#include "shroud/resolver/dns_core.h"
#include "shroud/resolver/dns_message.h"

namespace shroud::dns::test {

using namespace std::chrono_literals;

static const ServerConfig PRIMARY{.name = "primary", .address = "192.0.2.1", .protocol = Protocol::DOT, .priority = 10};
static const ServerConfig SECONDARY{.name = "secondary", .address = "192.0.2.2", .protocol = Protocol::DOT};

struct ReplyOptions {
    uint32_t ttl = 300;
    ldns_pkt_rcode rcode = LDNS_RCODE_NOERROR;
    bool with_answer = true;
    bool wrong_id = false;
    /** Answer an AAAA question instead of the asked one */
    bool wrong_question = false;
};

// Answer the query with one A record
static Connection::ExchangeResult make_reply(Uint8View request, ReplyOptions options = {}) {
    ldns_pkt *raw = nullptr;
    if (ldns_wire2pkt(&raw, request.data(), request.size()) != LDNS_STATUS_OK) {
        return make_error(DnsError::AE_DECODE_ERROR);
    }
    LdnsPktPtr query{raw};
    LdnsPktPtr reply{ldns_pkt_new()};
    ldns_pkt_set_id(reply.get(), ldns_pkt_id(query.get()) + (options.wrong_id ? 1 : 0));
    ldns_pkt_set_qr(reply.get(), true);
    ldns_pkt_set_rd(reply.get(), true);
    ldns_pkt_set_ra(reply.get(), true);
    ldns_pkt_set_rcode(reply.get(), options.rcode);
    ldns_rr *question = ldns_rr_list_rr(ldns_pkt_question(query.get()), 0);
    ldns_rr *echoed = ldns_rr_clone(question);
    if (options.wrong_question) {
        ldns_rr_set_type(echoed, LDNS_RR_TYPE_AAAA);
    }
    ldns_pkt_push_rr(reply.get(), LDNS_SECTION_QUESTION, echoed);
    if (options.with_answer) {
        char *owner = ldns_rdf2str(ldns_rr_owner(question));
        std::string record = fmt::format("{} {} IN A 192.0.2.10", owner, options.ttl);
        free(owner);
        ldns_rr *answer = nullptr;
        if (ldns_rr_new_frm_str(&answer, record.c_str(), 0, nullptr, nullptr) != LDNS_STATUS_OK) {
            return make_error(DnsError::AE_ENCODE_ERROR);
        }
        ldns_pkt_push_rr(reply.get(), LDNS_SECTION_ANSWER, answer);
    }
    uint8_t *wire = nullptr;
    size_t size = 0;
    if (ldns_pkt2wire(&wire, reply.get(), &size) != LDNS_STATUS_OK) {
        return make_error(DnsError::AE_ENCODE_ERROR);
    }
    LdnsBufferPtr buffer{wire};
    return Uint8Vector{wire, wire + size};
}

class DnsCoreTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeFactory> factory = std::make_shared<FakeFactory>();
    DnsCore core;

    CoreSettings make_settings() {
        CoreSettings settings = CoreSettings::get_default();
        settings.servers = {SECONDARY, PRIMARY};
        settings.sources = {
                SourceConfig{
                        .name = "ads",
                        .origin = "||ads.example^\n@@||ok.ads.example^\n",
                        .in_memory = true,
                        .format = SourceFormat::FILTER_LIST,
                        .category = Category::ADS,
                },
                SourceConfig{
                        .name = "malware",
                        .origin = "bad.example\n",
                        .in_memory = true,
                        .format = SourceFormat::PLAIN_DOMAINS,
                        .category = Category::MALWARE,
                },
        };
        settings.transports = {{Protocol::DOT, factory}};
        settings.log_level = LogLevel::LOG_LEVEL_DEBUG;
        return settings;
    }

    void SetUp() override {
        factory->responder = [](const ServerConfig &, Uint8View request) {
            return make_reply(request);
        };
    }

    void TearDown() override {
        core.deinit();
        set_logger_callback(nullptr);
        SteadyClock::reset_time_shift();
    }

    void init(CoreSettings settings) {
        auto err = core.init(std::move(settings));
        ASSERT_FALSE(err) << err->str();
    }
};

TEST_F(DnsCoreTest, RejectsInvalidSettings) {
    CoreSettings settings = make_settings();
    settings.servers.clear();
    auto err = core.init(settings);
    ASSERT_TRUE(err);
    ASSERT_EQ(err->value(), CoreInitError::AE_NO_SERVERS);

    settings = make_settings();
    settings.servers.push_back(ServerConfig{.name = "doh", .address = "192.0.2.3", .protocol = Protocol::DOH});
    err = core.init(settings);
    ASSERT_TRUE(err);
    ASSERT_EQ(err->value(), CoreInitError::AE_PROTOCOL_NOT_SUPPORTED);

    settings = make_settings();
    settings.servers.push_back(PRIMARY);
    err = core.init(settings);
    ASSERT_TRUE(err);
    ASSERT_EQ(err->value(), CoreInitError::AE_DUPLICATE_NAME);

    settings = make_settings();
    settings.transports.clear();
    settings.servers = {ServerConfig{.name = "named", .address = "dns.example.net"}};
    err = core.init(settings);
    ASSERT_TRUE(err);
    ASSERT_EQ(err->value(), CoreInitError::AE_INVALID_SERVER);

    settings = make_settings();
    settings.sources.push_back(SourceConfig{.name = "empty"});
    err = core.init(settings);
    ASSERT_TRUE(err);
    ASSERT_EQ(err->value(), CoreInitError::AE_INVALID_SOURCE);

    settings = make_settings();
    settings.sources.push_back(settings.sources.front());
    err = core.init(settings);
    ASSERT_TRUE(err);
    ASSERT_EQ(err->value(), CoreInitError::AE_DUPLICATE_NAME);

    ASSERT_FALSE(core.initialized());
    init(make_settings());
    err = core.init(make_settings());
    ASSERT_TRUE(err);
    ASSERT_EQ(err->value(), CoreInitError::AE_ALREADY_INITIALIZED);
}

TEST_F(DnsCoreTest, NotInitialized) {
    auto verdict = core.check("example.org");
    ASSERT_TRUE(verdict.has_error());
    ASSERT_EQ(verdict.error()->value(), CoreError::AE_NOT_INITIALIZED);

    ResolveResult result = core.resolve("example.org", "A");
    ASSERT_TRUE(result.error);
    ASSERT_EQ(result.error->value(), ResolveError::AE_NOT_INITIALIZED);

    auto rtt = core.test_server(PRIMARY, "example.org", Millis{100});
    ASSERT_TRUE(rtt.has_error());
    ASSERT_EQ(factory->connects.load(), 0);
}

TEST_F(DnsCoreTest, Check) {
    init(make_settings());

    auto verdict = core.check("tracker.ads.example", "AAAA");
    ASSERT_FALSE(verdict.has_error());
    ASSERT_TRUE(verdict->ready);
    ASSERT_TRUE(verdict->blocked);
    ASSERT_EQ(verdict->category, Category::ADS);
    ASSERT_EQ(verdict->matched_by, MatchedBy::TRIE);

    verdict = core.check("ok.ads.example");
    ASSERT_FALSE(verdict->blocked);

    verdict = core.check("BAD.example.");
    ASSERT_TRUE(verdict->blocked);
    ASSERT_EQ(verdict->matched_by, MatchedBy::EXACT);

    verdict = core.check("sub.bad.example");
    ASSERT_FALSE(verdict->blocked);

    verdict = core.check("example.org", "NOTATYPE");
    ASSERT_TRUE(verdict.has_error());
    ASSERT_EQ(verdict.error()->value(), CoreError::AE_INVALID_QTYPE);

    CoreStats stats = core.stats();
    ASSERT_EQ(stats.counters.lookups, 4);
    ASSERT_EQ(stats.counters.blocked, 2);
    ASSERT_EQ(stats.counters.blocked_in(Category::ADS), 1);
    ASSERT_EQ(stats.counters.blocked_in(Category::MALWARE), 1);
    ASSERT_EQ(stats.snapshot_entries, 3);
    ASSERT_EQ(stats.counters.source_entries.at("ads"), 2);
    ASSERT_EQ(stats.counters.source_entries.at("malware"), 1);
}

TEST_F(DnsCoreTest, CheckBatch) {
    CoreSettings settings = make_settings();
    settings.max_batch_size = 3;
    init(std::move(settings));

    auto verdicts = core.check_batch({"ads.example", "example.org", "bad.example"});
    ASSERT_FALSE(verdicts.has_error());
    ASSERT_EQ(verdicts->size(), 3);
    ASSERT_TRUE((*verdicts)[0].blocked);
    ASSERT_FALSE((*verdicts)[1].blocked);
    ASSERT_TRUE((*verdicts)[2].blocked);

    verdicts = core.check_batch({"a.example", "b.example", "c.example", "d.example"});
    ASSERT_TRUE(verdicts.has_error());
    ASSERT_EQ(verdicts.error()->value(), CoreError::AE_BATCH_TOO_LARGE);
}

TEST_F(DnsCoreTest, BlockedDomainIsNotResolved) {
    init(make_settings());
    ResolveResult result = core.resolve("www.ads.example", "A");
    ASSERT_FALSE(result.error);
    ASSERT_TRUE(result.blocked);
    ASSERT_EQ(result.category, Category::ADS);
    ASSERT_FALSE(result.response.has_value());
    ASSERT_EQ(factory->exchanges.load(), 0);
}

TEST_F(DnsCoreTest, ResolvesAndCaches) {
    init(make_settings());

    ResolveResult result = core.resolve("Example.ORG", "A");
    ASSERT_FALSE(result.error) << result.error->str();
    ASSERT_FALSE(result.blocked);
    ASSERT_FALSE(result.from_cache);
    ASSERT_TRUE(result.response.has_value());

    result = core.resolve("example.org.", LDNS_RR_TYPE_A);
    ASSERT_FALSE(result.error);
    ASSERT_TRUE(result.from_cache);
    ASSERT_EQ(factory->exchanges.load(), 1);

    // Another query type is another key
    result = core.resolve("example.org", "AAAA");
    ASSERT_FALSE(result.error);
    ASSERT_FALSE(result.from_cache);
    ASSERT_EQ(factory->exchanges.load(), 2);

    CoreStats stats = core.stats();
    ASSERT_EQ(stats.counters.cache_hits, 1);
    ASSERT_EQ(stats.counters.cache_misses, 2);
    ASSERT_EQ(stats.counters.resolutions_succeeded, 3);
    ASSERT_EQ(stats.cache.size, 2);

    core.clear_cache();
    ASSERT_EQ(core.stats().cache.size, 0);
    result = core.resolve("example.org", "A");
    ASSERT_FALSE(result.from_cache);
    ASSERT_EQ(factory->exchanges.load(), 3);
}

TEST_F(DnsCoreTest, PrefersHigherPriorityServer) {
    init(make_settings());
    std::vector<std::string> used;
    std::mutex mtx;
    factory->responder = [&](const ServerConfig &server, Uint8View request) {
        std::scoped_lock l(mtx);
        used.push_back(server.name);
        return make_reply(request);
    };
    ASSERT_FALSE(core.resolve("example.org", "A").error);
    ASSERT_EQ(used, std::vector<std::string>{"primary"});
}

TEST_F(DnsCoreTest, FailsOverToNextServer) {
    init(make_settings());
    factory->responder = [](const ServerConfig &server, Uint8View request) {
        if (server.name == "primary") {
            return make_reply(request, {.rcode = LDNS_RCODE_SERVFAIL, .with_answer = false});
        }
        return make_reply(request);
    };
    ResolveResult result = core.resolve("example.org", "A");
    ASSERT_FALSE(result.error) << result.error->str();
    ASSERT_EQ(factory->exchanges.load(), 2);

    CoreStats stats = core.stats();
    for (const ServerHealth &server : stats.servers) {
        if (server.name == "primary") {
            ASSERT_EQ(server.failures, 1);
            ASSERT_EQ(server.consecutive_failures, 1);
        } else {
            ASSERT_EQ(server.successes, 1);
            ASSERT_TRUE(server.latency.has_value());
        }
    }
}

TEST_F(DnsCoreTest, RejectsMismatchedReplyId) {
    init(make_settings());
    factory->responder = [](const ServerConfig &, Uint8View request) {
        return make_reply(request, {.wrong_id = true});
    };
    ResolveResult result = core.resolve("example.org", "A");
    ASSERT_TRUE(result.error);
    ASSERT_EQ(result.error->value(), ResolveError::AE_RESOLUTION_FAILED);
    ASSERT_FALSE(result.response.has_value());
    ASSERT_EQ(core.stats().counters.resolutions_failed, 1);
}

TEST_F(DnsCoreTest, RejectsReplyToAnotherQuestion) {
    init(make_settings());
    factory->responder = [](const ServerConfig &server, Uint8View request) {
        return make_reply(request, {.wrong_question = server.name == "primary"});
    };
    ResolveResult result = core.resolve("example.org", "A");
    ASSERT_FALSE(result.error) << result.error->str();
    ASSERT_EQ(factory->exchanges.load(), 2);

    for (const ServerHealth &server : core.stats().servers) {
        ASSERT_EQ(server.failures, server.name == "primary" ? 1 : 0) << server.name;
    }
}

TEST_F(DnsCoreTest, OpenCircuitsMakeServersUnavailable) {
    CoreSettings settings = make_settings();
    settings.pool.breaker.failure_threshold = 1;
    init(std::move(settings));
    factory->refuse = [](const ServerConfig &) {
        return true;
    };

    ResolveResult result = core.resolve("example.org", "A");
    ASSERT_TRUE(result.error);
    ASSERT_EQ(result.error->value(), ResolveError::AE_RESOLUTION_FAILED);

    // Never falls back to anything else
    result = core.resolve("example.org", "A");
    ASSERT_TRUE(result.error);
    ASSERT_EQ(result.error->value(), ResolveError::AE_ALL_SERVERS_UNAVAILABLE);
    ASSERT_EQ(factory->connects.load(), 2);

    CoreStats stats = core.stats();
    ASSERT_EQ(stats.counters.breaker_transitions[(size_t) BreakerState::OPEN], 2);
    for (const ServerHealth &server : stats.servers) {
        ASSERT_EQ(server.state, BreakerState::OPEN);
    }
}

TEST_F(DnsCoreTest, LimitsAttempts) {
    CoreSettings settings = make_settings();
    settings.resolve.max_attempts = 1;
    init(std::move(settings));
    factory->responder = [](const ServerConfig &, Uint8View request) {
        return make_reply(request, {.rcode = LDNS_RCODE_REFUSED, .with_answer = false});
    };
    ResolveResult result = core.resolve("example.org", "A");
    ASSERT_TRUE(result.error);
    ASSERT_EQ(result.error->value(), ResolveError::AE_RESOLUTION_FAILED);
    ASSERT_EQ(factory->exchanges.load(), 1);
}

TEST_F(DnsCoreTest, TimesOut) {
    init(make_settings());
    factory->responder = [](const ServerConfig &, Uint8View) -> Connection::ExchangeResult {
        std::this_thread::sleep_for(150ms);
        return make_error(DnsError::AE_TIMED_OUT);
    };
    ResolveResult result = core.resolve("example.org", "A", Millis{100});
    ASSERT_TRUE(result.error);
    ASSERT_EQ(result.error->value(), ResolveError::AE_TIMED_OUT);
    ASSERT_EQ(factory->exchanges.load(), 1);
    ASSERT_EQ(core.stats().counters.resolutions_timed_out, 1);
}

TEST_F(DnsCoreTest, FailsOverWhenServerHangs) {
    CoreSettings settings = make_settings();
    settings.resolve.per_server_timeout = Millis{200};
    init(std::move(settings));
    factory->hang = [](const ServerConfig &server) {
        return server.name == "primary";
    };

    utils::Timer timer;
    ResolveResult result = core.resolve("example.org", "A", Millis{1000});
    ASSERT_FALSE(result.error) << result.error->str();
    ASSERT_TRUE(result.response.has_value());
    ASSERT_LT(timer.elapsed<Millis>(), Millis{1000});
    ASSERT_EQ(factory->exchanges.load(), 2);

    for (const ServerHealth &server : core.stats().servers) {
        if (server.name == "primary") {
            ASSERT_EQ(server.failures, 1);
        } else {
            ASSERT_EQ(server.successes, 1);
        }
    }
}

TEST_F(DnsCoreTest, AllServersHanging) {
    CoreSettings settings = make_settings();
    settings.resolve.per_server_timeout = Millis{100};
    init(std::move(settings));
    factory->hang = [](const ServerConfig &) {
        return true;
    };
    ResolveResult result = core.resolve("example.org", "A", Millis{1000});
    ASSERT_TRUE(result.error);
    ASSERT_EQ(result.error->value(), ResolveError::AE_TIMED_OUT);
    ASSERT_EQ(factory->exchanges.load(), 2);
    ASSERT_EQ(core.stats().counters.resolutions_timed_out, 1);
}

TEST_F(DnsCoreTest, TestServerMeasuresRoundTrip) {
    init(make_settings());
    auto rtt = core.test_server(PRIMARY, "Example.ORG", Millis{1000});
    ASSERT_FALSE(rtt.has_error()) << rtt.error()->str();
    ASSERT_GE(rtt->count(), 0);
    ASSERT_EQ(factory->exchanges.load(), 1);

    // Servers outside the configuration can be tested too
    ServerConfig candidate{.name = "candidate", .address = "192.0.2.9", .protocol = Protocol::DOT};
    ASSERT_FALSE(core.test_server(candidate, "example.org", Millis{1000}).has_error());

    CoreStats stats = core.stats();
    ASSERT_EQ(stats.counters.resolutions_succeeded, 0);
    for (const ServerHealth &server : stats.servers) {
        ASSERT_EQ(server.successes, 0);
        ASSERT_EQ(server.idle_connections, 0);
    }
    ASSERT_EQ(factory->open_connections.load(), 0);
}

TEST_F(DnsCoreTest, TestServerFailuresLeaveBreakersAlone) {
    CoreSettings settings = make_settings();
    settings.pool.breaker.failure_threshold = 1;
    init(std::move(settings));
    factory->refuse = [](const ServerConfig &server) {
        return server.name == "primary";
    };

    auto rtt = core.test_server(PRIMARY, "example.org", Millis{1000});
    ASSERT_TRUE(rtt.has_error());
    ASSERT_EQ(rtt.error()->value(), DnsError::AE_SOCKET_ERROR);

    factory->refuse = nullptr;
    factory->responder = [](const ServerConfig &, Uint8View request) {
        return make_reply(request, {.wrong_question = true});
    };
    rtt = core.test_server(PRIMARY, "example.org", Millis{1000});
    ASSERT_TRUE(rtt.has_error());
    ASSERT_EQ(rtt.error()->value(), DnsError::AE_BAD_RESPONSE);

    rtt = core.test_server(PRIMARY, "bad..example", Millis{1000});
    ASSERT_TRUE(rtt.has_error());
    ASSERT_EQ(rtt.error()->value(), DnsError::AE_ENCODE_ERROR);

    for (const ServerHealth &server : core.stats().servers) {
        ASSERT_EQ(server.state, BreakerState::CLOSED) << server.name;
        ASSERT_EQ(server.failures, 0) << server.name;
    }
}

TEST_F(DnsCoreTest, ConcurrentCallersShareResolution) {
    init(make_settings());
    factory->responder = [](const ServerConfig &, Uint8View request) {
        std::this_thread::sleep_for(100ms);
        return make_reply(request);
    };
    std::vector<std::future<ResolveResult>> results;
    for (int i = 0; i < 20; ++i) {
        results.emplace_back(std::async(std::launch::async, [this] {
            return core.resolve("example.org", "A");
        }));
    }
    for (auto &f : results) {
        ResolveResult result = f.get();
        ASSERT_FALSE(result.error);
        ASSERT_TRUE(result.response.has_value());
    }
    ASSERT_EQ(factory->exchanges.load(), 1);
}

TEST_F(DnsCoreTest, InvalidInput) {
    init(make_settings());
    ResolveResult result = core.resolve("bad..example", "A");
    ASSERT_TRUE(result.error);
    ASSERT_EQ(result.error->value(), ResolveError::AE_INVALID_DOMAIN);

    result = core.resolve("example.org", "BOGUS");
    ASSERT_TRUE(result.error);
    ASSERT_EQ(result.error->value(), ResolveError::AE_INVALID_QTYPE);
    ASSERT_EQ(factory->exchanges.load(), 0);
}

TEST_F(DnsCoreTest, ReloadReplacesSources) {
    init(make_settings());
    ASSERT_TRUE(core.check("bad.example")->blocked);

    auto results = core.reload({SourceConfig{
            .name = "custom",
            .origin = "0.0.0.0 tracker.example\n",
            .in_memory = true,
            .format = SourceFormat::HOSTS,
            .category = Category::TRACKING,
    }});
    ASSERT_EQ(results.size(), 3);
    ASSERT_EQ(results[0].source_name, "custom");
    ASSERT_EQ(results[0].added, 1);

    ASSERT_FALSE(core.check("bad.example")->blocked);
    ASSERT_TRUE(core.check("cdn.tracker.example")->blocked);

    CoreStats stats = core.stats();
    ASSERT_EQ(stats.counters.source_entries, (std::map<std::string, size_t>{{"custom", 1}}));
    ASSERT_EQ(stats.sources.size(), 1);

    // Unchanged sources produce no churn
    results = core.reload();
    ASSERT_EQ(results.size(), 1);
    ASSERT_EQ(results[0].added, 0);
    ASSERT_EQ(results[0].removed, 0);
}

TEST_F(DnsCoreTest, DomainNamesAreNeverLogged) {
    std::mutex mtx;
    std::vector<std::string> messages;
    set_logger_callback([&](LogLevel, std::string_view message) {
        std::scoped_lock l(mtx);
        messages.emplace_back(message);
    });
    CoreSettings settings = make_settings();
    settings.log_level = LogLevel::LOG_LEVEL_TRACE;
    settings.sources.push_back(SourceConfig{
            .name = "private",
            .origin = "secret-blocked.example\n",
            .in_memory = true,
    });
    init(std::move(settings));

    (void) core.check("secret-blocked.example");
    (void) core.resolve("secret-blocked.example", "A");
    (void) core.resolve("secret-allowed.example", "A");
    factory->responder = [](const ServerConfig &, Uint8View request) {
        return make_reply(request, {.rcode = LDNS_RCODE_SERVFAIL, .with_answer = false});
    };
    (void) core.resolve("secret-failing.example", "A");
    (void) core.test_server(PRIMARY, "secret-tested.example", Millis{1000});
    core.deinit();
    set_logger_callback(nullptr);

    ASSERT_FALSE(messages.empty());
    for (const std::string &message : messages) {
        ASSERT_EQ(message.find("secret-"), std::string::npos) << message;
    }
}

} // namespace shroud::dns::test
