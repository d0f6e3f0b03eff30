#include <gtest/gtest.h>

#include "shroud/upstream/dot_connection.h"

namespace shroud::dns::test {

using namespace std::chrono_literals;

class DotConnectionTest : public ::testing::Test {
protected:
    std::shared_ptr<DotConnectionFactory> factory;

    void SetUp() override {
        auto result = DotConnectionFactory::create();
        ASSERT_FALSE(result.has_error()) << result.error()->str();
        factory = std::move(result.value());
    }
};

TEST_F(DotConnectionTest, RejectsHostNameAddress) {
    auto conn = factory->connect(ServerConfig{.name = "named", .address = "dns.example.net"}, 1000ms);
    ASSERT_TRUE(conn.has_error());
    ASSERT_EQ(conn.error()->value(), DnsError::AE_SOCKET_ERROR);
}

TEST_F(DotConnectionTest, RejectsInvalidAddress) {
    for (const char *address : {"0.0.0.0", "::", "[::]"}) {
        auto conn = factory->connect(ServerConfig{.name = "invalid", .address = address, .port = 1}, 1000ms);
        ASSERT_TRUE(conn.has_error()) << address;
    }
}

TEST_F(DotConnectionTest, ConnectionRefused) {
    // Nothing listens on the loopback discard port
    auto conn = factory->connect(ServerConfig{.name = "loopback", .address = "127.0.0.1", .port = 9}, 1000ms);
    ASSERT_TRUE(conn.has_error());
    ASSERT_EQ(conn.error()->value(), DnsError::AE_SOCKET_ERROR);
}

TEST_F(DotConnectionTest, NoSessionsBeforeHandshake) {
    ASSERT_EQ(factory->session_cache().size("loopback"), 0);
    ASSERT_TRUE(factory->session_cache().get_session("loopback") == nullptr);
}

} // namespace shroud::dns::test
