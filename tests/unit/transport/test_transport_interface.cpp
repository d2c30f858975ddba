/**
 * @file test_transport_interface.cpp
 * @brief Unit tests for transport configuration and the TCP transport
 */

#include <gtest/gtest.h>

#include <kcenon/xdcc_client/transport/tcp_transport.h>

#include <atomic>
#include <chrono>
#include <vector>

namespace kcenon::xdcc_client::test {

// ============================================================================
// Transport Configuration Tests
// ============================================================================

class TransportConfigTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(TransportConfigTest, TcpConfigDefaults) {
    tcp_transport_config config;

    EXPECT_EQ(config.abort_check_interval, std::chrono::milliseconds{50});
}

TEST_F(TransportConfigTest, TcpConfigBuilder) {
    auto config = transport_config_builder::tcp()
        .with_abort_check_interval(std::chrono::milliseconds{200})
        .build_tcp();

    EXPECT_EQ(config.abort_check_interval, std::chrono::milliseconds{200});
}

TEST_F(TransportConfigTest, ConnectOptionsDefaults) {
    connect_options options;

    EXPECT_EQ(options.timeout, std::chrono::seconds{10});
    EXPECT_EQ(options.abort, nullptr);
}

TEST_F(TransportConfigTest, ReceiveOptionsDefaults) {
    receive_options options;

    EXPECT_EQ(options.max_size, 4096u);
    EXPECT_EQ(options.timeout, std::chrono::seconds{30});
}

TEST_F(TransportConfigTest, StatisticsDefaults) {
    transport_statistics stats;

    EXPECT_EQ(stats.bytes_sent, 0u);
    EXPECT_EQ(stats.bytes_received, 0u);
    EXPECT_EQ(stats.packets_sent, 0u);
    EXPECT_EQ(stats.packets_received, 0u);
    EXPECT_EQ(stats.errors, 0u);
}

// ============================================================================
// Transport State Tests
// ============================================================================

TEST(TransportStateTest, StateToString) {
    EXPECT_STREQ(to_string(transport_state::disconnected), "disconnected");
    EXPECT_STREQ(to_string(transport_state::connecting), "connecting");
    EXPECT_STREQ(to_string(transport_state::connected), "connected");
    EXPECT_STREQ(to_string(transport_state::disconnecting), "disconnecting");
    EXPECT_STREQ(to_string(transport_state::error), "error");
}

// ============================================================================
// TCP Transport Tests
// ============================================================================

class TcpTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = tcp_transport::create();
    }

    void TearDown() override {
        transport_.reset();
    }

    std::unique_ptr<tcp_transport> transport_;
};

TEST_F(TcpTransportTest, Creation) {
    ASSERT_NE(transport_, nullptr);
    EXPECT_EQ(transport_->type(), "tcp");
}

TEST_F(TcpTransportTest, InitialState) {
    EXPECT_EQ(transport_->state(), transport_state::disconnected);
    EXPECT_FALSE(transport_->is_connected());
}

TEST_F(TcpTransportTest, StatisticsInitialized) {
    auto stats = transport_->get_statistics();
    EXPECT_EQ(stats.bytes_sent, 0u);
    EXPECT_EQ(stats.bytes_received, 0u);
    EXPECT_EQ(stats.errors, 0u);
}

TEST_F(TcpTransportTest, SendWithoutConnection) {
    std::vector<std::byte> data(100);
    auto result = transport_->send(data);

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::not_initialized);
}

TEST_F(TcpTransportTest, ReceiveWithoutConnection) {
    auto result = transport_->receive();

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::not_initialized);
}

TEST_F(TcpTransportTest, DisconnectWhenAlreadyDisconnected) {
    auto result = transport_->disconnect();
    EXPECT_TRUE(result.has_value());
}

TEST_F(TcpTransportTest, CustomConfiguration) {
    auto config = transport_config_builder::tcp()
        .with_abort_check_interval(std::chrono::milliseconds{20})
        .build_tcp();

    auto custom = tcp_transport::create(config);
    ASSERT_NE(custom, nullptr);
    EXPECT_EQ(custom->config().abort_check_interval, std::chrono::milliseconds{20});
}

TEST_F(TcpTransportTest, ConnectWithAbortSetIsCancelled) {
    std::atomic<bool> stop{true};

    auto started = std::chrono::steady_clock::now();
    auto result = transport_->connect(endpoint{"127.0.0.1", 9},
                                      connect_options{std::chrono::seconds{10}, &stop});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::transfer_cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds{5});
    EXPECT_EQ(transport_->state(), transport_state::disconnected);
}

TEST_F(TcpTransportTest, MoveKeepsState) {
    tcp_transport moved(std::move(*transport_));

    EXPECT_EQ(moved.state(), transport_state::disconnected);
    EXPECT_EQ(moved.type(), "tcp");
}

}  // namespace kcenon::xdcc_client::test
