// tests/transport_test.cpp
// Connection state machine: retry, pause, timed reconnect, failure handling.

#include <gtest/gtest.h>
#include "transport.hpp"
#include "test_support.hpp"

#include <string>
#include <vector>

using namespace tether;
using namespace tether::test;

namespace {

constexpr std::chrono::milliseconds kInterval(10000);

struct TransportFixture : ::testing::Test {
    std::shared_ptr<FakeNetwork> net = std::make_shared<FakeNetwork>();
    ManualClock clock;
    Connection connection{fake_socket_factory(net), clock.source(), kInterval, 128};
    int connect_hooks = 0;
    int disconnect_hooks = 0;

    void SetUp() override {
        connection.set_connect_hook([this] { connect_hooks++; });
        connection.set_disconnect_hook([this] { disconnect_hooks++; });
        connection.configure("device.example", 9000);
    }

    size_t send_text(const std::string& s) {
        return connection.send_bytes(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    std::string receive_text() {
        std::string out;
        connection.receive_bytes([&out](const uint8_t* d, size_t n) {
            out.append(reinterpret_cast<const char*>(d), n);
        });
        return out;
    }
};

} // namespace

// ==================== Lifecycle ====================

TEST_F(TransportFixture, StartsPausedAndDisconnected) {
    EXPECT_EQ(connection.state(), ConnectionState::DisconnectedPaused);
    connection.poll();
    EXPECT_EQ(net->connects, 0);
    EXPECT_EQ(send_text("x"), 0u);
}

TEST_F(TransportFixture, RetryConnectsImmediately) {
    connection.retry();
    EXPECT_EQ(connection.state(), ConnectionState::Connected);
    EXPECT_EQ(net->connects, 1);
    EXPECT_EQ(net->last_host, "device.example");
    EXPECT_EQ(net->last_port, 9000);
    EXPECT_EQ(connect_hooks, 1);
    EXPECT_EQ(connection.stats().connects, 1u);
}

TEST_F(TransportFixture, UnconfiguredNeverConnects) {
    Connection bare(fake_socket_factory(net), clock.source(), kInterval, 128);
    bare.retry();
    clock.advance(kInterval * 3);
    bare.poll();
    EXPECT_EQ(bare.state(), ConnectionState::DisconnectedActive);
    EXPECT_EQ(net->connects, 0);
}

TEST_F(TransportFixture, PauseSuppressesPolling) {
    connection.pause();
    for (int i = 0; i < 20; i++) {
        clock.advance(kInterval);
        connection.poll();
        send_text("data");
        receive_text();
    }
    EXPECT_EQ(connection.state(), ConnectionState::DisconnectedPaused);
    EXPECT_EQ(connection.stats().connect_attempts, 0u);

    connection.retry();
    EXPECT_EQ(connection.state(), ConnectionState::Connected);
}

TEST_F(TransportFixture, PauseWhileConnectedKeepsSocketUntilFailure) {
    connection.retry();
    connection.pause();
    EXPECT_TRUE(connection.connected());
    EXPECT_TRUE(connection.paused());

    net->peer_closed = true;
    receive_text();
    EXPECT_EQ(connection.state(), ConnectionState::DisconnectedPaused);

    clock.advance(kInterval * 2);
    connection.poll();
    EXPECT_EQ(net->connects, 1);
}

// ==================== Reconnect timer ====================

TEST_F(TransportFixture, FailedRetryAttemptsAgainOnNextPoll) {
    net->refuse_connect = true;
    connection.retry();
    EXPECT_EQ(connection.state(), ConnectionState::DisconnectedActive);
    EXPECT_EQ(connection.stats().connect_attempts, 1u);

    net->refuse_connect = false;
    clock.advance(std::chrono::milliseconds(1));
    connection.poll();
    EXPECT_EQ(connection.stats().connect_attempts, 2u);
    EXPECT_TRUE(connection.connected());
}

TEST_F(TransportFixture, FailedTimedAttemptWaitsFullInterval) {
    net->refuse_connect = true;
    connection.retry();
    clock.advance(std::chrono::milliseconds(1));
    connection.poll();
    EXPECT_EQ(connection.stats().connect_attempts, 2u);

    net->refuse_connect = false;
    // Exactly the interval is not enough.
    clock.advance(kInterval);
    connection.poll();
    EXPECT_EQ(connection.stats().connect_attempts, 2u);

    clock.advance(std::chrono::milliseconds(1));
    connection.poll();
    EXPECT_EQ(connection.stats().connect_attempts, 3u);
    EXPECT_TRUE(connection.connected());
}

TEST_F(TransportFixture, FailedReconnectAttemptsAgainOnNextPoll) {
    connection.retry();
    net->refuse_connect = true;
    connection.reconnect();
    EXPECT_EQ(connection.state(), ConnectionState::DisconnectedActive);

    net->refuse_connect = false;
    clock.advance(std::chrono::milliseconds(1));
    connection.poll();
    EXPECT_TRUE(connection.connected());
    EXPECT_EQ(net->connects, 2);
}

TEST_F(TransportFixture, FixedIntervalNoBackoff) {
    net->refuse_connect = true;
    connection.retry();
    for (int i = 0; i < 5; i++) {
        clock.advance(kInterval + std::chrono::milliseconds(1));
        connection.poll();
        connection.poll();
    }
    EXPECT_EQ(connection.stats().connect_attempts, 6u);
}

TEST_F(TransportFixture, ThreeSendFailuresThenOneAttemptAfterInterval) {
    connection.retry();
    ASSERT_TRUE(connection.connected());
    net->fail_send = true;

    EXPECT_EQ(send_text("one"), 0u);
    EXPECT_EQ(send_text("two"), 0u);
    EXPECT_EQ(send_text("three"), 0u);
    EXPECT_EQ(connection.state(), ConnectionState::DisconnectedActive);
    EXPECT_EQ(disconnect_hooks, 1);

    uint64_t attempts = connection.stats().connect_attempts;
    clock.advance(kInterval + std::chrono::milliseconds(1));
    connection.poll();
    connection.poll();
    EXPECT_EQ(connection.stats().connect_attempts, attempts + 1);
    EXPECT_TRUE(connection.connected());
}

TEST_F(TransportFixture, ReconnectForcesTeardownAndAttempt) {
    connection.retry();
    connection.reconnect();
    EXPECT_EQ(disconnect_hooks, 1);
    EXPECT_EQ(connect_hooks, 2);
    EXPECT_EQ(net->connects, 2);
    EXPECT_EQ(net->closes, 1);
    EXPECT_TRUE(connection.connected());
}

TEST_F(TransportFixture, ReconnectWhilePausedOnlyTearsDown) {
    connection.retry();
    connection.pause();
    connection.reconnect();
    EXPECT_EQ(connection.state(), ConnectionState::DisconnectedPaused);
    EXPECT_EQ(disconnect_hooks, 1);
    EXPECT_EQ(net->connects, 1);
}

// ==================== Send ====================

TEST_F(TransportFixture, SendWritesAllBytes) {
    connection.retry();
    net->send_limit = 3;
    EXPECT_EQ(send_text("abcdefgh"), 8u);
    EXPECT_EQ(std::string(net->outbound.begin(), net->outbound.end()), "abcdefgh");
    EXPECT_EQ(connection.stats().bytes_sent, 8u);
}

TEST_F(TransportFixture, SendWouldBlockIsFatal) {
    connection.retry();
    net->send_would_block = true;
    EXPECT_EQ(send_text("abc"), 0u);
    EXPECT_FALSE(connection.connected());
    EXPECT_EQ(disconnect_hooks, 1);
}

TEST_F(TransportFixture, SendPollsFirst) {
    net->refuse_connect = true;
    connection.retry();
    net->refuse_connect = false;
    clock.advance(kInterval + std::chrono::milliseconds(1));
    EXPECT_EQ(send_text("hi"), 2u);
    EXPECT_TRUE(connection.connected());
}

// ==================== Receive ====================

TEST_F(TransportFixture, ReceiveDrainsUntilWouldBlock) {
    connection.retry();
    net->recv_chunk = 5;
    net->push(std::string("hello world, again"));
    EXPECT_EQ(receive_text(), "hello world, again");
    EXPECT_TRUE(connection.connected());
    EXPECT_EQ(connection.stats().bytes_received, 18u);
}

TEST_F(TransportFixture, ReceiveNothingAvailable) {
    connection.retry();
    EXPECT_EQ(receive_text(), "");
    EXPECT_TRUE(connection.connected());
}

TEST_F(TransportFixture, PeerCloseDisconnects) {
    connection.retry();
    net->push(std::string("bye"));
    net->peer_closed = true;
    EXPECT_EQ(receive_text(), "bye");
    EXPECT_EQ(connection.state(), ConnectionState::DisconnectedActive);
    EXPECT_EQ(disconnect_hooks, 1);
    EXPECT_EQ(connection.stats().disconnects, 1u);
}

TEST_F(TransportFixture, ReceiveErrorDisconnects) {
    connection.retry();
    net->recv_error = true;
    EXPECT_EQ(receive_text(), "");
    EXPECT_FALSE(connection.connected());
    EXPECT_EQ(disconnect_hooks, 1);
}

TEST_F(TransportFixture, ConnectHookMaySend) {
    connection.set_connect_hook([this] { send_text("hello"); });
    connection.retry();
    EXPECT_EQ(std::string(net->outbound.begin(), net->outbound.end()), "hello");
}
