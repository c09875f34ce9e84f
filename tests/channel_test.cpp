// tests/channel_test.cpp
// JSON message channel over a scripted connection.

#include <gtest/gtest.h>
#include "channel.hpp"
#include "test_support.hpp"

#include <string>
#include <vector>

using namespace tether;
using namespace tether::test;

namespace {

struct ChannelFixture : ::testing::Test {
    std::shared_ptr<FakeNetwork> net = std::make_shared<FakeNetwork>();
    ManualClock clock;
    Connection connection{fake_socket_factory(net), clock.source(),
                          std::chrono::milliseconds(1000), 64};
    MessageChannel channel{connection, LengthWidth::Two, 0};

    void SetUp() override {
        connection.set_disconnect_hook([this] { channel.reset(); });
        connection.configure("server.example", 7000);
        connection.retry();
        ASSERT_TRUE(connection.connected());
    }

    std::vector<nlohmann::json> receive_all(int* keepalives = nullptr) {
        std::vector<nlohmann::json> out;
        channel.receive_messages(
            [&out](nlohmann::json& m) { out.push_back(m); },
            [keepalives] { if (keepalives) (*keepalives)++; });
        return out;
    }
};

} // namespace

TEST_F(ChannelFixture, SendMessageFramesJson) {
    EXPECT_TRUE(channel.send_message({{"cmd", "hello"}, {"n", 1}}));
    auto sent = net->sent_messages();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["cmd"], "hello");
    EXPECT_EQ(sent[0]["n"], 1);
}

TEST_F(ChannelFixture, SendNullIsEmptyFrame) {
    EXPECT_TRUE(channel.send_null());
    EXPECT_EQ(net->outbound, (std::vector<uint8_t>{0, 0}));
}

TEST_F(ChannelFixture, OversizeMessageNotSent) {
    nlohmann::json big = {{"blob", std::string(70000, 'a')}};
    EXPECT_FALSE(channel.send_message(big));
    EXPECT_TRUE(net->outbound.empty());
    EXPECT_TRUE(connection.connected());
}

TEST_F(ChannelFixture, SendFailureReturnsFalse) {
    net->fail_send = true;
    EXPECT_FALSE(channel.send_message({{"cmd", "x"}}));
    EXPECT_FALSE(connection.connected());
}

TEST_F(ChannelFixture, MessagesDeliveredInOrder) {
    net->push_message({{"seq", 1}});
    net->push_message({{"seq", 2}});
    net->push_message({{"seq", 3}});
    auto got = receive_all();
    ASSERT_EQ(got.size(), 3u);
    EXPECT_EQ(got[0]["seq"], 1);
    EXPECT_EQ(got[1]["seq"], 2);
    EXPECT_EQ(got[2]["seq"], 3);
}

TEST_F(ChannelFixture, MessageSpanningManyReads) {
    net->recv_chunk = 3;
    net->push_message({{"text", std::string(200, 'q')}});
    auto got = receive_all();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0]["text"].get<std::string>().size(), 200u);
}

TEST_F(ChannelFixture, MessageSpanningReceiveCalls) {
    std::string payload = nlohmann::json({{"k", "v"}}).dump();
    net->push_frame(payload);
    std::vector<uint8_t> tail(net->inbound.begin() + 4, net->inbound.end());
    net->inbound.resize(4);

    EXPECT_TRUE(receive_all().empty());
    net->push(tail);
    auto got = receive_all();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0]["k"], "v");
}

TEST_F(ChannelFixture, KeepaliveGoesToKeepaliveHandler) {
    net->push_frame("");
    net->push_message({{"a", 1}});
    int keepalives = 0;
    auto got = receive_all(&keepalives);
    EXPECT_EQ(keepalives, 1);
    EXPECT_EQ(got.size(), 1u);
}

TEST_F(ChannelFixture, InvalidJsonThrowsAfterEarlierMessages) {
    net->push_message({{"first", true}});
    net->push_frame("{not json");
    std::vector<nlohmann::json> got;
    try {
        channel.receive_messages([&got](nlohmann::json& m) { got.push_back(m); });
        FAIL() << "expected malformed message";
    } catch (const TetherError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedMessage);
    }
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0]["first"], true);
}

TEST_F(ChannelFixture, NonObjectJsonIsMalformed) {
    net->push_frame("[1,2,3]");
    try {
        receive_all();
        FAIL() << "expected malformed message";
    } catch (const TetherError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedMessage);
    }
}

TEST_F(ChannelFixture, MessagesBeforeEofAreDelivered) {
    net->push_message({{"last", "words"}});
    net->peer_closed = true;
    auto got = receive_all();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0]["last"], "words");
    EXPECT_FALSE(connection.connected());
}

TEST_F(ChannelFixture, PartialFrameDiscardedOnDisconnect) {
    net->push(std::vector<uint8_t>{0x00, 0x10, '{'});
    net->peer_closed = true;
    EXPECT_TRUE(receive_all().empty());
    EXPECT_FALSE(connection.connected());

    clock.advance(std::chrono::milliseconds(1001));
    net->push_message({{"fresh", 1}});
    auto got = receive_all();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0]["fresh"], 1);
}

TEST(ChannelLimitTest, OversizeIncomingFrameIsProtocolError) {
    auto net = std::make_shared<FakeNetwork>();
    ManualClock clock;
    Connection connection(fake_socket_factory(net), clock.source(),
                          std::chrono::milliseconds(1000), 256);
    MessageChannel channel(connection, LengthWidth::Two, 100);
    connection.configure("h", 1);
    connection.retry();

    net->push_frame(std::string(500, ' '));
    try {
        channel.receive_messages([](nlohmann::json&) {});
        FAIL() << "expected protocol error";
    } catch (const TetherError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Protocol);
    }
}

TEST(ChannelWidthTest, OneByteWidthRoundTrip) {
    auto net = std::make_shared<FakeNetwork>();
    ManualClock clock;
    Connection connection(fake_socket_factory(net), clock.source(),
                          std::chrono::milliseconds(1000), 64);
    MessageChannel channel(connection, LengthWidth::One, 0);
    connection.configure("h", 1);
    connection.retry();

    EXPECT_TRUE(channel.send_message({{"cmd", "short"}}));
    EXPECT_FALSE(channel.send_message({{"blob", std::string(300, 'x')}}));
    auto sent = net->sent_messages(LengthWidth::One);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["cmd"], "short");

    net->push_message({{"reply", 2}}, LengthWidth::One);
    std::vector<nlohmann::json> got;
    channel.receive_messages([&got](nlohmann::json& m) { got.push_back(m); });
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0]["reply"], 2);
}
