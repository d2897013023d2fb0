#include <gtest/gtest.h>
#include "tcp_peer_connection.h"
#include "socket.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace peerdrop;

namespace {

bool wait_until(const std::function<bool()>& predicate, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

// Collects everything a channel reports, from whichever thread reports it
struct ChannelEvents {
    std::mutex mutex;
    std::atomic<bool> opened{false};
    std::atomic<bool> closed{false};
    std::vector<std::string> texts;
    std::vector<std::vector<uint8_t>> binaries;

    void attach(const std::shared_ptr<ByteChannel>& channel) {
        channel->set_open_callback([this]() { opened = true; });
        channel->set_close_callback([this]() { closed = true; });
        channel->set_text_message_callback([this](const std::string& text) {
            std::lock_guard<std::mutex> lock(mutex);
            texts.push_back(text);
        });
        channel->set_binary_message_callback([this](const std::vector<uint8_t>& data) {
            std::lock_guard<std::mutex> lock(mutex);
            binaries.push_back(data);
        });
    }

    size_t binary_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return binaries.size();
    }

    size_t text_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return texts.size();
    }
};

} // namespace

class TcpPeerConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(init_socket_library());
    }

    void TearDown() override {
        cleanup_socket_library();
    }

    /**
     * Offer/answer between the two connections. The responder's candidates
     * are collected in candidates_ but not yet handed to the initiator.
     */
    void negotiate(TcpPeerConnection& initiator, TcpPeerConnection& responder) {
        auto channel = initiator.create_channel("t1");
        ASSERT_NE(channel, nullptr);
        initiator_events_.attach(channel);

        responder.set_local_candidate_callback([this](const std::string& candidate) {
            candidates_.push_back(candidate);
        });
        responder.set_channel_callback([this](std::shared_ptr<ByteChannel> remote) {
            responder_events_.attach(remote);
            std::lock_guard<std::mutex> lock(channel_mutex_);
            responder_channel_ = remote;
        });

        auto offer = initiator.create_offer();
        ASSERT_TRUE(offer.has_value());
        EXPECT_EQ((*offer)["type"], "offer");
        EXPECT_EQ((*offer)["label"], "t1");

        auto answer = responder.create_answer(*offer);
        ASSERT_TRUE(answer.has_value());
        EXPECT_EQ((*answer)["type"], "answer");
        ASSERT_FALSE(candidates_.empty());

        ASSERT_TRUE(initiator.set_remote_answer(*answer));
        initiator_channel_ = channel;
    }

    std::shared_ptr<ByteChannel> responder_channel() {
        std::lock_guard<std::mutex> lock(channel_mutex_);
        return responder_channel_;
    }

    // Must outlive the channels below
    ChannelEvents initiator_events_;
    ChannelEvents responder_events_;
    std::vector<std::string> candidates_;

    std::shared_ptr<ByteChannel> initiator_channel_;
    std::mutex channel_mutex_;
    std::shared_ptr<ByteChannel> responder_channel_;
};

TEST_F(TcpPeerConnectionTest, HostCandidateSdpFormat) {
    HostCandidate candidate;
    candidate.foundation = "42";
    candidate.priority = calculate_host_candidate_priority(65535);
    candidate.ip = "192.168.1.20";
    candidate.port = 50123;

    std::string sdp = candidate.to_sdp();
    EXPECT_EQ(sdp, "candidate:42 1 tcp " + std::to_string(candidate.priority) + " 192.168.1.20 50123 typ host");

    auto parsed = HostCandidate::from_sdp(sdp);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->foundation, "42");
    EXPECT_EQ(parsed->priority, candidate.priority);
    EXPECT_EQ(parsed->address(), "192.168.1.20:50123");
}

TEST_F(TcpPeerConnectionTest, HostCandidateRejectsOtherKinds) {
    EXPECT_FALSE(HostCandidate::from_sdp("candidate:1 1 udp 2130706431 10.0.0.1 5000 typ host").has_value());
    EXPECT_FALSE(HostCandidate::from_sdp("candidate:1 1 tcp 1694498815 10.0.0.1 5000 typ srflx").has_value());
    EXPECT_FALSE(HostCandidate::from_sdp("candidate:1 1 tcp 2130706431 not-an-ip 5000 typ host").has_value());
    EXPECT_FALSE(HostCandidate::from_sdp("candidate:1 1 tcp 2130706431 10.0.0.1 0 typ host").has_value());
    EXPECT_FALSE(HostCandidate::from_sdp("garbage").has_value());
    EXPECT_FALSE(HostCandidate::from_sdp("").has_value());

    // Transport is case-insensitive, as browsers emit "TCP"
    EXPECT_TRUE(HostCandidate::from_sdp("candidate:1 1 TCP 2130706431 10.0.0.1 5000 typ host").has_value());
}

TEST_F(TcpPeerConnectionTest, CandidatePriorityOrder) {
    uint32_t interface_priority = calculate_host_candidate_priority(65535);
    uint32_t loopback_priority = calculate_host_candidate_priority(1000);
    EXPECT_GT(interface_priority, loopback_priority);
    EXPECT_EQ(interface_priority >> 24, 126u);
    EXPECT_EQ(interface_priority & 0xFF, 255u);
}

TEST_F(TcpPeerConnectionTest, ChannelFramesAcrossSocket) {
    socket_t server = create_tcp_server_v4(0);
    ASSERT_TRUE(is_valid_socket(server));
    int port = get_ephemeral_port(server);

    socket_t client = create_tcp_client_v4("127.0.0.1", port, 2000);
    ASSERT_TRUE(is_valid_socket(client));
    socket_t accepted = accept_client(server);
    ASSERT_TRUE(is_valid_socket(accepted));

    std::string text = "{\"type\":\"file-end\"}";
    auto text_frame = encode_channel_frame(ChannelFrameKind::TEXT,
                                           reinterpret_cast<const uint8_t*>(text.data()), text.size());
    EXPECT_EQ(text_frame.size(), CHANNEL_FRAME_HEADER_SIZE + text.size());
    auto empty_frame = encode_channel_frame(ChannelFrameKind::BINARY, nullptr, 0);
    ASSERT_TRUE(send_all(client, text_frame.data(), text_frame.size()));
    ASSERT_TRUE(send_all(client, empty_frame.data(), empty_frame.size()));

    ChannelFrameKind kind;
    std::vector<uint8_t> payload;
    ASSERT_TRUE(receive_channel_frame(accepted, kind, payload));
    EXPECT_EQ(kind, ChannelFrameKind::TEXT);
    EXPECT_EQ(std::string(payload.begin(), payload.end()), text);

    ASSERT_TRUE(receive_channel_frame(accepted, kind, payload));
    EXPECT_EQ(kind, ChannelFrameKind::BINARY);
    EXPECT_TRUE(payload.empty());

    // Unknown kind
    std::vector<uint8_t> bad = {9, 0, 0, 0, 0};
    ASSERT_TRUE(send_all(client, bad.data(), bad.size()));
    EXPECT_FALSE(receive_channel_frame(accepted, kind, payload));

    close_socket(client);
    close_socket(accepted);
    close_socket(server);
}

TEST_F(TcpPeerConnectionTest, DescriptionsAreValidated) {
    TcpPeerConnection connection;
    EXPECT_FALSE(connection.create_offer().has_value());
    EXPECT_FALSE(connection.create_answer(nlohmann::json{{"type", "answer"}}).has_value());
    EXPECT_FALSE(connection.create_answer(nlohmann::json{{"type", "offer"}}).has_value());
    EXPECT_FALSE(connection.set_remote_answer(nlohmann::json{{"type", "answer"}, {"ufrag", "u"}, {"pwd", "p"}}));

    ASSERT_NE(connection.create_channel("t1"), nullptr);
    EXPECT_EQ(connection.create_channel("t2"), nullptr);
    ASSERT_TRUE(connection.create_offer().has_value());
    EXPECT_TRUE(connection.is_controlling());
    EXPECT_FALSE(connection.create_answer(nlohmann::json{{"type", "offer"}, {"ufrag", "u"}, {"pwd", "p"}}).has_value());
}

TEST_F(TcpPeerConnectionTest, DuplicateRemoteCandidateCountsOnce) {
    TcpPeerConnection connection;
    ASSERT_NE(connection.create_channel("t1"), nullptr);
    ASSERT_TRUE(connection.create_offer().has_value());

    const std::string candidate = "candidate:1 1 tcp 2130706431 127.0.0.1 9 typ host";
    EXPECT_TRUE(connection.add_remote_candidate(candidate));
    EXPECT_TRUE(connection.add_remote_candidate(candidate));
    EXPECT_FALSE(connection.add_remote_candidate("candidate:broken"));
    EXPECT_EQ(connection.remote_candidate_count(), 1u);
}

TEST_F(TcpPeerConnectionTest, ConnectsOverHostCandidates) {
    TcpPeerConnection initiator;
    TcpPeerConnection responder;
    negotiate(initiator, responder);

    EXPECT_GT(responder.get_listen_port(), 0);
    EXPECT_FALSE(responder.is_controlling());
    for (const auto& candidate : candidates_) {
        EXPECT_TRUE(HostCandidate::from_sdp(candidate).has_value()) << candidate;
        EXPECT_TRUE(initiator.add_remote_candidate(candidate));
    }

    ASSERT_TRUE(wait_until([&]() { return initiator_events_.opened.load() && responder_events_.opened.load(); }));
    ASSERT_NE(responder_channel(), nullptr);
    EXPECT_EQ(responder_channel()->label(), "t1");
    EXPECT_EQ(initiator_channel_->state(), ChannelState::OPEN);

    ASSERT_TRUE(initiator_channel_->send_text("{\"type\":\"file-meta\"}"));
    ASSERT_TRUE(initiator_channel_->send_binary(std::vector<uint8_t>(70000, 0x5A)));
    ASSERT_TRUE(wait_until([&]() { return responder_events_.binary_count() == 1; }));

    {
        std::lock_guard<std::mutex> lock(responder_events_.mutex);
        ASSERT_EQ(responder_events_.texts.size(), 1u);
        EXPECT_EQ(responder_events_.texts[0], "{\"type\":\"file-meta\"}");
        EXPECT_EQ(responder_events_.binaries[0].size(), 70000u);
    }
    EXPECT_TRUE(wait_until([&]() { return initiator_channel_->buffered_amount() == 0; }));

    // Frames flow the other way too
    ASSERT_TRUE(responder_channel()->send_text("ack"));
    ASSERT_TRUE(wait_until([&]() { return initiator_events_.text_count() == 1; }));

    initiator.close();
    EXPECT_TRUE(wait_until([&]() { return responder_events_.closed.load() && initiator_events_.closed.load(); }));
    EXPECT_FALSE(initiator_channel_->send_text("late"));
}

TEST_F(TcpPeerConnectionTest, GracefulCloseFlushesQueuedFrames) {
    TcpPeerConnection initiator;
    TcpPeerConnection responder;
    negotiate(initiator, responder);
    for (const auto& candidate : candidates_) {
        initiator.add_remote_candidate(candidate);
    }
    ASSERT_TRUE(wait_until([&]() { return initiator_events_.opened.load() && responder_events_.opened.load(); }));

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(initiator_channel_->send_binary(std::vector<uint8_t>(16384, static_cast<uint8_t>(i))));
    }
    initiator_channel_->close();

    ASSERT_TRUE(wait_until([&]() { return responder_events_.closed.load(); }));
    EXPECT_EQ(responder_events_.binary_count(), 3u);
    EXPECT_TRUE(wait_until([&]() { return initiator_channel_->state() == ChannelState::CLOSED; }));
}

TEST_F(TcpPeerConnectionTest, WrongCredentialsNeverOpen) {
    std::atomic<bool> remote_channel{false};
    std::vector<std::string> candidates;
    TcpPeerConnection initiator;
    TcpPeerConnection responder;

    auto channel = initiator.create_channel("t1");
    ASSERT_NE(channel, nullptr);
    responder.set_channel_callback([&remote_channel](std::shared_ptr<ByteChannel>) { remote_channel = true; });
    responder.set_local_candidate_callback([&candidates](const std::string& candidate) {
        candidates.push_back(candidate);
    });

    auto offer = initiator.create_offer();
    ASSERT_TRUE(offer.has_value());
    auto answer = responder.create_answer(*offer);
    ASSERT_TRUE(answer.has_value());

    (*answer)["pwd"] = "not-the-password";
    ASSERT_TRUE(initiator.set_remote_answer(*answer));
    for (const auto& candidate : candidates) {
        initiator.add_remote_candidate(candidate);
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    EXPECT_EQ(channel->state(), ChannelState::CONNECTING);
    EXPECT_FALSE(remote_channel.load());

    initiator.close();
    EXPECT_EQ(channel->state(), ChannelState::CLOSED);
}

TEST_F(TcpPeerConnectionTest, CloseBeforeConnectClosesChannel) {
    std::atomic<bool> closed{false};
    TcpPeerConnection connection;
    auto channel = connection.create_channel("t1");
    ASSERT_NE(channel, nullptr);
    channel->set_close_callback([&closed]() { closed = true; });

    connection.close();
    EXPECT_TRUE(closed.load());
    EXPECT_EQ(channel->state(), ChannelState::CLOSED);
    EXPECT_FALSE(channel->send_text("x"));
}
