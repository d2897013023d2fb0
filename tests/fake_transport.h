#pragma once

// In-memory stand-ins for the relay and the peer-connection transport.
// Everything runs on one EventLoop: sends are posted and delivered in order,
// so tests drive both endpoints with loop.run_until().

#include "event_loop.h"
#include "identity.h"
#include "peer_connection.h"
#include "signaling_client.h"
#include "signaling_message.h"
#include "transfer_endpoint.h"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerdrop {
namespace testing_support {

//=============================================================================
// Channel
//=============================================================================

class FakeByteChannel : public ByteChannel, public std::enable_shared_from_this<FakeByteChannel> {
public:
    FakeByteChannel(EventLoop& loop, const std::string& label)
        : loop_(loop), label_(label), state_(ChannelState::CONNECTING),
          buffered_(0), threshold_(0), text_frames_sent_(0), binary_frames_sent_(0) {}

    std::string label() const override { return label_; }
    ChannelState state() const override { return state_; }

    bool send_text(const std::string& text) override {
        if (state_ != ChannelState::OPEN) {
            return false;
        }
        text_frames_sent_++;
        buffered_ += text.size();
        auto self = shared_from_this();
        loop_.post([self, text]() {
            auto peer = self->peer_.lock();
            if (peer && peer->state_ == ChannelState::OPEN) {
                peer->notify_text_message(text);
            }
            self->drain(text.size());
        });
        return true;
    }

    bool send_binary(const std::vector<uint8_t>& data) override {
        if (state_ != ChannelState::OPEN) {
            return false;
        }
        binary_frames_sent_++;
        buffered_ += data.size();
        auto self = shared_from_this();
        loop_.post([self, data]() {
            auto peer = self->peer_.lock();
            if (peer && peer->state_ == ChannelState::OPEN) {
                peer->notify_binary_message(data);
            }
            self->drain(data.size());
        });
        return true;
    }

    size_t buffered_amount() const override { return buffered_; }
    void set_buffered_amount_low_threshold(size_t threshold) override { threshold_ = threshold; }

    void close() override {
        if (state_ == ChannelState::OPEN) {
            state_ = ChannelState::CLOSING;
            if (buffered_ == 0) {
                auto self = shared_from_this();
                loop_.post([self]() { self->finish_close(); });
            }
        } else if (state_ == ChannelState::CONNECTING) {
            state_ = ChannelState::CLOSED;
            notify_close();
        }
    }

    // Test controls
    void pair_with(const std::shared_ptr<FakeByteChannel>& peer) { peer_ = peer; }

    void open() {
        if (state_ == ChannelState::CONNECTING) {
            state_ = ChannelState::OPEN;
            notify_open();
        }
    }

    /// Hard close: queued frames are dropped and the peer sees the channel close.
    void abort() {
        if (state_ == ChannelState::CLOSED) {
            return;
        }
        buffered_ = 0;
        finish_close();
    }

    /// Deliver a text frame as if the paired peer had sent it
    void inject_text(const std::string& text) { notify_text_message(text); }
    void inject_binary(const std::vector<uint8_t>& data) { notify_binary_message(data); }

    size_t text_frames_sent() const { return text_frames_sent_; }
    size_t binary_frames_sent() const { return binary_frames_sent_; }

private:
    void drain(size_t size) {
        if (size > buffered_) {
            return;
        }
        bool was_above = buffered_ > threshold_;
        buffered_ -= size;
        if (was_above && buffered_ <= threshold_ && state_ == ChannelState::OPEN) {
            notify_buffered_amount_low();
        }
        if (state_ == ChannelState::CLOSING && buffered_ == 0) {
            finish_close();
        }
    }

    void finish_close() {
        if (state_ == ChannelState::CLOSED) {
            return;
        }
        state_ = ChannelState::CLOSED;
        notify_close();

        auto peer = peer_.lock();
        if (peer) {
            loop_.post([peer]() { peer->remote_closed(); });
        }
    }

    void remote_closed() {
        if (state_ == ChannelState::OPEN || state_ == ChannelState::CLOSING) {
            state_ = ChannelState::CLOSED;
            buffered_ = 0;
            notify_close();
        }
    }

    EventLoop& loop_;
    std::string label_;
    ChannelState state_;
    size_t buffered_;
    size_t threshold_;
    size_t text_frames_sent_;
    size_t binary_frames_sent_;
    std::weak_ptr<FakeByteChannel> peer_;
};

//=============================================================================
// Peer connection
//=============================================================================

class FakePeerConnection;

/**
 * Shared rendezvous for fake connections: offers are matched to answers by id.
 */
struct FakeNetwork {
    explicit FakeNetwork(EventLoop& event_loop) : loop(event_loop), never_open(false), next_offer_id(1) {}

    EventLoop& loop;
    bool never_open;                                    // Channels stay CONNECTING forever
    std::vector<std::string> answer_candidates;         // Emitted by every answering connection
    std::vector<std::shared_ptr<FakePeerConnection>> created;

    int next_offer_id;
    std::map<int, std::weak_ptr<FakePeerConnection>> offers;
};

class FakePeerConnection : public PeerConnection, public std::enable_shared_from_this<FakePeerConnection> {
public:
    explicit FakePeerConnection(FakeNetwork& network)
        : network_(network), offer_id_(0), remote_description_set_(false), closed_(false) {}

    std::shared_ptr<ByteChannel> create_channel(const std::string& label) override {
        if (channel_) {
            return nullptr;
        }
        channel_ = std::make_shared<FakeByteChannel>(network_.loop, label);
        return channel_;
    }

    std::optional<nlohmann::json> create_offer() override {
        if (!channel_) {
            return std::nullopt;
        }
        offer_id_ = network_.next_offer_id++;
        network_.offers[offer_id_] = shared_from_this();
        return nlohmann::json{{"type", "offer"}, {"fake_id", offer_id_}, {"label", channel_->label()}};
    }

    std::optional<nlohmann::json> create_answer(const nlohmann::json& offer) override {
        if (!offer.contains("fake_id") || !offer["fake_id"].is_number_integer()) {
            return std::nullopt;
        }
        auto it = network_.offers.find(offer["fake_id"].get<int>());
        if (it == network_.offers.end()) {
            return std::nullopt;
        }
        auto initiator = it->second.lock();
        if (!initiator || !initiator->channel_) {
            return std::nullopt;
        }

        offer_id_ = it->first;
        remote_ = initiator;
        initiator->remote_ = shared_from_this();
        remote_description_set_ = true;

        channel_ = std::make_shared<FakeByteChannel>(network_.loop, initiator->channel_->label());
        channel_->pair_with(initiator->channel_);
        initiator->channel_->pair_with(channel_);

        for (const auto& candidate : network_.answer_candidates) {
            notify_local_candidate(candidate);
        }
        return nlohmann::json{{"type", "answer"}, {"fake_id", offer_id_}};
    }

    bool set_remote_answer(const nlohmann::json& answer) override {
        if (!answer.contains("fake_id") || answer["fake_id"] != offer_id_) {
            return false;
        }
        remote_description_set_ = true;
        if (network_.never_open) {
            return true;
        }

        auto self = shared_from_this();
        network_.loop.post([self]() { self->connect(); });
        return true;
    }

    bool add_remote_candidate(const std::string& candidate) override {
        if (candidate.empty()) {
            return false;
        }
        applied_candidates_.push_back(candidate);
        return true;
    }

    void close() override {
        closed_ = true;
        if (channel_) {
            channel_->abort();
        }
    }

    const std::vector<std::string>& applied_candidates() const { return applied_candidates_; }
    bool is_closed() const { return closed_; }
    const std::shared_ptr<FakeByteChannel>& channel() const { return channel_; }

private:
    void connect() {
        auto remote = remote_.lock();
        if (closed_ || !remote || remote->closed_) {
            return;
        }
        remote->notify_channel(remote->channel_);
        remote->channel_->open();
        channel_->open();
    }

    FakeNetwork& network_;
    int offer_id_;
    bool remote_description_set_;
    bool closed_;
    std::shared_ptr<FakeByteChannel> channel_;
    std::weak_ptr<FakePeerConnection> remote_;
    std::vector<std::string> applied_candidates_;
};

class FakePeerConnectionFactory : public PeerConnectionFactory {
public:
    explicit FakePeerConnectionFactory(FakeNetwork& network) : network_(network) {}

    std::shared_ptr<PeerConnection> create() override {
        auto connection = std::make_shared<FakePeerConnection>(network_);
        network_.created.push_back(connection);
        return connection;
    }

private:
    FakeNetwork& network_;
};

//=============================================================================
// Signaling
//=============================================================================

class FakeRelay;

/**
 * One user's signaling connection. Records everything sent; directed
 * messages are routed through the relay with from/from_username added.
 */
class FakeSignaling : public SignalingTransport {
public:
    FakeSignaling(FakeRelay& relay, const Identity& identity)
        : relay_(relay), identity_(identity), fail_sends_(false) {}

    bool send(const nlohmann::json& message) override;

    std::vector<nlohmann::json> sent_of_type(const std::string& type) const {
        std::vector<nlohmann::json> result;
        for (const auto& message : sent_) {
            if (get_string_field(message, "type") == type) {
                result.push_back(message);
            }
        }
        return result;
    }

    const std::vector<nlohmann::json>& sent() const { return sent_; }
    const Identity& identity() const { return identity_; }
    void set_fail_sends(bool fail) { fail_sends_ = fail; }

private:
    FakeRelay& relay_;
    Identity identity_;
    bool fail_sends_;
    std::vector<nlohmann::json> sent_;
};

class FakeRelay {
public:
    explicit FakeRelay(EventLoop& loop) : loop_(loop) {}

    void attach(const std::string& user_id, TransferEndpoint* endpoint) { endpoints_[user_id] = endpoint; }
    void detach(const std::string& user_id) { endpoints_.erase(user_id); }

    /// Drop directed messages of this type instead of forwarding them
    void block_type(const std::string& type) { blocked_types_.insert(type); }

    void route(const Identity& from, const nlohmann::json& message) {
        std::string type = get_string_field(message, "type");
        if (blocked_types_.count(type) > 0) {
            return;
        }
        std::string target = get_string_field(message, "target");
        nlohmann::json forwarded = annotate_forwarded_message(message, from.user_id, from.username);
        loop_.post([this, target, forwarded]() {
            auto it = endpoints_.find(target);
            if (it != endpoints_.end()) {
                it->second->handle_signaling_message(forwarded);
            }
        });
    }

private:
    EventLoop& loop_;
    std::unordered_map<std::string, TransferEndpoint*> endpoints_;
    std::set<std::string> blocked_types_;
};

inline bool FakeSignaling::send(const nlohmann::json& message) {
    if (fail_sends_) {
        return false;
    }
    sent_.push_back(message);
    if (is_directed_message(get_message_type(message))) {
        relay_.route(identity_, message);
    }
    return true;
}

} // namespace testing_support
} // namespace peerdrop
