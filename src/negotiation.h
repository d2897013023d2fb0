#pragma once

/**
 * @file negotiation.h
 * @brief Offer/answer/candidate exchange that yields one ByteChannel per transfer
 *
 * Each transfer id owns a negotiation context: its PeerConnection, its
 * channel, the candidates seen so far and a timeout timer. All context state
 * lives on the event loop thread; transport callbacks are posted there.
 */

#include "event_loop.h"
#include "peer_connection.h"
#include "signaling_client.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerdrop {

enum class NegotiationRole {
    INITIATOR,
    RESPONDER
};

/**
 * Channel events of negotiated transfers, delivered on the event loop thread.
 * After on_channel_closed or on_negotiation_failed the context is gone.
 */
class NegotiationListener {
public:
    virtual ~NegotiationListener() = default;

    virtual void on_channel_open(const std::string& transfer_id, const std::shared_ptr<ByteChannel>& channel) = 0;
    virtual void on_channel_text(const std::string& transfer_id, const std::string& text) = 0;
    virtual void on_channel_binary(const std::string& transfer_id, const std::vector<uint8_t>& data) = 0;
    virtual void on_channel_buffered_amount_low(const std::string& transfer_id) = 0;
    virtual void on_channel_closed(const std::string& transfer_id) = 0;
    virtual void on_negotiation_failed(const std::string& transfer_id, const std::string& reason) = 0;
};

class NegotiationEngine {
public:
    NegotiationEngine(EventLoop& loop,
                      SignalingTransport& signaling,
                      std::shared_ptr<PeerConnectionFactory> factory,
                      NegotiationListener& listener,
                      std::chrono::milliseconds timeout);
    ~NegotiationEngine();

    NegotiationEngine(const NegotiationEngine&) = delete;
    NegotiationEngine& operator=(const NegotiationEngine&) = delete;

    /**
     * Create a context as initiator, request the channel and send the offer.
     * @return false if a context already exists or the offer could not be sent
     */
    bool start_initiator(const std::string& transfer_id, const std::string& peer_id);

    /**
     * Create a context as responder from a remote offer and send the answer.
     * A second offer for the same transfer id is ignored.
     */
    bool handle_offer(const std::string& transfer_id, const std::string& from, const nlohmann::json& offer);

    bool handle_answer(const std::string& transfer_id, const std::string& from, const nlohmann::json& answer);

    /**
     * Candidates are buffered until the remote description is set.
     * Repeated candidates are ignored.
     */
    bool handle_ice_candidate(const std::string& transfer_id, const std::string& from, const std::string& candidate);

    /**
     * Drop the context and close its connection. No listener callback.
     */
    void close(const std::string& transfer_id);

    void close_all();

    bool has_context(const std::string& transfer_id) const;
    size_t context_count() const { return contexts_.size(); }
    bool is_channel_open(const std::string& transfer_id) const;
    std::shared_ptr<ByteChannel> get_channel(const std::string& transfer_id) const;

private:
    struct Context {
        std::string transfer_id;
        std::string peer_id;
        NegotiationRole role;
        std::shared_ptr<PeerConnection> connection;
        std::shared_ptr<ByteChannel> channel;
        bool remote_description_set;
        bool channel_open;
        std::vector<std::string> pending_candidates;
        std::set<std::string> seen_candidates;
        EventLoop::TimerId timeout_timer;

        Context() : role(NegotiationRole::INITIATOR), remote_description_set(false),
                    channel_open(false), timeout_timer(0) {}
    };
    using ContextPtr = std::shared_ptr<Context>;
    using WeakContext = std::weak_ptr<Context>;

    ContextPtr create_context(const std::string& transfer_id, const std::string& peer_id, NegotiationRole role);
    void install_connection_callbacks(const ContextPtr& context);
    void install_channel_callbacks(const WeakContext& context, const std::shared_ptr<ByteChannel>& channel);
    void start_timeout(const ContextPtr& context);

    // Loop-thread handlers; each first checks the context is still current
    void on_local_candidate(const WeakContext& context, const std::string& candidate);
    void on_remote_channel(const WeakContext& context, const std::shared_ptr<ByteChannel>& channel);
    void on_channel_open(const WeakContext& context, const std::shared_ptr<ByteChannel>& channel);
    void on_channel_closed(const WeakContext& context);
    void on_timeout(const WeakContext& context);

    ContextPtr lock_current(const WeakContext& context) const;
    ContextPtr find_context(const std::string& transfer_id) const;
    void remove_context(const ContextPtr& context);
    void fail(const ContextPtr& context, const std::string& reason);

    EventLoop& loop_;
    SignalingTransport& signaling_;
    std::shared_ptr<PeerConnectionFactory> factory_;
    NegotiationListener& listener_;
    std::chrono::milliseconds timeout_;

    std::unordered_map<std::string, ContextPtr> contexts_;

    std::shared_ptr<std::atomic<bool>> alive_;
};

} // namespace peerdrop
