#include "negotiation.h"
#include "signaling_message.h"
#include "logger.h"

// Negotiation module logging macros
#define LOG_NEGOTIATION_DEBUG(message) LOG_DEBUG("negotiation", message)
#define LOG_NEGOTIATION_INFO(message)  LOG_INFO("negotiation", message)
#define LOG_NEGOTIATION_WARN(message)  LOG_WARN("negotiation", message)
#define LOG_NEGOTIATION_ERROR(message) LOG_ERROR("negotiation", message)

namespace peerdrop {

NegotiationEngine::NegotiationEngine(EventLoop& loop,
                                     SignalingTransport& signaling,
                                     std::shared_ptr<PeerConnectionFactory> factory,
                                     NegotiationListener& listener,
                                     std::chrono::milliseconds timeout)
    : loop_(loop), signaling_(signaling), factory_(std::move(factory)), listener_(listener),
      timeout_(timeout), alive_(std::make_shared<std::atomic<bool>>(true)) {
}

NegotiationEngine::~NegotiationEngine() {
    alive_->store(false);
    close_all();
}

bool NegotiationEngine::start_initiator(const std::string& transfer_id, const std::string& peer_id) {
    if (contexts_.find(transfer_id) != contexts_.end()) {
        LOG_NEGOTIATION_WARN("Negotiation for transfer " << transfer_id << " already started");
        return false;
    }

    ContextPtr context = create_context(transfer_id, peer_id, NegotiationRole::INITIATOR);
    if (!context) {
        return false;
    }

    auto channel = context->connection->create_channel(transfer_id);
    if (!channel) {
        LOG_NEGOTIATION_ERROR("Failed to request a channel for transfer " << transfer_id);
        context->connection->close();
        return false;
    }
    install_channel_callbacks(context, channel);
    context->channel = channel;

    auto offer = context->connection->create_offer();
    if (!offer) {
        LOG_NEGOTIATION_ERROR("Failed to create offer for transfer " << transfer_id);
        context->connection->close();
        return false;
    }

    contexts_[transfer_id] = context;
    start_timeout(context);

    if (!signaling_.send(make_offer_message(peer_id, transfer_id, *offer))) {
        LOG_NEGOTIATION_ERROR("Failed to send offer for transfer " << transfer_id);
        remove_context(context);
        return false;
    }

    LOG_NEGOTIATION_INFO("Sent offer to " << peer_id << " for transfer " << transfer_id);
    return true;
}

bool NegotiationEngine::handle_offer(const std::string& transfer_id, const std::string& from, const nlohmann::json& offer) {
    if (contexts_.find(transfer_id) != contexts_.end()) {
        LOG_NEGOTIATION_WARN("Ignoring repeated offer for transfer " << transfer_id);
        return false;
    }

    ContextPtr context = create_context(transfer_id, from, NegotiationRole::RESPONDER);
    if (!context) {
        return false;
    }

    auto answer = context->connection->create_answer(offer);
    if (!answer) {
        LOG_NEGOTIATION_WARN("Could not answer offer from " << from << " for transfer " << transfer_id);
        context->connection->close();
        return false;
    }
    context->remote_description_set = true;

    contexts_[transfer_id] = context;
    start_timeout(context);

    if (!signaling_.send(make_answer_message(from, transfer_id, *answer))) {
        LOG_NEGOTIATION_ERROR("Failed to send answer for transfer " << transfer_id);
        remove_context(context);
        return false;
    }

    LOG_NEGOTIATION_INFO("Answered offer from " << from << " for transfer " << transfer_id);
    return true;
}

bool NegotiationEngine::handle_answer(const std::string& transfer_id, const std::string& from, const nlohmann::json& answer) {
    ContextPtr context = find_context(transfer_id);
    if (!context || context->role != NegotiationRole::INITIATOR || context->peer_id != from) {
        LOG_NEGOTIATION_WARN("Dropping answer from " << from << " for unknown transfer " << transfer_id);
        return false;
    }
    if (context->remote_description_set) {
        LOG_NEGOTIATION_DEBUG("Ignoring repeated answer for transfer " << transfer_id);
        return false;
    }

    if (!context->connection->set_remote_answer(answer)) {
        fail(context, "invalid answer from peer");
        return false;
    }
    context->remote_description_set = true;

    for (const auto& candidate : context->pending_candidates) {
        context->connection->add_remote_candidate(candidate);
    }
    LOG_NEGOTIATION_DEBUG("Applied answer for transfer " << transfer_id << " and "
                          << context->pending_candidates.size() << " buffered candidates");
    context->pending_candidates.clear();
    return true;
}

bool NegotiationEngine::handle_ice_candidate(const std::string& transfer_id, const std::string& from, const std::string& candidate) {
    ContextPtr context = find_context(transfer_id);
    if (!context || context->peer_id != from) {
        LOG_NEGOTIATION_WARN("Dropping candidate from " << from << " for unknown transfer " << transfer_id);
        return false;
    }

    if (!context->seen_candidates.insert(candidate).second) {
        LOG_NEGOTIATION_DEBUG("Ignoring repeated candidate for transfer " << transfer_id);
        return true;
    }

    if (!context->remote_description_set) {
        context->pending_candidates.push_back(candidate);
        return true;
    }
    return context->connection->add_remote_candidate(candidate);
}

void NegotiationEngine::close(const std::string& transfer_id) {
    ContextPtr context = find_context(transfer_id);
    if (context) {
        LOG_NEGOTIATION_DEBUG("Closing negotiation context for transfer " << transfer_id);
        remove_context(context);
    }
}

void NegotiationEngine::close_all() {
    std::unordered_map<std::string, ContextPtr> contexts;
    contexts.swap(contexts_);

    for (auto& entry : contexts) {
        if (entry.second->timeout_timer != 0) {
            loop_.cancel_timer(entry.second->timeout_timer);
        }
        entry.second->connection->close();
    }
}

bool NegotiationEngine::has_context(const std::string& transfer_id) const {
    return contexts_.find(transfer_id) != contexts_.end();
}

bool NegotiationEngine::is_channel_open(const std::string& transfer_id) const {
    ContextPtr context = find_context(transfer_id);
    return context && context->channel_open;
}

std::shared_ptr<ByteChannel> NegotiationEngine::get_channel(const std::string& transfer_id) const {
    ContextPtr context = find_context(transfer_id);
    return context ? context->channel : nullptr;
}

//=============================================================================
// Context setup
//=============================================================================

NegotiationEngine::ContextPtr NegotiationEngine::create_context(const std::string& transfer_id,
                                                                const std::string& peer_id,
                                                                NegotiationRole role) {
    auto connection = factory_->create();
    if (!connection) {
        LOG_NEGOTIATION_ERROR("Peer connection factory failed for transfer " << transfer_id);
        return nullptr;
    }

    auto context = std::make_shared<Context>();
    context->transfer_id = transfer_id;
    context->peer_id = peer_id;
    context->role = role;
    context->connection = connection;
    install_connection_callbacks(context);
    return context;
}

void NegotiationEngine::install_connection_callbacks(const ContextPtr& context) {
    WeakContext weak = context;
    EventLoop* loop = &loop_;
    auto alive = alive_;

    context->connection->set_local_candidate_callback([this, loop, alive, weak](const std::string& candidate) {
        loop->post([this, alive, weak, candidate]() {
            if (alive->load()) {
                on_local_candidate(weak, candidate);
            }
        });
    });

    // Runs on the transport thread before the channel delivers anything
    context->connection->set_channel_callback([this, loop, alive, weak](std::shared_ptr<ByteChannel> channel) {
        if (!alive->load()) {
            return;
        }
        install_channel_callbacks(weak, channel);
        loop->post([this, alive, weak, channel]() {
            if (alive->load()) {
                on_remote_channel(weak, channel);
            }
        });
    });
}

void NegotiationEngine::install_channel_callbacks(const WeakContext& context, const std::shared_ptr<ByteChannel>& channel) {
    EventLoop* loop = &loop_;
    auto alive = alive_;
    std::weak_ptr<ByteChannel> weak_channel = channel;

    channel->set_open_callback([this, loop, alive, context, weak_channel]() {
        loop->post([this, alive, context, weak_channel]() {
            auto channel = weak_channel.lock();
            if (alive->load() && channel) {
                on_channel_open(context, channel);
            }
        });
    });

    channel->set_text_message_callback([this, loop, alive, context](const std::string& text) {
        loop->post([this, alive, context, text]() {
            if (!alive->load()) {
                return;
            }
            ContextPtr current = lock_current(context);
            if (current) {
                listener_.on_channel_text(current->transfer_id, text);
            }
        });
    });

    channel->set_binary_message_callback([this, loop, alive, context](const std::vector<uint8_t>& data) {
        loop->post([this, alive, context, data]() {
            if (!alive->load()) {
                return;
            }
            ContextPtr current = lock_current(context);
            if (current) {
                listener_.on_channel_binary(current->transfer_id, data);
            }
        });
    });

    channel->set_buffered_amount_low_callback([this, loop, alive, context]() {
        loop->post([this, alive, context]() {
            if (!alive->load()) {
                return;
            }
            ContextPtr current = lock_current(context);
            if (current) {
                listener_.on_channel_buffered_amount_low(current->transfer_id);
            }
        });
    });

    channel->set_close_callback([this, loop, alive, context]() {
        loop->post([this, alive, context]() {
            if (alive->load()) {
                on_channel_closed(context);
            }
        });
    });
}

void NegotiationEngine::start_timeout(const ContextPtr& context) {
    WeakContext weak = context;
    auto alive = alive_;
    context->timeout_timer = loop_.post_delayed(timeout_, [this, alive, weak]() {
        if (alive->load()) {
            on_timeout(weak);
        }
    });
}

//=============================================================================
// Loop-thread handlers
//=============================================================================

void NegotiationEngine::on_local_candidate(const WeakContext& context, const std::string& candidate) {
    ContextPtr current = lock_current(context);
    if (!current) {
        return;
    }
    if (!signaling_.send(make_ice_candidate_message(current->peer_id, current->transfer_id, candidate))) {
        LOG_NEGOTIATION_WARN("Failed to send candidate for transfer " << current->transfer_id);
    }
}

void NegotiationEngine::on_remote_channel(const WeakContext& context, const std::shared_ptr<ByteChannel>& channel) {
    ContextPtr current = lock_current(context);
    if (!current) {
        channel->close();
        return;
    }
    if (current->channel && current->channel != channel) {
        LOG_NEGOTIATION_WARN("Closing extra channel for transfer " << current->transfer_id);
        channel->close();
        return;
    }

    LOG_NEGOTIATION_DEBUG("Remote channel " << channel->label() << " announced for transfer " << current->transfer_id);
    current->channel = channel;
    if (channel->state() == ChannelState::OPEN) {
        on_channel_open(context, channel);
    }
}

void NegotiationEngine::on_channel_open(const WeakContext& context, const std::shared_ptr<ByteChannel>& channel) {
    ContextPtr current = lock_current(context);
    if (!current || current->channel_open) {
        return;
    }
    if (!current->channel) {
        current->channel = channel;
    }

    current->channel_open = true;
    if (current->timeout_timer != 0) {
        loop_.cancel_timer(current->timeout_timer);
        current->timeout_timer = 0;
    }

    LOG_NEGOTIATION_INFO("Channel open with " << current->peer_id << " for transfer " << current->transfer_id);
    listener_.on_channel_open(current->transfer_id, current->channel);
}

void NegotiationEngine::on_channel_closed(const WeakContext& context) {
    ContextPtr current = lock_current(context);
    if (!current) {
        return;
    }

    if (!current->channel_open) {
        fail(current, "channel closed during negotiation");
        return;
    }

    LOG_NEGOTIATION_DEBUG("Channel closed for transfer " << current->transfer_id);
    remove_context(current);
    listener_.on_channel_closed(current->transfer_id);
}

void NegotiationEngine::on_timeout(const WeakContext& context) {
    ContextPtr current = lock_current(context);
    if (!current || current->channel_open) {
        return;
    }
    current->timeout_timer = 0;
    fail(current, "channel did not open within " + std::to_string(timeout_.count()) + " ms");
}

NegotiationEngine::ContextPtr NegotiationEngine::lock_current(const WeakContext& context) const {
    ContextPtr locked = context.lock();
    if (!locked) {
        return nullptr;
    }
    ContextPtr current = find_context(locked->transfer_id);
    return current == locked ? current : nullptr;
}

NegotiationEngine::ContextPtr NegotiationEngine::find_context(const std::string& transfer_id) const {
    auto it = contexts_.find(transfer_id);
    return it != contexts_.end() ? it->second : nullptr;
}

void NegotiationEngine::remove_context(const ContextPtr& context) {
    auto it = contexts_.find(context->transfer_id);
    if (it != contexts_.end() && it->second == context) {
        contexts_.erase(it);
    }
    if (context->timeout_timer != 0) {
        loop_.cancel_timer(context->timeout_timer);
        context->timeout_timer = 0;
    }
    context->connection->close();
}

void NegotiationEngine::fail(const ContextPtr& context, const std::string& reason) {
    LOG_NEGOTIATION_WARN("Negotiation for transfer " << context->transfer_id << " failed: " << reason);
    remove_context(context);
    listener_.on_negotiation_failed(context->transfer_id, reason);
}

} // namespace peerdrop
