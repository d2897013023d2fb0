#include "signaling_relay.h"
#include "signaling_message.h"
#include "peerdrop_log_macros.h"
#include <algorithm>

namespace peerdrop {

SignalingRelay::SignalingRelay()
    : rooms_([this](const std::string& user_id, const nlohmann::json& message) {
          deliver(user_id, message);
      }) {
}

SignalingRelay::~SignalingRelay() {
    std::unordered_map<std::string, ConnectionEntry> remaining;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        remaining.swap(connections_);
    }
    for (auto& entry : remaining) {
        entry.second.connection->close();
    }
}

void SignalingRelay::connect(const Identity& identity, std::shared_ptr<RelayConnection> connection) {
    std::shared_ptr<RelayConnection> replaced;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(identity.user_id);
        if (it != connections_.end()) {
            replaced = it->second.connection;
        }
        connections_[identity.user_id] = ConnectionEntry{identity, std::move(connection), std::make_shared<Outbox>()};
    }

    if (replaced) {
        LOG_RELAY_INFO("User " << identity.user_id << " reconnected, closing previous connection");
        replaced->close();
    }

    rooms_.register_user(identity);
    LOG_RELAY_INFO("User " << identity.username << " (" << identity.user_id << ") connected");
}

void SignalingRelay::disconnect(const std::string& user_id) {
    disconnect_internal(user_id, nullptr);
    reap_failed_connections();
}

void SignalingRelay::disconnect(const std::string& user_id, const RelayConnection* connection) {
    disconnect_internal(user_id, connection);
    reap_failed_connections();
}

void SignalingRelay::handle_message(const std::string& user_id, const std::string& text) {
    ConnectionEntry sender;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(user_id);
        if (it == connections_.end()) {
            LOG_RELAY_DEBUG("Ignoring message from disconnected user " << user_id);
            return;
        }
        sender = it->second;
    }

    auto message = parse_signaling_message(text);
    if (!message) {
        LOG_RELAY_WARN("Dropping malformed message from " << user_id);
        return;
    }

    SignalingMessageType type = get_message_type(*message);
    switch (type) {
        case SignalingMessageType::JOIN_ROOM: {
            std::string room_id = get_string_field(*message, "room_id");
            if (room_id.empty()) {
                LOG_RELAY_WARN("join_room without room_id from " << user_id);
                break;
            }
            rooms_.join(user_id, room_id);
            break;
        }
        case SignalingMessageType::LEAVE_ROOM:
            rooms_.leave(user_id);
            break;
        case SignalingMessageType::TRANSFER_REQUEST:
        case SignalingMessageType::TRANSFER_RESPONSE:
        case SignalingMessageType::OFFER:
        case SignalingMessageType::ANSWER:
        case SignalingMessageType::ICE_CANDIDATE:
            forward(sender, *message);
            break;
        default:
            LOG_RELAY_WARN("Dropping unexpected message type '" << get_string_field(*message, "type")
                           << "' from " << user_id);
            break;
    }

    reap_failed_connections();
}

bool SignalingRelay::is_connected(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.find(user_id) != connections_.end();
}

size_t SignalingRelay::connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void SignalingRelay::deliver(const std::string& user_id, const nlohmann::json& message) {
    std::shared_ptr<Outbox> outbox;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(user_id);
        if (it == connections_.end()) {
            LOG_RELAY_DEBUG("No connection for " << user_id << ", dropping "
                            << get_string_field(message, "type"));
            return;
        }
        outbox = it->second.outbox;
    }

    std::string text = message.dump();
    std::lock_guard<std::mutex> lock(outbox->mutex);
    outbox->pending.push_back(std::move(text));
}

void SignalingRelay::flush_outboxes() {
    std::vector<std::pair<std::string, ConnectionEntry>> entries;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        entries.reserve(connections_.size());
        for (const auto& entry : connections_) {
            entries.push_back(entry);
        }
    }

    for (const auto& entry : entries) {
        flush_outbox(entry.first, entry.second);
    }
}

void SignalingRelay::flush_outbox(const std::string& user_id, const ConnectionEntry& entry) {
    Outbox& outbox = *entry.outbox;
    std::unique_lock<std::mutex> lock(outbox.mutex);
    if (outbox.flushing || outbox.pending.empty()) {
        // Another thread is writing to this connection and drains what we queued
        return;
    }

    outbox.flushing = true;
    bool failed = false;
    while (!outbox.pending.empty()) {
        std::string text = std::move(outbox.pending.front());
        outbox.pending.pop_front();

        lock.unlock();
        bool sent = entry.connection->send_text(text);
        lock.lock();

        if (!sent) {
            outbox.pending.clear();
            failed = true;
            break;
        }
    }
    outbox.flushing = false;
    lock.unlock();

    if (failed) {
        LOG_RELAY_WARN("Send to " << user_id << " failed, scheduling disconnect");
        std::lock_guard<std::mutex> failed_lock(failed_mutex_);
        if (std::find(failed_users_.begin(), failed_users_.end(), user_id) == failed_users_.end()) {
            failed_users_.push_back(user_id);
        }
    }
}

void SignalingRelay::forward(const ConnectionEntry& sender, const nlohmann::json& message) {
    std::string target = get_string_field(message, "target");
    if (target.empty()) {
        LOG_RELAY_WARN("Dropping " << get_string_field(message, "type") << " without target from "
                       << sender.identity.user_id);
        return;
    }

    LOG_RELAY_DEBUG("Forwarding " << get_string_field(message, "type") << " from "
                    << sender.identity.user_id << " to " << target);
    deliver(target, annotate_forwarded_message(message, sender.identity.user_id, sender.identity.username));
}

void SignalingRelay::disconnect_internal(const std::string& user_id, const RelayConnection* expected) {
    std::shared_ptr<RelayConnection> connection;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(user_id);
        if (it == connections_.end()) {
            return;
        }
        if (expected != nullptr && it->second.connection.get() != expected) {
            // Replaced by a newer connection of the same user
            return;
        }
        connection = it->second.connection;
        connections_.erase(it);
    }

    connection->close();
    rooms_.unregister_user(user_id);
    LOG_RELAY_INFO("User " << user_id << " disconnected");
}

void SignalingRelay::reap_failed_connections() {
    while (true) {
        flush_outboxes();

        std::vector<std::string> failed;
        {
            std::lock_guard<std::mutex> lock(failed_mutex_);
            failed.swap(failed_users_);
        }
        if (failed.empty()) {
            return;
        }
        for (const auto& user_id : failed) {
            disconnect_internal(user_id, nullptr);
        }
    }
}

} // namespace peerdrop
