#pragma once

#include "identity.h"
#include "room_registry.h"
#include <nlohmann/json.hpp>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerdrop {

/**
 * One authenticated user's full-duplex connection, seen from the relay.
 * Implementations must allow send_text() from several threads.
 */
class RelayConnection {
public:
    virtual ~RelayConnection() = default;

    /**
     * @return false if the message could not be delivered
     */
    virtual bool send_text(const std::string& text) = 0;

    virtual void close() = 0;
};

/**
 * Connection broker: room membership plus forwarding of directed
 * messages by target user id. It never looks at payload fields other
 * than type and target.
 *
 * Outbound messages are queued per recipient while the room lock is held
 * and written after it is released, one writer per recipient at a time, so
 * a recipient that stops reading stalls only the thread writing to it.
 * A failed send disconnects the recipient once the operation that
 * triggered the send has finished.
 */
class SignalingRelay {
public:
    SignalingRelay();
    ~SignalingRelay();

    SignalingRelay(const SignalingRelay&) = delete;
    SignalingRelay& operator=(const SignalingRelay&) = delete;

    /**
     * Register a connection. An existing connection of the same user is
     * replaced and closed.
     */
    void connect(const Identity& identity, std::shared_ptr<RelayConnection> connection);

    /**
     * Drop a user's connection and silently remove it from its room.
     */
    void disconnect(const std::string& user_id);

    /**
     * Drop a user's connection only if it is still the given one. Used by
     * reader threads of connections that may already have been replaced.
     */
    void disconnect(const std::string& user_id, const RelayConnection* connection);

    /**
     * Handle one inbound text frame from a connected user.
     */
    void handle_message(const std::string& user_id, const std::string& text);

    bool is_connected(const std::string& user_id) const;
    size_t connection_count() const;

    const RoomRegistry& rooms() const { return rooms_; }

private:
    // Messages waiting for one connection, in delivery order
    struct Outbox {
        std::mutex mutex;
        std::deque<std::string> pending;
        bool flushing = false;
    };

    struct ConnectionEntry {
        Identity identity;
        std::shared_ptr<RelayConnection> connection;
        std::shared_ptr<Outbox> outbox;
    };

    // Queues only; never blocks on the connection
    void deliver(const std::string& user_id, const nlohmann::json& message);
    void forward(const ConnectionEntry& sender, const nlohmann::json& message);
    void flush_outboxes();
    void flush_outbox(const std::string& user_id, const ConnectionEntry& entry);
    void disconnect_internal(const std::string& user_id, const RelayConnection* expected);
    void reap_failed_connections();

    mutable std::mutex connections_mutex_;
    std::unordered_map<std::string, ConnectionEntry> connections_;

    std::mutex failed_mutex_;
    std::vector<std::string> failed_users_;

    RoomRegistry rooms_;
};

} // namespace peerdrop
