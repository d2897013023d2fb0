#pragma once

#include "identity.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerdrop {

/**
 * Hands a message for one connected user to its outbound queue.
 * Called with the registry lock held, so it must neither block on the
 * network nor call back into the registry.
 */
using MessageSink = std::function<void(const std::string& user_id, const nlohmann::json& message)>;

/**
 * Room membership table shared by every session on the relay.
 *
 * A user is in at most one room. Rooms exist while they have members.
 * Every mutation and the broadcasts it causes happen under one lock, so a
 * room_users list always reflects the membership at the time it was sent.
 */
class RoomRegistry {
public:
    explicit RoomRegistry(MessageSink sink);

    /**
     * Remember who a user is, for room_users lists.
     */
    void register_user(const Identity& identity);

    /**
     * Remove a user from its room without acknowledging to it, then forget it.
     * Remaining members receive an updated room_users list.
     */
    void unregister_user(const std::string& user_id);

    /**
     * Move a user into a room. The user receives room_joined, then every member
     * (the joiner included) receives room_users without itself. The previous
     * room, if any, receives its updated list first.
     */
    void join(const std::string& user_id, const std::string& room_id);

    /**
     * Take a user out of its room. The user receives room_left and the
     * remaining members receive room_users.
     */
    void leave(const std::string& user_id);

    /**
     * @return Room id of the user, or empty string when in no room
     */
    std::string get_room_of(const std::string& user_id) const;

    /**
     * @return Members in join order, empty when the room does not exist
     */
    std::vector<std::string> get_members(const std::string& room_id) const;

    size_t room_count() const;

private:
    // Returns the room the user was in (possibly now deleted), or empty string
    std::string remove_from_room_locked(const std::string& user_id);
    void broadcast_room_users_locked(const std::string& room_id);

    MessageSink sink_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<std::string>> rooms_;
    std::unordered_map<std::string, std::string> user_rooms_;
    std::unordered_map<std::string, Identity> users_;
};

} // namespace peerdrop
