#include "room_registry.h"
#include "signaling_message.h"
#include "peerdrop_log_macros.h"
#include <algorithm>

namespace peerdrop {

RoomRegistry::RoomRegistry(MessageSink sink) : sink_(std::move(sink)) {
}

void RoomRegistry::register_user(const Identity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    users_[identity.user_id] = identity;
}

void RoomRegistry::unregister_user(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string previous_room = remove_from_room_locked(user_id);
    users_.erase(user_id);

    if (!previous_room.empty()) {
        LOG_RELAY_INFO("User " << user_id << " dropped from room " << previous_room);
        broadcast_room_users_locked(previous_room);
    }
}

void RoomRegistry::join(const std::string& user_id, const std::string& room_id) {
    if (room_id.empty()) {
        LOG_RELAY_WARN("Ignoring join with empty room id from " << user_id);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto current = user_rooms_.find(user_id);
    bool already_member = current != user_rooms_.end() && current->second == room_id;

    if (!already_member) {
        std::string previous_room = remove_from_room_locked(user_id);
        if (!previous_room.empty()) {
            broadcast_room_users_locked(previous_room);
        }

        rooms_[room_id].push_back(user_id);
        user_rooms_[user_id] = room_id;
        LOG_RELAY_INFO("User " << user_id << " joined room " << room_id
                       << " (" << rooms_[room_id].size() << " members)");
    }

    sink_(user_id, make_room_joined_message(room_id));
    broadcast_room_users_locked(room_id);
}

void RoomRegistry::leave(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string previous_room = remove_from_room_locked(user_id);
    sink_(user_id, make_room_left_message(previous_room));

    if (!previous_room.empty()) {
        LOG_RELAY_INFO("User " << user_id << " left room " << previous_room);
        broadcast_room_users_locked(previous_room);
    }
}

std::string RoomRegistry::get_room_of(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = user_rooms_.find(user_id);
    return it != user_rooms_.end() ? it->second : std::string();
}

std::vector<std::string> RoomRegistry::get_members(const std::string& room_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room_id);
    return it != rooms_.end() ? it->second : std::vector<std::string>();
}

size_t RoomRegistry::room_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rooms_.size();
}

std::string RoomRegistry::remove_from_room_locked(const std::string& user_id) {
    auto it = user_rooms_.find(user_id);
    if (it == user_rooms_.end()) {
        return "";
    }

    std::string room_id = it->second;
    user_rooms_.erase(it);

    auto room_it = rooms_.find(room_id);
    if (room_it != rooms_.end()) {
        auto& members = room_it->second;
        members.erase(std::remove(members.begin(), members.end(), user_id), members.end());
        if (members.empty()) {
            rooms_.erase(room_it);
            LOG_RELAY_DEBUG("Room " << room_id << " is empty and was removed");
        }
    }

    return room_id;
}

void RoomRegistry::broadcast_room_users_locked(const std::string& room_id) {
    auto room_it = rooms_.find(room_id);
    if (room_it == rooms_.end()) {
        return;
    }

    const auto& members = room_it->second;
    for (const auto& recipient : members) {
        nlohmann::json users = nlohmann::json::array();
        for (const auto& member : members) {
            if (member == recipient) {
                continue;
            }
            auto user_it = users_.find(member);
            if (user_it != users_.end()) {
                users.push_back(identity_to_json(user_it->second));
            } else {
                users.push_back(identity_to_json(Identity(member, member, "")));
            }
        }
        sink_(recipient, make_room_users_message(room_id, users));
    }
}

} // namespace peerdrop
