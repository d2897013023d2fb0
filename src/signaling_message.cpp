#include "signaling_message.h"
#include "logger.h"

#define LOG_SIGNALING_WARN(message) LOG_WARN("signaling", message)

namespace peerdrop {

std::string signaling_message_type_to_string(SignalingMessageType type) {
    switch (type) {
        case SignalingMessageType::AUTH: return "auth";
        case SignalingMessageType::AUTH_OK: return "auth_ok";
        case SignalingMessageType::JOIN_ROOM: return "join_room";
        case SignalingMessageType::LEAVE_ROOM: return "leave_room";
        case SignalingMessageType::ROOM_USERS: return "room_users";
        case SignalingMessageType::ROOM_JOINED: return "room_joined";
        case SignalingMessageType::ROOM_LEFT: return "room_left";
        case SignalingMessageType::TRANSFER_REQUEST: return "transfer-request";
        case SignalingMessageType::TRANSFER_RESPONSE: return "transfer-response";
        case SignalingMessageType::OFFER: return "offer";
        case SignalingMessageType::ANSWER: return "answer";
        case SignalingMessageType::ICE_CANDIDATE: return "ice-candidate";
        default: return "unknown";
    }
}

SignalingMessageType string_to_signaling_message_type(const std::string& str) {
    if (str == "auth") return SignalingMessageType::AUTH;
    if (str == "auth_ok") return SignalingMessageType::AUTH_OK;
    if (str == "join_room") return SignalingMessageType::JOIN_ROOM;
    if (str == "leave_room") return SignalingMessageType::LEAVE_ROOM;
    if (str == "room_users") return SignalingMessageType::ROOM_USERS;
    if (str == "room_joined") return SignalingMessageType::ROOM_JOINED;
    if (str == "room_left") return SignalingMessageType::ROOM_LEFT;
    if (str == "transfer-request" || str == "transfer_request") return SignalingMessageType::TRANSFER_REQUEST;
    if (str == "transfer-response" || str == "transfer_response") return SignalingMessageType::TRANSFER_RESPONSE;
    if (str == "offer") return SignalingMessageType::OFFER;
    if (str == "answer") return SignalingMessageType::ANSWER;
    if (str == "ice-candidate" || str == "ice_candidate") return SignalingMessageType::ICE_CANDIDATE;
    return SignalingMessageType::UNKNOWN;
}

bool is_directed_message(SignalingMessageType type) {
    switch (type) {
        case SignalingMessageType::TRANSFER_REQUEST:
        case SignalingMessageType::TRANSFER_RESPONSE:
        case SignalingMessageType::OFFER:
        case SignalingMessageType::ANSWER:
        case SignalingMessageType::ICE_CANDIDATE:
            return true;
        default:
            return false;
    }
}

std::optional<nlohmann::json> parse_signaling_message(const std::string& text) {
    try {
        nlohmann::json message = nlohmann::json::parse(text);
        if (!message.is_object() || !message.contains("type") || !message["type"].is_string()) {
            LOG_SIGNALING_WARN("Dropping signaling message without a string type");
            return std::nullopt;
        }
        return message;
    } catch (const nlohmann::json::exception& e) {
        LOG_SIGNALING_WARN("Failed to parse signaling message: " << e.what());
        return std::nullopt;
    }
}

SignalingMessageType get_message_type(const nlohmann::json& message) {
    if (!message.is_object()) {
        return SignalingMessageType::UNKNOWN;
    }
    auto it = message.find("type");
    if (it == message.end() || !it->is_string()) {
        return SignalingMessageType::UNKNOWN;
    }
    return string_to_signaling_message_type(it->get<std::string>());
}

std::string get_string_field(const nlohmann::json& message, const char* key) {
    if (!message.is_object()) {
        return "";
    }
    auto it = message.find(key);
    if (it == message.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

nlohmann::json make_auth_message(const std::string& token) {
    return {{"type", "auth"}, {"token", token}};
}

nlohmann::json make_auth_ok_message(const std::string& user_id, const std::string& username, const std::string& email) {
    return {
        {"type", "auth_ok"},
        {"user", {{"id", user_id}, {"username", username}, {"email", email}}}
    };
}

nlohmann::json make_join_room_message(const std::string& room_id) {
    return {{"type", "join_room"}, {"room_id", room_id}};
}

nlohmann::json make_leave_room_message() {
    return {{"type", "leave_room"}};
}

nlohmann::json make_room_joined_message(const std::string& room_id) {
    return {{"type", "room_joined"}, {"room_id", room_id}};
}

nlohmann::json make_room_left_message(const std::string& room_id) {
    return {{"type", "room_left"}, {"room_id", room_id}};
}

nlohmann::json make_room_users_message(const std::string& room_id, const nlohmann::json& users) {
    return {{"type", "room_users"}, {"room_id", room_id}, {"users", users}};
}

nlohmann::json make_transfer_request_message(const std::string& target,
                                             const std::string& transfer_id,
                                             const std::string& file_name,
                                             uint64_t file_size,
                                             const std::string& file_type) {
    return {
        {"type", "transfer-request"},
        {"target", target},
        {"transfer_id", transfer_id},
        {"fileName", file_name},
        {"fileSize", file_size},
        {"fileType", file_type}
    };
}

nlohmann::json make_transfer_response_message(const std::string& target,
                                              const std::string& transfer_id,
                                              bool accepted) {
    return {
        {"type", "transfer-response"},
        {"target", target},
        {"transfer_id", transfer_id},
        {"accepted", accepted}
    };
}

nlohmann::json make_offer_message(const std::string& target, const std::string& transfer_id, const nlohmann::json& offer) {
    return {{"type", "offer"}, {"target", target}, {"transfer_id", transfer_id}, {"offer", offer}};
}

nlohmann::json make_answer_message(const std::string& target, const std::string& transfer_id, const nlohmann::json& answer) {
    return {{"type", "answer"}, {"target", target}, {"transfer_id", transfer_id}, {"answer", answer}};
}

nlohmann::json make_ice_candidate_message(const std::string& target, const std::string& transfer_id, const std::string& candidate) {
    return {{"type", "ice-candidate"}, {"target", target}, {"transfer_id", transfer_id}, {"candidate", candidate}};
}

nlohmann::json annotate_forwarded_message(const nlohmann::json& message,
                                          const std::string& from,
                                          const std::string& from_username) {
    nlohmann::json forwarded = message;
    forwarded["from"] = from;
    forwarded["from_username"] = from_username;
    forwarded.erase("target");
    return forwarded;
}

} // namespace peerdrop
