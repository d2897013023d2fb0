#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace peerdrop {

/**
 * Signaling message types exchanged between endpoints and the relay.
 * Every message is a JSON object discriminated by its "type" field.
 */
enum class SignalingMessageType {
    AUTH,               // endpoint -> relay, first frame on a connection
    AUTH_OK,            // relay -> endpoint, carries the caller's own identity
    JOIN_ROOM,
    LEAVE_ROOM,
    ROOM_USERS,
    ROOM_JOINED,
    ROOM_LEFT,
    TRANSFER_REQUEST,
    TRANSFER_RESPONSE,
    OFFER,
    ANSWER,
    ICE_CANDIDATE,
    UNKNOWN
};

std::string signaling_message_type_to_string(SignalingMessageType type);
SignalingMessageType string_to_signaling_message_type(const std::string& str);

/**
 * Directed messages carry a "target" user id and are forwarded by the relay.
 */
bool is_directed_message(SignalingMessageType type);

/**
 * Parse a JSON text into a message object.
 * @return The message, or std::nullopt if the text is not a JSON object with a string "type"
 */
std::optional<nlohmann::json> parse_signaling_message(const std::string& text);

/**
 * Read the type of a parsed message (UNKNOWN when absent or unrecognized)
 */
SignalingMessageType get_message_type(const nlohmann::json& message);

/**
 * Read a string field, returning an empty string when absent or not a string
 */
std::string get_string_field(const nlohmann::json& message, const char* key);

// Connection
nlohmann::json make_auth_message(const std::string& token);
nlohmann::json make_auth_ok_message(const std::string& user_id, const std::string& username, const std::string& email);

// Rooms
nlohmann::json make_join_room_message(const std::string& room_id);
nlohmann::json make_leave_room_message();
nlohmann::json make_room_joined_message(const std::string& room_id);
nlohmann::json make_room_left_message(const std::string& room_id);
nlohmann::json make_room_users_message(const std::string& room_id, const nlohmann::json& users);

// Transfer handshake
nlohmann::json make_transfer_request_message(const std::string& target,
                                             const std::string& transfer_id,
                                             const std::string& file_name,
                                             uint64_t file_size,
                                             const std::string& file_type);
nlohmann::json make_transfer_response_message(const std::string& target,
                                              const std::string& transfer_id,
                                              bool accepted);

// Negotiation
nlohmann::json make_offer_message(const std::string& target, const std::string& transfer_id, const nlohmann::json& offer);
nlohmann::json make_answer_message(const std::string& target, const std::string& transfer_id, const nlohmann::json& answer);
nlohmann::json make_ice_candidate_message(const std::string& target, const std::string& transfer_id, const std::string& candidate);

/**
 * Prepare a directed message for delivery: a copy with "from" and
 * "from_username" set and "target" removed. Other fields are untouched.
 */
nlohmann::json annotate_forwarded_message(const nlohmann::json& message,
                                          const std::string& from,
                                          const std::string& from_username);

} // namespace peerdrop
