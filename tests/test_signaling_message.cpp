#include <gtest/gtest.h>
#include "signaling_message.h"

using namespace peerdrop;

TEST(SignalingMessageTest, TypeStrings) {
    EXPECT_EQ(signaling_message_type_to_string(SignalingMessageType::TRANSFER_REQUEST), "transfer-request");
    EXPECT_EQ(signaling_message_type_to_string(SignalingMessageType::ICE_CANDIDATE), "ice-candidate");
    EXPECT_EQ(signaling_message_type_to_string(SignalingMessageType::ROOM_USERS), "room_users");

    EXPECT_EQ(string_to_signaling_message_type("join_room"), SignalingMessageType::JOIN_ROOM);
    EXPECT_EQ(string_to_signaling_message_type("transfer_response"), SignalingMessageType::TRANSFER_RESPONSE);
    EXPECT_EQ(string_to_signaling_message_type("ice_candidate"), SignalingMessageType::ICE_CANDIDATE);
    EXPECT_EQ(string_to_signaling_message_type("chat"), SignalingMessageType::UNKNOWN);
}

TEST(SignalingMessageTest, OnlyHandshakeAndNegotiationAreDirected) {
    EXPECT_TRUE(is_directed_message(SignalingMessageType::TRANSFER_REQUEST));
    EXPECT_TRUE(is_directed_message(SignalingMessageType::TRANSFER_RESPONSE));
    EXPECT_TRUE(is_directed_message(SignalingMessageType::OFFER));
    EXPECT_TRUE(is_directed_message(SignalingMessageType::ANSWER));
    EXPECT_TRUE(is_directed_message(SignalingMessageType::ICE_CANDIDATE));
    EXPECT_FALSE(is_directed_message(SignalingMessageType::JOIN_ROOM));
    EXPECT_FALSE(is_directed_message(SignalingMessageType::ROOM_USERS));
    EXPECT_FALSE(is_directed_message(SignalingMessageType::AUTH));
}

TEST(SignalingMessageTest, ParseRequiresObjectWithStringType) {
    EXPECT_TRUE(parse_signaling_message(R"({"type": "leave_room"})").has_value());
    EXPECT_FALSE(parse_signaling_message("").has_value());
    EXPECT_FALSE(parse_signaling_message("{").has_value());
    EXPECT_FALSE(parse_signaling_message(R"(["type"])").has_value());
    EXPECT_FALSE(parse_signaling_message(R"({"room_id": "r"})").has_value());
    EXPECT_FALSE(parse_signaling_message(R"({"type": 7})").has_value());

    auto unknown = parse_signaling_message(R"({"type": "chat"})");
    ASSERT_TRUE(unknown.has_value());
    EXPECT_EQ(get_message_type(*unknown), SignalingMessageType::UNKNOWN);
}

TEST(SignalingMessageTest, StringFieldAccess) {
    nlohmann::json message = {{"type", "offer"}, {"target", "2"}, {"count", 3}};
    EXPECT_EQ(get_string_field(message, "target"), "2");
    EXPECT_EQ(get_string_field(message, "count"), "");
    EXPECT_EQ(get_string_field(message, "missing"), "");
    EXPECT_EQ(get_string_field(nlohmann::json::array(), "type"), "");
}

TEST(SignalingMessageTest, TransferRequestFields) {
    auto request = make_transfer_request_message("2", "abc", "report.pdf", 32768, "application/pdf");
    EXPECT_EQ(request["type"], "transfer-request");
    EXPECT_EQ(request["target"], "2");
    EXPECT_EQ(request["transfer_id"], "abc");
    EXPECT_EQ(request["fileName"], "report.pdf");
    EXPECT_EQ(request["fileSize"], 32768);
    EXPECT_EQ(request["fileType"], "application/pdf");

    auto response = make_transfer_response_message("1", "abc", false);
    EXPECT_EQ(response["type"], "transfer-response");
    EXPECT_EQ(response["accepted"], false);
}

TEST(SignalingMessageTest, AuthOkCarriesIdentity) {
    auto message = make_auth_ok_message("1", "alice", "alice@example.com");
    EXPECT_EQ(get_message_type(message), SignalingMessageType::AUTH_OK);
    EXPECT_EQ(message["user"]["id"], "1");
    EXPECT_EQ(message["user"]["username"], "alice");
    EXPECT_EQ(message["user"]["email"], "alice@example.com");
}

TEST(SignalingMessageTest, ForwardingAnnotatesSenderAndDropsTarget) {
    auto offer = make_offer_message("2", "abc", {{"sdp", "v=0"}});
    auto forwarded = annotate_forwarded_message(offer, "1", "alice");

    EXPECT_FALSE(forwarded.contains("target"));
    EXPECT_EQ(forwarded["from"], "1");
    EXPECT_EQ(forwarded["from_username"], "alice");
    EXPECT_EQ(forwarded["transfer_id"], "abc");
    EXPECT_EQ(forwarded["offer"]["sdp"], "v=0");

    // The original is untouched
    EXPECT_EQ(offer["target"], "2");
    EXPECT_FALSE(offer.contains("from"));
}
