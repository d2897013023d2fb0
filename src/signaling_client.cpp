#include "signaling_client.h"
#include "signaling_message.h"
#include "logger.h"

// Client module logging macros
#define LOG_CLIENT_DEBUG(message) LOG_DEBUG("client", message)
#define LOG_CLIENT_INFO(message)  LOG_INFO("client", message)
#define LOG_CLIENT_WARN(message)  LOG_WARN("client", message)
#define LOG_CLIENT_ERROR(message) LOG_ERROR("client", message)

namespace peerdrop {

SignalingClient::SignalingClient(EventLoop& loop)
    : loop_(loop),
      socket_(INVALID_SOCKET_VALUE),
      connected_(false),
      alive_(std::make_shared<std::atomic<bool>>(true)) {
}

SignalingClient::~SignalingClient() {
    alive_->store(false);
    disconnect();
}

bool SignalingClient::connect(const std::string& host, int port, const std::string& token, int timeout_ms) {
    if (connected_.load()) {
        LOG_CLIENT_WARN("Already connected to the relay");
        return false;
    }

    if (!init_socket_library()) {
        return false;
    }

    LOG_CLIENT_INFO("Connecting to relay at " << host << ":" << port);
    socket_t sock = create_tcp_client(host, port, timeout_ms);
    if (!is_valid_socket(sock)) {
        LOG_CLIENT_ERROR("Failed to connect to relay at " << host << ":" << port);
        return false;
    }

    if (!send_tcp_string_framed(sock, make_auth_message(token).dump())) {
        LOG_CLIENT_ERROR("Failed to send authentication to relay");
        close_socket(sock);
        return false;
    }

    set_socket_receive_timeout(sock, timeout_ms);
    std::string text;
    if (!receive_tcp_string_framed(sock, text)) {
        LOG_CLIENT_ERROR("Relay closed the connection during authentication (invalid token?)");
        close_socket(sock);
        return false;
    }
    set_socket_receive_timeout(sock, 0);

    auto reply = parse_signaling_message(text);
    if (!reply || get_message_type(*reply) != SignalingMessageType::AUTH_OK ||
        !reply->contains("user") || !(*reply)["user"].is_object()) {
        LOG_CLIENT_ERROR("Unexpected reply to authentication");
        close_socket(sock);
        return false;
    }

    const nlohmann::json& user = (*reply)["user"];
    identity_ = Identity(get_string_field(user, "id"), get_string_field(user, "username"), get_string_field(user, "email"));

    socket_ = sock;
    connected_.store(true);
    start_managed_thread("signaling-reader", [this]() { reader_loop(); });

    LOG_CLIENT_INFO("Authenticated as " << identity_.username << " (" << identity_.user_id << ")");
    return true;
}

void SignalingClient::disconnect() {
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (is_valid_socket(socket_)) {
            shutdown_socket(socket_);
        }
    }

    join_all_active_threads();

    std::lock_guard<std::mutex> lock(send_mutex_);
    if (is_valid_socket(socket_)) {
        close_socket(socket_);
        socket_ = INVALID_SOCKET_VALUE;
        cleanup_socket_library();
    }
}

bool SignalingClient::send(const nlohmann::json& message) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (!connected_.load() || !is_valid_socket(socket_)) {
        LOG_CLIENT_WARN("Cannot send " << get_string_field(message, "type") << ": not connected");
        return false;
    }

    if (!send_tcp_string_framed(socket_, message.dump())) {
        LOG_CLIENT_ERROR("Failed to send " << get_string_field(message, "type") << " to relay");
        return false;
    }
    return true;
}

void SignalingClient::reader_loop() {
    try {
        std::string text;
        while (receive_tcp_string_framed(socket_, text)) {
            auto message = parse_signaling_message(text);
            if (!message) {
                continue;
            }
            LOG_CLIENT_DEBUG("Received " << get_string_field(*message, "type") << " from relay");

            loop_.post([this, alive = alive_, msg = std::move(*message)]() {
                if (alive->load() && message_callback_) {
                    message_callback_(msg);
                }
            });
        }
    } catch (const std::exception& e) {
        LOG_CLIENT_ERROR("Signaling reader failed: " << e.what());
    }

    connected_.store(false);
    LOG_CLIENT_INFO("Relay connection closed");

    loop_.post([this, alive = alive_]() {
        if (alive->load() && closed_callback_) {
            closed_callback_();
        }
    });
}

} // namespace peerdrop
