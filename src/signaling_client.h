#pragma once

#include "event_loop.h"
#include "identity.h"
#include "socket.h"
#include "threadmanager.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace peerdrop {

/**
 * Outbound half of the signaling connection, as used by an endpoint.
 */
class SignalingTransport {
public:
    virtual ~SignalingTransport() = default;

    /**
     * @return false if the message could not be sent
     */
    virtual bool send(const nlohmann::json& message) = 0;
};

/**
 * Framed-TCP connection from an endpoint to the relay.
 *
 * A reader thread receives messages and posts them to the endpoint's event
 * loop; the closed callback is posted once when the connection ends.
 */
class SignalingClient : public SignalingTransport, public ThreadManager {
public:
    using MessageCallback = std::function<void(const nlohmann::json&)>;
    using ClosedCallback = std::function<void()>;

    explicit SignalingClient(EventLoop& loop);
    ~SignalingClient();

    /**
     * Connect, authenticate with the token and start the reader thread.
     * Blocks until the relay acknowledges the token or the timeout expires.
     * @return true if authenticated
     */
    bool connect(const std::string& host, int port, const std::string& token, int timeout_ms = 5000);

    void disconnect();

    bool send(const nlohmann::json& message) override;

    bool is_connected() const { return connected_.load(); }

    /**
     * Identity the relay assigned to our token. Valid after connect() succeeded.
     */
    const Identity& get_identity() const { return identity_; }

    // Set before connect(); invoked on the event loop thread
    void set_message_callback(MessageCallback callback) { message_callback_ = std::move(callback); }
    void set_closed_callback(ClosedCallback callback) { closed_callback_ = std::move(callback); }

private:
    void reader_loop();

    EventLoop& loop_;
    socket_t socket_;
    std::mutex send_mutex_;
    std::atomic<bool> connected_;
    Identity identity_;

    MessageCallback message_callback_;
    ClosedCallback closed_callback_;

    // Cleared on destruction so tasks still queued on the loop become no-ops
    std::shared_ptr<std::atomic<bool>> alive_;
};

} // namespace peerdrop
