#pragma once

#include "identity.h"
#include "signaling_relay.h"
#include "socket.h"
#include "threadmanager.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

namespace peerdrop {

/**
 * RelayConnection over a framed TCP socket. The socket itself is owned
 * and finally closed by the server's reader thread for the connection.
 */
class TcpRelayConnection : public RelayConnection {
public:
    explicit TcpRelayConnection(socket_t socket);

    bool send_text(const std::string& text) override;

    /**
     * Unblocks the reader thread; it closes the socket when it exits.
     */
    void close() override;

    /**
     * Refuse further sends and wait for a send in progress to return.
     * Called by the reader thread before it closes the socket.
     */
    void mark_closed();

private:
    socket_t socket_;
    std::mutex send_mutex_;   // one frame at a time
    std::mutex state_mutex_;  // closed_ and shutdown, never held across a send
    bool closed_;
};

/**
 * Keeps an authenticated connection registered with the relay while in
 * scope. On destruction the user is disconnected (unless a newer
 * connection replaced it) and the connection refuses further sends.
 */
class RelayRegistration {
public:
    RelayRegistration(SignalingRelay& relay, const Identity& identity, std::shared_ptr<TcpRelayConnection> connection);
    ~RelayRegistration();

    RelayRegistration(const RelayRegistration&) = delete;
    RelayRegistration& operator=(const RelayRegistration&) = delete;

private:
    SignalingRelay& relay_;
    std::string user_id_;
    std::shared_ptr<TcpRelayConnection> connection_;
};

/**
 * TCP front end of the signaling relay.
 *
 * Each accepted connection must first send {type: "auth", token}. A known
 * token is answered with auth_ok and the connection joins the relay; an
 * unknown token, or any other first frame, closes the socket.
 */
class SignalingServer : public ThreadManager {
public:
    SignalingServer(int listen_port, std::shared_ptr<IdentityResolver> resolver, int backlog = 16);
    ~SignalingServer();

    /**
     * Bind and start accepting connections.
     * @return true if the server is listening
     */
    bool start();

    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * @return The bound port (resolved after start() when configured as 0)
     */
    int get_listen_port() const { return listen_port_; }

    const SignalingRelay& relay() const { return relay_; }

private:
    void server_loop();
    void handle_client(socket_t client_socket);
    void serve_client(socket_t client_socket, const std::string& peer_address);

    int listen_port_;
    int backlog_;
    std::shared_ptr<IdentityResolver> resolver_;

    std::atomic<bool> running_;
    socket_t server_socket_;
    std::thread server_thread_;

    std::mutex client_sockets_mutex_;
    std::unordered_set<socket_t> client_sockets_;

    SignalingRelay relay_;
};

} // namespace peerdrop
