#include "signaling_server.h"
#include "signaling_message.h"
#include "logger.h"

// Server module logging macros
#define LOG_SERVER_DEBUG(message) LOG_DEBUG("server", message)
#define LOG_SERVER_INFO(message)  LOG_INFO("server", message)
#define LOG_SERVER_WARN(message)  LOG_WARN("server", message)
#define LOG_SERVER_ERROR(message) LOG_ERROR("server", message)

namespace peerdrop {

// A client has this long to authenticate after connecting
static const int AUTH_TIMEOUT_MS = 10000;

// A client that stops reading for this long is disconnected
static const int SEND_TIMEOUT_MS = 10000;

TcpRelayConnection::TcpRelayConnection(socket_t socket)
    : socket_(socket), closed_(false) {
}

bool TcpRelayConnection::send_text(const std::string& text) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        if (closed_) {
            return false;
        }
    }
    return send_tcp_string_framed(socket_, text);
}

void TcpRelayConnection::close() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!closed_) {
        shutdown_socket(socket_);
    }
}

void TcpRelayConnection::mark_closed() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        // Fails a send blocked on a peer that stopped reading
        shutdown_socket(socket_);
    }
    // Returns once no send is in progress
    std::lock_guard<std::mutex> lock(send_mutex_);
}

RelayRegistration::RelayRegistration(SignalingRelay& relay, const Identity& identity,
                                     std::shared_ptr<TcpRelayConnection> connection)
    : relay_(relay), user_id_(identity.user_id), connection_(std::move(connection)) {
    relay_.connect(identity, connection_);
}

RelayRegistration::~RelayRegistration() {
    relay_.disconnect(user_id_, connection_.get());
    connection_->mark_closed();
}

SignalingServer::SignalingServer(int listen_port, std::shared_ptr<IdentityResolver> resolver, int backlog)
    : listen_port_(listen_port),
      backlog_(backlog),
      resolver_(std::move(resolver)),
      running_(false),
      server_socket_(INVALID_SOCKET_VALUE) {
}

SignalingServer::~SignalingServer() {
    stop();
}

bool SignalingServer::start() {
    if (running_.load()) {
        LOG_SERVER_WARN("Signaling server is already running");
        return false;
    }

    if (!init_socket_library()) {
        return false;
    }

    server_socket_ = create_tcp_server(listen_port_, backlog_);
    if (!is_valid_socket(server_socket_)) {
        LOG_SERVER_ERROR("Failed to create server socket on port " << listen_port_);
        return false;
    }
    listen_port_ = get_ephemeral_port(server_socket_);

    running_.store(true);
    server_thread_ = std::thread(&SignalingServer::server_loop, this);

    LOG_SERVER_INFO("Signaling server started on port " << listen_port_);
    return true;
}

void SignalingServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_SERVER_INFO("Stopping signaling server");
    shutdown_all_threads();

    // Break the accept loop
    shutdown_socket(server_socket_);

    {
        std::lock_guard<std::mutex> lock(client_sockets_mutex_);
        LOG_SERVER_DEBUG("Closing " << client_sockets_.size() << " client connections");
        for (socket_t client_socket : client_sockets_) {
            shutdown_socket(client_socket);
        }
    }

    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    close_socket(server_socket_);
    server_socket_ = INVALID_SOCKET_VALUE;

    join_all_active_threads();
    cleanup_socket_library();

    LOG_SERVER_INFO("Signaling server stopped");
}

void SignalingServer::server_loop() {
    LOG_SERVER_DEBUG("Server loop started");

    while (running_.load()) {
        socket_t client_socket = accept_client(server_socket_);
        if (!is_valid_socket(client_socket)) {
            if (running_.load()) {
                LOG_SERVER_ERROR("Failed to accept client connection");
            }
            break;
        }
        if (!running_.load()) {
            close_socket(client_socket);
            break;
        }

        {
            std::lock_guard<std::mutex> lock(client_sockets_mutex_);
            client_sockets_.insert(client_socket);
        }

        // Threads of connections that already closed
        reap_finished_threads();

        if (!start_managed_thread("relay-client-" + std::to_string(client_socket),
                                  [this, client_socket]() { handle_client(client_socket); })) {
            {
                std::lock_guard<std::mutex> lock(client_sockets_mutex_);
                client_sockets_.erase(client_socket);
            }
            close_socket(client_socket);
            break;
        }
    }

    LOG_SERVER_DEBUG("Server loop ended");
}

void SignalingServer::handle_client(socket_t client_socket) {
    std::string peer_address = get_peer_address(client_socket);

    try {
        serve_client(client_socket, peer_address);
    } catch (const std::exception& e) {
        LOG_SERVER_ERROR("Client handler for " << peer_address << " failed: " << e.what());
    }

    {
        std::lock_guard<std::mutex> lock(client_sockets_mutex_);
        client_sockets_.erase(client_socket);
    }
    close_socket(client_socket);
}

void SignalingServer::serve_client(socket_t client_socket, const std::string& peer_address) {
    set_socket_receive_timeout(client_socket, AUTH_TIMEOUT_MS);

    std::string text;
    if (!receive_tcp_string_framed(client_socket, text)) {
        LOG_SERVER_WARN("Connection from " << peer_address << " closed before authenticating");
        return;
    }

    auto message = parse_signaling_message(text);
    if (!message || get_message_type(*message) != SignalingMessageType::AUTH) {
        LOG_SERVER_WARN("First frame from " << peer_address << " is not an auth message, closing");
        return;
    }

    auto identity = resolver_->resolve(get_string_field(*message, "token"));
    if (!identity) {
        LOG_SERVER_WARN("Rejecting connection from " << peer_address << ": unknown token");
        return;
    }

    set_socket_receive_timeout(client_socket, 0);
    if (!set_socket_send_timeout(client_socket, SEND_TIMEOUT_MS)) {
        LOG_SERVER_WARN("Could not set send timeout for " << peer_address);
    }

    auto connection = std::make_shared<TcpRelayConnection>(client_socket);
    if (!connection->send_text(make_auth_ok_message(identity->user_id, identity->username, identity->email).dump())) {
        LOG_SERVER_WARN("Failed to acknowledge authentication of " << identity->user_id);
        connection->mark_closed();
        return;
    }

    LOG_SERVER_INFO("Authenticated " << identity->username << " (" << identity->user_id << ") from " << peer_address);
    RelayRegistration registration(relay_, *identity, connection);

    while (running_.load() && receive_tcp_string_framed(client_socket, text)) {
        relay_.handle_message(identity->user_id, text);
    }
}

} // namespace peerdrop
