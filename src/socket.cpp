#include "socket.h"
#include "network_utils.h"
#include "logger.h"
#include <cstring>
#ifndef _WIN32
    #include <fcntl.h>
    #include <errno.h>
    #include <poll.h>
    #include <netinet/tcp.h>
#endif

// Socket module logging macros
#define LOG_SOCKET_DEBUG(message) LOG_DEBUG("socket", message)
#define LOG_SOCKET_INFO(message)  LOG_INFO("socket", message)
#define LOG_SOCKET_WARN(message)  LOG_WARN("socket", message)
#define LOG_SOCKET_ERROR(message) LOG_ERROR("socket", message)

#ifdef MSG_NOSIGNAL
    #define PEERDROP_SEND_FLAGS MSG_NOSIGNAL
#else
    #define PEERDROP_SEND_FLAGS 0
#endif

namespace peerdrop {

namespace {

bool set_blocking(socket_t socket, bool blocking) {
#ifdef _WIN32
    unsigned long mode = blocking ? 0 : 1;
    return ioctlsocket(socket, FIONBIO, &mode) == 0;
#else
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags == -1) {
        return false;
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(socket, F_SETFL, flags) != -1;
#endif
}

bool interrupted() {
#ifdef _WIN32
    return false;
#else
    return errno == EINTR;
#endif
}

// Leaves the socket in blocking mode on success
bool connect_with_timeout(socket_t socket, const sockaddr* addr, socklen_t addr_len, int timeout_ms) {
    if (timeout_ms <= 0) {
        return connect(socket, addr, addr_len) != SOCKET_ERROR_VALUE;
    }

    if (!set_blocking(socket, false)) {
        LOG_SOCKET_ERROR("Failed to make socket " << socket << " non-blocking");
        return false;
    }

    if (connect(socket, addr, addr_len) == SOCKET_ERROR_VALUE) {
#ifdef _WIN32
        if (WSAGetLastError() != WSAEWOULDBLOCK) {
            return false;
        }
        fd_set write_set;
        FD_ZERO(&write_set);
        FD_SET(socket, &write_set);
        timeval tv;
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;
        if (select(0, nullptr, &write_set, nullptr, &tv) <= 0) {
            return false;
        }
#else
        if (errno != EINPROGRESS) {
            return false;
        }
        pollfd pfd;
        pfd.fd = socket;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        if (poll(&pfd, 1, timeout_ms) <= 0) {
            LOG_SOCKET_DEBUG("Connect timed out after " << timeout_ms << "ms");
            return false;
        }
#endif
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(socket, SOL_SOCKET, SO_ERROR, (char*)&so_error, &len) == SOCKET_ERROR_VALUE || so_error != 0) {
            return false;
        }
    }

    return set_blocking(socket, true);
}

// Connects to an already resolved address of the given family
socket_t connect_resolved(int family, const std::string& ip, int port, int timeout_ms) {
    sockaddr_storage addr;
    socklen_t addr_len = 0;
    memset(&addr, 0, sizeof(addr));

    if (family == AF_INET) {
        sockaddr_in* in = reinterpret_cast<sockaddr_in*>(&addr);
        in->sin_family = AF_INET;
        in->sin_port = htons(static_cast<uint16_t>(port));
        if (inet_pton(AF_INET, ip.c_str(), &in->sin_addr) != 1) {
            LOG_SOCKET_ERROR("Invalid address: " << ip);
            return INVALID_SOCKET_VALUE;
        }
        addr_len = sizeof(sockaddr_in);
    } else {
        sockaddr_in6* in6 = reinterpret_cast<sockaddr_in6*>(&addr);
        in6->sin6_family = AF_INET6;
        in6->sin6_port = htons(static_cast<uint16_t>(port));
        if (inet_pton(AF_INET6, ip.c_str(), &in6->sin6_addr) != 1) {
            LOG_SOCKET_ERROR("Invalid IPv6 address: " << ip);
            return INVALID_SOCKET_VALUE;
        }
        addr_len = sizeof(sockaddr_in6);
    }

    socket_t client_socket = socket(family, SOCK_STREAM, 0);
    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create client socket");
        return INVALID_SOCKET_VALUE;
    }

    if (!connect_with_timeout(client_socket, reinterpret_cast<sockaddr*>(&addr), addr_len, timeout_ms)) {
        LOG_SOCKET_DEBUG("Connection to " << ip << ":" << port << " failed");
        close_socket(client_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_DEBUG("Connected to " << ip << ":" << port);
    return client_socket;
}

bool valid_client_port(int port) {
    if (port <= 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 1-65535)");
        return false;
    }
    return true;
}

bool valid_server_port(int port) {
    if (port < 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 0-65535)");
        return false;
    }
    return true;
}

// Binds and listens; closes the socket on failure
socket_t bind_and_listen(socket_t server_socket, const sockaddr* addr, socklen_t addr_len, int port, int backlog) {
    int opt = 1;
    if (setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR, (char*)&opt, sizeof(opt)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set SO_REUSEADDR");
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    if (bind(server_socket, addr, addr_len) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to bind server socket to port " << port);
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    if (listen(server_socket, backlog) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to listen on port " << port);
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_DEBUG("Listening on port " << get_ephemeral_port(server_socket) << " (backlog: " << backlog << ")");
    return server_socket;
}

} // namespace

bool init_socket_library() {
#ifdef _WIN32
    WSADATA wsaData;
    int result = WSAStartup(MAKEWORD(2, 2), &wsaData);
    if (result != 0) {
        LOG_SOCKET_ERROR("WSAStartup failed: " << result);
        return false;
    }
#endif
    return true;
}

void cleanup_socket_library() {
#ifdef _WIN32
    WSACleanup();
#endif
}

socket_t create_tcp_client(const std::string& host, int port, int timeout_ms) {
    if (!valid_client_port(port)) {
        return INVALID_SOCKET_VALUE;
    }

    // Literal IPv4 addresses skip the IPv6 attempt
    if (!network_utils::is_valid_ipv4(host)) {
        std::string ip6 = network_utils::resolve_hostname_v6(host);
        if (!ip6.empty()) {
            socket_t client_socket = connect_resolved(AF_INET6, ip6, port, timeout_ms);
            if (is_valid_socket(client_socket)) {
                return client_socket;
            }
            LOG_SOCKET_DEBUG("IPv6 connection to " << host << " failed, trying IPv4");
        }
    }

    socket_t client_socket = create_tcp_client_v4(host, port, timeout_ms);
    if (!is_valid_socket(client_socket)) {
        LOG_SOCKET_WARN("Failed to connect to " << host << ":" << port);
    }
    return client_socket;
}

socket_t create_tcp_client_v4(const std::string& host, int port, int timeout_ms) {
    if (!valid_client_port(port)) {
        return INVALID_SOCKET_VALUE;
    }

    std::string ip = network_utils::resolve_hostname(host);
    if (ip.empty()) {
        LOG_SOCKET_ERROR("Failed to resolve hostname: " << host);
        return INVALID_SOCKET_VALUE;
    }
    return connect_resolved(AF_INET, ip, port, timeout_ms);
}

socket_t create_tcp_server(int port, int backlog) {
    if (!valid_server_port(port)) {
        return INVALID_SOCKET_VALUE;
    }

    socket_t server_socket = socket(AF_INET6, SOCK_STREAM, 0);
    if (server_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_WARN("No IPv6 support, listening on IPv4 only");
        return create_tcp_server_v4(port, backlog);
    }

    // Accept IPv4 clients as mapped addresses
    int ipv6_only = 0;
    if (setsockopt(server_socket, IPPROTO_IPV6, IPV6_V6ONLY, (char*)&ipv6_only, sizeof(ipv6_only)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_WARN("Failed to disable IPv6-only mode, will be IPv6 only");
    }

    sockaddr_in6 server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin6_family = AF_INET6;
    server_addr.sin6_addr = in6addr_any;
    server_addr.sin6_port = htons(static_cast<uint16_t>(port));

    return bind_and_listen(server_socket, reinterpret_cast<sockaddr*>(&server_addr), sizeof(server_addr), port, backlog);
}

socket_t create_tcp_server_v4(int port, int backlog) {
    if (!valid_server_port(port)) {
        return INVALID_SOCKET_VALUE;
    }

    socket_t server_socket = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create server socket");
        return INVALID_SOCKET_VALUE;
    }

    sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_addr.s_addr = INADDR_ANY;
    server_addr.sin_port = htons(static_cast<uint16_t>(port));

    return bind_and_listen(server_socket, reinterpret_cast<sockaddr*>(&server_addr), sizeof(server_addr), port, backlog);
}

socket_t accept_client(socket_t server_socket) {
    sockaddr_storage client_addr;
    socklen_t client_addr_len = sizeof(client_addr);

    socket_t client_socket = accept(server_socket, reinterpret_cast<sockaddr*>(&client_addr), &client_addr_len);
    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_DEBUG("accept() on socket " << server_socket << " returned no client");
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_DEBUG("Client connected from " << get_peer_address(client_socket));
    return client_socket;
}

std::string get_peer_address(socket_t socket) {
    sockaddr_storage peer_addr;
    socklen_t peer_addr_len = sizeof(peer_addr);

    if (getpeername(socket, reinterpret_cast<sockaddr*>(&peer_addr), &peer_addr_len) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_DEBUG("No peer address for socket " << socket);
        return "";
    }

    char ip_str[INET6_ADDRSTRLEN] = {0};
    uint16_t peer_port = 0;
    if (peer_addr.ss_family == AF_INET) {
        sockaddr_in* in = reinterpret_cast<sockaddr_in*>(&peer_addr);
        inet_ntop(AF_INET, &in->sin_addr, ip_str, sizeof(ip_str));
        peer_port = ntohs(in->sin_port);
    } else if (peer_addr.ss_family == AF_INET6) {
        sockaddr_in6* in6 = reinterpret_cast<sockaddr_in6*>(&peer_addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, ip_str, sizeof(ip_str));
        peer_port = ntohs(in6->sin6_port);
    } else {
        return "";
    }

    return std::string(ip_str) + ":" + std::to_string(peer_port);
}

int get_ephemeral_port(socket_t socket) {
    sockaddr_storage addr;
    socklen_t addr_len = sizeof(addr);
    if (getsockname(socket, reinterpret_cast<sockaddr*>(&addr), &addr_len) == SOCKET_ERROR_VALUE) {
        return 0;
    }

    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
    return 0;
}

bool send_all(socket_t socket, const uint8_t* data, size_t size) {
    size_t total_sent = 0;
    while (total_sent < size) {
        int bytes_sent = send(socket, (const char*)data + total_sent,
                              static_cast<int>(size - total_sent), PEERDROP_SEND_FLAGS);
        if (bytes_sent == SOCKET_ERROR_VALUE) {
            if (interrupted()) {
                continue;
            }
            LOG_SOCKET_DEBUG("send() failed on socket " << socket);
            return false;
        }
        total_sent += static_cast<size_t>(bytes_sent);
    }
    return true;
}

bool receive_exact_bytes(socket_t socket, size_t num_bytes, std::vector<uint8_t>& out) {
    out.resize(num_bytes);
    size_t total_received = 0;

    while (total_received < num_bytes) {
        int bytes_received = recv(socket, (char*)out.data() + total_received,
                                  static_cast<int>(num_bytes - total_received), 0);
        if (bytes_received == SOCKET_ERROR_VALUE && interrupted()) {
            continue;
        }
        if (bytes_received <= 0) {
            LOG_SOCKET_DEBUG((bytes_received == 0 ? "Connection closed by peer on socket " : "recv() failed on socket ")
                             << socket);
            out.clear();
            return false;
        }
        total_received += static_cast<size_t>(bytes_received);
    }

    return true;
}

void encode_frame_header(uint32_t payload_size, uint8_t header[FRAME_HEADER_SIZE]) {
    header[0] = static_cast<uint8_t>((payload_size >> 24) & 0xFF);
    header[1] = static_cast<uint8_t>((payload_size >> 16) & 0xFF);
    header[2] = static_cast<uint8_t>((payload_size >> 8) & 0xFF);
    header[3] = static_cast<uint8_t>(payload_size & 0xFF);
}

uint32_t decode_frame_header(const uint8_t header[FRAME_HEADER_SIZE]) {
    return (static_cast<uint32_t>(header[0]) << 24) |
           (static_cast<uint32_t>(header[1]) << 16) |
           (static_cast<uint32_t>(header[2]) << 8) |
           static_cast<uint32_t>(header[3]);
}

namespace {

bool send_frame(socket_t socket, const uint8_t* payload, size_t size) {
    if (size > MAX_FRAME_SIZE) {
        LOG_SOCKET_ERROR("Refusing to send oversized frame of " << size << " bytes");
        return false;
    }

    std::vector<uint8_t> frame(FRAME_HEADER_SIZE + size);
    encode_frame_header(static_cast<uint32_t>(size), frame.data());
    if (size > 0) {
        memcpy(frame.data() + FRAME_HEADER_SIZE, payload, size);
    }
    return send_all(socket, frame.data(), frame.size());
}

} // namespace

bool send_tcp_message_framed(socket_t socket, const std::vector<uint8_t>& message) {
    return send_frame(socket, message.data(), message.size());
}

bool send_tcp_string_framed(socket_t socket, const std::string& message) {
    return send_frame(socket, reinterpret_cast<const uint8_t*>(message.data()), message.size());
}

bool receive_tcp_message_framed(socket_t socket, std::vector<uint8_t>& out) {
    std::vector<uint8_t> header;
    if (!receive_exact_bytes(socket, FRAME_HEADER_SIZE, header)) {
        return false;
    }

    uint32_t length = decode_frame_header(header.data());
    if (length > MAX_FRAME_SIZE) {
        LOG_SOCKET_ERROR("Frame length " << length << " exceeds limit on socket " << socket);
        return false;
    }
    if (length == 0) {
        out.clear();
        return true;
    }
    return receive_exact_bytes(socket, length, out);
}

bool receive_tcp_string_framed(socket_t socket, std::string& out) {
    std::vector<uint8_t> data;
    if (!receive_tcp_message_framed(socket, data)) {
        return false;
    }
    out.assign(data.begin(), data.end());
    return true;
}

void close_socket(socket_t socket) {
    if (is_valid_socket(socket)) {
        closesocket(socket);
    }
}

void shutdown_socket(socket_t socket) {
    if (!is_valid_socket(socket)) {
        return;
    }
#ifdef _WIN32
    shutdown(socket, SD_BOTH);
#else
    shutdown(socket, SHUT_RDWR);
#endif
}

bool is_valid_socket(socket_t socket) {
    return socket != INVALID_SOCKET_VALUE;
}

bool set_tcp_nodelay(socket_t socket) {
    int flag = 1;
    if (setsockopt(socket, IPPROTO_TCP, TCP_NODELAY, (char*)&flag, sizeof(flag)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_WARN("Failed to set TCP_NODELAY on socket " << socket);
        return false;
    }
    return true;
}

namespace {

bool set_socket_timeout(socket_t socket, int option, int timeout_ms) {
#ifdef _WIN32
    DWORD tv = static_cast<DWORD>(timeout_ms);
#else
    timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
#endif
    return setsockopt(socket, SOL_SOCKET, option, (const char*)&tv, sizeof(tv)) != SOCKET_ERROR_VALUE;
}

} // namespace

bool set_socket_receive_timeout(socket_t socket, int timeout_ms) {
    if (!set_socket_timeout(socket, SO_RCVTIMEO, timeout_ms)) {
        LOG_SOCKET_WARN("Failed to set receive timeout on socket " << socket);
        return false;
    }
    return true;
}

bool set_socket_send_timeout(socket_t socket, int timeout_ms) {
    if (!set_socket_timeout(socket, SO_SNDTIMEO, timeout_ms)) {
        LOG_SOCKET_WARN("Failed to set send timeout on socket " << socket);
        return false;
    }
    return true;
}

} // namespace peerdrop
