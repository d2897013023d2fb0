#pragma once

/**
 * @file socket.h
 * @brief Blocking TCP sockets and length-prefixed framing
 *
 * The relay connection and peer byte channels both run over blocking sockets
 * driven by dedicated threads. Frames are a 4-byte big-endian payload length
 * followed by the payload.
 */

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    typedef SOCKET socket_t;
    #define INVALID_SOCKET_VALUE INVALID_SOCKET
    #define SOCKET_ERROR_VALUE SOCKET_ERROR
#else
    #include <sys/socket.h>
    #include <arpa/inet.h>
    #include <netinet/in.h>
    #include <unistd.h>
    typedef int socket_t;
    #define INVALID_SOCKET_VALUE -1
    #define SOCKET_ERROR_VALUE -1
    #define closesocket close
#endif

namespace peerdrop {

/// Largest frame payload sent or accepted (16 MiB)
constexpr uint32_t MAX_FRAME_SIZE = 16 * 1024 * 1024;

/// Size of the length prefix in front of every frame
constexpr size_t FRAME_HEADER_SIZE = 4;

// Winsock startup and cleanup; no-ops elsewhere
bool init_socket_library();
void cleanup_socket_library();

/**
 * Connect to host:port, trying IPv6 first unless host is an IPv4 literal
 * @param timeout_ms Connect timeout in milliseconds (0 blocks)
 * @return Connected socket, or INVALID_SOCKET_VALUE
 */
socket_t create_tcp_client(const std::string& host, int port, int timeout_ms = 0);

/**
 * Connect to host:port over IPv4 only
 * @return Connected socket, or INVALID_SOCKET_VALUE
 */
socket_t create_tcp_client_v4(const std::string& host, int port, int timeout_ms = 0);

/**
 * Listen on every interface, dual stack where available
 * @param port Port to bind, 0 for an ephemeral port
 * @return Listening socket, or INVALID_SOCKET_VALUE
 */
socket_t create_tcp_server(int port, int backlog = 5);

/**
 * Listen on every IPv4 interface
 * @param port Port to bind, 0 for an ephemeral port
 * @return Listening socket, or INVALID_SOCKET_VALUE
 */
socket_t create_tcp_server_v4(int port, int backlog = 5);

/**
 * Block until a client connects
 * @return Client socket, or INVALID_SOCKET_VALUE once the listener is shut down
 */
socket_t accept_client(socket_t server_socket);

/**
 * @return "ip:port" of the remote end, or empty string on error
 */
std::string get_peer_address(socket_t socket);

/**
 * @return Port the socket is bound to, or 0 on error
 */
int get_ephemeral_port(socket_t socket);

/**
 * Send the whole buffer, retrying partial sends
 * @return true if every byte was sent
 */
bool send_all(socket_t socket, const uint8_t* data, size_t size);

/**
 * Receive exactly num_bytes
 * @return false on error or connection close, out is cleared then
 */
bool receive_exact_bytes(socket_t socket, size_t num_bytes, std::vector<uint8_t>& out);

/**
 * Write the length prefix of a payload of the given size
 */
void encode_frame_header(uint32_t payload_size, uint8_t header[FRAME_HEADER_SIZE]);

/**
 * Read a length prefix
 */
uint32_t decode_frame_header(const uint8_t header[FRAME_HEADER_SIZE]);

/**
 * Send one frame. Payloads above MAX_FRAME_SIZE are refused.
 */
bool send_tcp_message_framed(socket_t socket, const std::vector<uint8_t>& message);
bool send_tcp_string_framed(socket_t socket, const std::string& message);

/**
 * Receive one frame
 * @return false on error, connection close or a declared length above MAX_FRAME_SIZE
 */
bool receive_tcp_message_framed(socket_t socket, std::vector<uint8_t>& out);
bool receive_tcp_string_framed(socket_t socket, std::string& out);

void close_socket(socket_t socket);

/**
 * Shut down both directions without releasing the handle.
 * Threads blocked in recv() or accept() on the socket return.
 */
void shutdown_socket(socket_t socket);

bool is_valid_socket(socket_t socket);

// Disable Nagle's algorithm
bool set_tcp_nodelay(socket_t socket);

/**
 * Bound blocking receives on the socket
 * @param timeout_ms Timeout in milliseconds, 0 blocks indefinitely
 */
bool set_socket_receive_timeout(socket_t socket, int timeout_ms);

/**
 * Bound blocking sends on the socket; a send that times out fails
 * @param timeout_ms Timeout in milliseconds, 0 blocks indefinitely
 */
bool set_socket_send_timeout(socket_t socket, int timeout_ms);

} // namespace peerdrop
