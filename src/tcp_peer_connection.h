#pragma once

/**
 * @file tcp_peer_connection.h
 * @brief PeerConnection over direct TCP, negotiated with ICE-style host candidates
 *
 * The answering side listens on an ephemeral port and advertises one host
 * candidate per local IPv4 address. The offering side (controlling agent)
 * dials the candidates in priority order once it holds the answer and proves
 * knowledge of the answerer's ufrag/pwd with a hello frame. The first
 * connection acknowledged with hello-ack carries the channel.
 *
 * Channel wire format: 1-byte kind, 4-byte big-endian length, payload.
 */

#include "peer_connection.h"
#include "chained_send_buffer.h"
#include "threadmanager.h"
#include "socket.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace peerdrop {

enum class ChannelFrameKind : uint8_t {
    CONTROL = 0,
    TEXT = 1,
    BINARY = 2
};

constexpr size_t CHANNEL_FRAME_HEADER_SIZE = 5;

std::vector<uint8_t> encode_channel_frame(ChannelFrameKind kind, const uint8_t* data, size_t size);

/**
 * Read one channel frame (blocking).
 * @return false on connection close, socket error, unknown kind or oversized frame
 */
bool receive_channel_frame(socket_t socket, ChannelFrameKind& kind, std::vector<uint8_t>& payload);

/**
 * TCP host candidate, serialized as an SDP candidate attribute:
 * "candidate:<foundation> 1 tcp <priority> <ip> <port> typ host"
 */
struct HostCandidate {
    std::string foundation;
    uint32_t component_id;
    uint32_t priority;
    std::string ip;
    uint16_t port;

    HostCandidate() : component_id(1), priority(0), port(0) {}

    std::string to_sdp() const;
    static std::optional<HostCandidate> from_sdp(const std::string& sdp_line);

    std::string address() const { return ip + ":" + std::to_string(port); }
};

/**
 * RFC 8445 priority for a host candidate
 */
uint32_t calculate_host_candidate_priority(uint16_t local_preference, uint16_t component_id = 1);

/**
 * ByteChannel over an authenticated TCP socket.
 *
 * Outbound frames are queued in a ChainedSendBuffer and written by a writer
 * thread; a reader thread delivers inbound frames. The close callback fires
 * once both threads have exited.
 */
class TcpByteChannel : public ByteChannel, public ThreadManager {
public:
    explicit TcpByteChannel(const std::string& label);
    ~TcpByteChannel() override;

    std::string label() const override { return label_; }
    ChannelState state() const override { return state_.load(); }
    bool send_text(const std::string& text) override;
    bool send_binary(const std::vector<uint8_t>& data) override;
    size_t buffered_amount() const override;
    void set_buffered_amount_low_threshold(size_t threshold) override;
    void close() override;

    /**
     * Take ownership of an authenticated socket, report OPEN and start I/O.
     * The socket is closed instead if the channel is no longer CONNECTING.
     */
    void attach(socket_t socket);

    /**
     * Close immediately, discarding queued frames.
     */
    void abort();

private:
    bool queue_frame(ChannelFrameKind kind, const uint8_t* data, size_t size);
    void reader_loop();
    void writer_loop();
    void on_io_thread_exit();

    std::string label_;
    std::atomic<ChannelState> state_;
    std::atomic<socket_t> socket_;
    std::atomic<int> io_threads_;

    mutable std::mutex send_mutex_;
    std::condition_variable send_cv_;
    ChainedSendBuffer send_buffer_;
    size_t low_threshold_;
    bool writer_stop_;
};

class TcpPeerConnection : public PeerConnection, public ThreadManager {
public:
    explicit TcpPeerConnection(int connect_timeout_ms = 2000);
    ~TcpPeerConnection() override;

    std::shared_ptr<ByteChannel> create_channel(const std::string& label) override;
    std::optional<nlohmann::json> create_offer() override;
    std::optional<nlohmann::json> create_answer(const nlohmann::json& offer) override;
    bool set_remote_answer(const nlohmann::json& answer) override;
    bool add_remote_candidate(const std::string& candidate) override;
    void close() override;

    bool is_controlling() const;
    size_t remote_candidate_count() const;

    /**
     * Port of the candidate listener, 0 when not listening
     */
    int get_listen_port() const;

private:
    void connectivity_check_loop();
    socket_t try_candidate(const HostCandidate& candidate, const std::string& ufrag, const std::string& pwd);
    void accept_loop();
    bool authenticate_incoming(socket_t client);
    std::vector<HostCandidate> gather_host_candidates(int port) const;

    static std::string generate_ufrag();
    static std::string generate_password();

    int connect_timeout_ms_;
    std::string local_ufrag_;
    std::string local_pwd_;

    mutable std::mutex mutex_;
    std::condition_variable checks_cv_;
    bool closed_;
    bool controlling_;
    bool offer_created_;
    bool answer_created_;
    bool remote_answer_set_;
    bool connected_;
    std::string remote_ufrag_;
    std::string remote_pwd_;
    std::string label_;
    std::shared_ptr<TcpByteChannel> channel_;
    std::vector<HostCandidate> pending_candidates_;
    std::set<std::string> known_candidates_;
    socket_t listen_socket_;
    int listen_port_;
};

class TcpPeerConnectionFactory : public PeerConnectionFactory {
public:
    explicit TcpPeerConnectionFactory(int connect_timeout_ms = 2000) : connect_timeout_ms_(connect_timeout_ms) {}

    std::shared_ptr<PeerConnection> create() override;

private:
    int connect_timeout_ms_;
};

} // namespace peerdrop
