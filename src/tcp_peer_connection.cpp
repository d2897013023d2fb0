#include "tcp_peer_connection.h"
#include "network_utils.h"
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <functional>
#include <random>
#include <sstream>

// TCP peer connection module logging macros
#define LOG_TCPPC_DEBUG(message) LOG_DEBUG("tcp_pc", message)
#define LOG_TCPPC_INFO(message)  LOG_INFO("tcp_pc", message)
#define LOG_TCPPC_WARN(message)  LOG_WARN("tcp_pc", message)
#define LOG_TCPPC_ERROR(message) LOG_ERROR("tcp_pc", message)

namespace peerdrop {

namespace {

const int HANDSHAKE_TIMEOUT_MS = 5000;
const uint16_t LOOPBACK_LOCAL_PREFERENCE = 1000;

bool send_control_message(socket_t socket, const nlohmann::json& message) {
    std::string text = message.dump();
    std::vector<uint8_t> frame = encode_channel_frame(ChannelFrameKind::CONTROL,
                                                      reinterpret_cast<const uint8_t*>(text.data()), text.size());
    return send_all(socket, frame.data(), frame.size());
}

std::optional<nlohmann::json> receive_control_message(socket_t socket) {
    ChannelFrameKind kind;
    std::vector<uint8_t> payload;
    if (!receive_channel_frame(socket, kind, payload)) {
        return std::nullopt;
    }
    if (kind != ChannelFrameKind::CONTROL) {
        LOG_TCPPC_WARN("Expected a control frame during handshake, got kind " << static_cast<int>(kind));
        return std::nullopt;
    }

    try {
        nlohmann::json message = nlohmann::json::parse(payload.begin(), payload.end());
        if (!message.is_object()) {
            return std::nullopt;
        }
        return message;
    } catch (const nlohmann::json::exception& e) {
        LOG_TCPPC_WARN("Malformed handshake frame: " << e.what());
        return std::nullopt;
    }
}

std::string get_description_field(const nlohmann::json& description, const char* key) {
    auto it = description.find(key);
    if (it == description.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

} // namespace

//=============================================================================
// Channel framing
//=============================================================================

std::vector<uint8_t> encode_channel_frame(ChannelFrameKind kind, const uint8_t* data, size_t size) {
    std::vector<uint8_t> frame(CHANNEL_FRAME_HEADER_SIZE);
    frame.reserve(CHANNEL_FRAME_HEADER_SIZE + size);
    frame[0] = static_cast<uint8_t>(kind);
    encode_frame_header(static_cast<uint32_t>(size), frame.data() + 1);

    if (size > 0) {
        frame.insert(frame.end(), data, data + size);
    }
    return frame;
}

bool receive_channel_frame(socket_t socket, ChannelFrameKind& kind, std::vector<uint8_t>& payload) {
    std::vector<uint8_t> header;
    if (!receive_exact_bytes(socket, CHANNEL_FRAME_HEADER_SIZE, header)) {
        return false;
    }

    if (header[0] > static_cast<uint8_t>(ChannelFrameKind::BINARY)) {
        LOG_TCPPC_ERROR("Unknown channel frame kind " << static_cast<int>(header[0]));
        return false;
    }
    kind = static_cast<ChannelFrameKind>(header[0]);

    uint32_t length = decode_frame_header(header.data() + 1);
    if (length > MAX_FRAME_SIZE) {
        LOG_TCPPC_ERROR("Channel frame of " << length << " bytes exceeds the maximum of " << MAX_FRAME_SIZE);
        return false;
    }

    if (length == 0) {
        payload.clear();
        return true;
    }
    return receive_exact_bytes(socket, length, payload);
}

//=============================================================================
// HostCandidate
//=============================================================================

std::string HostCandidate::to_sdp() const {
    std::ostringstream sdp;
    sdp << "candidate:" << foundation << " " << component_id << " tcp " << priority << " "
        << ip << " " << port << " typ host";
    return sdp.str();
}

std::optional<HostCandidate> HostCandidate::from_sdp(const std::string& sdp_line) {
    std::istringstream iss(sdp_line);
    std::string token;
    HostCandidate candidate;

    // candidate:foundation component transport priority ip port typ type
    if (!(iss >> token) || token.compare(0, 10, "candidate:") != 0) {
        return std::nullopt;
    }
    candidate.foundation = token.substr(10);

    std::string transport;
    std::string typ;
    std::string type;
    uint32_t port = 0;
    if (!(iss >> candidate.component_id >> transport >> candidate.priority >> candidate.ip >> port >> typ >> type)) {
        return std::nullopt;
    }

    std::transform(transport.begin(), transport.end(), transport.begin(), ::tolower);
    if (transport != "tcp" || typ != "typ" || type != "host") {
        return std::nullopt;
    }
    if (port == 0 || port > 65535 || !network_utils::is_valid_ipv4(candidate.ip)) {
        return std::nullopt;
    }
    candidate.port = static_cast<uint16_t>(port);
    return candidate;
}

uint32_t calculate_host_candidate_priority(uint16_t local_preference, uint16_t component_id) {
    const uint32_t type_preference = 126;
    return (type_preference << 24) |
           (static_cast<uint32_t>(local_preference) << 8) |
           static_cast<uint32_t>(256 - component_id);
}

//=============================================================================
// TcpByteChannel
//=============================================================================

TcpByteChannel::TcpByteChannel(const std::string& label)
    : label_(label), state_(ChannelState::CONNECTING), socket_(INVALID_SOCKET_VALUE), io_threads_(0),
      low_threshold_(0), writer_stop_(false) {
}

TcpByteChannel::~TcpByteChannel() {
    abort();
    shutdown_all_threads();
    join_all_active_threads();

    socket_t socket = socket_.exchange(INVALID_SOCKET_VALUE);
    if (is_valid_socket(socket)) {
        close_socket(socket);
    }
}

bool TcpByteChannel::send_text(const std::string& text) {
    return queue_frame(ChannelFrameKind::TEXT, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

bool TcpByteChannel::send_binary(const std::vector<uint8_t>& data) {
    return queue_frame(ChannelFrameKind::BINARY, data.data(), data.size());
}

size_t TcpByteChannel::buffered_amount() const {
    std::lock_guard<std::mutex> lock(send_mutex_);
    return send_buffer_.buffered_amount();
}

void TcpByteChannel::set_buffered_amount_low_threshold(size_t threshold) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    low_threshold_ = threshold;
}

bool TcpByteChannel::queue_frame(ChannelFrameKind kind, const uint8_t* data, size_t size) {
    if (size > MAX_FRAME_SIZE) {
        LOG_TCPPC_ERROR("Refusing to queue a frame of " << size << " bytes on channel " << label_);
        return false;
    }

    std::lock_guard<std::mutex> lock(send_mutex_);
    if (state_.load() != ChannelState::OPEN) {
        LOG_TCPPC_WARN("Send on channel " << label_ << " in state " << channel_state_to_string(state_.load()));
        return false;
    }
    send_buffer_.push(encode_channel_frame(kind, data, size));
    send_cv_.notify_one();
    return true;
}

void TcpByteChannel::close() {
    ChannelState expected = ChannelState::OPEN;
    if (state_.compare_exchange_strong(expected, ChannelState::CLOSING)) {
        LOG_TCPPC_DEBUG("Closing channel " << label_ << " after flushing " << buffered_amount() << " bytes");
        std::lock_guard<std::mutex> lock(send_mutex_);
        send_cv_.notify_one();
        return;
    }

    expected = ChannelState::CONNECTING;
    if (state_.compare_exchange_strong(expected, ChannelState::CLOSED)) {
        notify_close();
    }
}

void TcpByteChannel::abort() {
    ChannelState expected = ChannelState::CONNECTING;
    if (state_.compare_exchange_strong(expected, ChannelState::CLOSED)) {
        notify_close();
        return;
    }
    if (state_.load() == ChannelState::CLOSED) {
        return;
    }

    state_.store(ChannelState::CLOSING);
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        writer_stop_ = true;
        send_cv_.notify_one();
    }
    shutdown_socket(socket_.load());
}

void TcpByteChannel::attach(socket_t socket) {
    if (state_.load() != ChannelState::CONNECTING) {
        LOG_TCPPC_DEBUG("Channel " << label_ << " no longer connecting, dropping socket");
        close_socket(socket);
        return;
    }

    socket_.store(socket);
    io_threads_.store(2);
    state_.store(ChannelState::OPEN);
    LOG_TCPPC_INFO("Channel " << label_ << " open to " << get_peer_address(socket));

    // Open is reported before the reader can deliver anything
    notify_open();

    start_managed_thread("channel-writer-" + label_, [this]() { writer_loop(); });
    start_managed_thread("channel-reader-" + label_, [this]() { reader_loop(); });
}

void TcpByteChannel::writer_loop() {
    socket_t socket = socket_.load();

    try {
        while (true) {
            std::vector<uint8_t> frame;
            {
                std::unique_lock<std::mutex> lock(send_mutex_);
                send_cv_.wait(lock, [this] {
                    return writer_stop_ || send_buffer_.has_queued_frames() || state_.load() == ChannelState::CLOSING;
                });
                if (writer_stop_ || !send_buffer_.has_queued_frames()) {
                    break;
                }
                frame = send_buffer_.begin_write();
            }

            if (!send_all(socket, frame.data(), frame.size())) {
                LOG_TCPPC_WARN("Write failed on channel " << label_);
                break;
            }

            bool crossed_low = false;
            {
                std::lock_guard<std::mutex> lock(send_mutex_);
                crossed_low = send_buffer_.finish_write(low_threshold_);
            }
            if (crossed_low) {
                notify_buffered_amount_low();
            }
        }
    } catch (const std::exception& e) {
        LOG_TCPPC_ERROR("Exception in channel writer: " << e.what());
    }

    // Ends the reader as well; the peer sees EOF after the flushed frames
    shutdown_socket(socket);
    on_io_thread_exit();
}

void TcpByteChannel::reader_loop() {
    socket_t socket = socket_.load();

    try {
        ChannelFrameKind kind;
        std::vector<uint8_t> payload;
        while (receive_channel_frame(socket, kind, payload)) {
            switch (kind) {
                case ChannelFrameKind::TEXT:
                    notify_text_message(std::string(payload.begin(), payload.end()));
                    break;
                case ChannelFrameKind::BINARY:
                    notify_binary_message(payload);
                    break;
                case ChannelFrameKind::CONTROL:
                    LOG_TCPPC_DEBUG("Ignoring control frame on open channel " << label_);
                    break;
            }
        }
    } catch (const std::exception& e) {
        LOG_TCPPC_ERROR("Exception in channel reader: " << e.what());
    }

    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        writer_stop_ = true;
        send_cv_.notify_one();
    }
    shutdown_socket(socket);
    on_io_thread_exit();
}

void TcpByteChannel::on_io_thread_exit() {
    if (io_threads_.fetch_sub(1) != 1) {
        return;
    }
    state_.store(ChannelState::CLOSED);
    LOG_TCPPC_DEBUG("Channel " << label_ << " closed");
    notify_close();
}

//=============================================================================
// TcpPeerConnection
//=============================================================================

TcpPeerConnection::TcpPeerConnection(int connect_timeout_ms)
    : connect_timeout_ms_(connect_timeout_ms),
      local_ufrag_(generate_ufrag()),
      local_pwd_(generate_password()),
      closed_(false), controlling_(false), offer_created_(false), answer_created_(false),
      remote_answer_set_(false), connected_(false),
      listen_socket_(INVALID_SOCKET_VALUE), listen_port_(0) {
}

TcpPeerConnection::~TcpPeerConnection() {
    close();
    shutdown_all_threads();
    join_all_active_threads();

    if (is_valid_socket(listen_socket_)) {
        close_socket(listen_socket_);
        listen_socket_ = INVALID_SOCKET_VALUE;
    }
}

std::shared_ptr<ByteChannel> TcpPeerConnection::create_channel(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || channel_ || answer_created_) {
        LOG_TCPPC_ERROR("Cannot create channel " << label << " on this connection");
        return nullptr;
    }
    label_ = label;
    channel_ = std::make_shared<TcpByteChannel>(label);
    return channel_;
}

std::optional<nlohmann::json> TcpPeerConnection::create_offer() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || !channel_ || answer_created_) {
            LOG_TCPPC_ERROR("Cannot create an offer without a channel request");
            return std::nullopt;
        }
        if (!offer_created_) {
            offer_created_ = true;
            controlling_ = true;
            start_managed_thread("ice-checks", [this]() { connectivity_check_loop(); });
        }
    }

    nlohmann::json offer;
    offer["type"] = "offer";
    offer["ufrag"] = local_ufrag_;
    offer["pwd"] = local_pwd_;
    offer["label"] = label_;
    return offer;
}

std::optional<nlohmann::json> TcpPeerConnection::create_answer(const nlohmann::json& offer) {
    if (!offer.is_object() || get_description_field(offer, "type") != "offer") {
        LOG_TCPPC_WARN("Remote description is not an offer");
        return std::nullopt;
    }
    std::string remote_ufrag = get_description_field(offer, "ufrag");
    std::string remote_pwd = get_description_field(offer, "pwd");
    if (remote_ufrag.empty() || remote_pwd.empty()) {
        LOG_TCPPC_WARN("Offer is missing ICE credentials");
        return std::nullopt;
    }

    std::vector<HostCandidate> candidates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || offer_created_ || answer_created_) {
            LOG_TCPPC_ERROR("Cannot answer on this connection");
            return std::nullopt;
        }

        listen_socket_ = create_tcp_server_v4(0, 4);
        if (!is_valid_socket(listen_socket_)) {
            LOG_TCPPC_ERROR("Failed to create candidate listener");
            return std::nullopt;
        }
        listen_port_ = get_ephemeral_port(listen_socket_);

        answer_created_ = true;
        controlling_ = false;
        remote_ufrag_ = remote_ufrag;
        remote_pwd_ = remote_pwd;
        label_ = get_description_field(offer, "label");
        candidates = gather_host_candidates(listen_port_);

        start_managed_thread("ice-accept", [this]() { accept_loop(); });
    }

    LOG_TCPPC_DEBUG("Listening for connectivity checks on port " << listen_port_
                    << " with " << candidates.size() << " host candidates");
    for (const auto& candidate : candidates) {
        notify_local_candidate(candidate.to_sdp());
    }

    nlohmann::json answer;
    answer["type"] = "answer";
    answer["ufrag"] = local_ufrag_;
    answer["pwd"] = local_pwd_;
    answer["label"] = label_;
    return answer;
}

bool TcpPeerConnection::set_remote_answer(const nlohmann::json& answer) {
    if (!answer.is_object() || get_description_field(answer, "type") != "answer") {
        LOG_TCPPC_WARN("Remote description is not an answer");
        return false;
    }
    std::string remote_ufrag = get_description_field(answer, "ufrag");
    std::string remote_pwd = get_description_field(answer, "pwd");
    if (remote_ufrag.empty() || remote_pwd.empty()) {
        LOG_TCPPC_WARN("Answer is missing ICE credentials");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || !controlling_ || remote_answer_set_) {
            LOG_TCPPC_WARN("Unexpected answer");
            return false;
        }
        remote_ufrag_ = remote_ufrag;
        remote_pwd_ = remote_pwd;
        remote_answer_set_ = true;
    }
    checks_cv_.notify_all();
    return true;
}

bool TcpPeerConnection::add_remote_candidate(const std::string& candidate) {
    auto parsed = HostCandidate::from_sdp(candidate);
    if (!parsed) {
        LOG_TCPPC_WARN("Ignoring unparsable candidate: " << candidate);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!known_candidates_.insert(parsed->address()).second) {
            LOG_TCPPC_DEBUG("Duplicate candidate " << parsed->address());
            return true;
        }
        if (!controlling_ || connected_ || closed_) {
            return true;
        }
        pending_candidates_.push_back(*parsed);
    }
    checks_cv_.notify_all();
    return true;
}

void TcpPeerConnection::close() {
    std::shared_ptr<TcpByteChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        channel = channel_;
        shutdown_socket(listen_socket_);
    }
    checks_cv_.notify_all();

    if (channel) {
        channel->abort();
    }
}

bool TcpPeerConnection::is_controlling() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return controlling_;
}

size_t TcpPeerConnection::remote_candidate_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return known_candidates_.size();
}

int TcpPeerConnection::get_listen_port() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listen_port_;
}

void TcpPeerConnection::connectivity_check_loop() {
    try {
        while (true) {
            HostCandidate candidate;
            std::string ufrag;
            std::string pwd;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                checks_cv_.wait(lock, [this] {
                    return closed_ || (remote_answer_set_ && !pending_candidates_.empty());
                });
                if (closed_) {
                    return;
                }

                auto best = std::max_element(pending_candidates_.begin(), pending_candidates_.end(),
                                             [](const HostCandidate& a, const HostCandidate& b) {
                                                 return a.priority < b.priority;
                                             });
                candidate = *best;
                pending_candidates_.erase(best);
                ufrag = remote_ufrag_;
                pwd = remote_pwd_;
            }

            socket_t socket = try_candidate(candidate, ufrag, pwd);
            if (!is_valid_socket(socket)) {
                continue;
            }

            std::shared_ptr<TcpByteChannel> channel;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_) {
                    close_socket(socket);
                    return;
                }
                connected_ = true;
                pending_candidates_.clear();
                channel = channel_;
            }

            LOG_TCPPC_INFO("Connectivity check succeeded via " << candidate.address());
            channel->attach(socket);
            return;
        }
    } catch (const std::exception& e) {
        LOG_TCPPC_ERROR("Exception in connectivity checks: " << e.what());
    }
}

socket_t TcpPeerConnection::try_candidate(const HostCandidate& candidate, const std::string& ufrag, const std::string& pwd) {
    LOG_TCPPC_DEBUG("Checking candidate " << candidate.address() << " (priority " << candidate.priority << ")");

    socket_t socket = create_tcp_client(candidate.ip, candidate.port, connect_timeout_ms_);
    if (!is_valid_socket(socket)) {
        LOG_TCPPC_DEBUG("Candidate " << candidate.address() << " unreachable");
        return INVALID_SOCKET_VALUE;
    }

    nlohmann::json hello;
    hello["type"] = "hello";
    hello["ufrag"] = ufrag;
    hello["pwd"] = pwd;

    set_socket_receive_timeout(socket, HANDSHAKE_TIMEOUT_MS);
    if (!send_control_message(socket, hello)) {
        close_socket(socket);
        return INVALID_SOCKET_VALUE;
    }

    auto ack = receive_control_message(socket);
    if (!ack || get_description_field(*ack, "type") != "hello-ack" ||
        get_description_field(*ack, "ufrag") != ufrag) {
        LOG_TCPPC_WARN("Candidate " << candidate.address() << " did not acknowledge the hello");
        close_socket(socket);
        return INVALID_SOCKET_VALUE;
    }

    set_socket_receive_timeout(socket, 0);
    set_tcp_nodelay(socket);
    return socket;
}

void TcpPeerConnection::accept_loop() {
    try {
        while (true) {
            socket_t listener;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_ || connected_) {
                    break;
                }
                listener = listen_socket_;
            }

            socket_t client = accept_client(listener);
            if (!is_valid_socket(client)) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!closed_) {
                    LOG_TCPPC_ERROR("Candidate listener failed");
                }
                break;
            }

            if (!authenticate_incoming(client)) {
                close_socket(client);
                continue;
            }

            std::shared_ptr<TcpByteChannel> channel;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_ || connected_) {
                    close_socket(client);
                    break;
                }
                connected_ = true;
                channel = std::make_shared<TcpByteChannel>(label_);
                channel_ = channel;
            }

            // The callback installs channel handlers before any frame is read
            notify_channel(channel);
            channel->attach(client);
            break;
        }
    } catch (const std::exception& e) {
        LOG_TCPPC_ERROR("Exception in candidate listener: " << e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (is_valid_socket(listen_socket_)) {
        close_socket(listen_socket_);
        listen_socket_ = INVALID_SOCKET_VALUE;
    }
}

bool TcpPeerConnection::authenticate_incoming(socket_t client) {
    set_socket_receive_timeout(client, HANDSHAKE_TIMEOUT_MS);

    auto hello = receive_control_message(client);
    if (!hello || get_description_field(*hello, "type") != "hello") {
        LOG_TCPPC_WARN("Connectivity check from " << get_peer_address(client) << " without hello");
        return false;
    }
    if (get_description_field(*hello, "ufrag") != local_ufrag_ ||
        get_description_field(*hello, "pwd") != local_pwd_) {
        LOG_TCPPC_WARN("Connectivity check from " << get_peer_address(client) << " with wrong credentials");
        return false;
    }

    nlohmann::json ack;
    ack["type"] = "hello-ack";
    ack["ufrag"] = local_ufrag_;
    if (!send_control_message(client, ack)) {
        return false;
    }

    set_socket_receive_timeout(client, 0);
    set_tcp_nodelay(client);
    return true;
}

std::vector<HostCandidate> TcpPeerConnection::gather_host_candidates(int port) const {
    std::vector<std::string> addresses = network_utils::get_host_candidate_addresses();

    std::vector<HostCandidate> candidates;
    uint16_t local_preference = 65535;
    for (const auto& ip : addresses) {
        HostCandidate candidate;
        candidate.ip = ip;
        candidate.port = static_cast<uint16_t>(port);
        candidate.component_id = 1;

        bool loopback = network_utils::is_loopback_ipv4(ip);
        candidate.priority = calculate_host_candidate_priority(loopback ? LOOPBACK_LOCAL_PREFERENCE : local_preference--);

        std::hash<std::string> hasher;
        candidate.foundation = std::to_string(hasher("host_tcp_" + ip) % 1000000);
        candidates.push_back(candidate);
    }
    return candidates;
}

std::string TcpPeerConnection::generate_ufrag() {
    const char charset[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, sizeof(charset) - 2);

    std::string ufrag;
    for (int i = 0; i < 8; ++i) {
        ufrag += charset[dis(gen)];
    }
    return ufrag;
}

std::string TcpPeerConnection::generate_password() {
    const char charset[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789+/";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, sizeof(charset) - 2);

    std::string password;
    for (int i = 0; i < 24; ++i) {
        password += charset[dis(gen)];
    }
    return password;
}

std::shared_ptr<PeerConnection> TcpPeerConnectionFactory::create() {
    return std::make_shared<TcpPeerConnection>(connect_timeout_ms_);
}

} // namespace peerdrop
