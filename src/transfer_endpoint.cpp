#include "transfer_endpoint.h"
#include "peerdrop_log_macros.h"
#include "signaling_message.h"
#include "fs.h"
#include <chrono>

namespace peerdrop {

TransferEndpoint::TransferEndpoint(EventLoop& loop,
                                   SignalingTransport& signaling,
                                   std::shared_ptr<PeerConnectionFactory> factory,
                                   const EndpointConfig& config,
                                   std::shared_ptr<TransferRecordSink> record_sink)
    : loop_(loop),
      signaling_(signaling),
      config_(config),
      record_sink_(record_sink ? std::move(record_sink) : std::make_shared<LoggingRecordSink>()),
      negotiation_(loop, signaling, std::move(factory), *this,
                   std::chrono::milliseconds(config.negotiation_timeout_ms)),
      alive_(std::make_shared<std::atomic<bool>>(true)) {
}

TransferEndpoint::~TransferEndpoint() {
    alive_->store(false);
    for (auto& entry : sessions_) {
        if (entry.second->offer_timer != 0) {
            loop_.cancel_timer(entry.second->offer_timer);
        }
    }
    negotiation_.close_all();
}

//=============================================================================
// Rooms
//=============================================================================

bool TransferEndpoint::join_room(const std::string& room_id) {
    if (room_id.empty()) {
        LOG_ENDPOINT_WARN("Refusing to join a room with an empty id");
        return false;
    }
    if (!signaling_.send(make_join_room_message(room_id))) {
        LOG_ENDPOINT_ERROR("Failed to send join_room for " << room_id);
        return false;
    }
    LOG_ENDPOINT_DEBUG("Requested to join room " << room_id);
    return true;
}

bool TransferEndpoint::leave_room() {
    if (!signaling_.send(make_leave_room_message())) {
        LOG_ENDPOINT_ERROR("Failed to send leave_room");
        return false;
    }
    return true;
}

void TransferEndpoint::handle_room_users(const nlohmann::json& message) {
    auto users = message.find("users");
    if (users == message.end() || !users->is_array()) {
        LOG_ENDPOINT_WARN("room_users without a users array");
        return;
    }

    std::vector<Identity> peers;
    for (const auto& user : *users) {
        if (!user.is_object()) {
            continue;
        }
        std::string user_id = get_string_field(user, "id");
        if (user_id.empty() || user_id == identity_.user_id) {
            continue;
        }
        peers.emplace_back(user_id, get_string_field(user, "username"), get_string_field(user, "email"));
    }

    std::string room_id = get_string_field(message, "room_id");
    if (!room_id.empty() && current_room_.empty()) {
        current_room_ = room_id;
    }
    peers_ = peers;
    LOG_ENDPOINT_DEBUG("Room " << room_id << " now has " << peers_.size() << " other users");

    if (room_users_callback_) {
        room_users_callback_(room_id, peers_);
    }
}

void TransferEndpoint::handle_room_joined(const nlohmann::json& message) {
    current_room_ = get_string_field(message, "room_id");
    LOG_ENDPOINT_INFO("Joined room " << current_room_);
    if (room_joined_callback_) {
        room_joined_callback_(current_room_);
    }
}

void TransferEndpoint::handle_room_left(const nlohmann::json& message) {
    std::string room_id = get_string_field(message, "room_id");
    current_room_.clear();
    peers_.clear();
    LOG_ENDPOINT_INFO("Left room " << room_id);
    if (room_left_callback_) {
        room_left_callback_(room_id);
    }
}

//=============================================================================
// Transfer handshake
//=============================================================================

std::string TransferEndpoint::send_file(const std::string& target_id, const std::string& file_path) {
    if (identity_.user_id.empty()) {
        LOG_ENDPOINT_ERROR("Cannot send before the relay acknowledged our identity");
        return "";
    }
    if (target_id.empty() || target_id == identity_.user_id) {
        LOG_ENDPOINT_ERROR("Invalid transfer target '" << target_id << "'");
        return "";
    }
    if (!is_file(file_path)) {
        LOG_ENDPOINT_ERROR("Not a readable file: " << file_path);
        return "";
    }
    int64_t file_size = get_file_size(file_path);
    if (file_size < 0) {
        LOG_ENDPOINT_ERROR("Cannot determine size of " << file_path);
        return "";
    }
    if (!admission_available()) {
        LOG_ENDPOINT_WARN("Already at " << config_.max_active_transfers << " active transfers, not sending " << file_path);
        return "";
    }

    auto session = std::make_shared<TransferSession>();
    Transfer& transfer = session->transfer;
    transfer.transfer_id = generate_transfer_id();
    transfer.direction = TransferDirection::OUTGOING;
    transfer.state = TransferState::REQUESTED;
    transfer.file_name = get_filename_from_path(file_path);
    transfer.file_size = static_cast<uint64_t>(file_size);
    transfer.file_type = get_mime_type(file_path);
    transfer.sender_id = identity_.user_id;
    transfer.receiver_id = target_id;
    transfer.local_path = file_path;

    nlohmann::json request = make_transfer_request_message(target_id, transfer.transfer_id,
                                                           transfer.file_name, transfer.file_size, transfer.file_type);
    if (!signaling_.send(request)) {
        LOG_ENDPOINT_ERROR("Failed to send transfer request for " << file_path);
        return "";
    }

    sessions_[transfer.transfer_id] = session;
    LOG_ENDPOINT_INFO("Requested transfer " << transfer.transfer_id << " of " << transfer.file_name
                      << " (" << transfer.file_size << " bytes) to " << target_id);
    return transfer.transfer_id;
}

bool TransferEndpoint::accept_transfer(const std::string& transfer_id) {
    SessionPtr session = find_session(transfer_id);
    if (!session || session->transfer.direction != TransferDirection::INCOMING ||
        session->transfer.state != TransferState::PENDING) {
        LOG_ENDPOINT_WARN("No pending incoming transfer " << transfer_id);
        return false;
    }

    if (!signaling_.send(make_transfer_response_message(session->transfer.sender_id, transfer_id, true))) {
        fail(session, "could not send acceptance");
        return false;
    }

    session->transfer.state = TransferState::ACCEPTED;
    start_offer_timer(session);
    LOG_ENDPOINT_INFO("Accepted transfer " << transfer_id << " of " << session->transfer.file_name);
    return true;
}

bool TransferEndpoint::reject_transfer(const std::string& transfer_id) {
    SessionPtr session = find_session(transfer_id);
    if (!session || session->transfer.direction != TransferDirection::INCOMING ||
        session->transfer.state != TransferState::PENDING) {
        LOG_ENDPOINT_WARN("No pending incoming transfer " << transfer_id);
        return false;
    }

    if (!signaling_.send(make_transfer_response_message(session->transfer.sender_id, transfer_id, false))) {
        LOG_ENDPOINT_WARN("Could not deliver rejection of " << transfer_id);
    }
    reject(session, "rejected locally");
    return true;
}

bool TransferEndpoint::cancel_transfer(const std::string& transfer_id) {
    SessionPtr session = find_session(transfer_id);
    if (!session) {
        return false;
    }
    if (session->transfer.direction == TransferDirection::INCOMING &&
        session->transfer.state == TransferState::PENDING) {
        return reject_transfer(transfer_id);
    }
    fail(session, "cancelled");
    return true;
}

void TransferEndpoint::handle_transfer_request(const nlohmann::json& message) {
    std::string from = get_string_field(message, "from");
    std::string transfer_id = get_string_field(message, "transfer_id");
    auto file_size = message.find("fileSize");
    if (from.empty() || transfer_id.empty() || file_size == message.end() || !file_size->is_number_unsigned()) {
        LOG_ENDPOINT_WARN("Dropping malformed transfer request");
        return;
    }
    if (sessions_.count(transfer_id) > 0) {
        LOG_ENDPOINT_WARN("Dropping repeated transfer request " << transfer_id);
        return;
    }

    Transfer transfer;
    transfer.transfer_id = transfer_id;
    transfer.direction = TransferDirection::INCOMING;
    transfer.state = TransferState::PENDING;
    transfer.file_name = get_string_field(message, "fileName");
    transfer.file_size = file_size->get<uint64_t>();
    transfer.file_type = get_string_field(message, "fileType");
    transfer.sender_id = from;
    transfer.receiver_id = identity_.user_id;
    if (transfer.file_type.empty()) {
        transfer.file_type = "application/octet-stream";
    }

    if (!admission_available()) {
        LOG_ENDPOINT_INFO("Busy, rejecting transfer " << transfer_id << " from " << from);
        if (!signaling_.send(make_transfer_response_message(from, transfer_id, false))) {
            LOG_ENDPOINT_WARN("Could not deliver rejection of " << transfer_id);
        }
        transfer.state = TransferState::REJECTED;
        transfer.error_message = "too many active transfers";
        finished_.push_back(transfer);
        if (finished_.size() > MAX_FINISHED_TRANSFERS) {
            finished_.pop_front();
        }
        return;
    }

    auto session = std::make_shared<TransferSession>();
    session->transfer = transfer;
    sessions_[transfer_id] = session;

    LOG_ENDPOINT_INFO("Incoming transfer " << transfer_id << " from " << from << ": "
                      << transfer.file_name << " (" << transfer.file_size << " bytes, " << transfer.file_type << ")");
    if (incoming_request_callback_) {
        incoming_request_callback_(session->transfer);
    }
}

void TransferEndpoint::handle_transfer_response(const nlohmann::json& message) {
    std::string from = get_string_field(message, "from");
    std::string transfer_id = get_string_field(message, "transfer_id");
    SessionPtr session = find_session(transfer_id);
    if (!session || session->transfer.direction != TransferDirection::OUTGOING ||
        session->transfer.state != TransferState::REQUESTED || session->transfer.receiver_id != from) {
        LOG_ENDPOINT_WARN("Dropping transfer response from " << from << " for unknown transfer " << transfer_id);
        return;
    }

    auto accepted = message.find("accepted");
    if (accepted == message.end() || !accepted->is_boolean() || !accepted->get<bool>()) {
        LOG_ENDPOINT_INFO("Transfer " << transfer_id << " rejected by " << from);
        reject(session, "rejected by peer");
        return;
    }

    LOG_ENDPOINT_INFO("Transfer " << transfer_id << " accepted by " << from << ", negotiating");
    session->transfer.state = TransferState::NEGOTIATING;
    if (!negotiation_.start_initiator(transfer_id, from)) {
        fail(session, "could not start negotiation");
    }
}

//=============================================================================
// Negotiation messages
//=============================================================================

void TransferEndpoint::handle_offer(const nlohmann::json& message) {
    std::string from = get_string_field(message, "from");
    std::string transfer_id = get_string_field(message, "transfer_id");
    SessionPtr session = find_session(transfer_id);

    // Only an offer for a transfer we accepted, from its sender, starts negotiation
    if (!session || session->transfer.direction != TransferDirection::INCOMING ||
        session->transfer.state != TransferState::ACCEPTED || session->transfer.sender_id != from) {
        LOG_ENDPOINT_WARN("Dropping unsolicited offer from " << from << " for transfer " << transfer_id);
        return;
    }

    auto offer = message.find("offer");
    if (offer == message.end() || !offer->is_object()) {
        LOG_ENDPOINT_WARN("Dropping offer without a description for transfer " << transfer_id);
        return;
    }

    if (session->offer_timer != 0) {
        loop_.cancel_timer(session->offer_timer);
        session->offer_timer = 0;
    }
    session->transfer.state = TransferState::NEGOTIATING;

    if (!negotiation_.handle_offer(transfer_id, from, *offer)) {
        fail(session, "could not answer offer");
    }
}

void TransferEndpoint::handle_answer(const nlohmann::json& message) {
    std::string from = get_string_field(message, "from");
    std::string transfer_id = get_string_field(message, "transfer_id");
    SessionPtr session = find_session(transfer_id);
    if (!session || session->transfer.direction != TransferDirection::OUTGOING ||
        session->transfer.state != TransferState::NEGOTIATING) {
        LOG_ENDPOINT_WARN("Dropping answer from " << from << " for transfer " << transfer_id);
        return;
    }

    auto answer = message.find("answer");
    if (answer == message.end() || !answer->is_object()) {
        LOG_ENDPOINT_WARN("Dropping answer without a description for transfer " << transfer_id);
        return;
    }
    negotiation_.handle_answer(transfer_id, from, *answer);
}

void TransferEndpoint::handle_ice_candidate(const nlohmann::json& message) {
    std::string from = get_string_field(message, "from");
    std::string transfer_id = get_string_field(message, "transfer_id");
    SessionPtr session = find_session(transfer_id);
    if (!session || (session->transfer.state != TransferState::NEGOTIATING &&
                     session->transfer.state != TransferState::TRANSFERRING)) {
        LOG_ENDPOINT_WARN("Dropping candidate from " << from << " for transfer " << transfer_id);
        return;
    }

    // Browsers send {candidate, sdpMid, sdpMLineIndex}; the candidate line is what matters
    std::string candidate;
    auto field = message.find("candidate");
    if (field != message.end() && field->is_string()) {
        candidate = field->get<std::string>();
    } else if (field != message.end() && field->is_object()) {
        candidate = get_string_field(*field, "candidate");
    }
    if (candidate.empty()) {
        LOG_ENDPOINT_DEBUG("Ignoring empty candidate for transfer " << transfer_id);
        return;
    }

    negotiation_.handle_ice_candidate(transfer_id, from, candidate);
}

void TransferEndpoint::handle_signaling_message(const nlohmann::json& message) {
    switch (get_message_type(message)) {
        case SignalingMessageType::AUTH_OK: {
            auto user = message.find("user");
            if (user != message.end() && user->is_object()) {
                identity_ = Identity(get_string_field(*user, "id"), get_string_field(*user, "username"),
                                     get_string_field(*user, "email"));
            }
            break;
        }
        case SignalingMessageType::ROOM_USERS:
            handle_room_users(message);
            break;
        case SignalingMessageType::ROOM_JOINED:
            handle_room_joined(message);
            break;
        case SignalingMessageType::ROOM_LEFT:
            handle_room_left(message);
            break;
        case SignalingMessageType::TRANSFER_REQUEST:
            handle_transfer_request(message);
            break;
        case SignalingMessageType::TRANSFER_RESPONSE:
            handle_transfer_response(message);
            break;
        case SignalingMessageType::OFFER:
            handle_offer(message);
            break;
        case SignalingMessageType::ANSWER:
            handle_answer(message);
            break;
        case SignalingMessageType::ICE_CANDIDATE:
            handle_ice_candidate(message);
            break;
        default:
            LOG_ENDPOINT_WARN("Ignoring signaling message of type " << get_string_field(message, "type"));
            break;
    }
}

void TransferEndpoint::handle_signaling_closed() {
    LOG_ENDPOINT_WARN("Signaling connection closed, abandoning " << get_active_transfer_count() << " transfers");

    std::vector<SessionPtr> active;
    for (const auto& entry : sessions_) {
        active.push_back(entry.second);
    }
    for (const auto& session : active) {
        fail(session, "signaling connection lost");
    }

    current_room_.clear();
    peers_.clear();
}

//=============================================================================
// Channel events
//=============================================================================

void TransferEndpoint::on_channel_open(const std::string& transfer_id, const std::shared_ptr<ByteChannel>& channel) {
    SessionPtr session = find_session(transfer_id);
    if (!session) {
        negotiation_.close(transfer_id);
        return;
    }

    if (session->transfer.direction == TransferDirection::OUTGOING) {
        start_sending(session, channel);
    } else {
        LOG_ENDPOINT_DEBUG("Channel for incoming transfer " << transfer_id << " open, waiting for file-meta");
    }
}

void TransferEndpoint::on_channel_text(const std::string& transfer_id, const std::string& text) {
    SessionPtr session = find_session(transfer_id);
    if (!session || session->transfer.direction != TransferDirection::INCOMING) {
        LOG_ENDPOINT_DEBUG("Ignoring text frame for transfer " << transfer_id);
        return;
    }

    auto frame = parse_control_frame(text);
    if (!frame) {
        LOG_ENDPOINT_WARN("Dropping malformed control frame on transfer " << transfer_id);
        return;
    }

    if (frame->type == ControlFrameType::FILE_META) {
        handle_file_meta(session, frame->meta);
    } else {
        handle_file_end(session);
    }
}

void TransferEndpoint::on_channel_binary(const std::string& transfer_id, const std::vector<uint8_t>& data) {
    SessionPtr session = find_session(transfer_id);
    if (!session || session->transfer.direction != TransferDirection::INCOMING) {
        return;
    }
    if (!session->meta_received) {
        fail(session, "data arrived before file-meta");
        return;
    }
    if (!session->reassembly.append(data)) {
        fail(session, "received more data than the declared " + std::to_string(session->reassembly.expected_size()) + " bytes");
        return;
    }

    session->transfer.bytes_transferred = session->reassembly.received_bytes();
    session->transfer.progress = session->reassembly.progress();
    report_progress(session);
}

void TransferEndpoint::on_channel_buffered_amount_low(const std::string& transfer_id) {
    SessionPtr session = find_session(transfer_id);
    if (session && session->sender) {
        session->sender->on_buffered_amount_low();
    }
}

void TransferEndpoint::on_channel_closed(const std::string& transfer_id) {
    SessionPtr session = find_session(transfer_id);
    if (!session) {
        return;
    }

    if (session->sender) {
        session->sender->on_channel_closed();
        return;
    }
    fail(session, "channel closed before file-end");
}

void TransferEndpoint::on_negotiation_failed(const std::string& transfer_id, const std::string& reason) {
    SessionPtr session = find_session(transfer_id);
    if (session) {
        fail(session, "negotiation failed: " + reason);
    }
}

//=============================================================================
// Sending
//=============================================================================

void TransferEndpoint::start_sending(const SessionPtr& session, const std::shared_ptr<ByteChannel>& channel) {
    Transfer& transfer = session->transfer;

    FileMeta meta;
    meta.file_name = transfer.file_name;
    meta.file_size = transfer.file_size;
    meta.file_type = transfer.file_type;
    meta.sender_id = identity_.user_id;

    session->sender = std::make_unique<ChunkSender>(channel, transfer.local_path, meta, config_.chunk_size,
                                                    config_.send_high_water_mark, config_.send_low_water_mark);

    std::string transfer_id = transfer.transfer_id;
    session->sender->set_progress_callback([this, transfer_id](uint64_t bytes_sent, int progress) {
        SessionPtr current = find_session(transfer_id);
        if (!current) {
            return;
        }
        current->transfer.bytes_transferred = bytes_sent;
        current->transfer.progress = progress;
        report_progress(current);
    });
    session->sender->set_finished_callback([this, transfer_id]() {
        SessionPtr current = find_session(transfer_id);
        if (current) {
            complete(current);
        }
    });
    session->sender->set_failure_callback([this, transfer_id](const std::string& reason) {
        SessionPtr current = find_session(transfer_id);
        if (current) {
            fail(current, reason);
        }
    });

    transfer.state = TransferState::TRANSFERRING;
    LOG_ENDPOINT_INFO("Sending " << transfer.file_name << " for transfer " << transfer_id);
    session->sender->start();
}

//=============================================================================
// Receiving
//=============================================================================

void TransferEndpoint::handle_file_meta(const SessionPtr& session, const FileMeta& meta) {
    Transfer& transfer = session->transfer;
    if (session->meta_received) {
        fail(session, "repeated file-meta");
        return;
    }
    if (meta.file_size != transfer.file_size) {
        LOG_ENDPOINT_WARN("file-meta declares " << meta.file_size << " bytes, request declared " << transfer.file_size);
    }
    if (meta.sender_id != transfer.sender_id) {
        LOG_ENDPOINT_WARN("file-meta names sender '" << meta.sender_id << "', transfer " << transfer.transfer_id
                          << " was requested by '" << transfer.sender_id << "'");
    }

    session->meta_received = true;
    session->reassembly.begin(meta.file_size);
    transfer.file_name = meta.file_name;
    transfer.file_size = meta.file_size;
    transfer.file_type = meta.file_type;
    transfer.bytes_transferred = 0;
    transfer.progress = 0;
    transfer.state = TransferState::TRANSFERRING;

    LOG_ENDPOINT_INFO("Receiving " << meta.file_name << " (" << meta.file_size << " bytes) for transfer " << transfer.transfer_id);
    report_progress(session);
}

void TransferEndpoint::handle_file_end(const SessionPtr& session) {
    if (!session->meta_received) {
        fail(session, "file-end before file-meta");
        return;
    }

    if (!create_directories(config_.download_directory)) {
        fail(session, "cannot create download directory " + config_.download_directory);
        return;
    }

    std::string artifact_path = make_artifact_path(session->transfer.file_name);
    std::string error;
    if (!session->reassembly.finalize(artifact_path, error)) {
        fail(session, error);
        return;
    }

    session->transfer.local_path = artifact_path;
    session->transfer.bytes_transferred = session->transfer.file_size;
    complete(session);
}

void TransferEndpoint::start_offer_timer(const SessionPtr& session) {
    std::string transfer_id = session->transfer.transfer_id;
    auto alive = alive_;
    session->offer_timer = loop_.post_delayed(std::chrono::milliseconds(config_.negotiation_timeout_ms),
                                              [this, alive, transfer_id]() {
        if (!alive->load()) {
            return;
        }
        SessionPtr current = find_session(transfer_id);
        if (current && current->transfer.state == TransferState::ACCEPTED) {
            current->offer_timer = 0;
            fail(current, "no offer received within " + std::to_string(config_.negotiation_timeout_ms) + " ms");
        }
    });
}

std::string TransferEndpoint::make_artifact_path(const std::string& file_name) const {
    // Only the base name is used so a path in fileName cannot leave the download directory
    std::string base = get_filename_from_path(file_name);
    if (base.empty() || base == "." || base == "..") {
        base = "download";
    }

    std::string path = combine_paths(config_.download_directory, base);
    std::string stem = get_file_stem(base);
    std::string extension = get_file_extension(base);
    for (int n = 1; file_exists(path); ++n) {
        path = combine_paths(config_.download_directory, stem + " (" + std::to_string(n) + ")" + extension);
    }
    return path;
}

//=============================================================================
// State transitions
//=============================================================================

void TransferEndpoint::report_progress(const SessionPtr& session) {
    if (progress_callback_) {
        progress_callback_(session->transfer);
    }
}

void TransferEndpoint::complete(const SessionPtr& session) {
    Transfer& transfer = session->transfer;
    transfer.state = TransferState::DONE;
    transfer.progress = 100;
    finish_session(session);

    LOG_ENDPOINT_INFO("Transfer " << transfer.transfer_id << " of " << transfer.file_name << " done");
    report_progress(session);

    if (transfer.direction == TransferDirection::INCOMING) {
        persist_record(transfer);
    }
    if (completed_callback_) {
        completed_callback_(transfer, transfer.local_path);
    }
}

void TransferEndpoint::reject(const SessionPtr& session, const std::string& reason) {
    session->transfer.state = TransferState::REJECTED;
    session->transfer.error_message = reason;
    finish_session(session);

    if (rejected_callback_) {
        rejected_callback_(session->transfer);
    }
}

void TransferEndpoint::fail(const SessionPtr& session, const std::string& reason) {
    if (session->transfer.is_terminal()) {
        return;
    }
    session->transfer.state = TransferState::FAILED;
    session->transfer.error_message = reason;
    session->reassembly.discard();
    finish_session(session);

    LOG_ENDPOINT_WARN("Transfer " << session->transfer.transfer_id << " failed: " << reason);
    if (failed_callback_) {
        failed_callback_(session->transfer);
    }
}

void TransferEndpoint::finish_session(const SessionPtr& session) {
    const std::string& transfer_id = session->transfer.transfer_id;

    auto it = sessions_.find(transfer_id);
    if (it != sessions_.end() && it->second == session) {
        sessions_.erase(it);
    }
    if (session->offer_timer != 0) {
        loop_.cancel_timer(session->offer_timer);
        session->offer_timer = 0;
    }
    negotiation_.close(transfer_id);

    finished_.push_back(session->transfer);
    if (finished_.size() > MAX_FINISHED_TRANSFERS) {
        finished_.pop_front();
    }
}

void TransferEndpoint::persist_record(const Transfer& transfer) {
    TransferRecord record;
    record.transfer_id = transfer.transfer_id;
    record.file_name = transfer.file_name;
    record.file_size = transfer.file_size;
    record.file_type = transfer.file_type;
    record.sender_id = transfer.sender_id;
    record.receiver_id = transfer.receiver_id;
    record.timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    if (!record_sink_->persist(record)) {
        LOG_ENDPOINT_WARN("Failed to persist record of transfer " << transfer.transfer_id);
    }
}

//=============================================================================
// Queries
//=============================================================================

std::optional<Transfer> TransferEndpoint::get_transfer(const std::string& transfer_id) const {
    SessionPtr session = find_session(transfer_id);
    if (!session) {
        return std::nullopt;
    }
    return session->transfer;
}

std::vector<Transfer> TransferEndpoint::get_transfers() const {
    std::vector<Transfer> transfers;
    for (const auto& entry : sessions_) {
        transfers.push_back(entry.second->transfer);
    }
    return transfers;
}

std::vector<Transfer> TransferEndpoint::get_finished_transfers() const {
    return std::vector<Transfer>(finished_.begin(), finished_.end());
}

size_t TransferEndpoint::get_active_transfer_count() const {
    return sessions_.size();
}

TransferEndpoint::SessionPtr TransferEndpoint::find_session(const std::string& transfer_id) const {
    auto it = sessions_.find(transfer_id);
    return it != sessions_.end() ? it->second : nullptr;
}

bool TransferEndpoint::admission_available() const {
    return sessions_.size() < config_.max_active_transfers;
}

} // namespace peerdrop
