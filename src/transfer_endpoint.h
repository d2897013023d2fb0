#pragma once

/**
 * @file transfer_endpoint.h
 * @brief Per-user actor: room presence, transfer handshake, negotiation and chunk streaming
 *
 * Every method must be called on the thread that drives the endpoint's
 * EventLoop; signaling messages and channel events arrive there as posted
 * tasks. Transfers are keyed by transfer id, each with its own negotiation
 * context and channel.
 */

#include "config.h"
#include "event_loop.h"
#include "identity.h"
#include "negotiation.h"
#include "chunk_protocol.h"
#include "reassembly.h"
#include "signaling_client.h"
#include "transfer.h"
#include "transfer_record.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerdrop {

class TransferEndpoint : public NegotiationListener {
public:
    using RoomUsersCallback = std::function<void(const std::string& room_id, const std::vector<Identity>& users)>;
    using RoomCallback = std::function<void(const std::string& room_id)>;
    using TransferCallback = std::function<void(const Transfer& transfer)>;
    using CompletedCallback = std::function<void(const Transfer& transfer, const std::string& artifact_path)>;

    /// Finished transfers kept for get_finished_transfers()
    static constexpr size_t MAX_FINISHED_TRANSFERS = 64;

    TransferEndpoint(EventLoop& loop,
                     SignalingTransport& signaling,
                     std::shared_ptr<PeerConnectionFactory> factory,
                     const EndpointConfig& config,
                     std::shared_ptr<TransferRecordSink> record_sink = nullptr);
    ~TransferEndpoint() override;

    TransferEndpoint(const TransferEndpoint&) = delete;
    TransferEndpoint& operator=(const TransferEndpoint&) = delete;

    /**
     * Our own identity as acknowledged by the relay; its id is the senderId of file-meta.
     */
    void set_local_identity(const Identity& identity) { identity_ = identity; }
    const Identity& get_local_identity() const { return identity_; }

    // Rooms
    bool join_room(const std::string& room_id);
    bool leave_room();
    const std::vector<Identity>& get_peers() const { return peers_; }
    const std::string& get_current_room() const { return current_room_; }

    // Transfers
    /**
     * Request sending a file to a peer.
     * @return The new transfer id, or an empty string if the request could not be made
     */
    std::string send_file(const std::string& target_id, const std::string& file_path);

    bool accept_transfer(const std::string& transfer_id);
    bool reject_transfer(const std::string& transfer_id);

    /**
     * Abandon a transfer locally. A pending incoming request is rejected instead.
     */
    bool cancel_transfer(const std::string& transfer_id);

    std::optional<Transfer> get_transfer(const std::string& transfer_id) const;

    /**
     * Transfers that have not reached a terminal state
     */
    std::vector<Transfer> get_transfers() const;

    /**
     * Most recent terminal transfers, oldest first
     */
    std::vector<Transfer> get_finished_transfers() const;

    size_t get_active_transfer_count() const;

    // Signaling input
    void handle_signaling_message(const nlohmann::json& message);

    /**
     * The relay connection ended: every unfinished transfer fails.
     */
    void handle_signaling_closed();

    // Callbacks, invoked on the event loop thread
    void set_room_users_callback(RoomUsersCallback callback) { room_users_callback_ = std::move(callback); }
    void set_room_joined_callback(RoomCallback callback) { room_joined_callback_ = std::move(callback); }
    void set_room_left_callback(RoomCallback callback) { room_left_callback_ = std::move(callback); }
    void set_incoming_request_callback(TransferCallback callback) { incoming_request_callback_ = std::move(callback); }
    void set_progress_callback(TransferCallback callback) { progress_callback_ = std::move(callback); }
    void set_completed_callback(CompletedCallback callback) { completed_callback_ = std::move(callback); }
    void set_rejected_callback(TransferCallback callback) { rejected_callback_ = std::move(callback); }
    void set_failed_callback(TransferCallback callback) { failed_callback_ = std::move(callback); }

    // NegotiationListener
    void on_channel_open(const std::string& transfer_id, const std::shared_ptr<ByteChannel>& channel) override;
    void on_channel_text(const std::string& transfer_id, const std::string& text) override;
    void on_channel_binary(const std::string& transfer_id, const std::vector<uint8_t>& data) override;
    void on_channel_buffered_amount_low(const std::string& transfer_id) override;
    void on_channel_closed(const std::string& transfer_id) override;
    void on_negotiation_failed(const std::string& transfer_id, const std::string& reason) override;

private:
    struct TransferSession {
        Transfer transfer;
        std::unique_ptr<ChunkSender> sender;
        ReassemblyBuffer reassembly;
        bool meta_received;
        EventLoop::TimerId offer_timer;

        TransferSession() : meta_received(false), offer_timer(0) {}
    };
    using SessionPtr = std::shared_ptr<TransferSession>;

    // Signaling handlers
    void handle_room_users(const nlohmann::json& message);
    void handle_room_joined(const nlohmann::json& message);
    void handle_room_left(const nlohmann::json& message);
    void handle_transfer_request(const nlohmann::json& message);
    void handle_transfer_response(const nlohmann::json& message);
    void handle_offer(const nlohmann::json& message);
    void handle_answer(const nlohmann::json& message);
    void handle_ice_candidate(const nlohmann::json& message);

    // Receiving side
    void handle_file_meta(const SessionPtr& session, const FileMeta& meta);
    void handle_file_end(const SessionPtr& session);
    void start_offer_timer(const SessionPtr& session);
    std::string make_artifact_path(const std::string& file_name) const;

    // Sending side
    void start_sending(const SessionPtr& session, const std::shared_ptr<ByteChannel>& channel);

    // State transitions
    void report_progress(const SessionPtr& session);
    void complete(const SessionPtr& session);
    void reject(const SessionPtr& session, const std::string& reason);
    void fail(const SessionPtr& session, const std::string& reason);
    void finish_session(const SessionPtr& session);
    void persist_record(const Transfer& transfer);

    SessionPtr find_session(const std::string& transfer_id) const;
    bool admission_available() const;

    EventLoop& loop_;
    SignalingTransport& signaling_;
    EndpointConfig config_;
    std::shared_ptr<TransferRecordSink> record_sink_;
    NegotiationEngine negotiation_;

    Identity identity_;
    std::string current_room_;
    std::vector<Identity> peers_;

    std::unordered_map<std::string, SessionPtr> sessions_;
    std::deque<Transfer> finished_;

    RoomUsersCallback room_users_callback_;
    RoomCallback room_joined_callback_;
    RoomCallback room_left_callback_;
    TransferCallback incoming_request_callback_;
    TransferCallback progress_callback_;
    CompletedCallback completed_callback_;
    TransferCallback rejected_callback_;
    TransferCallback failed_callback_;

    std::shared_ptr<std::atomic<bool>> alive_;
};

} // namespace peerdrop
