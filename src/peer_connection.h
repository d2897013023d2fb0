#pragma once

/**
 * @file peer_connection.h
 * @brief Boundary between the transfer protocol and the peer-connection transport
 *
 * A PeerConnection negotiates one direct path to a remote peer through an
 * offer/answer exchange plus any number of candidates, and yields a single
 * ByteChannel: reliable, ordered, carrying text and binary frames.
 *
 * Implementations may invoke callbacks from their own threads. Callers that
 * own single-threaded state must hop to their event loop before touching it.
 */

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace peerdrop {

enum class ChannelState {
    CONNECTING,
    OPEN,
    CLOSING,
    CLOSED
};

std::string channel_state_to_string(ChannelState state);

class ByteChannel {
public:
    using OpenCallback = std::function<void()>;
    using TextMessageCallback = std::function<void(const std::string&)>;
    using BinaryMessageCallback = std::function<void(const std::vector<uint8_t>&)>;
    using BufferedAmountLowCallback = std::function<void()>;
    using CloseCallback = std::function<void()>;

    virtual ~ByteChannel() = default;

    virtual std::string label() const = 0;
    virtual ChannelState state() const = 0;

    /**
     * Queue a text frame. Fails unless the channel is OPEN.
     */
    virtual bool send_text(const std::string& text) = 0;

    /**
     * Queue a binary frame. Fails unless the channel is OPEN.
     */
    virtual bool send_binary(const std::vector<uint8_t>& data) = 0;

    /**
     * Bytes queued locally and not yet handed to the network
     */
    virtual size_t buffered_amount() const = 0;

    /**
     * The buffered-amount-low callback fires when buffered_amount() drops
     * from above this threshold to at or below it.
     */
    virtual void set_buffered_amount_low_threshold(size_t threshold) = 0;

    /**
     * Close gracefully: frames already queued are flushed first.
     */
    virtual void close() = 0;

    void set_open_callback(OpenCallback callback);
    void set_text_message_callback(TextMessageCallback callback);
    void set_binary_message_callback(BinaryMessageCallback callback);
    void set_buffered_amount_low_callback(BufferedAmountLowCallback callback);
    void set_close_callback(CloseCallback callback);

protected:
    void notify_open();
    void notify_text_message(const std::string& text);
    void notify_binary_message(const std::vector<uint8_t>& data);
    void notify_buffered_amount_low();
    void notify_close();

private:
    mutable std::mutex callbacks_mutex_;
    OpenCallback open_callback_;
    TextMessageCallback text_message_callback_;
    BinaryMessageCallback binary_message_callback_;
    BufferedAmountLowCallback buffered_amount_low_callback_;
    CloseCallback close_callback_;
};

class PeerConnection {
public:
    using LocalCandidateCallback = std::function<void(const std::string& candidate)>;
    using ChannelCallback = std::function<void(std::shared_ptr<ByteChannel> channel)>;

    virtual ~PeerConnection() = default;

    /**
     * Request a channel before creating the offer (initiator side only).
     * @return The channel in CONNECTING state, or nullptr if one already exists
     */
    virtual std::shared_ptr<ByteChannel> create_channel(const std::string& label) = 0;

    /**
     * Produce the offer description. Requires create_channel() first.
     */
    virtual std::optional<nlohmann::json> create_offer() = 0;

    /**
     * Ingest a remote offer and produce the answer description.
     */
    virtual std::optional<nlohmann::json> create_answer(const nlohmann::json& offer) = 0;

    /**
     * Ingest the remote answer (initiator side only).
     */
    virtual bool set_remote_answer(const nlohmann::json& answer) = 0;

    /**
     * Ingest a remote candidate. Adding the same candidate twice is a no-op.
     * @return false if the candidate cannot be parsed
     */
    virtual bool add_remote_candidate(const std::string& candidate) = 0;

    /**
     * Abandon negotiation and close the channel, if any.
     */
    virtual void close() = 0;

    void set_local_candidate_callback(LocalCandidateCallback callback);

    /**
     * Responder side: called once with the channel the initiator requested,
     * before any of its frames are delivered.
     */
    void set_channel_callback(ChannelCallback callback);

protected:
    void notify_local_candidate(const std::string& candidate);
    void notify_channel(std::shared_ptr<ByteChannel> channel);

private:
    mutable std::mutex callbacks_mutex_;
    LocalCandidateCallback local_candidate_callback_;
    ChannelCallback channel_callback_;
};

class PeerConnectionFactory {
public:
    virtual ~PeerConnectionFactory() = default;
    virtual std::shared_ptr<PeerConnection> create() = 0;
};

} // namespace peerdrop
