#include "peer_connection.h"

namespace peerdrop {

std::string channel_state_to_string(ChannelState state) {
    switch (state) {
        case ChannelState::CONNECTING: return "connecting";
        case ChannelState::OPEN: return "open";
        case ChannelState::CLOSING: return "closing";
        case ChannelState::CLOSED: return "closed";
        default: return "unknown";
    }
}

//=============================================================================
// ByteChannel
//=============================================================================

void ByteChannel::set_open_callback(OpenCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    open_callback_ = std::move(callback);
}

void ByteChannel::set_text_message_callback(TextMessageCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    text_message_callback_ = std::move(callback);
}

void ByteChannel::set_binary_message_callback(BinaryMessageCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    binary_message_callback_ = std::move(callback);
}

void ByteChannel::set_buffered_amount_low_callback(BufferedAmountLowCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    buffered_amount_low_callback_ = std::move(callback);
}

void ByteChannel::set_close_callback(CloseCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    close_callback_ = std::move(callback);
}

// Callbacks are copied out so they run without the lock held

void ByteChannel::notify_open() {
    OpenCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = open_callback_;
    }
    if (callback) {
        callback();
    }
}

void ByteChannel::notify_text_message(const std::string& text) {
    TextMessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = text_message_callback_;
    }
    if (callback) {
        callback(text);
    }
}

void ByteChannel::notify_binary_message(const std::vector<uint8_t>& data) {
    BinaryMessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = binary_message_callback_;
    }
    if (callback) {
        callback(data);
    }
}

void ByteChannel::notify_buffered_amount_low() {
    BufferedAmountLowCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = buffered_amount_low_callback_;
    }
    if (callback) {
        callback();
    }
}

void ByteChannel::notify_close() {
    CloseCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = close_callback_;
    }
    if (callback) {
        callback();
    }
}

//=============================================================================
// PeerConnection
//=============================================================================

void PeerConnection::set_local_candidate_callback(LocalCandidateCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    local_candidate_callback_ = std::move(callback);
}

void PeerConnection::set_channel_callback(ChannelCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    channel_callback_ = std::move(callback);
}

void PeerConnection::notify_local_candidate(const std::string& candidate) {
    LocalCandidateCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = local_candidate_callback_;
    }
    if (callback) {
        callback(candidate);
    }
}

void PeerConnection::notify_channel(std::shared_ptr<ByteChannel> channel) {
    ChannelCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = channel_callback_;
    }
    if (callback) {
        callback(std::move(channel));
    }
}

} // namespace peerdrop
