#pragma once

/**
 * @file chunk_protocol.h
 * @brief Frames exchanged over a transfer's ByteChannel
 *
 * Text frames carry control messages, binary frames carry file data:
 *   file-meta {fileName, fileSize, fileType, senderId}
 *   binary slice * N      (in file offset order, at most chunk_size bytes each)
 *   file-end {}
 */

#include "peer_connection.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace peerdrop {

struct FileMeta {
    std::string file_name;
    uint64_t file_size;
    std::string file_type;
    std::string sender_id;

    FileMeta() : file_size(0) {}
};

enum class ControlFrameType {
    FILE_META,
    FILE_END
};

struct ControlFrame {
    ControlFrameType type;
    FileMeta meta;      // FILE_META only
};

std::string encode_file_meta(const FileMeta& meta);
std::string encode_file_end();

/**
 * Parse a text frame.
 * @return std::nullopt for malformed JSON, unknown types or invalid file-meta fields
 */
std::optional<ControlFrame> parse_control_frame(const std::string& text);

/**
 * Streams one file over an open channel with flow control.
 *
 * Slices are queued only while the channel's buffered amount is below the
 * high water mark; sending resumes from on_buffered_amount_low(), which the
 * owner calls when the channel drains to the low water mark. The transfer is
 * finished once file-end has been handed to the network.
 *
 * Single-threaded: all calls come from the owner's event loop.
 */
class ChunkSender {
public:
    using ProgressCallback = std::function<void(uint64_t bytes_sent, int progress)>;
    using FinishedCallback = std::function<void()>;
    using FailureCallback = std::function<void(const std::string& reason)>;

    ChunkSender(std::shared_ptr<ByteChannel> channel,
                const std::string& file_path,
                const FileMeta& meta,
                size_t chunk_size,
                size_t high_water_mark,
                size_t low_water_mark);

    /**
     * Send file-meta and begin streaming.
     * @return false if the channel rejected file-meta
     */
    bool start();

    void on_buffered_amount_low();

    /**
     * The channel closed. Fails unless everything was already handed off.
     */
    void on_channel_closed();

    bool is_finished() const { return phase_ == Phase::FINISHED; }
    bool is_failed() const { return phase_ == Phase::FAILED; }
    uint64_t bytes_sent() const { return bytes_sent_; }
    int progress() const { return progress_; }

    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }
    void set_finished_callback(FinishedCallback callback) { finished_callback_ = std::move(callback); }
    void set_failure_callback(FailureCallback callback) { failure_callback_ = std::move(callback); }

private:
    enum class Phase {
        IDLE,
        STREAMING,
        DRAINING,
        FINISHED,
        FAILED
    };

    void pump();
    void begin_draining();
    void finish();
    void fail(const std::string& reason);

    std::shared_ptr<ByteChannel> channel_;
    std::string file_path_;
    FileMeta meta_;
    size_t chunk_size_;
    size_t high_water_mark_;
    size_t low_water_mark_;

    Phase phase_;
    uint64_t bytes_sent_;
    int progress_;

    ProgressCallback progress_callback_;
    FinishedCallback finished_callback_;
    FailureCallback failure_callback_;
};

} // namespace peerdrop
