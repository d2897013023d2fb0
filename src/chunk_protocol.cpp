#include "chunk_protocol.h"
#include "fs.h"
#include "transfer.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <vector>

// Chunk protocol module logging macros
#define LOG_CHUNK_DEBUG(message) LOG_DEBUG("chunks", message)
#define LOG_CHUNK_INFO(message)  LOG_INFO("chunks", message)
#define LOG_CHUNK_WARN(message)  LOG_WARN("chunks", message)
#define LOG_CHUNK_ERROR(message) LOG_ERROR("chunks", message)

namespace peerdrop {

std::string encode_file_meta(const FileMeta& meta) {
    nlohmann::json frame;
    frame["type"] = "file-meta";
    frame["fileName"] = meta.file_name;
    frame["fileSize"] = meta.file_size;
    frame["fileType"] = meta.file_type;
    frame["senderId"] = meta.sender_id;
    return frame.dump();
}

std::string encode_file_end() {
    nlohmann::json frame;
    frame["type"] = "file-end";
    return frame.dump();
}

std::optional<ControlFrame> parse_control_frame(const std::string& text) {
    try {
        nlohmann::json frame = nlohmann::json::parse(text);
        if (!frame.is_object() || !frame.contains("type") || !frame["type"].is_string()) {
            LOG_CHUNK_WARN("Control frame without a type");
            return std::nullopt;
        }

        std::string type = frame["type"].get<std::string>();
        ControlFrame result;

        if (type == "file-end") {
            result.type = ControlFrameType::FILE_END;
            return result;
        }

        if (type == "file-meta") {
            if (!frame.contains("fileSize") || !frame["fileSize"].is_number_unsigned()) {
                LOG_CHUNK_WARN("file-meta without a valid fileSize");
                return std::nullopt;
            }
            result.type = ControlFrameType::FILE_META;
            result.meta.file_name = frame.value("fileName", "");
            result.meta.file_size = frame["fileSize"].get<uint64_t>();
            result.meta.file_type = frame.value("fileType", "application/octet-stream");
            result.meta.sender_id = frame.value("senderId", "");
            if (result.meta.file_name.empty()) {
                LOG_CHUNK_WARN("file-meta without a fileName");
                return std::nullopt;
            }
            return result;
        }

        LOG_CHUNK_WARN("Unknown control frame type: " << type);
        return std::nullopt;
    } catch (const nlohmann::json::exception& e) {
        LOG_CHUNK_WARN("Malformed control frame: " << e.what());
        return std::nullopt;
    }
}

//=============================================================================
// ChunkSender
//=============================================================================

ChunkSender::ChunkSender(std::shared_ptr<ByteChannel> channel,
                         const std::string& file_path,
                         const FileMeta& meta,
                         size_t chunk_size,
                         size_t high_water_mark,
                         size_t low_water_mark)
    : channel_(std::move(channel)), file_path_(file_path), meta_(meta),
      chunk_size_(chunk_size), high_water_mark_(high_water_mark), low_water_mark_(low_water_mark),
      phase_(Phase::IDLE), bytes_sent_(0), progress_(0) {
}

bool ChunkSender::start() {
    if (phase_ != Phase::IDLE) {
        return false;
    }

    channel_->set_buffered_amount_low_threshold(low_water_mark_);
    if (!channel_->send_text(encode_file_meta(meta_))) {
        fail("channel rejected file-meta");
        return false;
    }

    LOG_CHUNK_DEBUG("Streaming " << meta_.file_name << " (" << meta_.file_size << " bytes) in slices of " << chunk_size_);
    phase_ = Phase::STREAMING;
    pump();
    return true;
}

void ChunkSender::on_buffered_amount_low() {
    if (phase_ == Phase::STREAMING) {
        pump();
    } else if (phase_ == Phase::DRAINING && channel_->buffered_amount() == 0) {
        finish();
    }
}

void ChunkSender::on_channel_closed() {
    if (phase_ == Phase::FINISHED || phase_ == Phase::FAILED) {
        return;
    }
    if (phase_ == Phase::DRAINING && channel_->buffered_amount() == 0) {
        finish();
        return;
    }
    fail("channel closed before the transfer completed");
}

void ChunkSender::pump() {
    std::vector<uint8_t> slice;

    while (phase_ == Phase::STREAMING && channel_->buffered_amount() < high_water_mark_) {
        if (bytes_sent_ >= meta_.file_size) {
            begin_draining();
            return;
        }

        size_t want = static_cast<size_t>(std::min<uint64_t>(chunk_size_, meta_.file_size - bytes_sent_));
        slice.resize(want);
        int64_t read = read_file_chunk(file_path_, bytes_sent_, slice.data(), want);
        if (read <= 0) {
            fail("failed to read " + file_path_ + " at offset " + std::to_string(bytes_sent_));
            return;
        }
        slice.resize(static_cast<size_t>(read));

        if (!channel_->send_binary(slice)) {
            fail("channel rejected a data slice");
            return;
        }

        bytes_sent_ += static_cast<uint64_t>(read);
        int progress = compute_progress(bytes_sent_, meta_.file_size);
        if (progress > progress_) {
            progress_ = progress;
        }
        if (progress_callback_) {
            progress_callback_(bytes_sent_, progress_);
        }
    }
}

void ChunkSender::begin_draining() {
    if (!channel_->send_text(encode_file_end())) {
        fail("channel rejected file-end");
        return;
    }

    phase_ = Phase::DRAINING;
    // Threshold first, then check, so the drain to zero cannot be missed
    channel_->set_buffered_amount_low_threshold(0);
    if (channel_->buffered_amount() == 0) {
        finish();
    }
}

void ChunkSender::finish() {
    phase_ = Phase::FINISHED;
    progress_ = 100;
    LOG_CHUNK_INFO("Sent " << meta_.file_name << " (" << bytes_sent_ << " bytes)");
    if (finished_callback_) {
        finished_callback_();
    }
}

void ChunkSender::fail(const std::string& reason) {
    phase_ = Phase::FAILED;
    LOG_CHUNK_WARN("Sending " << meta_.file_name << " failed: " << reason);
    if (failure_callback_) {
        failure_callback_(reason);
    }
}

} // namespace peerdrop
