#include "reassembly.h"
#include "transfer.h"
#include "fs.h"
#include "logger.h"

// Reassembly module logging macros
#define LOG_REASSEMBLY_DEBUG(message) LOG_DEBUG("reassembly", message)
#define LOG_REASSEMBLY_WARN(message)  LOG_WARN("reassembly", message)
#define LOG_REASSEMBLY_ERROR(message) LOG_ERROR("reassembly", message)

namespace peerdrop {

ReassemblyBuffer::ReassemblyBuffer()
    : expected_size_(0), received_bytes_(0), progress_(0), active_(false) {
}

void ReassemblyBuffer::begin(uint64_t expected_size) {
    segments_.clear();
    expected_size_ = expected_size;
    received_bytes_ = 0;
    progress_ = 0;
    active_ = true;
}

bool ReassemblyBuffer::append(const std::vector<uint8_t>& segment) {
    if (!active_) {
        LOG_REASSEMBLY_WARN("Segment of " << segment.size() << " bytes arrived before file-meta");
        return false;
    }
    if (received_bytes_ + segment.size() > expected_size_) {
        LOG_REASSEMBLY_WARN("Segment overflows declared size: " << received_bytes_ << " + "
                            << segment.size() << " > " << expected_size_);
        return false;
    }

    segments_.push_back(segment);
    received_bytes_ += segment.size();

    int progress = compute_progress(received_bytes_, expected_size_);
    if (progress > progress_) {
        progress_ = progress;
    }
    return true;
}

bool ReassemblyBuffer::finalize(const std::string& path, std::string& error) {
    if (!active_) {
        error = "no transfer in progress";
        return false;
    }

    if (received_bytes_ != expected_size_) {
        error = "received " + std::to_string(received_bytes_) + " bytes, expected " + std::to_string(expected_size_);
        LOG_REASSEMBLY_WARN("Size mismatch at file-end: " << error);
        discard();
        return false;
    }

    if (!write_file_segments(path, segments_)) {
        error = "failed to write " + path;
        LOG_REASSEMBLY_ERROR("Could not materialize artifact " << path);
        discard();
        return false;
    }

    LOG_REASSEMBLY_DEBUG("Wrote " << received_bytes_ << " bytes in " << segments_.size() << " segments to " << path);
    progress_ = 100;
    segments_.clear();
    segments_.shrink_to_fit();
    active_ = false;
    return true;
}

void ReassemblyBuffer::discard() {
    segments_.clear();
    segments_.shrink_to_fit();
    active_ = false;
}

} // namespace peerdrop
